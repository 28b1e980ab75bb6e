/*
Licensed to the Apache Software Foundation (ASF) under one
or more contributor license agreements.  See the NOTICE file
distributed with this work for additional information
regarding copyright ownership.  The ASF licenses this file
to you under the Apache License, Version 2.0 (the
"License"); you may not use this file except in compliance
with the License.  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the License is distributed on an
"AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
KIND, either express or implied.  See the License for the
specific language governing permissions and limitations
under the License.
*/

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iostream>
#include <fstream>
#include <vector>
#include "cardinality_sketch.hpp"
#include "quantile_sketch.hpp"
#include "optionparser.h"

using namespace option;
using namespace std;
using namespace streamsketch;

/**
 * Code to run accuracy benchmarks on the cardinality and quantile sketches.
 * Writes one CSV line per measurement:
 *   cardinality,<maxK>,<real cardinality>,<iteration>,<estimate - real>
 *   quantile,<k>,<stream length>,<iteration>,<max rank error over the deciles>
 */


enum  optionIndex {
  UNKNOWN, HELP, MAX_CARDINALITY, MIN_CARDINALITY, REPEAT_COUNT, OUT_FILE, MAX_K, K
};
const option::Descriptor usage[] =
{
  { UNKNOWN, 0, "", "", option::Arg::None, "USAGE: sketch_benchmark [options]\n\n"
    "Options:" },
  { HELP,    0, "", "help", option::Arg::None, "  --help  \tPrint usage and exit." },
  { MIN_CARDINALITY, 0, "l", "min_cardinality", Arg::Optional, "  -l[<arg>], \t--min_cardinality[=<arg>]"
    "  \tSet min target cardinality to run benchmark, default is 1." },
  { MAX_CARDINALITY, 0, "h", "max_cardinality", Arg::Optional, "  -h[<arg>], \t--max_cardinality[=<arg>]"
    "  \tSet max target cardinality to run benchmark, default is 100000." },
  { OUT_FILE, 0, "o", "output_file", Arg::Optional, "  -o[<arg>], \t--output_file[=<arg>]"
    "  \tOutput file to save results" },
  { REPEAT_COUNT, 0, "r", "repeat", Arg::Optional, "  -r[<arg>], \t--repeat[=<arg>]"
    "  \tRepeat test N times, changing hash and random seeds each time. Default is 10" },
  { MAX_K, 0, "", "max_k", Arg::Optional, "  --max_k[=<arg>]"
    "  \tmaxK of the cardinality sketches, default is 4096." },
  { K, 0, "k", "k", Arg::Optional, "  -k[<arg>], \t--k[=<arg>]"
    "  \tk of the quantile sketches, default is 200." },
  { 0, 0, 0, 0, 0, 0 }
};

int64_t getOutputStep(int64_t realCardinality) {
  // for numbers up to 999 - return 1, then increase step 10x for each extra digit in the number
  // (e.g. step 10 for 1000->9999, step 100 for 10000->99999 etc)
  if (realCardinality < 1000) {
    return 1;
  }
  int nDigitsMinusOne = (int)log10((double)realCardinality);

  return std::pow(10, nDigitsMinusOne - 2);
}

double maxDecileError(const QuantileSketch& sketch, uint64_t streamLength) {
  double maxError = 0;
  for (int decile = 1; decile < 10; ++decile) {
    const double fraction = decile / 10.0;
    // the stream holds 0 .. streamLength - 1
    const double trueRank = (sketch.quantile(fraction) + 1) / streamLength;
    maxError = std::max(maxError, std::fabs(trueRank - fraction));
  }
  return maxError;
}

int main(int argc, char **argv) {

  uint64_t minCardinality = 1;
  uint64_t maxCardinality = 100000;
  int repeatCount = 10;
  uint32_t maxK = CardinalitySketch::DEFAULT_MAX_K;
  uint16_t k = QuantileSketch::DEFAULT_K;
  string outputFile = "./sketch_benchmark_result.csv";

  // Command line parsing code
  argc -= (argc > 0); argv += (argc > 0); // skip program name argv[0] if present
  option::Stats  stats(usage, argc, argv);
  std::vector<option::Option> options(stats.options_max), buffer(stats.buffer_max);
  option::Parser parse(usage, argc, argv, options.data(), buffer.data());
  if (parse.error()) return 1;
  if (options[HELP]) {
    option::printUsage(cout, usage);
    return 0;
  }

  try {
    if (options[MAX_CARDINALITY].arg) {
      maxCardinality = stoull(options[MAX_CARDINALITY].arg);
      cout << "MAX_CARDINALITY <<" << maxCardinality << endl;
    }

    if (options[MIN_CARDINALITY].arg) {
      minCardinality = stoull(options[MIN_CARDINALITY].arg);
      cout << "MIN_CARDINALITY <<" << minCardinality << endl;
    }

    if (options[REPEAT_COUNT].arg) {
      cout << "REPEAT_COUNT <<" << options[REPEAT_COUNT].arg << endl;
      repeatCount = stoi(options[REPEAT_COUNT].arg);
    }

    if (options[MAX_K].arg) {
      maxK = static_cast<uint32_t>(stoul(options[MAX_K].arg));
      cout << "MAX_K <<" << maxK << endl;
    }

    if (options[K].arg) {
      k = static_cast<uint16_t>(stoul(options[K].arg));
      cout << "K <<" << k << endl;
    }
  } catch (std::logic_error& e) {
    cerr << "ERROR: invalid numeric option: " << e.what() << endl;
    return 1;
  }

  if (options[OUT_FILE].arg) {
    outputFile = options[OUT_FILE].arg;
    cout << "OUT_FILE <<" << outputFile << endl;
  }

  for (option::Option* opt = options[UNKNOWN]; opt; opt = opt->next())
  cout << "Unknown option: " << opt->name << "\n";
  for (int i = 0; i < parse.nonOptionsCount(); ++i) cout << "Non-option #" << i << ": " << parse.nonOption(i) << "\n";

  if (maxCardinality < minCardinality) {
    cerr << "ERROR: Max cardinality has to be bigger than min cardinality" << endl;
    return 1;
  }

  std::ofstream output(outputFile);
  if (!output) {
    cerr << "ERROR: cannot write to " << outputFile << endl;
    return 1;
  }

  try {
    for (int iteration = 0; iteration < repeatCount; ++iteration) {
      uint64_t seed = MURMURHASH_DEFAULT_SEED;
      if (iteration > 0) {
        seed = (uint64_t)time(nullptr) + iteration; // epoch seconds, shifted by iteration number
      }
      cout << "Running iteration " << iteration << " with seed " << seed << endl;

      CardinalitySketch distinct(maxK, CardinalityMode::DENSE, seed);
      QuantileSketch quantiles(k, seed);
      for (uint64_t realCardinality = 1; realCardinality <= maxCardinality; ++realCardinality) {
        distinct.update(Item::fromInteger(static_cast<int64_t>(realCardinality)));
        quantiles.update(static_cast<double>((realCardinality * 48271) % maxCardinality));
        if (realCardinality >= minCardinality
            && realCardinality % getOutputStep(realCardinality) == 0) {
          output <<
            "cardinality," <<
            maxK             << "," <<
            realCardinality  << "," <<
            iteration        << "," <<
            static_cast<int64_t>(distinct.estimate()) - static_cast<int64_t>(realCardinality) << "\n";
        }
      }
      output <<
        "quantile," <<
        k              << "," <<
        maxCardinality << "," <<
        iteration      << "," <<
        maxDecileError(quantiles, maxCardinality) << "\n";
    }
  } catch (ConfigError& e) {
    cerr << "ERROR: " << e.what() << endl;
    return 2;
  }

  return 0;
}
