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

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/escaping.h"
#include "optionparser.h"

#include "streamsketch/sketch.hpp"

using namespace option;
using namespace std;
using namespace streamsketch;

/**
 * Builds, merges and queries sketches from the command line.
 *
 * Input lines come from the files given as arguments, or stdin. Sketches
 * travel between invocations as base64 text, one per line (see --raw and
 * --merge).
 */

namespace {

enum ExitCode {
  EXIT_OK = 0, EXIT_USAGE = 1, EXIT_CONFIG = 2, EXIT_INCOMPATIBLE = 3, EXIT_DECODE = 4
};

// bad command line or unreadable input
struct UsageError : public std::runtime_error {
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

enum optionIndex {
  UNKNOWN, HELP, KIND, K, MODE, SEED, MERGE, RAW, FORMAT, RANK, QUANTILE, ITEM, THRESHOLD, TOP, VERBOSE
};
const option::Descriptor usage[] =
{
  { UNKNOWN, 0, "", "", Arg::None, "USAGE: sketchtool [options] [FILE...]\n\n"
    "Reads one item per line from the files, or stdin when none is given.\n\n"
    "Options:" },
  { HELP,      0, "", "help", Arg::None, "  --help  \tPrint usage and exit." },
  { KIND,      0, "", "kind", Arg::Optional, "  --kind=<arg>"
    "  \tcardinality, quantile or frequency. Default is cardinality." },
  { K,         0, "", "k", Arg::Optional, "  --k=<arg>"
    "  \tSize parameter: maxK for cardinality (default 4096), k for quantile (default 200),"
    " capacity for frequency (default 64)." },
  { MODE,      0, "", "mode", Arg::Optional, "  --mode=<arg>"
    "  \tdense or packed cardinality serialization. Default is dense." },
  { SEED,      0, "", "seed", Arg::Optional, "  --seed=<arg>"
    "  \tHash seed for cardinality sketches, random seed for quantile sketches." },
  { MERGE,     0, "", "merge", Arg::None, "  --merge"
    "  \tInput lines are base64 sketches to merge instead of items." },
  { RAW,       0, "", "raw", Arg::None, "  --raw"
    "  \tPrint the resulting sketch as base64 instead of query results." },
  { FORMAT,    0, "", "format", Arg::Optional, "  --format=<arg>"
    "  \ttext or tsv. Default is text." },
  { RANK,      0, "", "rank", Arg::Optional, "  --rank=<arg>"
    "  \tPrint the rank of a value (quantile, repeatable)." },
  { QUANTILE,  0, "", "quantile", Arg::Optional, "  --quantile=<arg>"
    "  \tPrint the value at a fraction (quantile, repeatable)." },
  { ITEM,      0, "", "item", Arg::Optional, "  --item=<arg>"
    "  \tPrint the estimated count of an item (frequency, repeatable)." },
  { THRESHOLD, 0, "", "threshold", Arg::Optional, "  --threshold=<arg>"
    "  \tFraction of the total above which items are frequent. Default is 0.01." },
  { TOP,       0, "", "top", Arg::Optional, "  --top=<arg>"
    "  \tPrint the N largest items instead of the frequent ones (frequency)." },
  { VERBOSE,   0, "", "verbose", Arg::None, "  --verbose  \tPrint the sketch summary on stderr." },
  { 0, 0, 0, 0, 0, 0 }
};

const char* requireArg(const option::Option& opt) {
  if (!opt.arg || *opt.arg == '\0') {
    throw UsageError(std::string("option ") + std::string(opt.name, opt.namelen) + " needs a value");
  }
  return opt.arg;
}

uint64_t parseUnsigned(const option::Option& opt) {
  const char* text = requireArg(opt);
  char* end = nullptr;
  errno = 0;
  unsigned long long value = std::strtoull(text, &end, 10);
  if (errno != 0 || *end != '\0' || *text == '-') {
    throw UsageError(std::string("invalid number for ") + std::string(opt.name, opt.namelen) + ": " + text);
  }
  return value;
}

// returns false when text is not entirely a double
bool parseDouble(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  value = std::strtod(text.c_str(), &end);
  return errno == 0 && *end == '\0';
}

double parseDouble(const option::Option& opt) {
  double value;
  if (!parseDouble(requireArg(opt), value)) {
    throw UsageError(std::string("invalid number for ") + std::string(opt.name, opt.namelen) + ": " + opt.arg);
  }
  return value;
}

SketchKind parseKind(const std::string& name) {
  if (name == "cardinality") {
    return SketchKind::CARDINALITY;
  }
  if (name == "quantile") {
    return SketchKind::QUANTILE;
  }
  if (name == "frequency") {
    return SketchKind::FREQUENCY;
  }
  throw UsageError("unknown sketch kind " + name);
}

SketchConfig makeConfig(SketchKind kind, option::Option* options) {
  SketchConfig config;
  if (options[K]) {
    const uint64_t k = parseUnsigned(*options[K].last());
    switch (kind) {
      case SketchKind::CARDINALITY:
        if (k > UINT32_MAX) {
          throw ConfigError("maxK " + std::to_string(k) + " is too large");
        }
        config.maxK = static_cast<uint32_t>(k);
        break;
      case SketchKind::QUANTILE:
        if (k > UINT16_MAX) {
          throw ConfigError("k " + std::to_string(k) + " is too large");
        }
        config.k = static_cast<uint16_t>(k);
        break;
      case SketchKind::FREQUENCY:
        if (k > UINT32_MAX) {
          throw ConfigError("capacity " + std::to_string(k) + " is too large");
        }
        config.capacity = static_cast<uint32_t>(k);
        break;
    }
  }
  if (options[MODE]) {
    const std::string mode = requireArg(*options[MODE].last());
    if (mode == "dense") {
      config.mode = CardinalityMode::DENSE;
    } else if (mode == "packed") {
      config.mode = CardinalityMode::PACKED;
    } else {
      throw UsageError("unknown mode " + mode);
    }
  }
  if (options[SEED]) {
    const uint64_t seed = parseUnsigned(*options[SEED].last());
    config.seed = seed;
    config.randomSeed = seed;
  }
  return config;
}

/**
 * Calls consume(line, lineNumber, source) for every line of every input,
 * stdin when there is no file argument.
 */
template<typename Consumer>
void forEachLine(const std::vector<std::string>& files, Consumer consume) {
  if (files.empty()) {
    std::string line;
    uint64_t lineNumber = 0;
    while (std::getline(std::cin, line)) {
      consume(line, ++lineNumber, "stdin");
    }
    return;
  }
  for (const std::string& file : files) {
    std::ifstream input(file);
    if (!input) {
      throw UsageError("cannot open " + file);
    }
    std::string line;
    uint64_t lineNumber = 0;
    while (std::getline(input, line)) {
      consume(line, ++lineNumber, file);
    }
    if (input.bad()) {
      throw UsageError("error while reading " + file);
    }
  }
}

Sketch buildSketch(SketchKind kind, const SketchConfig& config, const std::vector<std::string>& files) {
  Sketch sketch = Sketch::create(kind, config);
  forEachLine(files, [&](const std::string& line, uint64_t lineNumber, const std::string& source) {
    if (kind != SketchKind::QUANTILE) {
      sketch.update(Item::fromBytes(line));
      return;
    }
    double value;
    if (!parseDouble(line, value)) {
      cerr << "WARNING: " << source << ":" << lineNumber << ": not a number, skipped" << endl;
      return;
    }
    sketch.update(Item::fromDouble(value));
  });
  return sketch;
}

Sketch mergeSketches(SketchKind kind, const SketchConfig& config, bool kindGiven,
                     const std::vector<std::string>& files) {
  std::unique_ptr<Sketch> merged;
  forEachLine(files, [&](const std::string& line, uint64_t lineNumber, const std::string& source) {
    if (line.empty()) {
      return;
    }
    std::string decoded;
    if (!absl::Base64Unescape(line, &decoded)) {
      throw DecodeError(DecodeError::Reason::MALFORMED,
        source + ":" + std::to_string(lineNumber) + ": invalid base64");
    }
    Sketch sketch = Sketch::deserialize(reinterpret_cast<const uint8_t*>(decoded.data()), decoded.size());
    if (!merged) {
      merged.reset(new Sketch(std::move(sketch)));
    } else {
      merged->merge(sketch);
    }
  });
  if (!merged) {
    return Sketch::create(kind, config);
  }
  if (kindGiven && merged->getKind() != kind) {
    throw IncompatibleSketchError(std::string("input holds ") + kindName(merged->getKind())
      + " sketches, not " + kindName(kind));
  }
  return *merged;
}

class Printer {
  bool tsv;

public:
  explicit Printer(bool tsv) : tsv(tsv) {}

  template<typename T>
  void line(const std::string& label, const T& value) const {
    if (tsv) {
      cout << label << "\t" << value << "\n";
    } else {
      cout << label << ": " << value << "\n";
    }
  }

  void item(const FrequentItem& entry) const {
    if (tsv) {
      cout << entry.item << "\t" << entry.estimate << "\t" << entry.lowerBound << "\n";
    } else {
      cout << entry.item << ": " << entry.estimate << " (at least " << entry.lowerBound << ")\n";
    }
  }
};

void printCardinality(const Sketch& sketch, const Printer& printer) {
  printer.line("estimate", sketch.query(SketchQuery::estimate()).value);
  printer.line("lower_bound", sketch.query(SketchQuery::lowerBound(2)).value);
  printer.line("upper_bound", sketch.query(SketchQuery::upperBound(2)).value);
}

void printQuantile(const Sketch& sketch, option::Option* options, const Printer& printer) {
  if (!options[RANK] && !options[QUANTILE]) {
    const QuantileSketch& quantiles = sketch.asQuantile();
    printer.line("n", quantiles.getN());
    printer.line("min", quantiles.getMinValue());
    printer.line("max", quantiles.getMaxValue());
    const std::vector<double> quartiles = quantiles.quantiles({0.25, 0.5, 0.75});
    printer.line("q0.25", quartiles[0]);
    printer.line("q0.5", quartiles[1]);
    printer.line("q0.75", quartiles[2]);
    return;
  }
  for (option::Option* opt = options[RANK]; opt; opt = opt->next()) {
    const double value = parseDouble(*opt);
    printer.line(std::string("rank(") + opt->arg + ")", sketch.query(SketchQuery::rank(value)).value);
  }
  for (option::Option* opt = options[QUANTILE]; opt; opt = opt->next()) {
    const double fraction = parseDouble(*opt);
    printer.line(std::string("quantile(") + opt->arg + ")", sketch.query(SketchQuery::quantile(fraction)).value);
  }
}

void printFrequency(const Sketch& sketch, option::Option* options, const Printer& printer) {
  if (options[ITEM]) {
    for (option::Option* opt = options[ITEM]; opt; opt = opt->next()) {
      const std::string item = requireArg(*opt);
      printer.line(item, sketch.query(SketchQuery::frequency(item)).value);
    }
    return;
  }
  if (options[TOP]) {
    for (const FrequentItem& entry : sketch.asFrequency().topK(parseUnsigned(*options[TOP].last()))) {
      printer.item(entry);
    }
    return;
  }
  const double threshold = options[THRESHOLD] ? parseDouble(*options[THRESHOLD].last()) : 0.01;
  for (const FrequentItem& entry : sketch.query(SketchQuery::frequentItems(threshold)).items) {
    printer.item(entry);
  }
}

int run(option::Option* options, const std::vector<std::string>& files) {
  const bool kindGiven = options[KIND];
  const SketchKind kind = kindGiven ? parseKind(requireArg(*options[KIND].last())) : SketchKind::CARDINALITY;
  const SketchConfig config = makeConfig(kind, options);

  bool tsv = false;
  if (options[FORMAT]) {
    const std::string format = requireArg(*options[FORMAT].last());
    if (format != "text" && format != "tsv") {
      throw UsageError("unknown format " + format);
    }
    tsv = format == "tsv";
  }

  Sketch sketch = options[MERGE] ? mergeSketches(kind, config, kindGiven, files)
                                 : buildSketch(kind, config, files);
  if (options[VERBOSE]) {
    cerr << sketch.toString();
  }

  if (options[RAW]) {
    const Bytes bytes = sketch.serialize();
    cout << absl::Base64Escape(std::string(bytes.begin(), bytes.end())) << endl;
    return EXIT_OK;
  }

  const Printer printer(tsv);
  switch (sketch.getKind()) {
    case SketchKind::CARDINALITY:
      printCardinality(sketch, printer);
      break;
    case SketchKind::QUANTILE:
      printQuantile(sketch, options, printer);
      break;
    case SketchKind::FREQUENCY:
      printFrequency(sketch, options, printer);
      break;
  }
  cout.flush();
  return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
  // Command line parsing code
  argc -= (argc > 0); argv += (argc > 0); // skip program name argv[0] if present
  option::Stats stats(usage, argc, argv);
  std::vector<option::Option> options(stats.options_max), buffer(stats.buffer_max);
  option::Parser parse(usage, argc, argv, options.data(), buffer.data());
  if (parse.error()) {
    return EXIT_USAGE;
  }
  if (options[HELP]) {
    option::printUsage(cout, usage);
    return EXIT_OK;
  }
  if (options[UNKNOWN]) {
    for (option::Option* opt = options[UNKNOWN]; opt; opt = opt->next()) {
      cerr << "ERROR: unknown option: " << opt->name << endl;
    }
    return EXIT_USAGE;
  }

  std::vector<std::string> files;
  for (int i = 0; i < parse.nonOptionsCount(); ++i) {
    files.push_back(parse.nonOption(i));
  }

  try {
    return run(options.data(), files);
  } catch (UsageError& e) {
    cerr << "ERROR: " << e.what() << endl;
    return EXIT_USAGE;
  } catch (ConfigError& e) {
    cerr << "ERROR: " << e.what() << endl;
    return EXIT_CONFIG;
  } catch (IncompatibleSketchError& e) {
    cerr << "ERROR: " << e.what() << endl;
    return EXIT_INCOMPATIBLE;
  } catch (DecodeError& e) {
    cerr << "ERROR: " << e.what() << endl;
    return EXIT_DECODE;
  }
}
