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

#ifndef _STREAMSKETCH_QUANTILE_SKETCH_H_
#define _STREAMSKETCH_QUANTILE_SKETCH_H_

#include <stdint.h>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "sketch_errors.hpp"

namespace streamsketch {

/**
 * Quantile estimation over a stream of doubles with a stack of compactors
 * (KLL family).
 *
 * Level L holds items of weight 2^L. Values enter level 0. Whenever a level
 * holds more than k items it gets compacted: the buffer is sorted, an odd
 * item out (the smallest) stays in place, and one item out of every pair of
 * the remaining run is promoted to level L+1. Which one of the pair is kept
 * is decided by a single coin flip per compaction, so that the error does
 * not lean systematically towards small or large values. Compactions
 * cascade up as long as a level overflows.
 *
 * Total weight over all levels always equals getN(). The exact minimum and
 * maximum are tracked separately.
 *
 * The coin comes from a per-instance generator seeded through the
 * constructor (or setRandomSeed), which makes runs reproducible.
 */
class QuantileSketch {
public:
  static const uint16_t MIN_K = 8;
  static const uint16_t DEFAULT_K = 200;
  static const uint64_t DEFAULT_RANDOM_SEED = 5489;
  static const uint8_t MAX_LEVELS = 61;

  explicit QuantileSketch(uint16_t k = DEFAULT_K, uint64_t randomSeed = DEFAULT_RANDOM_SEED);

  /**
   * Rebuilds a sketch from previously extracted state. Throws ConfigError
   * when k is invalid or the levels are inconsistent with n, min and max.
   */
  static QuantileSketch restore(uint16_t k, uint64_t n, double minValue, double maxValue,
                                std::vector<std::vector<double>> levels);

  // NaN values are ignored
  void update(double value);

  /**
   * Absorbs another sketch built with the same k. Throws
   * IncompatibleSketchError otherwise, leaving this sketch untouched.
   */
  void merge(const QuantileSketch& other);

  /**
   * Fraction of the stream weight that is <= value. NaN when empty.
   */
  double rank(double value) const;

  /**
   * Smallest retained value whose normalized cumulative weight reaches
   * fraction. quantile(0) and quantile(1) are the exact minimum and maximum.
   * NaN when empty; ConfigError when fraction is outside [0, 1].
   */
  double quantile(double fraction) const;

  std::vector<double> quantiles(const std::vector<double>& fractions) const;

  /**
   * Cumulative distribution at the given split points. Returns one value per
   * split point (fraction of weight <= point) followed by 1.0. Split points
   * have to be strictly increasing.
   */
  std::vector<double> cdf(const std::vector<double>& splitPoints) const;

  // Weight fraction in each interval delimited by the split points
  std::vector<double> pmf(const std::vector<double>& splitPoints) const;

  uint16_t getK() const {
    return this->k;
  }

  uint64_t getN() const {
    return this->n;
  }

  bool isEmpty() const {
    return this->n == 0;
  }

  bool isEstimationMode() const {
    return this->levels.size() > 1;
  }

  double getMinValue() const;
  double getMaxValue() const;

  uint32_t getNumRetained() const;

  uint8_t getNumLevels() const {
    return static_cast<uint8_t>(this->levels.size());
  }

  const std::vector<std::vector<double>>& getLevels() const {
    return this->levels;
  }

  void setRandomSeed(uint64_t randomSeed);

  double getNormalizedRankError() const {
    return getNormalizedRankError(this->k);
  }

  // Empirical single-sided rank error (99th percentile) of a KLL sketch with
  // shrinking level capacities; levels here all hold k items, so it is an upper bound
  static double getNormalizedRankError(uint16_t k);

  std::string toString() const;

  // Compares the summarized state, not the random generator
  bool operator==(const QuantileSketch& rhs) const;

private:
  typedef std::vector<std::pair<double, uint64_t>> WeightedItems;

  static void checkConfig(uint16_t k);
  static void checkSplitPoints(const std::vector<double>& splitPoints);
  void compactLevel(size_t level);
  void compress();
  WeightedItems sortedView() const;
  double quantileFromView(const WeightedItems& view, double fraction) const;

  uint16_t k;
  uint64_t n;
  double minValue;
  double maxValue;
  std::vector<std::vector<double>> levels;
  std::mt19937_64 random;
};

} // namespace streamsketch

#endif
