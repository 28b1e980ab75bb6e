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
#include <iomanip>
#include <limits>
#include <sstream>

#include "streamsketch/quantile_sketch.hpp"

namespace streamsketch {

const uint16_t QuantileSketch::MIN_K;
const uint16_t QuantileSketch::DEFAULT_K;
const uint64_t QuantileSketch::DEFAULT_RANDOM_SEED;
const uint8_t QuantileSketch::MAX_LEVELS;

QuantileSketch::QuantileSketch(uint16_t k, uint64_t randomSeed) :
  k(k),
  n(0),
  minValue(std::numeric_limits<double>::quiet_NaN()),
  maxValue(std::numeric_limits<double>::quiet_NaN()),
  levels(1),
  random(randomSeed) {
  checkConfig(k);
}

void QuantileSketch::checkConfig(uint16_t k) {
  if (k < MIN_K) {
    throw ConfigError("k has to be at least " + std::to_string(MIN_K) + ", got " + std::to_string(k));
  }
}

QuantileSketch QuantileSketch::restore(uint16_t k, uint64_t n, double minValue, double maxValue,
                                       std::vector<std::vector<double>> levels) {
  QuantileSketch sketch(k);
  if (levels.empty() || levels.size() > MAX_LEVELS) {
    throw ConfigError("number of levels has to be between 1 and " + std::to_string(MAX_LEVELS));
  }

  uint64_t totalWeight = 0;
  for (size_t level = 0; level < levels.size(); ++level) {
    const std::vector<double>& buffer = levels[level];
    if (buffer.size() > k) {
      throw ConfigError("level " + std::to_string(level) + " holds more than k items");
    }
    const uint64_t count = buffer.size();
    if (count > ((UINT64_MAX - totalWeight) >> level)) {
      throw ConfigError("level weights overflow");
    }
    totalWeight += count << level;
    for (double value : buffer) {
      if (std::isnan(value) || value < minValue || value > maxValue) {
        throw ConfigError("retained value outside of [min, max]");
      }
    }
  }
  if (totalWeight != n) {
    throw ConfigError("level weights add up to " + std::to_string(totalWeight)
      + " instead of n = " + std::to_string(n));
  }
  if (n > 0 && !(minValue <= maxValue)) {
    throw ConfigError("minimum is greater than maximum");
  }

  sketch.n = n;
  if (n > 0) {
    sketch.minValue = minValue;
    sketch.maxValue = maxValue;
  }
  sketch.levels = std::move(levels);
  return sketch;
}

void QuantileSketch::setRandomSeed(uint64_t randomSeed) {
  this->random.seed(randomSeed);
}

void QuantileSketch::update(double value) {
  if (std::isnan(value)) {
    return;
  }
  if (this->n == 0) {
    this->minValue = value;
    this->maxValue = value;
  } else {
    this->minValue = std::min(this->minValue, value);
    this->maxValue = std::max(this->maxValue, value);
  }
  this->levels[0].push_back(value);
  this->n++;
  if (this->levels[0].size() > this->k) {
    compress();
  }
}

/**
 * Halves the weight-bearing run of a level into the level above.
 *
 *   sorted level L : [s | a0 a1 a2 a3 ... a(2m-1)]     s only if the size is odd
 *   coin = 0       : a0 a2 ... a(2m-2) go up
 *   coin = 1       : a1 a3 ... a(2m-1) go up
 *   level L after  : [s] or []
 *
 * Each promoted item doubles its weight, so 2m items of weight 2^L become
 * m items of weight 2^(L+1) and the total weight is unchanged.
 */
void QuantileSketch::compactLevel(size_t level) {
  if (level + 1 == this->levels.size()) {
    this->levels.emplace_back();
  }
  std::vector<double>& buffer = this->levels[level];
  std::vector<double>& above = this->levels[level + 1];

  std::sort(buffer.begin(), buffer.end());
  const size_t start = buffer.size() % 2;
  const size_t offset = static_cast<size_t>(this->random() & 1);
  for (size_t i = start + offset; i < buffer.size(); i += 2) {
    above.push_back(buffer[i]);
  }
  buffer.resize(start);
}

void QuantileSketch::compress() {
  for (size_t level = 0; level < this->levels.size(); ++level) {
    if (this->levels[level].size() > this->k) {
      compactLevel(level);
    }
  }
}

void QuantileSketch::merge(const QuantileSketch& other) {
  if (this->k != other.k) {
    throw IncompatibleSketchError("cannot merge quantile sketches with k " + std::to_string(this->k)
      + " and " + std::to_string(other.k));
  }
  if (other.isEmpty()) {
    return;
  }
  // merging a sketch into itself reads from the levels being extended
  const std::vector<std::vector<double>> otherLevels(other.levels);

  if (this->n == 0) {
    this->minValue = other.minValue;
    this->maxValue = other.maxValue;
  } else {
    this->minValue = std::min(this->minValue, other.minValue);
    this->maxValue = std::max(this->maxValue, other.maxValue);
  }
  this->n += other.n;

  if (this->levels.size() < otherLevels.size()) {
    this->levels.resize(otherLevels.size());
  }
  for (size_t level = 0; level < otherLevels.size(); ++level) {
    this->levels[level].insert(this->levels[level].end(), otherLevels[level].begin(), otherLevels[level].end());
  }
  compress();
}

double QuantileSketch::getMinValue() const {
  return this->minValue;
}

double QuantileSketch::getMaxValue() const {
  return this->maxValue;
}

uint32_t QuantileSketch::getNumRetained() const {
  uint32_t retained = 0;
  for (const std::vector<double>& buffer : this->levels) {
    retained += static_cast<uint32_t>(buffer.size());
  }
  return retained;
}

double QuantileSketch::rank(double value) const {
  if (isEmpty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  uint64_t weight = 0;
  for (size_t level = 0; level < this->levels.size(); ++level) {
    for (double item : this->levels[level]) {
      if (item <= value) {
        weight += uint64_t(1) << level;
      }
    }
  }
  return static_cast<double>(weight) / static_cast<double>(this->n);
}

QuantileSketch::WeightedItems QuantileSketch::sortedView() const {
  WeightedItems view;
  view.reserve(getNumRetained());
  for (size_t level = 0; level < this->levels.size(); ++level) {
    for (double item : this->levels[level]) {
      view.emplace_back(item, uint64_t(1) << level);
    }
  }
  std::sort(view.begin(), view.end(),
    [](const std::pair<double, uint64_t>& a, const std::pair<double, uint64_t>& b) {
      return a.first < b.first;
    });
  return view;
}

double QuantileSketch::quantileFromView(const WeightedItems& view, double fraction) const {
  if (std::isnan(fraction) || fraction < 0.0 || fraction > 1.0) {
    throw ConfigError("quantile fraction has to be in [0, 1]");
  }
  if (isEmpty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (fraction == 0.0) {
    return this->minValue;
  }
  if (fraction == 1.0) {
    return this->maxValue;
  }

  const double targetWeight = fraction * static_cast<double>(this->n);
  uint64_t cumulative = 0;
  for (const std::pair<double, uint64_t>& entry : view) {
    cumulative += entry.second;
    if (static_cast<double>(cumulative) >= targetWeight) {
      return entry.first;
    }
  }
  return this->maxValue;
}

double QuantileSketch::quantile(double fraction) const {
  return quantileFromView(sortedView(), fraction);
}

std::vector<double> QuantileSketch::quantiles(const std::vector<double>& fractions) const {
  const WeightedItems view = sortedView();
  std::vector<double> result;
  result.reserve(fractions.size());
  for (double fraction : fractions) {
    result.push_back(quantileFromView(view, fraction));
  }
  return result;
}

void QuantileSketch::checkSplitPoints(const std::vector<double>& splitPoints) {
  for (size_t i = 0; i < splitPoints.size(); ++i) {
    if (std::isnan(splitPoints[i])) {
      throw ConfigError("split points cannot contain NaN");
    }
    if (i > 0 && splitPoints[i - 1] >= splitPoints[i]) {
      throw ConfigError("split points have to be unique and increasing");
    }
  }
}

std::vector<double> QuantileSketch::cdf(const std::vector<double>& splitPoints) const {
  checkSplitPoints(splitPoints);
  if (isEmpty()) {
    return std::vector<double>();
  }

  // one bucket per split point plus the tail above the last one
  std::vector<uint64_t> buckets(splitPoints.size() + 1, 0);
  for (size_t level = 0; level < this->levels.size(); ++level) {
    for (double item : this->levels[level]) {
      size_t bucket = std::lower_bound(splitPoints.begin(), splitPoints.end(), item) - splitPoints.begin();
      buckets[bucket] += uint64_t(1) << level;
    }
  }

  std::vector<double> result;
  result.reserve(buckets.size());
  uint64_t cumulative = 0;
  for (uint64_t weight : buckets) {
    cumulative += weight;
    result.push_back(static_cast<double>(cumulative) / static_cast<double>(this->n));
  }
  return result;
}

std::vector<double> QuantileSketch::pmf(const std::vector<double>& splitPoints) const {
  std::vector<double> result = cdf(splitPoints);
  for (size_t i = result.size(); i > 1; --i) {
    result[i - 1] -= result[i - 2];
  }
  return result;
}

double QuantileSketch::getNormalizedRankError(uint16_t k) {
  return 2.296 / std::pow(k, 0.9723);
}

std::string QuantileSketch::toString() const {
  std::ostringstream os;
  os << "### Quantile sketch summary:" << std::endl;
  os << "   k              : " << this->k << std::endl;
  os << "   n              : " << this->n << std::endl;
  os << "   epsilon        : " << std::setprecision(3) << getNormalizedRankError() * 100 << "%" << std::endl;
  os << "   empty          : " << (isEmpty() ? "true" : "false") << std::endl;
  os << "   estimation mode: " << (isEstimationMode() ? "true" : "false") << std::endl;
  os << "   levels         : " << this->levels.size() << std::endl;
  os << "   retained items : " << getNumRetained() << std::endl;
  if (!isEmpty()) {
    os << std::setprecision(6);
    os << "   min value      : " << this->minValue << std::endl;
    os << "   max value      : " << this->maxValue << std::endl;
  }
  os << "### End sketch summary" << std::endl;
  return os.str();
}

bool QuantileSketch::operator==(const QuantileSketch& rhs) const {
  if (this->k != rhs.k || this->n != rhs.n || this->levels != rhs.levels) {
    return false;
  }
  // NaN min/max of empty sketches compare equal
  return isEmpty() || (this->minValue == rhs.minValue && this->maxValue == rhs.maxValue);
}

} // namespace streamsketch
