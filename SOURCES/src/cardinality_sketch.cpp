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
#include <iterator>
#include <sstream>
#include <utility>

#include "streamsketch/cardinality_sketch.hpp"

namespace streamsketch {

// 2^64 as a double, theta / TWO_TO_THE_SIXTY_FOUR is the sampling rate
static const double TWO_TO_THE_SIXTY_FOUR = 18446744073709551616.0;

const uint64_t CardinalitySketch::MAX_THETA;
const uint32_t CardinalitySketch::MIN_MAX_K;
const uint32_t CardinalitySketch::MAX_MAX_K;
const uint32_t CardinalitySketch::DEFAULT_MAX_K;

CardinalitySketch::CardinalitySketch(uint32_t maxK, CardinalityMode mode, uint64_t seed) :
  maxK(maxK), mode(mode), seed(seed), theta(MAX_THETA) {
  checkConfig(maxK);
}

void CardinalitySketch::checkConfig(uint32_t maxK) {
  const bool powerOfTwo = maxK != 0 && (maxK & (maxK - 1)) == 0;
  if (!powerOfTwo || maxK < MIN_MAX_K || maxK > MAX_MAX_K) {
    throw ConfigError("maxK has to be a power of two between " + std::to_string(MIN_MAX_K)
      + " and " + std::to_string(MAX_MAX_K) + ", got " + std::to_string(maxK));
  }
}

CardinalitySketch CardinalitySketch::restore(uint32_t maxK, CardinalityMode mode, uint64_t seed,
                                             uint64_t theta, std::vector<uint64_t> retained) {
  CardinalitySketch sketch(maxK, mode, seed);
  // theta is always a retained hash value that got evicted, never 0; an
  // estimation-mode sketch may have no retained hashes (empty intersection)
  if (theta == 0) {
    throw ConfigError("theta has to be greater than 0");
  }
  if (retained.size() > maxK) {
    throw ConfigError("retained " + std::to_string(retained.size()) + " hashes, more than maxK");
  }
  for (size_t i = 0; i < retained.size(); ++i) {
    if (retained[i] >= theta) {
      throw ConfigError("retained hash is not below theta");
    }
    if (i > 0 && retained[i - 1] >= retained[i]) {
      throw ConfigError("retained hashes are not strictly increasing");
    }
  }
  sketch.theta = theta;
  sketch.retained = std::move(retained);
  return sketch;
}

void CardinalitySketch::update(const Item& item) {
  updateHash(hashItem(item, this->seed));
}

void CardinalitySketch::updateHash(uint64_t hashValue) {
  // already below the sampling threshold, cannot change the estimate
  if (hashValue >= this->theta) {
    return;
  }
  auto position = std::lower_bound(this->retained.begin(), this->retained.end(), hashValue);
  if (position != this->retained.end() && *position == hashValue) {
    return;
  }
  this->retained.insert(position, hashValue);
  if (this->retained.size() > this->maxK) {
    this->theta = this->retained.back();
    this->retained.pop_back();
  }
}

void CardinalitySketch::checkCompatible(const CardinalitySketch& other, const char* operation) const {
  if (this->maxK != other.maxK) {
    throw IncompatibleSketchError(std::string("cannot compute ") + operation + " of cardinality sketches with maxK "
      + std::to_string(this->maxK) + " and " + std::to_string(other.maxK));
  }
  if (this->mode != other.mode) {
    throw IncompatibleSketchError(std::string("cannot compute ") + operation
      + " of cardinality sketches with different modes");
  }
  if (this->seed != other.seed) {
    throw IncompatibleSketchError(std::string("cannot compute ") + operation
      + " of cardinality sketches built with different hash seeds");
  }
}

void CardinalitySketch::merge(const CardinalitySketch& other) {
  checkCompatible(other, "union");

  uint64_t newTheta = std::min(this->theta, other.theta);
  std::vector<uint64_t> merged;
  merged.reserve(this->retained.size() + other.retained.size());
  std::set_union(this->retained.begin(), this->retained.end(),
                 other.retained.begin(), other.retained.end(),
                 std::back_inserter(merged));
  merged.erase(std::lower_bound(merged.begin(), merged.end(), newTheta), merged.end());
  if (merged.size() > this->maxK) {
    newTheta = merged[this->maxK];
    merged.resize(this->maxK);
  }

  this->theta = newTheta;
  this->retained.swap(merged);
}

CardinalitySketch CardinalitySketch::intersection(const CardinalitySketch& a, const CardinalitySketch& b) {
  a.checkCompatible(b, "intersection");

  CardinalitySketch result(a.maxK, a.mode, a.seed);
  result.theta = std::min(a.theta, b.theta);
  std::set_intersection(a.retained.begin(), a.retained.end(),
                        b.retained.begin(), b.retained.end(),
                        std::back_inserter(result.retained));
  result.retained.erase(std::lower_bound(result.retained.begin(), result.retained.end(), result.theta),
                        result.retained.end());
  return result;
}

CardinalitySketch CardinalitySketch::difference(const CardinalitySketch& a, const CardinalitySketch& b) {
  a.checkCompatible(b, "difference");

  CardinalitySketch result(a.maxK, a.mode, a.seed);
  result.theta = std::min(a.theta, b.theta);
  auto aEnd = std::lower_bound(a.retained.begin(), a.retained.end(), result.theta);
  auto bEnd = std::lower_bound(b.retained.begin(), b.retained.end(), result.theta);
  std::set_difference(a.retained.begin(), aEnd, b.retained.begin(), bEnd,
                      std::back_inserter(result.retained));
  return result;
}

double CardinalitySketch::getTheta() const {
  if (this->theta == MAX_THETA) {
    return 1.0;
  }
  return static_cast<double>(this->theta) / TWO_TO_THE_SIXTY_FOUR;
}

bool CardinalitySketch::isEmpty() const {
  return this->theta == MAX_THETA && this->retained.empty();
}

bool CardinalitySketch::isEstimationMode() const {
  return this->theta < MAX_THETA;
}

double CardinalitySketch::estimate() const {
  if (!isEstimationMode()) {
    return static_cast<double>(this->retained.size());
  }
  return static_cast<double>(this->retained.size()) / getTheta();
}

/**
 * Every hash below theta is retained independently with probability theta,
 * so the retained count is binomial. The bounds use its normal approximation:
 *
 *   sd(E) = sqrt(n * (1 - theta)) / theta
 */
double CardinalitySketch::boundDistance(uint8_t numStdDevs) const {
  if (numStdDevs < 1 || numStdDevs > 3) {
    throw ConfigError("number of standard deviations has to be 1, 2 or 3, got " + std::to_string(numStdDevs));
  }
  if (!isEstimationMode()) {
    return 0.0;
  }
  const double p = getTheta();
  const double n = static_cast<double>(std::max<size_t>(this->retained.size(), 1));
  return numStdDevs * std::sqrt(n * (1.0 - p)) / p;
}

double CardinalitySketch::lowerBound(uint8_t numStdDevs) const {
  const double distance = boundDistance(numStdDevs);
  // we have seen at least the retained hashes
  return std::max(estimate() - distance, static_cast<double>(this->retained.size()));
}

double CardinalitySketch::upperBound(uint8_t numStdDevs) const {
  return estimate() + boundDistance(numStdDevs);
}

std::string CardinalitySketch::toString() const {
  std::ostringstream os;
  os << "### Cardinality sketch summary:" << std::endl;
  os << "   maxK           : " << this->maxK << std::endl;
  os << "   mode           : " << (this->mode == CardinalityMode::DENSE ? "dense" : "packed") << std::endl;
  os << "   seed           : " << this->seed << std::endl;
  os << "   retained       : " << this->retained.size() << std::endl;
  os << "   theta          : " << getTheta() << std::endl;
  os << "   estimation mode: " << (isEstimationMode() ? "true" : "false") << std::endl;
  os << "   estimate       : " << estimate() << std::endl;
  os << "   lower bound 95%: " << lowerBound(2) << std::endl;
  os << "   upper bound 95%: " << upperBound(2) << std::endl;
  os << "### End sketch summary" << std::endl;
  return os.str();
}

bool CardinalitySketch::operator==(const CardinalitySketch& rhs) const {
  return this->maxK == rhs.maxK && this->mode == rhs.mode && this->seed == rhs.seed
    && this->theta == rhs.theta && this->retained == rhs.retained;
}

} // namespace streamsketch
