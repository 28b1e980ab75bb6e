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

#ifndef _STREAMSKETCH_CARDINALITY_SKETCH_H_
#define _STREAMSKETCH_CARDINALITY_SKETCH_H_

#include <stdint.h>
#include <string>
#include <vector>

#include "murmur_hash.hpp"
#include "sketch_errors.hpp"
#include "sketch_item.hpp"

namespace streamsketch {

/**
 * Layout of the retained hashes once serialized. DENSE writes every hash on
 * 8 bytes, PACKED writes varint-coded gaps between consecutive hashes.
 */
enum class CardinalityMode {DENSE, PACKED};

/**
 * Distinct counting with a k-minimum-values ("theta") sketch.
 *
 * The sketch keeps the maxK smallest distinct hashes seen so far, in a sorted
 * contiguous buffer, together with the sampling threshold theta. Every
 * retained hash is strictly below theta. As long as fewer than maxK + 1
 * distinct hashes have been seen theta stays at its maximum and the count is
 * exact. Afterwards every new hash that makes it into the buffer pushes out
 * the largest one, which becomes the new theta, and the estimate is
 *
 *   E = |retained| / (theta / 2^64)
 *
 * with a relative standard error close to 1 / sqrt(maxK).
 *
 * Theta is kept as a 64-bit integer; MAX_THETA stands for a sampling rate of
 * 1.0.
 */
class CardinalitySketch {
public:
  static const uint64_t MAX_THETA = UINT64_MAX;
  static const uint32_t MIN_MAX_K = 16;
  static const uint32_t MAX_MAX_K = 1 << 26;
  static const uint32_t DEFAULT_MAX_K = 4096;

  explicit CardinalitySketch(uint32_t maxK = DEFAULT_MAX_K,
                             CardinalityMode mode = CardinalityMode::DENSE,
                             uint64_t seed = MURMURHASH_DEFAULT_SEED);

  /**
   * Rebuilds a sketch from previously extracted state. Throws ConfigError
   * if the configuration is invalid or the state breaks an invariant
   * (unsorted or duplicated hashes, hashes not below theta, too many hashes).
   */
  static CardinalitySketch restore(uint32_t maxK, CardinalityMode mode, uint64_t seed,
                                   uint64_t theta, std::vector<uint64_t> retained);

  void update(const Item& item);

  // Feeds an already hashed value. The caller guarantees it used getSeed().
  void updateHash(uint64_t hashValue);

  /**
   * Union in place. Both sketches must share maxK, mode and seed, otherwise
   * IncompatibleSketchError is thrown and neither sketch is modified.
   */
  void merge(const CardinalitySketch& other);

  static CardinalitySketch intersection(const CardinalitySketch& a, const CardinalitySketch& b);

  // Items of a that are not in b
  static CardinalitySketch difference(const CardinalitySketch& a, const CardinalitySketch& b);

  double estimate() const;

  // numStdDevs has to be 1, 2 or 3
  double lowerBound(uint8_t numStdDevs) const;
  double upperBound(uint8_t numStdDevs) const;

  bool isEmpty() const;
  bool isEstimationMode() const;
  double getTheta() const;

  uint64_t getTheta64() const {
    return this->theta;
  }

  uint32_t getNumRetained() const {
    return static_cast<uint32_t>(this->retained.size());
  }

  uint32_t getMaxK() const {
    return this->maxK;
  }

  CardinalityMode getMode() const {
    return this->mode;
  }

  uint64_t getSeed() const {
    return this->seed;
  }

  const std::vector<uint64_t>& getRetained() const {
    return this->retained;
  }

  std::string toString() const;

  bool operator==(const CardinalitySketch& rhs) const;

private:
  static void checkConfig(uint32_t maxK);
  void checkCompatible(const CardinalitySketch& other, const char* operation) const;
  double boundDistance(uint8_t numStdDevs) const;

  uint32_t maxK;
  CardinalityMode mode;
  uint64_t seed;
  uint64_t theta;
  std::vector<uint64_t> retained;
};

} // namespace streamsketch

#endif
