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

#ifndef _STREAMSKETCH_SKETCH_H_
#define _STREAMSKETCH_SKETCH_H_

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include "cardinality_sketch.hpp"
#include "frequency_sketch.hpp"
#include "murmur_hash.hpp"
#include "quantile_sketch.hpp"
#include "sketch_codec.hpp"
#include "sketch_errors.hpp"
#include "sketch_item.hpp"

namespace streamsketch {

/**
 * Construction parameters of every sketch kind. Only the fields of the kind
 * being created are looked at.
 */
struct SketchConfig {
  // cardinality
  uint32_t maxK = CardinalitySketch::DEFAULT_MAX_K;
  CardinalityMode mode = CardinalityMode::DENSE;
  uint64_t seed = MURMURHASH_DEFAULT_SEED;
  // quantile
  uint16_t k = QuantileSketch::DEFAULT_K;
  uint64_t randomSeed = QuantileSketch::DEFAULT_RANDOM_SEED;
  // frequency
  uint32_t capacity = FrequencySketch::DEFAULT_CAPACITY;
};

enum class QueryType {ESTIMATE, LOWER_BOUND, UPPER_BOUND, RANK, QUANTILE, FREQUENCY, FREQUENT_ITEMS};

struct SketchQuery {
  QueryType type;
  double argument;
  std::string item;

  static SketchQuery estimate() {
    return SketchQuery{QueryType::ESTIMATE, 0.0, std::string()};
  }

  static SketchQuery lowerBound(uint8_t numStdDevs) {
    return SketchQuery{QueryType::LOWER_BOUND, static_cast<double>(numStdDevs), std::string()};
  }

  static SketchQuery upperBound(uint8_t numStdDevs) {
    return SketchQuery{QueryType::UPPER_BOUND, static_cast<double>(numStdDevs), std::string()};
  }

  static SketchQuery rank(double value) {
    return SketchQuery{QueryType::RANK, value, std::string()};
  }

  static SketchQuery quantile(double fraction) {
    return SketchQuery{QueryType::QUANTILE, fraction, std::string()};
  }

  static SketchQuery frequency(const std::string& item) {
    return SketchQuery{QueryType::FREQUENCY, 0.0, item};
  }

  static SketchQuery frequentItems(double thresholdFraction) {
    return SketchQuery{QueryType::FREQUENT_ITEMS, thresholdFraction, std::string()};
  }
};

// FREQUENT_ITEMS fills items, every other query fills value
struct QueryResult {
  double value;
  std::vector<FrequentItem> items;
};

/**
 * One sketch of any supported kind behind a single interface, so that
 * drivers can build, merge, query and ship sketches without branching on the
 * kind. The set of kinds is closed: every operation switches over SketchKind.
 *
 * Exactly one of the three kind-specific members is set, the one matching
 * getKind().
 */
class Sketch {
public:
  // ConfigError when the configuration is invalid for that kind
  static Sketch create(SketchKind kind, const SketchConfig& config = SketchConfig());

  explicit Sketch(const CardinalitySketch& sketch);
  explicit Sketch(const QuantileSketch& sketch);
  explicit Sketch(const FrequencySketch& sketch);

  Sketch(const Sketch& other);
  Sketch(Sketch&& other) = default;
  Sketch& operator=(const Sketch& other);
  Sketch& operator=(Sketch&& other) = default;

  SketchKind getKind() const {
    return this->kind;
  }

  /**
   * Cardinality sketches hash the item, frequency sketches count its key.
   * Quantile sketches take numeric items only and throw
   * IncompatibleSketchError for byte strings.
   */
  void update(const Item& item);

  /**
   * Throws IncompatibleSketchError when kinds or configurations differ; this
   * sketch is then left as it was.
   */
  void merge(const Sketch& other);

  // IncompatibleSketchError when the query does not apply to the kind
  QueryResult query(const SketchQuery& query) const;

  Bytes serialize() const;

  static Sketch deserialize(const uint8_t* data, size_t length);

  static Sketch deserialize(const Bytes& bytes) {
    return deserialize(bytes.data(), bytes.size());
  }

  bool isEmpty() const;

  std::string toString() const;

  const CardinalitySketch& asCardinality() const;
  const QuantileSketch& asQuantile() const;
  const FrequencySketch& asFrequency() const;

  bool operator==(const Sketch& rhs) const;

private:
  void checkKind(SketchKind expected, const char* what) const;

  SketchKind kind;
  std::unique_ptr<CardinalitySketch> cardinality;
  std::unique_ptr<QuantileSketch> quantile;
  std::unique_ptr<FrequencySketch> frequency;
};

} // namespace streamsketch

#endif
