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

#ifndef _STREAMSKETCH_FREQUENCY_SKETCH_H_
#define _STREAMSKETCH_FREQUENCY_SKETCH_H_

#include <stdint.h>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "sketch_errors.hpp"
#include "sketch_item.hpp"

namespace streamsketch {

struct FrequencyCounter {
  uint64_t count;
  // part of count that may come from other items
  uint64_t offset;

  bool operator==(const FrequencyCounter& rhs) const {
    return count == rhs.count && offset == rhs.offset;
  }
};

struct FrequentItem {
  std::string item;
  uint64_t estimate;
  uint64_t lowerBound;

  bool operator==(const FrequentItem& rhs) const {
    return item == rhs.item && estimate == rhs.estimate && lowerBound == rhs.lowerBound;
  }
};

/**
 * Heavy hitters with Space-Saving counters.
 *
 * At most `capacity` items are tracked. A new item arriving when all
 * counters are taken replaces the item with the smallest count and inherits
 * that count as its offset. For every tracked item:
 *
 *   count - offset <= true count <= count
 *   count - true count <= total weight / capacity
 */
class FrequencySketch {
public:
  static const uint32_t MAX_CAPACITY = 1 << 24;
  static const uint32_t DEFAULT_CAPACITY = 64;

  typedef absl::flat_hash_map<std::string, FrequencyCounter> Counters;

  explicit FrequencySketch(uint32_t capacity = DEFAULT_CAPACITY);

  /**
   * Rebuilds a sketch from previously extracted state. Throws ConfigError
   * when the capacity is invalid or the counters are inconsistent.
   */
  static FrequencySketch restore(uint32_t capacity, uint64_t totalWeight, Counters counters);

  void update(const Item& item, uint64_t weight = 1);
  void update(const std::string& item, uint64_t weight = 1);

  /**
   * Absorbs a sketch of the same capacity. Throws IncompatibleSketchError
   * otherwise, leaving this sketch untouched.
   */
  void merge(const FrequencySketch& other);

  // Stored count, 0 for untracked items
  uint64_t estimate(const std::string& item) const;
  uint64_t lowerBound(const std::string& item) const;
  uint64_t upperBound(const std::string& item) const;

  /**
   * Every tracked item whose estimate reaches thresholdFraction of the total
   * weight, by decreasing estimate.
   */
  std::vector<FrequentItem> frequentItems(double thresholdFraction) const;

  // The count largest tracked items, by decreasing estimate
  std::vector<FrequentItem> topK(size_t count) const;

  uint32_t getCapacity() const {
    return this->capacity;
  }

  uint64_t getTotalWeight() const {
    return this->totalWeight;
  }

  uint32_t getNumActiveItems() const {
    return static_cast<uint32_t>(this->counters.size());
  }

  bool isEmpty() const {
    return this->totalWeight == 0;
  }

  // Largest offset of any tracked item
  uint64_t getMaximumError() const;

  const Counters& getCounters() const {
    return this->counters;
  }

  std::string toString() const;

  bool operator==(const FrequencySketch& rhs) const;

private:
  static void checkConfig(uint32_t capacity);
  bool isFull() const;
  uint64_t minimumCount() const;
  Counters::iterator findMinimum();
  std::vector<FrequentItem> sortedItems() const;

  uint32_t capacity;
  uint64_t totalWeight;
  Counters counters;
};

} // namespace streamsketch

#endif
