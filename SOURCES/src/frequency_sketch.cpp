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
#include <sstream>
#include <utility>

#include "streamsketch/frequency_sketch.hpp"

namespace streamsketch {

const uint32_t FrequencySketch::MAX_CAPACITY;
const uint32_t FrequencySketch::DEFAULT_CAPACITY;

namespace {

// decreasing count, then increasing key so that results do not depend on map order
bool heavierThan(const FrequentItem& a, const FrequentItem& b) {
  if (a.estimate != b.estimate) {
    return a.estimate > b.estimate;
  }
  return a.item < b.item;
}

} // namespace

FrequencySketch::FrequencySketch(uint32_t capacity) : capacity(capacity), totalWeight(0) {
  checkConfig(capacity);
}

void FrequencySketch::checkConfig(uint32_t capacity) {
  if (capacity < 1 || capacity > MAX_CAPACITY) {
    throw ConfigError("capacity has to be between 1 and " + std::to_string(MAX_CAPACITY)
      + ", got " + std::to_string(capacity));
  }
}

FrequencySketch FrequencySketch::restore(uint32_t capacity, uint64_t totalWeight, Counters counters) {
  FrequencySketch sketch(capacity);
  if (counters.size() > capacity) {
    throw ConfigError("tracked " + std::to_string(counters.size()) + " items, more than capacity "
      + std::to_string(capacity));
  }
  // every unit of weight is counted by at most one guaranteed (count - offset) part
  uint64_t guaranteedWeight = 0;
  for (const auto& entry : counters) {
    if (entry.second.count == 0 || entry.second.offset > entry.second.count) {
      throw ConfigError("inconsistent counter for a tracked item");
    }
    if (entry.second.count > totalWeight) {
      throw ConfigError("count " + std::to_string(entry.second.count) + " of a tracked item exceeds total weight "
        + std::to_string(totalWeight));
    }
    guaranteedWeight += entry.second.count - entry.second.offset;
    if (guaranteedWeight > totalWeight) {
      throw ConfigError("guaranteed counts add up to more than total weight " + std::to_string(totalWeight));
    }
  }
  if (totalWeight == 0 && !counters.empty()) {
    throw ConfigError("tracked items in a sketch without weight");
  }
  sketch.totalWeight = totalWeight;
  sketch.counters = std::move(counters);
  return sketch;
}

bool FrequencySketch::isFull() const {
  return this->counters.size() >= this->capacity;
}

FrequencySketch::Counters::iterator FrequencySketch::findMinimum() {
  Counters::iterator minimum = this->counters.end();
  for (Counters::iterator it = this->counters.begin(); it != this->counters.end(); ++it) {
    if (minimum == this->counters.end()
        || it->second.count < minimum->second.count
        || (it->second.count == minimum->second.count && it->first < minimum->first)) {
      minimum = it;
    }
  }
  return minimum;
}

uint64_t FrequencySketch::minimumCount() const {
  uint64_t minimum = 0;
  bool first = true;
  for (const auto& entry : this->counters) {
    if (first || entry.second.count < minimum) {
      minimum = entry.second.count;
      first = false;
    }
  }
  return minimum;
}

void FrequencySketch::update(const Item& item, uint64_t weight) {
  update(item.toKey(), weight);
}

void FrequencySketch::update(const std::string& item, uint64_t weight) {
  if (weight == 0) {
    return;
  }
  this->totalWeight += weight;

  Counters::iterator it = this->counters.find(item);
  if (it != this->counters.end()) {
    it->second.count += weight;
    return;
  }
  if (!isFull()) {
    this->counters.emplace(item, FrequencyCounter{weight, 0});
    return;
  }

  Counters::iterator minimum = findMinimum();
  const uint64_t evictedCount = minimum->second.count;
  this->counters.erase(minimum);
  this->counters.emplace(item, FrequencyCounter{evictedCount + weight, evictedCount});
}

/**
 * An item tracked on one side only may still have occurred on the other
 * side up to that side's minimum count (if it was full), so that minimum is
 * added to both its count and its offset. Afterwards the `capacity` largest
 * counters survive.
 */
void FrequencySketch::merge(const FrequencySketch& other) {
  if (this->capacity != other.capacity) {
    throw IncompatibleSketchError("cannot merge frequency sketches with capacity "
      + std::to_string(this->capacity) + " and " + std::to_string(other.capacity));
  }

  const uint64_t thisMinimum = isFull() ? minimumCount() : 0;
  const uint64_t otherMinimum = other.isFull() ? other.minimumCount() : 0;

  Counters merged;
  merged.reserve(this->counters.size() + other.counters.size());
  for (const auto& entry : this->counters) {
    Counters::const_iterator found = other.counters.find(entry.first);
    if (found != other.counters.end()) {
      merged[entry.first] = FrequencyCounter{entry.second.count + found->second.count,
                                             entry.second.offset + found->second.offset};
    } else {
      merged[entry.first] = FrequencyCounter{entry.second.count + otherMinimum,
                                             entry.second.offset + otherMinimum};
    }
  }
  for (const auto& entry : other.counters) {
    if (this->counters.find(entry.first) == this->counters.end()) {
      merged[entry.first] = FrequencyCounter{entry.second.count + thisMinimum,
                                             entry.second.offset + thisMinimum};
    }
  }

  if (merged.size() > this->capacity) {
    std::vector<FrequentItem> ranked;
    ranked.reserve(merged.size());
    for (const auto& entry : merged) {
      ranked.push_back(FrequentItem{entry.first, entry.second.count, entry.second.count - entry.second.offset});
    }
    std::sort(ranked.begin(), ranked.end(), heavierThan);
    for (size_t i = this->capacity; i < ranked.size(); ++i) {
      merged.erase(ranked[i].item);
    }
  }

  this->totalWeight += other.totalWeight;
  this->counters.swap(merged);
}

uint64_t FrequencySketch::estimate(const std::string& item) const {
  Counters::const_iterator it = this->counters.find(item);
  return it == this->counters.end() ? 0 : it->second.count;
}

uint64_t FrequencySketch::lowerBound(const std::string& item) const {
  Counters::const_iterator it = this->counters.find(item);
  return it == this->counters.end() ? 0 : it->second.count - it->second.offset;
}

uint64_t FrequencySketch::upperBound(const std::string& item) const {
  Counters::const_iterator it = this->counters.find(item);
  if (it != this->counters.end()) {
    return it->second.count;
  }
  // an untracked item can not have been seen more often than the smallest counter
  return isFull() ? minimumCount() : 0;
}

uint64_t FrequencySketch::getMaximumError() const {
  uint64_t maximum = 0;
  for (const auto& entry : this->counters) {
    maximum = std::max(maximum, entry.second.offset);
  }
  return maximum;
}

std::vector<FrequentItem> FrequencySketch::sortedItems() const {
  std::vector<FrequentItem> items;
  items.reserve(this->counters.size());
  for (const auto& entry : this->counters) {
    items.push_back(FrequentItem{entry.first, entry.second.count, entry.second.count - entry.second.offset});
  }
  std::sort(items.begin(), items.end(), heavierThan);
  return items;
}

std::vector<FrequentItem> FrequencySketch::frequentItems(double thresholdFraction) const {
  if (std::isnan(thresholdFraction) || thresholdFraction < 0.0 || thresholdFraction > 1.0) {
    throw ConfigError("threshold fraction has to be in [0, 1]");
  }
  const double threshold = thresholdFraction * static_cast<double>(this->totalWeight);
  std::vector<FrequentItem> items = sortedItems();
  items.erase(std::remove_if(items.begin(), items.end(),
    [threshold](const FrequentItem& item) {
      return static_cast<double>(item.estimate) < threshold;
    }), items.end());
  return items;
}

std::vector<FrequentItem> FrequencySketch::topK(size_t count) const {
  std::vector<FrequentItem> items = sortedItems();
  if (items.size() > count) {
    items.resize(count);
  }
  return items;
}

std::string FrequencySketch::toString() const {
  std::ostringstream os;
  os << "### Frequency sketch summary:" << std::endl;
  os << "   capacity       : " << this->capacity << std::endl;
  os << "   total weight   : " << this->totalWeight << std::endl;
  os << "   active items   : " << this->counters.size() << std::endl;
  os << "   maximum error  : " << getMaximumError() << std::endl;
  os << "### End sketch summary" << std::endl;
  return os.str();
}

bool FrequencySketch::operator==(const FrequencySketch& rhs) const {
  return this->capacity == rhs.capacity && this->totalWeight == rhs.totalWeight
    && this->counters == rhs.counters;
}

} // namespace streamsketch
