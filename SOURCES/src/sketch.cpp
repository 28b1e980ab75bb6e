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

#include <cmath>
#include <utility>

#include "streamsketch/sketch.hpp"

namespace streamsketch {

Sketch Sketch::create(SketchKind kind, const SketchConfig& config) {
  switch (kind) {
    case SketchKind::CARDINALITY:
      return Sketch(CardinalitySketch(config.maxK, config.mode, config.seed));
    case SketchKind::QUANTILE:
      return Sketch(QuantileSketch(config.k, config.randomSeed));
    case SketchKind::FREQUENCY:
      return Sketch(FrequencySketch(config.capacity));
  }
  throw ConfigError("unknown sketch kind " + std::to_string(static_cast<int>(kind)));
}

Sketch::Sketch(const CardinalitySketch& sketch) :
  kind(SketchKind::CARDINALITY), cardinality(new CardinalitySketch(sketch)) {}

Sketch::Sketch(const QuantileSketch& sketch) :
  kind(SketchKind::QUANTILE), quantile(new QuantileSketch(sketch)) {}

Sketch::Sketch(const FrequencySketch& sketch) :
  kind(SketchKind::FREQUENCY), frequency(new FrequencySketch(sketch)) {}

Sketch::Sketch(const Sketch& other) : kind(other.kind) {
  if (other.cardinality) {
    this->cardinality.reset(new CardinalitySketch(*other.cardinality));
  }
  if (other.quantile) {
    this->quantile.reset(new QuantileSketch(*other.quantile));
  }
  if (other.frequency) {
    this->frequency.reset(new FrequencySketch(*other.frequency));
  }
}

Sketch& Sketch::operator=(const Sketch& other) {
  Sketch tmp(other); //reuse copy constructor
  *this = std::move(tmp);
  return *this;
}

void Sketch::checkKind(SketchKind expected, const char* what) const {
  if (this->kind != expected) {
    throw IncompatibleSketchError(std::string(what) + " needs a " + kindName(expected)
      + " sketch, this is a " + kindName(this->kind) + " sketch");
  }
}

namespace {

// standard deviation counts travel as a double in SketchQuery
uint8_t numStdDevs(double argument) {
  if (!(argument >= 1.0 && argument <= 3.0) || std::floor(argument) != argument) {
    throw ConfigError("number of standard deviations has to be 1, 2 or 3, got " + std::to_string(argument));
  }
  return static_cast<uint8_t>(argument);
}

} // namespace

void Sketch::update(const Item& item) {
  switch (this->kind) {
    case SketchKind::CARDINALITY:
      this->cardinality->update(item);
      return;
    case SketchKind::QUANTILE:
      if (!item.isNumeric()) {
        throw IncompatibleSketchError("quantile sketches only take numeric items");
      }
      this->quantile->update(item.asDouble());
      return;
    case SketchKind::FREQUENCY:
      this->frequency->update(item);
      return;
  }
}

void Sketch::merge(const Sketch& other) {
  if (this->kind != other.kind) {
    throw IncompatibleSketchError(std::string("cannot merge a ") + kindName(other.kind)
      + " sketch into a " + kindName(this->kind) + " sketch");
  }
  switch (this->kind) {
    case SketchKind::CARDINALITY:
      this->cardinality->merge(*other.cardinality);
      return;
    case SketchKind::QUANTILE:
      this->quantile->merge(*other.quantile);
      return;
    case SketchKind::FREQUENCY:
      this->frequency->merge(*other.frequency);
      return;
  }
}

QueryResult Sketch::query(const SketchQuery& query) const {
  QueryResult result;
  result.value = 0.0;
  switch (query.type) {
    case QueryType::ESTIMATE:
      checkKind(SketchKind::CARDINALITY, "estimate query");
      result.value = this->cardinality->estimate();
      break;
    case QueryType::LOWER_BOUND:
      checkKind(SketchKind::CARDINALITY, "lower bound query");
      result.value = this->cardinality->lowerBound(numStdDevs(query.argument));
      break;
    case QueryType::UPPER_BOUND:
      checkKind(SketchKind::CARDINALITY, "upper bound query");
      result.value = this->cardinality->upperBound(numStdDevs(query.argument));
      break;
    case QueryType::RANK:
      checkKind(SketchKind::QUANTILE, "rank query");
      result.value = this->quantile->rank(query.argument);
      break;
    case QueryType::QUANTILE:
      checkKind(SketchKind::QUANTILE, "quantile query");
      result.value = this->quantile->quantile(query.argument);
      break;
    case QueryType::FREQUENCY:
      checkKind(SketchKind::FREQUENCY, "frequency query");
      result.value = static_cast<double>(this->frequency->estimate(query.item));
      break;
    case QueryType::FREQUENT_ITEMS:
      checkKind(SketchKind::FREQUENCY, "frequent items query");
      result.items = this->frequency->frequentItems(query.argument);
      result.value = static_cast<double>(result.items.size());
      break;
  }
  return result;
}

Bytes Sketch::serialize() const {
  switch (this->kind) {
    case SketchKind::CARDINALITY:
      return SketchCodec::serialize(*this->cardinality);
    case SketchKind::QUANTILE:
      return SketchCodec::serialize(*this->quantile);
    case SketchKind::FREQUENCY:
      return SketchCodec::serialize(*this->frequency);
  }
  return Bytes();
}

Sketch Sketch::deserialize(const uint8_t* data, size_t length) {
  switch (SketchCodec::peekKind(data, length)) {
    case SketchKind::CARDINALITY:
      return Sketch(SketchCodec::deserializeCardinality(data, length));
    case SketchKind::QUANTILE:
      return Sketch(SketchCodec::deserializeQuantile(data, length));
    case SketchKind::FREQUENCY:
      return Sketch(SketchCodec::deserializeFrequency(data, length));
  }
  throw DecodeError(DecodeError::Reason::UNSUPPORTED_FORMAT, "unknown sketch kind");
}

bool Sketch::isEmpty() const {
  switch (this->kind) {
    case SketchKind::CARDINALITY:
      return this->cardinality->isEmpty();
    case SketchKind::QUANTILE:
      return this->quantile->isEmpty();
    case SketchKind::FREQUENCY:
      return this->frequency->isEmpty();
  }
  return true;
}

std::string Sketch::toString() const {
  switch (this->kind) {
    case SketchKind::CARDINALITY:
      return this->cardinality->toString();
    case SketchKind::QUANTILE:
      return this->quantile->toString();
    case SketchKind::FREQUENCY:
      return this->frequency->toString();
  }
  return std::string();
}

const CardinalitySketch& Sketch::asCardinality() const {
  checkKind(SketchKind::CARDINALITY, "cardinality access");
  return *this->cardinality;
}

const QuantileSketch& Sketch::asQuantile() const {
  checkKind(SketchKind::QUANTILE, "quantile access");
  return *this->quantile;
}

const FrequencySketch& Sketch::asFrequency() const {
  checkKind(SketchKind::FREQUENCY, "frequency access");
  return *this->frequency;
}

bool Sketch::operator==(const Sketch& rhs) const {
  if (this->kind != rhs.kind) {
    return false;
  }
  switch (this->kind) {
    case SketchKind::CARDINALITY:
      return *this->cardinality == *rhs.cardinality;
    case SketchKind::QUANTILE:
      return *this->quantile == *rhs.quantile;
    case SketchKind::FREQUENCY:
      return *this->frequency == *rhs.frequency;
  }
  return false;
}

} // namespace streamsketch
