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

#ifndef _STREAMSKETCH_SKETCH_CODEC_H_
#define _STREAMSKETCH_SKETCH_CODEC_H_

#include <stdint.h>
#include <cstddef>
#include <vector>

#include "cardinality_sketch.hpp"
#include "frequency_sketch.hpp"
#include "quantile_sketch.hpp"
#include "sketch_errors.hpp"

namespace streamsketch {

enum class SketchKind : uint8_t {CARDINALITY = 1, QUANTILE = 2, FREQUENCY = 3};

const char* kindName(SketchKind kind);

typedef std::vector<uint8_t> Bytes;

/**
 * Every serialized sketch starts with this 8 byte header:
 *
 *   +-------+-------+-------+-------+-------+-------+-------+-------+
 *   |  'S'  |  'K'  | major | minor | kind  | flags |   reserved    |
 *   +-------+-------+-------+-------+-------+-------+-------+-------+
 *
 * followed by the configuration and the raw state of the sketch kind.
 * Multi-byte fields are little-endian.
 */
struct SketchHdr {
  char magic[2] = {'S','K'};
  uint8_t formatMajor;
  uint8_t formatMinor;
  uint8_t kind;
  uint8_t flags; // FLAG_EMPTY
  char padding[2] = {'\0','\0'}; // padding to reach 8 bytes in length
};

/**
 * Binary layout of the three sketch kinds.
 *
 * Payloads of another major version are rejected with UNSUPPORTED_FORMAT.
 * Payloads of a newer minor version are read as far as this version knows
 * the layout and any bytes past it are ignored. Truncated or inconsistent
 * payloads are rejected with MALFORMED.
 */
class SketchCodec {
public:
  static const uint8_t FORMAT_MAJOR = 1;
  static const uint8_t FORMAT_MINOR = 0;
  static const size_t HEADER_SIZE = 8;
  static const uint8_t FLAG_EMPTY = 0x01;

  static Bytes serialize(const CardinalitySketch& sketch);
  static Bytes serialize(const QuantileSketch& sketch);
  static Bytes serialize(const FrequencySketch& sketch);

  // Validates magic, version and kind tag
  static SketchHdr readHeader(const uint8_t* data, size_t length);

  static SketchKind peekKind(const uint8_t* data, size_t length);

  static CardinalitySketch deserializeCardinality(const uint8_t* data, size_t length);
  static QuantileSketch deserializeQuantile(const uint8_t* data, size_t length);
  static FrequencySketch deserializeFrequency(const uint8_t* data, size_t length);

  static CardinalitySketch deserializeCardinality(const Bytes& bytes) {
    return deserializeCardinality(bytes.data(), bytes.size());
  }

  static QuantileSketch deserializeQuantile(const Bytes& bytes) {
    return deserializeQuantile(bytes.data(), bytes.size());
  }

  static FrequencySketch deserializeFrequency(const Bytes& bytes) {
    return deserializeFrequency(bytes.data(), bytes.size());
  }
};

} // namespace streamsketch

#endif
