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

#include <cstring>
#include <string>
#include <utility>

#include "streamsketch/sketch_codec.hpp"

namespace streamsketch {

const uint8_t SketchCodec::FORMAT_MAJOR;
const uint8_t SketchCodec::FORMAT_MINOR;
const size_t SketchCodec::HEADER_SIZE;
const uint8_t SketchCodec::FLAG_EMPTY;

const char* kindName(SketchKind kind) {
  switch (kind) {
    case SketchKind::CARDINALITY:
      return "cardinality";
    case SketchKind::QUANTILE:
      return "quantile";
    case SketchKind::FREQUENCY:
      return "frequency";
  }
  return "unknown";
}

namespace {

static_assert(sizeof(SketchHdr) == SketchCodec::HEADER_SIZE, "SketchHdr has to be 8 bytes long");

DecodeError malformed(const std::string& message) {
  return DecodeError(DecodeError::Reason::MALFORMED, message);
}

DecodeError unsupported(const std::string& message) {
  return DecodeError(DecodeError::Reason::UNSUPPORTED_FORMAT, message);
}

class ByteWriter {
  Bytes& out;

public:
  explicit ByteWriter(Bytes& out) : out(out) {}

  void putU8(uint8_t value) {
    out.push_back(value);
  }

  void putU16(uint16_t value) {
    putLittleEndian(value, 2);
  }

  void putU32(uint32_t value) {
    putLittleEndian(value, 4);
  }

  void putU64(uint64_t value) {
    putLittleEndian(value, 8);
  }

  void putDouble(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    putU64(bits);
  }

  // LEB128: 7 bits per byte, high bit set on every byte but the last
  void putVarint(uint64_t value) {
    while (value >= 0x80) {
      out.push_back(static_cast<uint8_t>(value | 0x80));
      value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
  }

  void putBytes(const std::string& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
  }

  void putHeader(SketchKind kind, bool empty) {
    SketchHdr hdr;
    hdr.formatMajor = SketchCodec::FORMAT_MAJOR;
    hdr.formatMinor = SketchCodec::FORMAT_MINOR;
    hdr.kind = static_cast<uint8_t>(kind);
    hdr.flags = empty ? SketchCodec::FLAG_EMPTY : 0;
    putU8(hdr.magic[0]);
    putU8(hdr.magic[1]);
    putU8(hdr.formatMajor);
    putU8(hdr.formatMinor);
    putU8(hdr.kind);
    putU8(hdr.flags);
    putU8(hdr.padding[0]);
    putU8(hdr.padding[1]);
  }

private:
  void putLittleEndian(uint64_t value, int width) {
    for (int i = 0; i < width; ++i) {
      out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
  }
};

class ByteReader {
  const uint8_t* data;
  size_t length;
  size_t position;

public:
  ByteReader(const uint8_t* data, size_t length) : data(data), length(length), position(0) {}

  size_t remaining() const {
    return length - position;
  }

  void need(size_t bytes, const char* what) const {
    if (remaining() < bytes) {
      throw malformed(std::string("payload is not big enough for ") + what + " ["
        + std::to_string(remaining()) + " - " + std::to_string(bytes) + "]");
    }
  }

  void skip(size_t bytes) {
    need(bytes, "header");
    position += bytes;
  }

  uint8_t getU8(const char* what) {
    need(1, what);
    return data[position++];
  }

  uint16_t getU16(const char* what) {
    return static_cast<uint16_t>(getLittleEndian(2, what));
  }

  uint32_t getU32(const char* what) {
    return static_cast<uint32_t>(getLittleEndian(4, what));
  }

  uint64_t getU64(const char* what) {
    return getLittleEndian(8, what);
  }

  double getDouble(const char* what) {
    uint64_t bits = getU64(what);
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  uint64_t getVarint(const char* what) {
    uint64_t value = 0;
    for (int shift = 0; shift < 64; shift += 7) {
      uint8_t byte = getU8(what);
      // the tenth byte may only carry the last bit
      if (shift == 63 && byte > 1) {
        throw malformed(std::string("varint overflow in ") + what);
      }
      value |= static_cast<uint64_t>(byte & 0x7f) << shift;
      if ((byte & 0x80) == 0) {
        return value;
      }
    }
    throw malformed(std::string("varint overflow in ") + what);
  }

  std::string getBytes(size_t count, const char* what) {
    need(count, what);
    std::string bytes(reinterpret_cast<const char*>(data + position), count);
    position += count;
    return bytes;
  }

private:
  uint64_t getLittleEndian(int width, const char* what) {
    need(width, what);
    uint64_t value = 0;
    for (int i = width - 1; i >= 0; --i) {
      value = (value << 8) | data[position + i];
    }
    position += width;
    return value;
  }
};

/**
 * Reads past the header of a payload of the expected kind.
 * Returns the header so the caller can check trailing bytes against the minor version.
 */
SketchHdr openPayload(ByteReader& reader, const uint8_t* data, size_t length, SketchKind expected) {
  SketchHdr hdr = SketchCodec::readHeader(data, length);
  if (hdr.kind != static_cast<uint8_t>(expected)) {
    throw malformed(std::string("payload holds a ") + kindName(static_cast<SketchKind>(hdr.kind))
      + " sketch, expected a " + kindName(expected) + " sketch");
  }
  reader.skip(SketchCodec::HEADER_SIZE);
  return hdr;
}

void closePayload(const ByteReader& reader, const SketchHdr& hdr, bool empty) {
  if (reader.remaining() != 0 && hdr.formatMinor <= SketchCodec::FORMAT_MINOR) {
    throw malformed(std::to_string(reader.remaining()) + " unexpected trailing bytes");
  }
  if (((hdr.flags & SketchCodec::FLAG_EMPTY) != 0) != empty) {
    throw malformed("empty flag does not match the sketch state");
  }
}

} // namespace

SketchHdr SketchCodec::readHeader(const uint8_t* data, size_t length) {
  if (length < HEADER_SIZE) {
    // too short to even tell the format apart
    if (length >= 2 && (data[0] != 'S' || data[1] != 'K')) {
      throw unsupported("unknown magic bytes");
    }
    throw malformed("payload is not big enough to contain header");
  }
  SketchHdr hdr;
  hdr.magic[0] = static_cast<char>(data[0]);
  hdr.magic[1] = static_cast<char>(data[1]);
  hdr.formatMajor = data[2];
  hdr.formatMinor = data[3];
  hdr.kind = data[4];
  hdr.flags = data[5];
  hdr.padding[0] = static_cast<char>(data[6]);
  hdr.padding[1] = static_cast<char>(data[7]);

  if (hdr.magic[0] != 'S' || hdr.magic[1] != 'K') {
    throw unsupported("unknown magic bytes");
  }
  if (hdr.formatMajor != FORMAT_MAJOR) {
    throw unsupported("unsupported format version " + std::to_string(hdr.formatMajor) + "."
      + std::to_string(hdr.formatMinor) + ", expected major version " + std::to_string(FORMAT_MAJOR));
  }
  if (hdr.kind < static_cast<uint8_t>(SketchKind::CARDINALITY) || hdr.kind > static_cast<uint8_t>(SketchKind::FREQUENCY)) {
    throw unsupported("unknown sketch kind tag " + std::to_string(hdr.kind));
  }
  return hdr;
}

SketchKind SketchCodec::peekKind(const uint8_t* data, size_t length) {
  return static_cast<SketchKind>(readHeader(data, length).kind);
}

/**
 * Cardinality:
 *   u32 maxK | u8 mode | u64 seed | u64 theta | u32 count | hashes
 *
 * DENSE hashes are u64 each. PACKED hashes are the varint coded differences
 * between consecutive hashes, the first one taken from 0.
 */
Bytes SketchCodec::serialize(const CardinalitySketch& sketch) {
  Bytes out;
  const std::vector<uint64_t>& retained = sketch.getRetained();
  out.reserve(HEADER_SIZE + 25 + retained.size() * 8);
  ByteWriter writer(out);
  writer.putHeader(SketchKind::CARDINALITY, sketch.isEmpty());
  writer.putU32(sketch.getMaxK());
  writer.putU8(static_cast<uint8_t>(sketch.getMode()));
  writer.putU64(sketch.getSeed());
  writer.putU64(sketch.getTheta64());
  writer.putU32(sketch.getNumRetained());

  if (sketch.getMode() == CardinalityMode::PACKED) {
    uint64_t previous = 0;
    for (uint64_t hashValue : retained) {
      writer.putVarint(hashValue - previous);
      previous = hashValue;
    }
  } else {
    for (uint64_t hashValue : retained) {
      writer.putU64(hashValue);
    }
  }
  return out;
}

CardinalitySketch SketchCodec::deserializeCardinality(const uint8_t* data, size_t length) {
  ByteReader reader(data, length);
  SketchHdr hdr = openPayload(reader, data, length, SketchKind::CARDINALITY);

  const uint32_t maxK = reader.getU32("maxK");
  const uint8_t modeCode = reader.getU8("mode");
  if (modeCode > static_cast<uint8_t>(CardinalityMode::PACKED)) {
    throw malformed("unknown cardinality mode " + std::to_string(modeCode));
  }
  const CardinalityMode mode = static_cast<CardinalityMode>(modeCode);
  const uint64_t seed = reader.getU64("seed");
  const uint64_t theta = reader.getU64("theta");
  const uint32_t count = reader.getU32("retained count");
  if (count > maxK) {
    throw malformed("retained count " + std::to_string(count) + " exceeds maxK " + std::to_string(maxK));
  }
  // every hash takes at least one byte, even packed
  reader.need(mode == CardinalityMode::DENSE ? static_cast<size_t>(count) * 8 : count, "retained hashes");

  std::vector<uint64_t> retained;
  retained.reserve(count);
  uint64_t previous = 0;
  for (uint32_t i = 0; i < count; ++i) {
    if (mode == CardinalityMode::PACKED) {
      const uint64_t delta = reader.getVarint("retained hashes");
      if (delta > UINT64_MAX - previous) {
        throw malformed("retained hash overflows");
      }
      previous += delta;
      retained.push_back(previous);
    } else {
      retained.push_back(reader.getU64("retained hashes"));
    }
  }

  try {
    CardinalitySketch sketch = CardinalitySketch::restore(maxK, mode, seed, theta, std::move(retained));
    closePayload(reader, hdr, sketch.isEmpty());
    return sketch;
  } catch (ConfigError& e) {
    throw malformed(std::string("invalid cardinality sketch: ") + e.what());
  }
}

/**
 * Quantile:
 *   u16 k | u64 n | f64 min | f64 max | u8 levels | per level: u32 size, f64 items
 */
Bytes SketchCodec::serialize(const QuantileSketch& sketch) {
  Bytes out;
  out.reserve(HEADER_SIZE + 27 + sketch.getNumLevels() * 4 + sketch.getNumRetained() * 8);
  ByteWriter writer(out);
  writer.putHeader(SketchKind::QUANTILE, sketch.isEmpty());
  writer.putU16(sketch.getK());
  writer.putU64(sketch.getN());
  writer.putDouble(sketch.getMinValue());
  writer.putDouble(sketch.getMaxValue());
  writer.putU8(sketch.getNumLevels());
  for (const std::vector<double>& level : sketch.getLevels()) {
    writer.putU32(static_cast<uint32_t>(level.size()));
    for (double value : level) {
      writer.putDouble(value);
    }
  }
  return out;
}

QuantileSketch SketchCodec::deserializeQuantile(const uint8_t* data, size_t length) {
  ByteReader reader(data, length);
  SketchHdr hdr = openPayload(reader, data, length, SketchKind::QUANTILE);

  const uint16_t k = reader.getU16("k");
  const uint64_t n = reader.getU64("n");
  const double minValue = reader.getDouble("minimum");
  const double maxValue = reader.getDouble("maximum");
  const uint8_t numLevels = reader.getU8("number of levels");
  if (numLevels == 0 || numLevels > QuantileSketch::MAX_LEVELS) {
    throw malformed("invalid number of levels " + std::to_string(numLevels));
  }

  std::vector<std::vector<double>> levels(numLevels);
  for (uint8_t level = 0; level < numLevels; ++level) {
    const uint32_t size = reader.getU32("level size");
    if (size > k) {
      throw malformed("level " + std::to_string(level) + " holds " + std::to_string(size)
        + " items, more than k " + std::to_string(k));
    }
    reader.need(static_cast<size_t>(size) * 8, "level items");
    levels[level].reserve(size);
    for (uint32_t i = 0; i < size; ++i) {
      levels[level].push_back(reader.getDouble("level items"));
    }
  }

  try {
    QuantileSketch sketch = QuantileSketch::restore(k, n, minValue, maxValue, std::move(levels));
    closePayload(reader, hdr, sketch.isEmpty());
    return sketch;
  } catch (ConfigError& e) {
    throw malformed(std::string("invalid quantile sketch: ") + e.what());
  }
}

/**
 * Frequency:
 *   u32 capacity | u64 total weight | u32 entries |
 *   per entry: u32 key length, key bytes, u64 count, u64 offset
 *
 * Entries are written by decreasing count so equal sketches serialize to
 * equal bytes.
 */
Bytes SketchCodec::serialize(const FrequencySketch& sketch) {
  Bytes out;
  ByteWriter writer(out);
  writer.putHeader(SketchKind::FREQUENCY, sketch.isEmpty());
  writer.putU32(sketch.getCapacity());
  writer.putU64(sketch.getTotalWeight());
  writer.putU32(sketch.getNumActiveItems());
  for (const FrequentItem& entry : sketch.topK(sketch.getNumActiveItems())) {
    writer.putU32(static_cast<uint32_t>(entry.item.size()));
    writer.putBytes(entry.item);
    writer.putU64(entry.estimate);
    writer.putU64(entry.estimate - entry.lowerBound);
  }
  return out;
}

FrequencySketch SketchCodec::deserializeFrequency(const uint8_t* data, size_t length) {
  ByteReader reader(data, length);
  SketchHdr hdr = openPayload(reader, data, length, SketchKind::FREQUENCY);

  const uint32_t capacity = reader.getU32("capacity");
  const uint64_t totalWeight = reader.getU64("total weight");
  const uint32_t entries = reader.getU32("number of entries");
  if (entries > capacity) {
    throw malformed("entry count " + std::to_string(entries) + " exceeds capacity " + std::to_string(capacity));
  }
  // smallest possible entry: empty key, count and offset
  reader.need(static_cast<size_t>(entries) * 20, "entries");

  FrequencySketch::Counters counters;
  counters.reserve(entries);
  for (uint32_t i = 0; i < entries; ++i) {
    const uint32_t keyLength = reader.getU32("key length");
    std::string key = reader.getBytes(keyLength, "key");
    const uint64_t count = reader.getU64("count");
    const uint64_t offset = reader.getU64("offset");
    if (!counters.emplace(std::move(key), FrequencyCounter{count, offset}).second) {
      throw malformed("duplicated key in frequency sketch");
    }
  }

  try {
    FrequencySketch sketch = FrequencySketch::restore(capacity, totalWeight, std::move(counters));
    closePayload(reader, hdr, sketch.isEmpty());
    return sketch;
  } catch (ConfigError& e) {
    throw malformed(std::string("invalid frequency sketch: ") + e.what());
  }
}

} // namespace streamsketch
