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

#include "sketch_codec.hpp"
#include "base_test.hpp"
#include "gtest/gtest.h"

#include <stdint.h>

using namespace std;
using namespace streamsketch;

namespace
{

class SketchCodecTest : public SketchBaseTest {
 protected:
  CardinalitySketch makeCardinality(uint32_t maxK, CardinalityMode mode, uint32_t count) {
    CardinalitySketch sketch(maxK, mode);
    for (const std::string& item : generateItems("item-", count)) {
      sketch.update(Item::fromBytes(item));
    }
    return sketch;
  }

  QuantileSketch makeQuantile(uint32_t count) {
    QuantileSketch sketch(32);
    for (double value : generatePermutation(count)) {
      sketch.update(value);
    }
    return sketch;
  }

  FrequencySketch makeFrequency(uint32_t count) {
    FrequencySketch sketch(8);
    for (uint32_t i = 0; i < count; ++i) {
      sketch.update("key-" + std::to_string(i % 13), i % 3 + 1);
    }
    return sketch;
  }

  // decodes with whichever typed decoder the header asks for
  void decode(const Bytes& bytes) {
    switch (SketchCodec::peekKind(bytes.data(), bytes.size())) {
      case SketchKind::CARDINALITY:
        SketchCodec::deserializeCardinality(bytes);
        break;
      case SketchKind::QUANTILE:
        SketchCodec::deserializeQuantile(bytes);
        break;
      case SketchKind::FREQUENCY:
        SketchCodec::deserializeFrequency(bytes);
        break;
    }
  }

  void expectDecodeError(const Bytes& bytes, DecodeError::Reason reason) {
    try {
      decode(bytes);
      FAIL() << "payload of " << bytes.size() << " bytes was accepted";
    } catch (DecodeError& e) {
      EXPECT_EQ(e.reason(), reason) << e.what();
    }
  }
};

TEST_F(SketchCodecTest, TestHeader)
{
  const Bytes bytes = SketchCodec::serialize(CardinalitySketch(16));
  ASSERT_EQ(bytes.size(), 33);
  EXPECT_EQ(bytes[0], 'S');
  EXPECT_EQ(bytes[1], 'K');
  EXPECT_EQ(bytes[2], SketchCodec::FORMAT_MAJOR);
  EXPECT_EQ(bytes[3], SketchCodec::FORMAT_MINOR);
  EXPECT_EQ(bytes[4], static_cast<uint8_t>(SketchKind::CARDINALITY));
  EXPECT_EQ(bytes[5], SketchCodec::FLAG_EMPTY);
  EXPECT_EQ(bytes[6], 0);
  EXPECT_EQ(bytes[7], 0);
  // maxK, little-endian
  EXPECT_EQ(bytes[8], 16);
  EXPECT_EQ(bytes[9], 0);

  EXPECT_EQ(SketchCodec::peekKind(bytes.data(), bytes.size()), SketchKind::CARDINALITY);
  EXPECT_EQ(SketchCodec::serialize(makeQuantile(10))[5], 0);
}

TEST_F(SketchCodecTest, TestCardinalityRoundTrip)
{
  for (CardinalityMode mode : {CardinalityMode::DENSE, CardinalityMode::PACKED}) {
    for (uint32_t count : {0, 10, 5000}) {
      CardinalitySketch sketch = makeCardinality(1024, mode, count);
      CardinalitySketch copy = SketchCodec::deserializeCardinality(SketchCodec::serialize(sketch));
      EXPECT_EQ(copy, sketch) << count;
      EXPECT_EQ(copy.estimate(), sketch.estimate());
    }
  }
}

TEST_F(SketchCodecTest, TestPackedIsSmaller)
{
  const Bytes dense = SketchCodec::serialize(makeCardinality(1024, CardinalityMode::DENSE, 5000));
  const Bytes packed = SketchCodec::serialize(makeCardinality(1024, CardinalityMode::PACKED, 5000));
  EXPECT_LT(packed.size(), dense.size());
  EXPECT_EQ(dense.size(), 33 + 1024 * 8);
}

TEST_F(SketchCodecTest, TestQuantileRoundTrip)
{
  for (uint32_t count : {0, 20, 10000}) {
    QuantileSketch sketch = makeQuantile(count);
    QuantileSketch copy = SketchCodec::deserializeQuantile(SketchCodec::serialize(sketch));
    EXPECT_EQ(copy, sketch) << count;
    if (count > 0) {
      EXPECT_EQ(copy.quantile(0.5), sketch.quantile(0.5));
      EXPECT_EQ(copy.getMinValue(), sketch.getMinValue());
    }
  }
}

TEST_F(SketchCodecTest, TestFrequencyRoundTrip)
{
  for (uint32_t count : {0, 5, 1000}) {
    FrequencySketch sketch = makeFrequency(count);
    const Bytes bytes = SketchCodec::serialize(sketch);
    FrequencySketch copy = SketchCodec::deserializeFrequency(bytes);
    EXPECT_EQ(copy, sketch) << count;
    // same state, same bytes
    EXPECT_EQ(SketchCodec::serialize(copy), bytes);
  }
}

TEST_F(SketchCodecTest, TestUnsupportedFormat)
{
  Bytes bytes = SketchCodec::serialize(makeCardinality(64, CardinalityMode::DENSE, 100));

  Bytes badMagic(bytes);
  badMagic[0] = 'H';
  expectDecodeError(badMagic, DecodeError::Reason::UNSUPPORTED_FORMAT);

  Bytes nextMajor(bytes);
  nextMajor[2] = SketchCodec::FORMAT_MAJOR + 1;
  expectDecodeError(nextMajor, DecodeError::Reason::UNSUPPORTED_FORMAT);

  Bytes unknownKind(bytes);
  unknownKind[4] = 9;
  expectDecodeError(unknownKind, DecodeError::Reason::UNSUPPORTED_FORMAT);

  expectDecodeError(Bytes{'X', 'Y', 'Z'}, DecodeError::Reason::UNSUPPORTED_FORMAT);
}

TEST_F(SketchCodecTest, TestTruncated)
{
  const std::vector<Bytes> payloads = {
    SketchCodec::serialize(makeCardinality(64, CardinalityMode::DENSE, 100)),
    SketchCodec::serialize(makeCardinality(64, CardinalityMode::PACKED, 100)),
    SketchCodec::serialize(makeQuantile(100)),
    SketchCodec::serialize(makeFrequency(100)),
  };
  for (const Bytes& bytes : payloads) {
    for (size_t length = 0; length < bytes.size(); ++length) {
      expectDecodeError(Bytes(bytes.begin(), bytes.begin() + length), DecodeError::Reason::MALFORMED);
    }
  }
}

TEST_F(SketchCodecTest, TestCorrupted)
{
  Bytes bytes = SketchCodec::serialize(makeCardinality(64, CardinalityMode::DENSE, 100));

  // empty flag on a sketch with content
  Bytes flagged(bytes);
  flagged[5] = SketchCodec::FLAG_EMPTY;
  expectDecodeError(flagged, DecodeError::Reason::MALFORMED);

  // first retained hash above all the others
  Bytes unsorted(bytes);
  for (size_t i = 33; i < 41; ++i) {
    unsorted[i] = 0xff;
  }
  expectDecodeError(unsorted, DecodeError::Reason::MALFORMED);

  // maxK no longer a power of two
  Bytes badConfig(bytes);
  badConfig[8] = 63;
  expectDecodeError(badConfig, DecodeError::Reason::MALFORMED);

  Bytes trailing(bytes);
  trailing.push_back(0);
  expectDecodeError(trailing, DecodeError::Reason::MALFORMED);

  // wrong kind for a typed decoder
  EXPECT_THROW(SketchCodec::deserializeQuantile(bytes), DecodeError);
}

TEST_F(SketchCodecTest, TestCorruptedTheta)
{
  Bytes bytes = SketchCodec::serialize(CardinalitySketch(16));
  // theta is the u64 at offset 21, after maxK, mode and seed
  for (size_t i = 21; i < 29; ++i) {
    bytes[i] = 0;
  }
  bytes[5] = 0;
  expectDecodeError(bytes, DecodeError::Reason::MALFORMED);

  // estimation mode without retained hashes is a legitimate state
  CardinalitySketch a(16);
  CardinalitySketch b(16);
  for (uint32_t i = 0; i < 1000; ++i) {
    a.update(Item::fromInteger(i));
    b.update(Item::fromInteger(i + 1000));
  }
  CardinalitySketch disjoint = CardinalitySketch::intersection(a, b);
  ASSERT_TRUE(disjoint.getRetained().empty());
  ASSERT_TRUE(disjoint.isEstimationMode());
  EXPECT_EQ(SketchCodec::deserializeCardinality(SketchCodec::serialize(disjoint)), disjoint);
}

TEST_F(SketchCodecTest, TestCorruptedFrequencyCounts)
{
  FrequencySketch sketch(4);
  sketch.update("a", 5);
  Bytes bytes = SketchCodec::serialize(sketch);
  EXPECT_EQ(SketchCodec::deserializeFrequency(bytes), sketch);

  // count of "a" is the u64 at offset 29, after capacity, total, entries, key length and key
  Bytes inflated(bytes);
  inflated[29] = 200;
  expectDecodeError(inflated, DecodeError::Reason::MALFORMED);
}

TEST_F(SketchCodecTest, TestNewerMinorVersion)
{
  QuantileSketch sketch = makeQuantile(1000);
  Bytes bytes = SketchCodec::serialize(sketch);
  bytes[3] = SketchCodec::FORMAT_MINOR + 1;
  // fields appended by a newer writer are skipped
  bytes.push_back(0xab);
  bytes.push_back(0xcd);
  EXPECT_EQ(SketchCodec::deserializeQuantile(bytes), sketch);
}

} // namespace
