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

#include "murmur_hash.hpp"
#include "gtest/gtest.h"

#include <stdint.h>
#include <limits>
#include <string>

using namespace streamsketch;

namespace
{

TEST(MurMurHashTest, TestReferenceVectors)
{
  MurMurHash<std::string> hash;
  // first half of the published MurmurHash3_x64_128 digests
  EXPECT_EQ(hash("hello", 0), 0xcbd8a7b341bd9b02ULL);
  EXPECT_EQ(hash("The quick brown fox jumps over the lazy dog", 0), 0xe34bbc7bbc071b6cULL);
  EXPECT_EQ(hash("", 0), 0ULL);
}

TEST(MurMurHashTest, TestDefaultSeed)
{
  MurMurHash<std::string> hash;
  EXPECT_EQ(hash(""), 0x1e70a32266491bb9ULL);
  EXPECT_EQ(hash("a"), 0xf6020f0aa43b822fULL);
  EXPECT_EQ(hash("item-0"), 0xe20c82170223515dULL);
  // exactly one block, then one block and a one byte tail
  EXPECT_EQ(hash("0123456789abcdef"), 0x257b60668d289420ULL);
  EXPECT_EQ(hash("abcdefghijklmnopq"), 0xd1f5ddef6987cc0cULL);
}

TEST(MurMurHashTest, TestIntegers)
{
  MurMurHash<uint64_t> hash;
  EXPECT_EQ(hash(42), 0x27e1ebf3d3bf87d2ULL);
  EXPECT_EQ(hash(0), 0x530bc77e2ff69268ULL);
  EXPECT_EQ(MurMurHash<int64_t>()(-1), 0xd2cb52ec30edb002ULL);
  EXPECT_NE(hash(42), hash(42, 1));
}

TEST(MurMurHashTest, TestDoubles)
{
  MurMurHash<double> hash;
  EXPECT_EQ(hash(1.5), 0x339467c3320a0db3ULL);
  EXPECT_EQ(hash(0.0), hash(-0.0));
  EXPECT_EQ(hash(std::numeric_limits<double>::quiet_NaN()), hash(-std::numeric_limits<double>::quiet_NaN()));
  EXPECT_NE(hash(1.0), hash(2.0));
}

TEST(MurMurHashTest, TestHashItem)
{
  EXPECT_EQ(hashItem(Item::fromBytes("a")), MurMurHash<std::string>()("a"));
  EXPECT_EQ(hashItem(Item::fromInteger(42)), MurMurHash<uint64_t>()(42));
  EXPECT_EQ(hashItem(Item::fromDouble(1.5), 7), MurMurHash<double>()(1.5, 7));
  // embedded zero bytes are part of the item
  EXPECT_NE(hashItem(Item::fromBytes(std::string("a\0b", 3))), hashItem(Item::fromBytes("a")));
}

} // namespace
