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

#ifndef _STREAMSKETCH_MURMUR_HASH_H_
#define _STREAMSKETCH_MURMUR_HASH_H_

#include <stdint.h>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

#include "sketch_item.hpp"

namespace streamsketch {

static const uint64_t MURMURHASH_DEFAULT_SEED = 9001;

template <typename T>
class Hash {
  public:
    virtual ~Hash() {}
    virtual uint64_t operator()(T value, uint64_t seed = MURMURHASH_DEFAULT_SEED) const = 0;
};

template<typename T>
class MurMurHash : public Hash<T> {};

/**
 * 64-bit MurmurHash2 applied to a single 8-byte word.
 */
template<>
class MurMurHash<uint64_t> : public Hash<uint64_t>{
  public:
    uint64_t operator()(uint64_t value, uint64_t seed = MURMURHASH_DEFAULT_SEED) const override {
      const uint64_t m = 0xc6a4a7935bd1e995;
      const int r = 47;
      uint64_t h = seed ^ (sizeof(uint64_t) * m);
      uint64_t k = value;
      k *= m;
      k ^= k >> r;
      k *= m;
      h ^= k;
      h *= m;
      h *= m;
      h ^= h >> r;
      h *= m;
      h ^= h >> r;
      return h;
    }
};

template<>
class MurMurHash<int64_t> : public Hash<int64_t>{
  public:
    uint64_t operator()(int64_t value, uint64_t seed = MURMURHASH_DEFAULT_SEED) const override {
      return MurMurHash<uint64_t>()(static_cast<uint64_t>(value), seed);
    }
};

/**
 * Doubles are hashed through their bit pattern. -0.0 and 0.0 compare equal
 * and every NaN is the same item, so both are folded to a single pattern first.
 */
template<>
class MurMurHash<double> : public Hash<double>{
  public:
    uint64_t operator()(double value, uint64_t seed = MURMURHASH_DEFAULT_SEED) const override {
      if (value == 0.0) {
        value = 0.0;
      } else if (std::isnan(value)) {
        value = std::numeric_limits<double>::quiet_NaN();
      }
      uint64_t bits;
      std::memcpy(&bits, &value, sizeof(bits));
      return MurMurHash<uint64_t>()(bits, seed);
    }
};

/**
 * MurmurHash3 x64/128 over an arbitrary byte string. Only the first 64-bit
 * half of the 128-bit result is kept.
 *
 * Blocks are assembled byte by byte in little-endian order so the value does
 * not depend on the host byte order or on the alignment of the input.
 */
template<>
class MurMurHash<std::string> : public Hash<std::string>{
  static uint64_t rotl64(uint64_t x, int8_t r) {
    return (x << r) | (x >> (64 - r));
  }

  static uint64_t fmix64(uint64_t k) {
    k ^= k >> 33;
    k *= 0xff51afd7ed558ccdULL;
    k ^= k >> 33;
    k *= 0xc4ceb9fe1a85ec53ULL;
    k ^= k >> 33;
    return k;
  }

  static uint64_t readBlock(const uint8_t* p) {
    uint64_t block = 0;
    for (int i = 7; i >= 0; --i) {
      block = (block << 8) | p[i];
    }
    return block;
  }

  public:
    uint64_t operator()(std::string value, uint64_t seed = MURMURHASH_DEFAULT_SEED) const override {
      return hashBytes(reinterpret_cast<const uint8_t*>(value.data()), value.size(), seed);
    }

    static uint64_t hashBytes(const uint8_t* data, size_t length, uint64_t seed = MURMURHASH_DEFAULT_SEED) {
      const size_t nblocks = length / 16;
      const uint64_t c1 = 0x87c37b91114253d5ULL;
      const uint64_t c2 = 0x4cf5ad432745937fULL;
      uint64_t h1 = seed;
      uint64_t h2 = seed;

      for (size_t i = 0; i < nblocks; ++i) {
        uint64_t k1 = readBlock(data + i * 16);
        uint64_t k2 = readBlock(data + i * 16 + 8);

        k1 *= c1; k1 = rotl64(k1, 31); k1 *= c2; h1 ^= k1;
        h1 = rotl64(h1, 27); h1 += h2; h1 = h1 * 5 + 0x52dce729;

        k2 *= c2; k2 = rotl64(k2, 33); k2 *= c1; h2 ^= k2;
        h2 = rotl64(h2, 31); h2 += h1; h2 = h2 * 5 + 0x38495ab5;
      }

      const uint8_t* tail = data + nblocks * 16;
      uint64_t k1 = 0;
      uint64_t k2 = 0;
      const size_t rest = length & 15;
      // bytes 8..14 of the tail feed k2, bytes 0..7 feed k1
      for (size_t i = rest; i > 8; --i) {
        k2 ^= static_cast<uint64_t>(tail[i - 1]) << ((i - 9) * 8);
      }
      if (rest > 8) {
        k2 *= c2; k2 = rotl64(k2, 33); k2 *= c1; h2 ^= k2;
      }
      for (size_t i = (rest > 8 ? 8 : rest); i > 0; --i) {
        k1 ^= static_cast<uint64_t>(tail[i - 1]) << ((i - 1) * 8);
      }
      if (rest > 0) {
        k1 *= c1; k1 = rotl64(k1, 31); k1 *= c2; h1 ^= k1;
      }

      h1 ^= static_cast<uint64_t>(length);
      h2 ^= static_cast<uint64_t>(length);
      h1 += h2;
      h2 += h1;
      h1 = fmix64(h1);
      h2 = fmix64(h2);
      h1 += h2;
      return h1;
    }
};

/**
 * Maps any item to its 64-bit hash. Every sketch that has to be merged with
 * another one must be fed through the same seed. Each item type has its own
 * hash, so the integer 42 and the bytes "42" hash differently.
 */
inline uint64_t hashItem(const Item& item, uint64_t seed = MURMURHASH_DEFAULT_SEED) {
  switch (item.getType()) {
    case Item::Type::INTEGER:
      return MurMurHash<int64_t>()(item.getInteger(), seed);
    case Item::Type::DOUBLE:
      return MurMurHash<double>()(item.getDouble(), seed);
    case Item::Type::BYTES:
      break;
  }
  const std::string& bytes = item.getBytes();
  return MurMurHash<std::string>::hashBytes(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), seed);
}

} // namespace streamsketch

#endif
