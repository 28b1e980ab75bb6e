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

#ifndef _STREAMSKETCH_SKETCH_ITEM_H_
#define _STREAMSKETCH_SKETCH_ITEM_H_

#include <stdint.h>
#include <cstdio>
#include <string>

namespace streamsketch {

/**
 * A single stream element: an opaque byte string, a 64-bit integer or a
 * double. Items are only hashed (or, for frequency sketches, keyed) and are
 * never modified once built.
 */
class Item {
public:
  enum class Type {BYTES, INTEGER, DOUBLE};

  static Item fromBytes(const std::string& bytes) {
    Item item(Type::BYTES);
    item.bytes = bytes;
    return item;
  }

  static Item fromBytes(const char* data, size_t length) {
    return fromBytes(std::string(data, length));
  }

  static Item fromInteger(int64_t value) {
    Item item(Type::INTEGER);
    item.integer = value;
    return item;
  }

  static Item fromDouble(double value) {
    Item item(Type::DOUBLE);
    item.real = value;
    return item;
  }

  Type getType() const {
    return this->type;
  }

  bool isNumeric() const {
    return this->type != Type::BYTES;
  }

  const std::string& getBytes() const {
    return this->bytes;
  }

  int64_t getInteger() const {
    return this->integer;
  }

  double getDouble() const {
    return this->real;
  }

  // Numeric value of an INTEGER or DOUBLE item
  double asDouble() const {
    return this->type == Type::INTEGER ? static_cast<double>(this->integer) : this->real;
  }

  /**
   * Identity of the item as a byte string. Numeric items use their decimal
   * text form, so fromInteger(42), fromDouble(42.0) and fromBytes("42") are
   * one key in a frequency sketch. Cardinality sketches hash each type on its
   * own (see hashItem) and count those three as distinct items.
   */
  std::string toKey() const {
    switch (this->type) {
      case Type::BYTES:
        return this->bytes;
      case Type::INTEGER:
        return std::to_string(this->integer);
      case Type::DOUBLE: {
        char buffer[32];
        int written = std::snprintf(buffer, sizeof(buffer), "%.17g", this->real);
        return std::string(buffer, written > 0 ? static_cast<size_t>(written) : 0);
      }
    }
    return this->bytes;
  }

private:
  explicit Item(Type type) : type(type), integer(0), real(0.0) {}

  Type type;
  std::string bytes;
  int64_t integer;
  double real;
};

} // namespace streamsketch

#endif
