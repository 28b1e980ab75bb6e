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

#ifndef _STREAMSKETCH_SKETCH_ERRORS_H_
#define _STREAMSKETCH_SKETCH_ERRORS_H_

#include <stdexcept>
#include <string>

namespace streamsketch {

/**
 * Root of every error raised by the sketch engine. Errors are raised at the
 * operation boundary (construction, merge, deserialization) and the sketch
 * involved is left as it was before the call.
 */
struct SketchError : public virtual std::runtime_error {
  SketchError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid construction or query parameters (capacity out of range, q > 1...)
struct ConfigError : public SketchError {
  ConfigError(const std::string& message) : std::runtime_error(message), SketchError(message) {}
};

// Merge or set operation between sketches of different kind or configuration
struct IncompatibleSketchError : public SketchError {
  IncompatibleSketchError(const std::string& message) : std::runtime_error(message), SketchError(message) {}
};

struct DecodeError : public SketchError {
  enum class Reason {UNSUPPORTED_FORMAT, MALFORMED};

  DecodeError(Reason reason, const std::string& message) :
    std::runtime_error(message), SketchError(message), decodeReason(reason) {}

  Reason reason() const {
    return decodeReason;
  }

private:
  Reason decodeReason;
};

} // namespace streamsketch

#endif
