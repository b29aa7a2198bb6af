// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TRACED_WORKSPACE_VALUE_H
#define TRACED_WORKSPACE_VALUE_H

#include "properties.h"
#include "google/cloud/status_or.h"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace traced_workspace {

inline auto constexpr kEncodingRaw = "application/octet-stream";
inline auto constexpr kEncodingString = "text/plain";
inline auto constexpr kEncodingProperties = "application/properties";
inline auto constexpr kEncodingJson = "application/json";
inline auto constexpr kEncodingInteger = "application/integer";
inline auto constexpr kEncodingFloat = "application/float";

// The value of a resource, tagged with the encoding of its payload.
class Value {
 public:
  enum class Kind {
    kRaw,
    kStringUtf8,
    kProperties,
    kJson,
    kInteger,
    kFloat,
    kCustom,
  };

  static Value Raw(std::string bytes);
  static Value StringUtf8(std::string s);
  static Value FromProperties(Properties const& p);
  static Value Json(std::string json);
  static Value Integer(std::int64_t v);
  static Value Float(double v);
  static Value Custom(std::string encoding, std::string bytes);

  // Rebuilds a value from the encoding descriptor and payload carried on
  // the wire. Unknown descriptors produce a `kCustom` value.
  static google::cloud::StatusOr<Value> Decode(std::string const& encoding,
                                               std::string payload);

  Kind kind() const { return kind_; }
  std::string const& encoding_descr() const { return encoding_; }
  std::string const& payload() const { return payload_; }

  // Only set for `kStringUtf8` values.
  std::optional<std::string> AsString() const;
  std::optional<std::int64_t> AsInteger() const;
  std::optional<double> AsFloat() const;
  std::optional<Properties> AsProperties() const;

  friend bool operator==(Value const& a, Value const& b) {
    return a.kind_ == b.kind_ && a.encoding_ == b.encoding_ &&
           a.payload_ == b.payload_;
  }
  friend bool operator!=(Value const& a, Value const& b) { return !(a == b); }

 private:
  Value(Kind k, std::string encoding, std::string payload)
      : kind_(k), encoding_(std::move(encoding)), payload_(std::move(payload)) {}

  Kind kind_;
  std::string encoding_;
  std::string payload_;
};

std::string ToString(Value::Kind kind);

// Prints the kind and a readable rendering of the payload, e.g.
// `StringUtf8("hello")` or `Raw(48 69 33)`.
std::ostream& operator<<(std::ostream& os, Value const& rhs);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_VALUE_H
