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

#include "value.h"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <iomanip>

namespace traced_workspace {

namespace gc = ::google::cloud;

namespace {

std::optional<std::int64_t> ParseInteger(std::string const& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  auto const v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
  return static_cast<std::int64_t>(v);
}

std::optional<double> ParseFloat(std::string const& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  auto const v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
  return v;
}

gc::Status DecodeError(std::string const& encoding, std::string const& payload) {
  return gc::Status(gc::StatusCode::kInvalidArgument,
                    fmt::format("payload <{}> is not valid for encoding {}",
                                payload, encoding));
}

}  // namespace

Value Value::Raw(std::string bytes) {
  return Value(Kind::kRaw, kEncodingRaw, std::move(bytes));
}

Value Value::StringUtf8(std::string s) {
  return Value(Kind::kStringUtf8, kEncodingString, std::move(s));
}

Value Value::FromProperties(Properties const& p) {
  return Value(Kind::kProperties, kEncodingProperties, p.ToString());
}

Value Value::Json(std::string json) {
  return Value(Kind::kJson, kEncodingJson, std::move(json));
}

Value Value::Integer(std::int64_t v) {
  return Value(Kind::kInteger, kEncodingInteger, std::to_string(v));
}

Value Value::Float(double v) {
  return Value(Kind::kFloat, kEncodingFloat, fmt::format("{}", v));
}

Value Value::Custom(std::string encoding, std::string bytes) {
  return Value(Kind::kCustom, std::move(encoding), std::move(bytes));
}

gc::StatusOr<Value> Value::Decode(std::string const& encoding,
                                  std::string payload) {
  if (encoding.empty() || encoding == kEncodingRaw) {
    return Raw(std::move(payload));
  }
  if (encoding == kEncodingString) return StringUtf8(std::move(payload));
  if (encoding == kEncodingProperties) {
    return Value(Kind::kProperties, kEncodingProperties, std::move(payload));
  }
  if (encoding == kEncodingJson) {
    if (!nlohmann::json::accept(payload)) return DecodeError(encoding, payload);
    return Json(std::move(payload));
  }
  if (encoding == kEncodingInteger) {
    if (!ParseInteger(payload)) return DecodeError(encoding, payload);
    return Value(Kind::kInteger, kEncodingInteger, std::move(payload));
  }
  if (encoding == kEncodingFloat) {
    if (!ParseFloat(payload)) return DecodeError(encoding, payload);
    return Value(Kind::kFloat, kEncodingFloat, std::move(payload));
  }
  return Custom(encoding, std::move(payload));
}

std::optional<std::string> Value::AsString() const {
  if (kind_ != Kind::kStringUtf8) return std::nullopt;
  return payload_;
}

std::optional<std::int64_t> Value::AsInteger() const {
  if (kind_ != Kind::kInteger) return std::nullopt;
  return ParseInteger(payload_);
}

std::optional<double> Value::AsFloat() const {
  if (kind_ != Kind::kFloat) return std::nullopt;
  return ParseFloat(payload_);
}

std::optional<Properties> Value::AsProperties() const {
  if (kind_ != Kind::kProperties) return std::nullopt;
  return Properties::Parse(payload_);
}

std::string ToString(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::kRaw:
      return "Raw";
    case Value::Kind::kStringUtf8:
      return "StringUtf8";
    case Value::Kind::kProperties:
      return "Properties";
    case Value::Kind::kJson:
      return "Json";
    case Value::Kind::kInteger:
      return "Integer";
    case Value::Kind::kFloat:
      return "Float";
    case Value::Kind::kCustom:
      return "Custom";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, Value const& rhs) {
  os << ToString(rhs.kind()) << "(";
  switch (rhs.kind()) {
    case Value::Kind::kStringUtf8:
    case Value::Kind::kJson:
      os << std::quoted(rhs.payload());
      break;
    case Value::Kind::kProperties:
    case Value::Kind::kInteger:
    case Value::Kind::kFloat:
      os << rhs.payload();
      break;
    case Value::Kind::kCustom:
      os << rhs.encoding_descr() << ", ";
      [[fallthrough]];
    case Value::Kind::kRaw: {
      char const* sep = "";
      for (auto c : rhs.payload()) {
        os << sep << fmt::format("{:02x}", static_cast<unsigned char>(c));
        sep = " ";
      }
      break;
    }
  }
  return os << ")";
}

}  // namespace traced_workspace
