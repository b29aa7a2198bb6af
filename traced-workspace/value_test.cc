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
#include <gmock/gmock.h>
#include <sstream>

namespace traced_workspace {
namespace {

namespace gc = ::google::cloud;
using ::testing::ElementsAre;
using ::testing::Pair;

std::string Print(Value const& v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

TEST(ValueTest, StringUtf8) {
  auto v = Value::StringUtf8("Put from C++!");
  EXPECT_EQ(v.kind(), Value::Kind::kStringUtf8);
  EXPECT_EQ(v.encoding_descr(), "text/plain");
  EXPECT_EQ(v.AsString(), std::optional<std::string>("Put from C++!"));
  EXPECT_FALSE(v.AsInteger().has_value());
  EXPECT_EQ(Print(v), R"(StringUtf8("Put from C++!"))");
}

TEST(ValueTest, Integer) {
  auto v = Value::Integer(-42);
  EXPECT_EQ(v.encoding_descr(), "application/integer");
  EXPECT_EQ(v.payload(), "-42");
  EXPECT_EQ(v.AsInteger(), std::optional<std::int64_t>(-42));
  EXPECT_FALSE(v.AsString().has_value());
  EXPECT_EQ(Print(v), "Integer(-42)");
}

TEST(ValueTest, Float) {
  auto v = Value::Float(2.5);
  EXPECT_EQ(v.encoding_descr(), "application/float");
  EXPECT_EQ(v.AsFloat(), std::optional<double>(2.5));
  EXPECT_EQ(Print(v), "Float(2.5)");
}

TEST(ValueTest, Properties) {
  auto v = Value::FromProperties(Properties::Parse("a=1;b=2"));
  EXPECT_EQ(v.encoding_descr(), "application/properties");
  auto p = v.AsProperties();
  ASSERT_TRUE(p.has_value());
  EXPECT_THAT(*p, ElementsAre(Pair("a", "1"), Pair("b", "2")));
  EXPECT_EQ(Print(v), "Properties(a=1;b=2)");
}

TEST(ValueTest, RawAndCustomPrintAsHex) {
  EXPECT_EQ(Print(Value::Raw("Hi3")), "Raw(48 69 33)");
  EXPECT_EQ(Print(Value::Custom("image/png", std::string("\x89P", 2))),
            "Custom(image/png, 89 50)");
}

TEST(ValueTest, Json) {
  auto v = Value::Json(R"({"a": 1})");
  EXPECT_EQ(v.encoding_descr(), "application/json");
  EXPECT_EQ(Print(v), R"(Json("{\"a\": 1}"))");
}

TEST(ValueTest, DecodeKnownEncodings) {
  auto s = Value::Decode("text/plain", "hello");
  ASSERT_TRUE(s.ok()) << s.status();
  EXPECT_EQ(*s, Value::StringUtf8("hello"));

  auto i = Value::Decode("application/integer", "7");
  ASSERT_TRUE(i.ok()) << i.status();
  EXPECT_EQ(i->AsInteger(), std::optional<std::int64_t>(7));

  auto f = Value::Decode("application/float", "0.25");
  ASSERT_TRUE(f.ok()) << f.status();
  EXPECT_EQ(f->AsFloat(), std::optional<double>(0.25));

  auto j = Value::Decode("application/json", R"([1, 2, 3])");
  ASSERT_TRUE(j.ok()) << j.status();
  EXPECT_EQ(j->kind(), Value::Kind::kJson);
}

TEST(ValueTest, DecodeEmptyEncodingIsRaw) {
  auto v = Value::Decode("", "bytes");
  ASSERT_TRUE(v.ok()) << v.status();
  EXPECT_EQ(v->kind(), Value::Kind::kRaw);
  EXPECT_EQ(v->encoding_descr(), "application/octet-stream");
}

TEST(ValueTest, DecodeUnknownEncodingIsCustom) {
  auto v = Value::Decode("application/x-sensor", "bytes");
  ASSERT_TRUE(v.ok()) << v.status();
  EXPECT_EQ(v->kind(), Value::Kind::kCustom);
  EXPECT_EQ(v->encoding_descr(), "application/x-sensor");
  EXPECT_EQ(v->payload(), "bytes");
}

TEST(ValueTest, DecodeInvalidPayloads) {
  for (auto const& p : std::vector<std::pair<std::string, std::string>>{
           {"application/integer", "12a"},
           {"application/integer", ""},
           {"application/float", "one"},
           {"application/json", "{not json"},
       }) {
    SCOPED_TRACE("Testing with " + p.first + " <" + p.second + ">");
    auto v = Value::Decode(p.first, p.second);
    ASSERT_FALSE(v.ok());
    EXPECT_EQ(v.status().code(), gc::StatusCode::kInvalidArgument);
  }
}

}  // namespace
}  // namespace traced_workspace
