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

#include "change.h"
#include <gmock/gmock.h>
#include <chrono>
#include <sstream>

namespace traced_workspace {
namespace {

template <typename T>
std::string Print(T const& v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

TEST(ChangeKindTest, Print) {
  EXPECT_EQ(Print(ChangeKind::kPut), "Put");
  EXPECT_EQ(Print(ChangeKind::kPatch), "Patch");
  EXPECT_EQ(Print(ChangeKind::kDelete), "Delete");
}

TEST(TimestampTest, Print) {
  // 2024-03-01T10:00:00Z
  auto const tp = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(1709287200) +
          std::chrono::microseconds(123456)));
  auto const ts = Timestamp{tp, "4f2a"};
  EXPECT_EQ(ToString(ts), "2024-03-01T10:00:00.123456+00:00/4f2a");
  EXPECT_EQ(Print(ts), ToString(ts));
}

TEST(TimestampTest, Now) {
  auto const before = std::chrono::system_clock::now();
  auto const ts = Timestamp::Now("session-a");
  EXPECT_EQ(ts.source, "session-a");
  EXPECT_GE(ts.time, before);
  EXPECT_LE(ts.time, std::chrono::system_clock::now());
}

}  // namespace
}  // namespace traced_workspace
