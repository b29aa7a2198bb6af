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

#ifndef TRACED_WORKSPACE_CHANGE_H
#define TRACED_WORKSPACE_CHANGE_H

#include "path.h"
#include "value.h"
#include <chrono>
#include <optional>
#include <ostream>
#include <string>

namespace traced_workspace {

// When, and by which session, a value was produced.
struct Timestamp {
  std::chrono::system_clock::time_point time;
  std::string source;

  static Timestamp Now(std::string source);
};

// RFC 3339 time followed by the source, e.g.
// `2024-03-01T10:00:00.123456789+00:00/4f2a...`.
std::string ToString(Timestamp const& ts);
std::ostream& operator<<(std::ostream& os, Timestamp const& rhs);

enum class ChangeKind { kPut, kPatch, kDelete };

std::string ToString(ChangeKind kind);
std::ostream& operator<<(std::ostream& os, ChangeKind rhs);

// A notification delivered to subscribers.
struct Change {
  Path path;
  ChangeKind kind;
  // Not set for deletions.
  std::optional<Value> value;
  Timestamp timestamp;
};

// A reply to a get.
struct Data {
  Path path;
  Value value;
  Timestamp timestamp;
};

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_CHANGE_H
