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
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace traced_workspace {

Timestamp Timestamp::Now(std::string source) {
  return Timestamp{std::chrono::system_clock::now(), std::move(source)};
}

std::string ToString(Timestamp const& ts) {
  return absl::FormatTime(absl::RFC3339_full, absl::FromChrono(ts.time),
                          absl::UTCTimeZone()) +
         "/" + ts.source;
}

std::ostream& operator<<(std::ostream& os, Timestamp const& rhs) {
  return os << ToString(rhs);
}

std::string ToString(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kPut:
      return "Put";
    case ChangeKind::kPatch:
      return "Patch";
    case ChangeKind::kDelete:
      return "Delete";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, ChangeKind rhs) {
  return os << ToString(rhs);
}

}  // namespace traced_workspace
