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

#ifndef TRACED_WORKSPACE_PROPERTIES_H
#define TRACED_WORKSPACE_PROPERTIES_H

#include "google/cloud/status_or.h"
#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace traced_workspace {

// A flat `key=value` configuration map.
//
// The text form separates entries with `;` or newlines:
//
//   mode=client;peer=tcp/localhost:8085
//   # comments are allowed when reading from a file
//   topic=demo
class Properties {
 public:
  using value_type = std::map<std::string, std::string>::value_type;
  using const_iterator = std::map<std::string, std::string>::const_iterator;

  Properties() = default;

  static Properties Parse(std::string const& text);
  static google::cloud::StatusOr<Properties> FromFile(std::string const& path);

  void Set(std::string key, std::string value);
  std::optional<std::string> Get(std::string const& key) const;
  std::string GetOr(std::string const& key, std::string fallback) const;
  bool Contains(std::string const& key) const {
    return entries_.count(key) != 0;
  }
  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

  std::string ToString() const;

  friend bool operator==(Properties const& a, Properties const& b) {
    return a.entries_ == b.entries_;
  }
  friend bool operator!=(Properties const& a, Properties const& b) {
    return !(a == b);
  }

 private:
  std::map<std::string, std::string> entries_;
};

std::ostream& operator<<(std::ostream& os, Properties const& rhs);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_PROPERTIES_H
