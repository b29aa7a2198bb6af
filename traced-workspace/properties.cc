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

#include "properties.h"
#include <fmt/format.h>
#include <cctype>
#include <fstream>
#include <sstream>

namespace traced_workspace {

namespace gc = ::google::cloud;

namespace {

std::string Trim(std::string const& s) {
  auto b = s.begin();
  auto e = s.end();
  while (b != e && std::isspace(static_cast<unsigned char>(*b))) ++b;
  while (e != b && std::isspace(static_cast<unsigned char>(*(e - 1)))) --e;
  return std::string(b, e);
}

void ParseEntry(Properties& result, std::string const& entry) {
  auto const trimmed = Trim(entry);
  if (trimmed.empty() || trimmed.front() == '#') return;
  auto const eq = trimmed.find('=');
  if (eq == std::string::npos) {
    result.Set(trimmed, std::string{});
    return;
  }
  auto key = Trim(trimmed.substr(0, eq));
  if (key.empty()) return;
  result.Set(std::move(key), Trim(trimmed.substr(eq + 1)));
}

}  // namespace

Properties Properties::Parse(std::string const& text) {
  Properties result;
  std::string entry;
  for (auto c : text) {
    if (c == ';' || c == '\n' || c == '\r') {
      ParseEntry(result, entry);
      entry.clear();
      continue;
    }
    entry.push_back(c);
  }
  ParseEntry(result, entry);
  return result;
}

gc::StatusOr<Properties> Properties::FromFile(std::string const& path) {
  std::ifstream is(path);
  if (!is) {
    return gc::Status(gc::StatusCode::kNotFound,
                      fmt::format("cannot read configuration file <{}>", path));
  }
  std::ostringstream contents;
  contents << is.rdbuf();
  return Parse(contents.str());
}

void Properties::Set(std::string key, std::string value) {
  entries_[std::move(key)] = std::move(value);
}

std::optional<std::string> Properties::Get(std::string const& key) const {
  auto i = entries_.find(key);
  if (i == entries_.end()) return std::nullopt;
  return i->second;
}

std::string Properties::GetOr(std::string const& key,
                              std::string fallback) const {
  auto i = entries_.find(key);
  if (i == entries_.end()) return fallback;
  return i->second;
}

std::string Properties::ToString() const {
  std::string result;
  char const* sep = "";
  for (auto const& [key, value] : entries_) {
    result += sep;
    result += key;
    result += '=';
    result += value;
    sep = ";";
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, Properties const& rhs) {
  return os << rhs.ToString();
}

}  // namespace traced_workspace
