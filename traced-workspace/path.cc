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

#include "path.h"
#include <fmt/format.h>
#include <algorithm>

namespace traced_workspace {

namespace gc = ::google::cloud;

namespace {

gc::Status InvalidArgument(std::string message) {
  return gc::Status(gc::StatusCode::kInvalidArgument, std::move(message));
}

// Splits `/a/b/c` (or `a/b/c`) into its chunks. The root path has none.
gc::StatusOr<std::vector<std::string>> SplitChunks(std::string const& s) {
  std::vector<std::string> chunks;
  if (s.empty()) return InvalidArgument("empty path");
  if (s == "/") return chunks;
  auto start = s.front() == '/' ? std::size_t{1} : std::size_t{0};
  while (true) {
    auto const end = s.find('/', start);
    auto chunk = s.substr(start, end == std::string::npos ? end : end - start);
    if (chunk.empty()) {
      return InvalidArgument(fmt::format("empty chunk in <{}>", s));
    }
    chunks.push_back(std::move(chunk));
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return chunks;
}

std::string Join(Path const& prefix, std::string const& relative) {
  auto const& p = prefix.str();
  if (!p.empty() && p.back() == '/') return p + relative;
  return p + "/" + relative;
}

// Glob match of a single chunk, where `*` matches any run of characters.
bool GlobMatch(std::string const& pattern, std::string const& text) {
  std::size_t p = 0;
  std::size_t t = 0;
  auto star = std::string::npos;
  std::size_t mark = 0;
  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      mark = t;
    } else if (p < pattern.size() && pattern[p] == text[t]) {
      ++p;
      ++t;
    } else if (star != std::string::npos) {
      p = star + 1;
      t = ++mark;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

bool MatchChunks(std::vector<std::string> const& expr, std::size_t i,
                 std::vector<std::string> const& path, std::size_t j) {
  if (i == expr.size()) return j == path.size();
  if (expr[i] == "**") {
    if (MatchChunks(expr, i + 1, path, j)) return true;
    return j < path.size() && MatchChunks(expr, i, path, j + 1);
  }
  if (j == path.size()) return false;
  return GlobMatch(expr[i], path[j]) && MatchChunks(expr, i + 1, path, j + 1);
}

}  // namespace

gc::StatusOr<Path> Path::Parse(std::string path) {
  if (path.find_first_of("*?#") != std::string::npos) {
    return InvalidArgument(
        fmt::format("<{}> is not a valid path, it contains '*', '?' or '#'",
                    path));
  }
  auto chunks = SplitChunks(path);
  if (!chunks) return std::move(chunks).status();
  return Path(std::move(path));
}

Path Path::WithPrefix(Path const& prefix) const {
  if (!IsRelative()) return *this;
  return Path(Join(prefix, path_));
}

std::ostream& operator<<(std::ostream& os, Path const& rhs) {
  return os << rhs.str();
}

gc::StatusOr<PathExpr> PathExpr::Parse(std::string expr) {
  if (expr.find_first_of("?#") != std::string::npos) {
    return InvalidArgument(fmt::format(
        "<{}> is not a valid path expression, it contains '?' or '#'", expr));
  }
  auto chunks = SplitChunks(expr);
  if (!chunks) return std::move(chunks).status();
  for (auto const& c : *chunks) {
    if (c.find("**") != std::string::npos && c != "**") {
      return InvalidArgument(fmt::format(
          "<{}> is not a valid path expression, '**' must be a whole chunk",
          expr));
    }
  }
  return PathExpr(std::move(expr), *std::move(chunks));
}

PathExpr::PathExpr(Path const& path)
    : expr_(path.str()), chunks_(SplitChunks(path.str()).value()) {}

PathExpr PathExpr::WithPrefix(Path const& prefix) const {
  if (!IsRelative()) return *this;
  auto joined = Join(prefix, expr_);
  auto chunks = SplitChunks(joined).value();
  return PathExpr(std::move(joined), std::move(chunks));
}

bool PathExpr::Matches(Path const& path) const {
  auto chunks = SplitChunks(path.str());
  if (!chunks) return false;
  return MatchChunks(chunks_, 0, *chunks, 0);
}

std::ostream& operator<<(std::ostream& os, PathExpr const& rhs) {
  return os << rhs.str();
}

gc::StatusOr<Selector> Selector::Parse(std::string const& selector) {
  auto const query = selector.find_first_of("?#");
  auto expr = PathExpr::Parse(selector.substr(0, query));
  if (!expr) return std::move(expr).status();
  Selector result(*std::move(expr));
  if (query == std::string::npos) return result;

  auto rest = selector.substr(query);
  if (rest.front() == '?') {
    rest = rest.substr(1);
    auto const open = rest.find('(');
    auto const hash = rest.find('#');
    if (open != std::string::npos && (hash == std::string::npos || open < hash)) {
      auto const close = rest.find(')', open);
      if (close == std::string::npos) {
        return InvalidArgument(
            fmt::format("<{}> has unbalanced properties", selector));
      }
      result.predicate_ = rest.substr(0, open);
      result.properties_ =
          Properties::Parse(rest.substr(open + 1, close - open - 1));
      rest = rest.substr(close + 1);
      if (!rest.empty() && rest.front() != '#') {
        return InvalidArgument(fmt::format(
            "<{}> has unexpected text after the properties", selector));
      }
    } else {
      result.predicate_ = rest.substr(0, hash);
      rest = hash == std::string::npos ? std::string{} : rest.substr(hash);
    }
  }
  if (!rest.empty()) result.fragment_ = rest.substr(1);
  return result;
}

Selector Selector::WithPrefix(Path const& prefix) const {
  auto result = *this;
  result.path_expr_ = path_expr_.WithPrefix(prefix);
  return result;
}

std::string Selector::ToString() const {
  auto result = path_expr_.str();
  if (!predicate_.empty() || !properties_.empty()) result += "?" + predicate_;
  if (!properties_.empty()) result += "(" + properties_.ToString() + ")";
  if (!fragment_.empty()) result += "#" + fragment_;
  return result;
}

std::ostream& operator<<(std::ostream& os, Selector const& rhs) {
  return os << rhs.ToString();
}

}  // namespace traced_workspace
