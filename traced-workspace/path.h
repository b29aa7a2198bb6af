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

#ifndef TRACED_WORKSPACE_PATH_H
#define TRACED_WORKSPACE_PATH_H

#include "properties.h"
#include "google/cloud/status_or.h"
#include <ostream>
#include <string>
#include <vector>

namespace traced_workspace {

// The name of a single resource, e.g. `/demo/example/sensor`.
//
// A path is a sequence of `/`-separated chunks. It cannot contain wildcards,
// nor the `?` and `#` characters reserved by selectors. Relative paths (not
// starting with `/`) are only meaningful under a workspace prefix.
class Path {
 public:
  static google::cloud::StatusOr<Path> Parse(std::string path);

  bool IsRelative() const { return path_.empty() || path_.front() != '/'; }
  std::string const& str() const { return path_; }

  // Returns `prefix/this`, or a copy of this path if it is absolute.
  Path WithPrefix(Path const& prefix) const;

  friend bool operator==(Path const& a, Path const& b) {
    return a.path_ == b.path_;
  }
  friend bool operator!=(Path const& a, Path const& b) { return !(a == b); }

 private:
  explicit Path(std::string p) : path_(std::move(p)) {}

  std::string path_;
};

std::ostream& operator<<(std::ostream& os, Path const& rhs);

// A path where chunks may be `*` globs or the `**` multi-chunk wildcard.
class PathExpr {
 public:
  static google::cloud::StatusOr<PathExpr> Parse(std::string expr);
  // Every path is also a (trivial) path expression.
  explicit PathExpr(Path const& path);

  bool IsRelative() const { return expr_.empty() || expr_.front() != '/'; }
  std::string const& str() const { return expr_; }
  PathExpr WithPrefix(Path const& prefix) const;

  bool Matches(Path const& path) const;

  friend bool operator==(PathExpr const& a, PathExpr const& b) {
    return a.expr_ == b.expr_;
  }
  friend bool operator!=(PathExpr const& a, PathExpr const& b) {
    return !(a == b);
  }

 private:
  PathExpr(std::string e, std::vector<std::string> chunks)
      : expr_(std::move(e)), chunks_(std::move(chunks)) {}

  std::string expr_;
  std::vector<std::string> chunks_;
};

std::ostream& operator<<(std::ostream& os, PathExpr const& rhs);

// `path_expr[?predicate][(properties)][#fragment]`
class Selector {
 public:
  static google::cloud::StatusOr<Selector> Parse(std::string const& selector);
  explicit Selector(PathExpr expr) : path_expr_(std::move(expr)) {}

  PathExpr const& path_expr() const { return path_expr_; }
  std::string const& predicate() const { return predicate_; }
  Properties const& properties() const { return properties_; }
  std::string const& fragment() const { return fragment_; }

  Selector WithPrefix(Path const& prefix) const;
  std::string ToString() const;

 private:
  PathExpr path_expr_;
  std::string predicate_;
  Properties properties_;
  std::string fragment_;
};

std::ostream& operator<<(std::ostream& os, Selector const& rhs);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_PATH_H
