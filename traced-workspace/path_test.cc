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
#include <gmock/gmock.h>
#include <sstream>

namespace traced_workspace {
namespace {

namespace gc = ::google::cloud;
using ::testing::ElementsAre;
using ::testing::Pair;

PathExpr Expr(std::string const& s) { return PathExpr::Parse(s).value(); }
Path P(std::string const& s) { return Path::Parse(s).value(); }

TEST(PathTest, Parse) {
  auto p = Path::Parse("/demo/example/zenoh-cpp-put");
  ASSERT_TRUE(p.ok()) << p.status();
  EXPECT_EQ(p->str(), "/demo/example/zenoh-cpp-put");
  EXPECT_FALSE(p->IsRelative());

  auto relative = Path::Parse("example/eval");
  ASSERT_TRUE(relative.ok()) << relative.status();
  EXPECT_TRUE(relative->IsRelative());
}

TEST(PathTest, ParseInvalid) {
  for (auto const* s : {"", "/demo/*", "/demo/**", "/demo?x", "/demo#f",
                        "/demo//example", "/demo/"}) {
    SCOPED_TRACE("Testing with " + std::string(s));
    auto p = Path::Parse(s);
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.status().code(), gc::StatusCode::kInvalidArgument);
  }
}

TEST(PathTest, WithPrefix) {
  EXPECT_EQ(P("eval").WithPrefix(P("/demo/example")), P("/demo/example/eval"));
  EXPECT_EQ(P("eval").WithPrefix(P("/")), P("/eval"));
  EXPECT_EQ(P("/other").WithPrefix(P("/demo")), P("/other"));
}

TEST(PathExprTest, ParseInvalid) {
  for (auto const* s : {"", "/demo/a**", "/demo?x", "/demo//x"}) {
    SCOPED_TRACE("Testing with " + std::string(s));
    EXPECT_FALSE(PathExpr::Parse(s).ok());
  }
}

TEST(PathExprTest, MatchesExact) {
  auto e = Expr("/demo/example/eval");
  EXPECT_TRUE(e.Matches(P("/demo/example/eval")));
  EXPECT_FALSE(e.Matches(P("/demo/example")));
  EXPECT_FALSE(e.Matches(P("/demo/example/eval/more")));
  EXPECT_TRUE(PathExpr(P("/demo/example/eval")).Matches(P("/demo/example/eval")));
}

TEST(PathExprTest, MatchesSingleChunkWildcard) {
  auto e = Expr("/demo/*/eval");
  EXPECT_TRUE(e.Matches(P("/demo/example/eval")));
  EXPECT_FALSE(e.Matches(P("/demo/eval")));
  EXPECT_FALSE(e.Matches(P("/demo/a/b/eval")));
}

TEST(PathExprTest, MatchesGlobWithinChunk) {
  auto e = Expr("/demo/example/zenoh-*-put");
  EXPECT_TRUE(e.Matches(P("/demo/example/zenoh-cpp-put")));
  EXPECT_TRUE(e.Matches(P("/demo/example/zenoh--put")));
  EXPECT_FALSE(e.Matches(P("/demo/example/zenoh-cpp-get")));
}

TEST(PathExprTest, MatchesAnyDepth) {
  auto e = Expr("/demo/example/**");
  EXPECT_TRUE(e.Matches(P("/demo/example")));
  EXPECT_TRUE(e.Matches(P("/demo/example/eval")));
  EXPECT_TRUE(e.Matches(P("/demo/example/a/b/c")));
  EXPECT_FALSE(e.Matches(P("/demo/other/eval")));

  auto middle = Expr("/demo/**/eval");
  EXPECT_TRUE(middle.Matches(P("/demo/eval")));
  EXPECT_TRUE(middle.Matches(P("/demo/a/b/eval")));
  EXPECT_FALSE(middle.Matches(P("/demo/a/b/evaluate")));

  EXPECT_TRUE(Expr("/**").Matches(P("/anything/at/all")));
}

TEST(PathExprTest, WithPrefix) {
  auto e = Expr("example/**").WithPrefix(P("/demo"));
  EXPECT_EQ(e.str(), "/demo/example/**");
  EXPECT_FALSE(e.IsRelative());
  EXPECT_TRUE(e.Matches(P("/demo/example/eval")));
}

TEST(SelectorTest, ParsePathOnly) {
  auto s = Selector::Parse("/demo/example/**");
  ASSERT_TRUE(s.ok()) << s.status();
  EXPECT_EQ(s->path_expr().str(), "/demo/example/**");
  EXPECT_TRUE(s->predicate().empty());
  EXPECT_TRUE(s->properties().empty());
  EXPECT_TRUE(s->fragment().empty());
  EXPECT_EQ(s->ToString(), "/demo/example/**");
}

TEST(SelectorTest, ParseProperties) {
  auto s = Selector::Parse("/demo/example/eval?(name=/demo/example/name)");
  ASSERT_TRUE(s.ok()) << s.status();
  EXPECT_EQ(s->path_expr().str(), "/demo/example/eval");
  EXPECT_TRUE(s->predicate().empty());
  EXPECT_THAT(s->properties(), ElementsAre(Pair("name", "/demo/example/name")));
  EXPECT_EQ(s->ToString(), "/demo/example/eval?(name=/demo/example/name)");
}

TEST(SelectorTest, ParseAllParts) {
  auto s = Selector::Parse("/demo/**?x>1(a=1;b=2)#frag");
  ASSERT_TRUE(s.ok()) << s.status();
  EXPECT_EQ(s->path_expr().str(), "/demo/**");
  EXPECT_EQ(s->predicate(), "x>1");
  EXPECT_THAT(s->properties(), ElementsAre(Pair("a", "1"), Pair("b", "2")));
  EXPECT_EQ(s->fragment(), "frag");

  std::ostringstream os;
  os << *s;
  EXPECT_EQ(os.str(), "/demo/**?x>1(a=1;b=2)#frag");
}

TEST(SelectorTest, ParsePredicateAndFragment) {
  auto s = Selector::Parse("/demo/*?starttime=now#f");
  ASSERT_TRUE(s.ok()) << s.status();
  EXPECT_EQ(s->predicate(), "starttime=now");
  EXPECT_TRUE(s->properties().empty());
  EXPECT_EQ(s->fragment(), "f");
}

TEST(SelectorTest, ParseParenthesisInFragment) {
  auto s = Selector::Parse("/a?(x=1)#f)");
  ASSERT_TRUE(s.ok()) << s.status();
  EXPECT_TRUE(s->predicate().empty());
  EXPECT_THAT(s->properties(), ElementsAre(Pair("x", "1")));
  EXPECT_EQ(s->fragment(), "f)");
}

TEST(SelectorTest, ParseInvalid) {
  for (auto const* s :
       {"", "/demo//x", "/demo?(name=Bob", "/demo?(name=Bob)trailing"}) {
    SCOPED_TRACE("Testing with " + std::string(s));
    auto selector = Selector::Parse(s);
    ASSERT_FALSE(selector.ok());
    EXPECT_EQ(selector.status().code(), gc::StatusCode::kInvalidArgument);
  }
}

TEST(SelectorTest, WithPrefix) {
  auto s = Selector::Parse("eval?(name=Bob)").value().WithPrefix(P("/demo"));
  EXPECT_EQ(s.ToString(), "/demo/eval?(name=Bob)");
}

}  // namespace
}  // namespace traced_workspace
