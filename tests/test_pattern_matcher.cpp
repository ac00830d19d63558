// Copyright 2026 The msgvariant Authors
// Tests for: KeySatisfied, FindFirstMatch

#include <optional>
#include <string>

#include "gtest/gtest.h"
#include "variant/pattern_matcher.h"

using namespace msgvariant::internal;

// ---------------------------------------------------------------------------
// KeySatisfied
// ---------------------------------------------------------------------------

TEST(PatternMatcherTest, ExactClauseMatches) {
  SelectorValues values = {{"countPlural", "one"}};
  EXPECT_TRUE(KeySatisfied(ParsePatternKey("countPlural=one"), values));
  EXPECT_FALSE(KeySatisfied(ParsePatternKey("countPlural=other"), values));
}

TEST(PatternMatcherTest, WildcardMatchesAnything) {
  SelectorValues values = {{"countPlural", "few"}};
  EXPECT_TRUE(KeySatisfied(ParsePatternKey("countPlural=*"), values));
}

TEST(PatternMatcherTest, WildcardMatchesMissingValue) {
  SelectorValues values = {{"gender", std::nullopt}};
  EXPECT_TRUE(KeySatisfied(ParsePatternKey("gender=*"), values));
  EXPECT_FALSE(KeySatisfied(ParsePatternKey("gender=female"), values));
}

TEST(PatternMatcherTest, UnknownSelectorOnlyMatchesWildcard) {
  SelectorValues values;
  EXPECT_FALSE(KeySatisfied(ParsePatternKey("x=1"), values));
  EXPECT_TRUE(KeySatisfied(ParsePatternKey("x=*"), values));
}

TEST(PatternMatcherTest, AllClausesMustHold) {
  SelectorValues values = {{"gender", "female"}, {"count", "one"}};
  EXPECT_TRUE(KeySatisfied(ParsePatternKey("gender=female,count=one"), values));
  EXPECT_TRUE(KeySatisfied(ParsePatternKey("gender=female,count=*"), values));
  EXPECT_FALSE(
      KeySatisfied(ParsePatternKey("gender=female,count=other"), values));
}

TEST(PatternMatcherTest, EmptyKeyIsSatisfied) {
  EXPECT_TRUE(KeySatisfied(ParsePatternKey(""), {}));
}

// ---------------------------------------------------------------------------
// FindFirstMatch
// ---------------------------------------------------------------------------

TEST(PatternMatcherTest, FirstMatchWins) {
  MatchTable match = {{"n=*", "any"}, {"n=one", "one"}};
  std::optional<size_t> hit = FindFirstMatch(match, {{"n", "one"}});
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, 0u);
}

TEST(PatternMatcherTest, FallsThroughToWildcard) {
  MatchTable match = {{"n=one", "one"}, {"n=*", "other"}};
  EXPECT_EQ(FindFirstMatch(match, {{"n", "one"}}), 0u);
  EXPECT_EQ(FindFirstMatch(match, {{"n", "few"}}), 1u);
}

TEST(PatternMatcherTest, NoMatch) {
  MatchTable match = {{"n=one", "one"}, {"n=two", "two"}};
  EXPECT_FALSE(FindFirstMatch(match, {{"n", "other"}}).has_value());
  EXPECT_FALSE(FindFirstMatch({}, {{"n", "other"}}).has_value());
}

TEST(PatternMatcherTest, WildcardFallbackNeverPicksLiteral) {
  MatchTable match = {{"platform=android", "A"}, {"platform=*", "Def"}};
  EXPECT_EQ(FindFirstMatch(match, {{"platform", "ios"}}), 1u);
}
