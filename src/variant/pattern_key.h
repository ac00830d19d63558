// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_VARIANT_PATTERN_KEY_H_
#define MSGVARIANT_VARIANT_PATTERN_KEY_H_

#include <string>
#include <vector>

#include "variant/variant_structure.h"

namespace msgvariant {
namespace internal {

/// Literal that satisfies any selector value.
constexpr const char kWildcard[] = "*";

/// One "selector=value" condition of a pattern key.
struct PatternClause {
  std::string selector;
  std::string value;

  bool is_wildcard() const { return value == kWildcard; }
};

inline bool operator==(const PatternClause& a, const PatternClause& b) {
  return a.selector == b.selector && a.value == b.value;
}

/// Conditions of one match entry, in key order, one clause per selector.
using PatternKey = std::vector<PatternClause>;

/// Parse "sel1=val1, sel2=val2".
///
/// Clauses missing a selector or a value are dropped (with a debug log).  A
/// selector repeated in the same key keeps its first position and takes the
/// last value.
PatternKey ParsePatternKey(const std::string& key);

/// Distinct selector names across all keys of @p match, in first-seen order.
std::vector<std::string> InferSelectorNames(const MatchTable& match);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_PATTERN_KEY_H_
