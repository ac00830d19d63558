// Copyright 2026 The msgvariant Authors

#include "variant/pattern_matcher.h"

namespace msgvariant {
namespace internal {

bool KeySatisfied(const PatternKey& key, const SelectorValues& values) {
  for (const auto& clause : key) {
    if (clause.is_wildcard()) continue;
    auto it = values.find(clause.selector);
    if (it == values.end() || !it->second || *it->second != clause.value)
      return false;
  }
  return true;
}

std::optional<size_t> FindFirstMatch(const MatchTable& match,
                                     const SelectorValues& values) {
  for (size_t i = 0; i < match.size(); ++i) {
    if (KeySatisfied(ParsePatternKey(match[i].first), values)) return i;
  }
  return std::nullopt;
}

}  // namespace internal
}  // namespace msgvariant
