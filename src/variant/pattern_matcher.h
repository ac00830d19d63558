// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_VARIANT_PATTERN_MATCHER_H_
#define MSGVARIANT_VARIANT_PATTERN_MATCHER_H_

#include <cstddef>
#include <optional>

#include "variant/pattern_key.h"
#include "variant/selector_evaluator.h"
#include "variant/variant_structure.h"

namespace msgvariant {
namespace internal {

/// True if every clause of @p key holds for @p values.  A wildcard clause
/// always holds; a literal holds when the selector value equals it.
bool KeySatisfied(const PatternKey& key, const SelectorValues& values);

/// Index of the first entry of @p match whose key is satisfied, or nullopt.
///
/// First match wins.  The producer emits specific keys before wildcard ones;
/// no specificity ranking happens here.
std::optional<size_t> FindFirstMatch(const MatchTable& match,
                                     const SelectorValues& values);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_PATTERN_MATCHER_H_
