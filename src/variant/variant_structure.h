// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_VARIANT_VARIANT_STRUCTURE_H_
#define MSGVARIANT_VARIANT_VARIANT_STRUCTURE_H_

#include <string>
#include <utility>
#include <vector>

#include "variant/declaration.h"

namespace msgvariant {
namespace internal {

/// (pattern key, template) pair, e.g. ("countPlural=one", "1 item").
using MatchEntry = std::pair<std::string, std::string>;

/// Match table in producer order.  The order decides which entry wins, so it
/// stays a sequence; never rebuild it as an associative container.
using MatchTable = std::vector<MatchEntry>;

/// One pluralized / conditional message.
struct VariantStructure {
  std::vector<Declaration> declarations;
  std::vector<std::string> selectors;  // empty = infer from match keys
  MatchTable match;
};

inline bool operator==(const VariantStructure& a, const VariantStructure& b) {
  return a.declarations == b.declarations && a.selectors == b.selectors &&
         a.match == b.match;
}

inline bool operator!=(const VariantStructure& a, const VariantStructure& b) {
  return !(a == b);
}

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_VARIANT_STRUCTURE_H_
