// Copyright 2026 The msgvariant Authors

#include "variant/pattern_key.h"

#include <algorithm>

#include "core/logger.h"
#include "core/string_util.h"

namespace msgvariant {
namespace internal {

PatternKey ParsePatternKey(const std::string& key) {
  PatternKey clauses;
  for (const auto& part : Split(key, ',')) {
    std::vector<std::string> fields = Split(part, '=');
    std::string selector = Trim(fields[0]);
    std::string value = fields.size() > 1 ? Trim(fields[1]) : std::string();
    if (selector.empty() || value.empty()) {
      if (!Trim(part).empty()) {
        MSGVARIANT_LOG_DEBUG("Ignoring malformed clause '{}' in key '{}'",
                             part, key);
      }
      continue;
    }

    auto it = std::find_if(clauses.begin(), clauses.end(),
                           [&](const PatternClause& c) {
                             return c.selector == selector;
                           });
    if (it != clauses.end()) {
      it->value = value;
    } else {
      clauses.push_back({selector, value});
    }
  }
  return clauses;
}

std::vector<std::string> InferSelectorNames(const MatchTable& match) {
  std::vector<std::string> names;
  for (const auto& entry : match) {
    for (const auto& clause : ParsePatternKey(entry.first)) {
      if (std::find(names.begin(), names.end(), clause.selector) ==
          names.end()) {
        names.push_back(clause.selector);
      }
    }
  }
  return names;
}

}  // namespace internal
}  // namespace msgvariant
