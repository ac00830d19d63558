// Copyright 2026 The msgvariant Authors
//
// ICU-backed plural rules.  Numbers are rounded to at most three fraction
// digits before categorization, the default precision message compilers
// use when they select plural forms, so 1.0004 selects "one" in English.

#ifndef MSGVARIANT_PLURAL_ICU_PLURAL_RULES_H_
#define MSGVARIANT_PLURAL_ICU_PLURAL_RULES_H_

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "plural/plural_rules.h"

namespace msgvariant {
namespace internal {

struct CompiledRules;

class IcuPluralRules : public PluralRules {
 public:
  IcuPluralRules();
  ~IcuPluralRules() override;

  std::string Select(double number, const std::string& locale,
                     PluralType type) const override;

  /// Number of compiled (locale, type) entries.  Tags are canonicalized
  /// first and every malformed tag shares the root entry.
  size_t cached_entries() const;

 private:
  using CacheKey = std::pair<std::string, PluralType>;

  std::shared_ptr<const CompiledRules> Lookup(const std::string& locale,
                                              PluralType type) const;

  mutable std::mutex mu_;
  mutable std::map<CacheKey, std::shared_ptr<const CompiledRules>> cache_;
};

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_PLURAL_ICU_PLURAL_RULES_H_
