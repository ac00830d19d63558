// Copyright 2026 The msgvariant Authors
//
// Plural categorization backend.  The engine asks it for the CLDR plural
// category of a number; where the rules come from is up to the subclass.

#ifndef MSGVARIANT_PLURAL_PLURAL_RULES_H_
#define MSGVARIANT_PLURAL_PLURAL_RULES_H_

#include <memory>
#include <string>

#include "msgvariant/msgvariant.h"

namespace msgvariant {
namespace internal {

enum class PluralType { kCardinal, kOrdinal };

/// Category returned for numbers that have no other category (and for NaN).
constexpr const char kPluralOther[] = "other";

class PluralRules {
 public:
  virtual ~PluralRules() = default;

  /// Return the plural category ("zero", "one", "two", "few", "many",
  /// "other") of @p number in @p locale (BCP-47 tag).
  ///
  /// Must be callable concurrently from several threads.
  virtual std::string Select(double number, const std::string& locale,
                             PluralType type) const = 0;
};

/// Parse the "type" option of a plural declaration ("cardinal", "ordinal").
/// Returns false (and leaves @p out untouched) for other values.
bool ParsePluralType(const std::string& text, PluralType* out);

/// Create the ICU-backed plural rules (CLDR data shipped with ICU).
std::unique_ptr<PluralRules> CreateIcuPluralRules();

/// Create plural rules that forward to a user C callback.
std::unique_ptr<PluralRules> CreateCallbackPluralRules(
    msgvariant_plural_callback_t callback, void* userdata);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_PLURAL_PLURAL_RULES_H_
