// Copyright 2026 The msgvariant Authors
//
// Entry points of the variant resolution engine.
//
//   VariantStructure + Params + locale
//     -> EvaluateSelectors -> FindFirstMatch -> SubstituteParams
//
// Everything here is a pure function of its arguments.  Malformed data never
// throws; it degrades and is reported as a warning on the msgvariant logger.

#ifndef MSGVARIANT_VARIANT_VARIANT_ENGINE_H_
#define MSGVARIANT_VARIANT_VARIANT_ENGINE_H_

#include <optional>
#include <string>
#include <vector>

#include "plural/plural_rules.h"
#include "variant/param_value.h"
#include "variant/variant_structure.h"

namespace msgvariant {
namespace internal {

/// Winner of one evaluation: index into the match table, and whether it was
/// a real match or the first-entry fallback.
struct ResolvedEntry {
  size_t index = 0;
  bool matched = false;
};

/// Evaluate selectors and pick the entry that render and detect share.
/// Returns nullopt when the match table is empty.
std::optional<ResolvedEntry> ResolveEntry(const VariantStructure& variant,
                                          const Params& params,
                                          const std::string& locale,
                                          const PluralRules& rules);

/// Render the winning template.  With no match the first template is
/// rendered; with an empty match table the result is "".
std::string Render(const VariantStructure& variant, const Params& params,
                   const std::string& locale, const PluralRules& rules);

/// Pattern key of the winning entry (first key when nothing matches), or
/// nullopt when the match table is empty.
std::optional<std::string> DetectActiveKey(const VariantStructure& variant,
                                           const Params& params,
                                           const std::string& locale,
                                           const PluralRules& rules);

/// Render a stored value: a variant (structured or encoded) is resolved,
/// anything else is treated as a plain template.
std::string RenderTemplate(const std::string& value, const Params& params,
                           const std::string& locale,
                           const PluralRules& rules);

/// Pattern keys in match order.
std::vector<std::string> VariantForms(const VariantStructure& variant);

/// Template stored under exactly @p key.
std::optional<std::string> FindTemplate(const VariantStructure& variant,
                                        const std::string& key);

/// True if @p other stores the same template as @p variant under the key
/// that is active in @p variant.  False if either side lacks the key.
bool ActiveFormEquals(const VariantStructure& variant,
                      const VariantStructure& other, const Params& params,
                      const std::string& locale, const PluralRules& rules);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_VARIANT_ENGINE_H_
