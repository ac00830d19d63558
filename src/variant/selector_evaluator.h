// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_VARIANT_SELECTOR_EVALUATOR_H_
#define MSGVARIANT_VARIANT_SELECTOR_EVALUATOR_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "plural/plural_rules.h"
#include "variant/declaration.h"
#include "variant/param_value.h"
#include "variant/variant_structure.h"

namespace msgvariant {
namespace internal {

/// Observed value of each selector.  nullopt means the parameter behind the
/// selector was not supplied; such a selector only satisfies wildcards.
using SelectorValues = std::map<std::string, std::optional<std::string>>;

/// Explicit selectors, or the names inferred from the match keys when the
/// structure declares none.
std::vector<std::string> ResolveSelectorNames(const VariantStructure& variant);

/// Value of a local declaration.  For "plural" the source parameter is
/// coerced to a number and categorized; a missing or non-numeric source
/// yields "other".  Other transforms pass the source value through.
std::optional<std::string> EvaluateLocal(const LocalDeclaration& local,
                                         const Params& params,
                                         const std::string& locale,
                                         const PluralRules& rules);

/// Compute every selector value of @p variant for one evaluation.
SelectorValues EvaluateSelectors(const VariantStructure& variant,
                                 const Params& params,
                                 const std::string& locale,
                                 const PluralRules& rules);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_SELECTOR_EVALUATOR_H_
