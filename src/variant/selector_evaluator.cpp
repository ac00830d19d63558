// Copyright 2026 The msgvariant Authors

#include "variant/selector_evaluator.h"

#include <cmath>
#include <limits>

#include "core/logger.h"
#include "variant/pattern_key.h"

namespace msgvariant {
namespace internal {

namespace {

constexpr const char kPluralTransform[] = "plural";
constexpr const char kTypeOption[] = "type";

std::optional<std::string> LookupParam(const Params& params,
                                       const std::string& name) {
  auto it = params.find(name);
  if (it == params.end()) return std::nullopt;
  return it->second.ToString();
}

}  // namespace

std::vector<std::string> ResolveSelectorNames(const VariantStructure& variant) {
  if (!variant.selectors.empty()) return variant.selectors;
  return InferSelectorNames(variant.match);
}

std::optional<std::string> EvaluateLocal(const LocalDeclaration& local,
                                         const Params& params,
                                         const std::string& locale,
                                         const PluralRules& rules) {
  if (local.transform != kPluralTransform) {
    MSGVARIANT_LOG_DEBUG("Transform '{}' of '{}' passes '{}' through",
                         local.transform, local.name, local.source);
    return LookupParam(params, local.source);
  }

  PluralType type = PluralType::kCardinal;
  auto type_it = local.options.find(kTypeOption);
  if (type_it != local.options.end() &&
      !ParsePluralType(type_it->second, &type)) {
    MSGVARIANT_LOG_WARN("Unknown plural type '{}' on '{}', using cardinal",
                        type_it->second, local.name);
  }

  auto source_it = params.find(local.source);
  double number = source_it != params.end()
                      ? source_it->second.ToNumber()
                      : std::numeric_limits<double>::quiet_NaN();
  if (std::isnan(number)) {
    MSGVARIANT_LOG_DEBUG("Plural source '{}' of '{}' is not a number",
                         local.source, local.name);
    return std::string(kPluralOther);
  }
  return rules.Select(number, locale, type);
}

SelectorValues EvaluateSelectors(const VariantStructure& variant,
                                 const Params& params,
                                 const std::string& locale,
                                 const PluralRules& rules) {
  SelectorValues values;
  for (const auto& name : ResolveSelectorNames(variant)) {
    const Declaration* decl = FindDeclaration(variant.declarations, name);
    if (decl) {
      if (const auto* local = std::get_if<LocalDeclaration>(decl)) {
        values[name] = EvaluateLocal(*local, params, locale, rules);
        continue;
      }
      if (const auto* input = std::get_if<InputDeclaration>(decl)) {
        values[name] = LookupParam(params, input->name);
        continue;
      }
    }
    // Undeclared selector: read the parameter of the same name.
    values[name] = LookupParam(params, name);
  }
  return values;
}

}  // namespace internal
}  // namespace msgvariant
