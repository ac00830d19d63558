// Copyright 2026 The msgvariant Authors

#include "variant/variant_engine.h"

#include "core/logger.h"
#include "variant/pattern_matcher.h"
#include "variant/selector_evaluator.h"
#include "variant/template_renderer.h"
#include "variant/variant_codec.h"

namespace msgvariant {
namespace internal {

std::optional<ResolvedEntry> ResolveEntry(const VariantStructure& variant,
                                          const Params& params,
                                          const std::string& locale,
                                          const PluralRules& rules) {
  if (variant.match.empty()) {
    MSGVARIANT_LOG_WARN("Invalid variant: match table is missing or empty");
    return std::nullopt;
  }

  SelectorValues values = EvaluateSelectors(variant, params, locale, rules);
  std::optional<size_t> hit = FindFirstMatch(variant.match, values);
  if (hit) return ResolvedEntry{*hit, true};

  // Render and detect must agree on this fallback.
  MSGVARIANT_LOG_WARN("No matching variant entry, falling back to '{}'",
                      variant.match.front().first);
  return ResolvedEntry{0, false};
}

std::string Render(const VariantStructure& variant, const Params& params,
                   const std::string& locale, const PluralRules& rules) {
  std::optional<ResolvedEntry> entry =
      ResolveEntry(variant, params, locale, rules);
  if (!entry) return {};
  return SubstituteParams(variant.match[entry->index].second, params);
}

std::optional<std::string> DetectActiveKey(const VariantStructure& variant,
                                           const Params& params,
                                           const std::string& locale,
                                           const PluralRules& rules) {
  std::optional<ResolvedEntry> entry =
      ResolveEntry(variant, params, locale, rules);
  if (!entry) return std::nullopt;
  return variant.match[entry->index].first;
}

std::string RenderTemplate(const std::string& value, const Params& params,
                           const std::string& locale,
                           const PluralRules& rules) {
  if (value.empty()) return {};
  std::optional<VariantStructure> variant =
      ExtractVariantStructureFromText(value);
  if (variant) return Render(*variant, params, locale, rules);
  return SubstituteParams(value, params);
}

std::vector<std::string> VariantForms(const VariantStructure& variant) {
  std::vector<std::string> keys;
  keys.reserve(variant.match.size());
  for (const auto& entry : variant.match) keys.push_back(entry.first);
  return keys;
}

std::optional<std::string> FindTemplate(const VariantStructure& variant,
                                        const std::string& key) {
  for (const auto& entry : variant.match) {
    if (entry.first == key) return entry.second;
  }
  return std::nullopt;
}

bool ActiveFormEquals(const VariantStructure& variant,
                      const VariantStructure& other, const Params& params,
                      const std::string& locale, const PluralRules& rules) {
  std::optional<std::string> key =
      DetectActiveKey(variant, params, locale, rules);
  if (!key) return false;
  std::optional<std::string> mine = FindTemplate(variant, *key);
  std::optional<std::string> theirs = FindTemplate(other, *key);
  return mine && theirs && *mine == *theirs;
}

}  // namespace internal
}  // namespace msgvariant
