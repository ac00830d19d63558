// Copyright 2026 The msgvariant Authors

#include "plural/icu_plural_rules.h"

#include <cmath>

#include <unicode/locid.h>
#include <unicode/numberformatter.h>
#include <unicode/plurrule.h>
#include <unicode/unistr.h>

#include "core/logger.h"

namespace msgvariant {
namespace internal {

/// Rules and formatter for one (locale, type).  Immutable once built; ICU
/// documents both as safe for concurrent const use.
struct CompiledRules {
  std::unique_ptr<icu::PluralRules> rules;
  icu::number::LocalizedNumberFormatter formatter;
};

namespace {

constexpr int kMaxFractionDigits = 3;

// Parse a BCP-47 tag; malformed tags fall back to root.
icu::Locale CanonicalLocale(const std::string& tag) {
  UErrorCode status = U_ZERO_ERROR;
  icu::Locale loc = icu::Locale::forLanguageTag(tag, status);
  if (U_FAILURE(status) || loc.isBogus()) {
    MSGVARIANT_LOG_DEBUG("Invalid locale '{}' ({}), using root plural rules",
                         tag, u_errorName(status));
    return icu::Locale::getRoot();
  }
  return loc;
}

std::shared_ptr<const CompiledRules> Compile(const icu::Locale& loc,
                                             PluralType type) {
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::PluralRules> rules(icu::PluralRules::forLocale(
      loc,
      type == PluralType::kOrdinal ? UPLURAL_TYPE_ORDINAL
                                   : UPLURAL_TYPE_CARDINAL,
      status));
  if (U_FAILURE(status) || !rules) {
    MSGVARIANT_LOG_ERROR("ICU plural rules unavailable for '{}': {}",
                         loc.getName(), u_errorName(status));
    return nullptr;
  }

  auto compiled = std::make_shared<CompiledRules>();
  compiled->rules = std::move(rules);
  compiled->formatter =
      icu::number::NumberFormatter::withLocale(loc)
          .precision(
              icu::number::Precision::minMaxFraction(0, kMaxFractionDigits))
          .roundingMode(UNUM_ROUND_HALFUP);
  MSGVARIANT_LOG_DEBUG("Compiled {} plural rules for '{}'",
                       type == PluralType::kOrdinal ? "ordinal" : "cardinal",
                       loc.getName());
  return compiled;
}

}  // namespace

IcuPluralRules::IcuPluralRules() = default;

IcuPluralRules::~IcuPluralRules() = default;

std::string IcuPluralRules::Select(double number, const std::string& locale,
                                   PluralType type) const {
  if (!std::isfinite(number)) return kPluralOther;

  std::shared_ptr<const CompiledRules> compiled = Lookup(locale, type);
  if (!compiled) return kPluralOther;

  UErrorCode status = U_ZERO_ERROR;
  icu::number::FormattedNumber formatted =
      compiled->formatter.formatDouble(number, status);
  icu::UnicodeString keyword;
  if (U_SUCCESS(status)) {
    keyword = compiled->rules->select(formatted, status);
  }
  if (U_FAILURE(status)) {
    MSGVARIANT_LOG_WARN("ICU plural select failed for {} ({}): {}", number,
                        locale, u_errorName(status));
    keyword = compiled->rules->select(number);
  }

  std::string out;
  keyword.toUTF8String(out);
  return out.empty() ? std::string(kPluralOther) : out;
}

size_t IcuPluralRules::cached_entries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cache_.size();
}

std::shared_ptr<const CompiledRules> IcuPluralRules::Lookup(
    const std::string& locale, PluralType type) const {
  icu::Locale loc = CanonicalLocale(locale);
  CacheKey key(loc.getName(), type);
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;

  // Failures are cached too, so a missing rule set is reported once.
  std::shared_ptr<const CompiledRules> compiled = Compile(loc, type);
  cache_.emplace(std::move(key), compiled);
  return compiled;
}

std::unique_ptr<PluralRules> CreateIcuPluralRules() {
  return std::make_unique<IcuPluralRules>();
}

}  // namespace internal
}  // namespace msgvariant
