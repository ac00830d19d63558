// Copyright 2026 The msgvariant Authors

#include "plural/plural_rules.h"

#include <cmath>

#include "core/logger.h"

namespace msgvariant {
namespace internal {

bool ParsePluralType(const std::string& text, PluralType* out) {
  if (text == "cardinal") {
    *out = PluralType::kCardinal;
    return true;
  }
  if (text == "ordinal") {
    *out = PluralType::kOrdinal;
    return true;
  }
  return false;
}

namespace {

class CallbackPluralRules : public PluralRules {
 public:
  CallbackPluralRules(msgvariant_plural_callback_t callback, void* userdata)
      : callback_(callback), userdata_(userdata) {}

  std::string Select(double number, const std::string& locale,
                     PluralType type) const override {
    if (std::isnan(number)) return kPluralOther;
    const char* category = callback_(
        number, locale.c_str(),
        type == PluralType::kOrdinal ? kMsgVariantPluralOrdinal
                                     : kMsgVariantPluralCardinal,
        userdata_);
    if (!category || !category[0]) {
      MSGVARIANT_LOG_WARN("Plural callback returned no category for {}",
                          number);
      return kPluralOther;
    }
    return category;
  }

 private:
  msgvariant_plural_callback_t callback_;
  void* userdata_;
};

}  // namespace

std::unique_ptr<PluralRules> CreateCallbackPluralRules(
    msgvariant_plural_callback_t callback, void* userdata) {
  if (!callback) return nullptr;
  return std::make_unique<CallbackPluralRules>(callback, userdata);
}

}  // namespace internal
}  // namespace msgvariant
