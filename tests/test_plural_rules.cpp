// Copyright 2026 The msgvariant Authors
// Tests for: CreateIcuPluralRules, IcuPluralRules cache, CreateCallbackPluralRules,
//            ParsePluralType

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "plural/icu_plural_rules.h"
#include "plural/plural_rules.h"

using namespace msgvariant::internal;

// ---------------------------------------------------------------------------
// ParsePluralType
// ---------------------------------------------------------------------------

TEST(PluralTypeTest, ParsesKnownNames) {
  PluralType type = PluralType::kCardinal;
  EXPECT_TRUE(ParsePluralType("ordinal", &type));
  EXPECT_EQ(type, PluralType::kOrdinal);
  EXPECT_TRUE(ParsePluralType("cardinal", &type));
  EXPECT_EQ(type, PluralType::kCardinal);
}

TEST(PluralTypeTest, RejectsUnknownNames) {
  PluralType type = PluralType::kOrdinal;
  EXPECT_FALSE(ParsePluralType("Ordinal", &type));
  EXPECT_FALSE(ParsePluralType("", &type));
  EXPECT_EQ(type, PluralType::kOrdinal);
}

// ---------------------------------------------------------------------------
// ICU backend
// ---------------------------------------------------------------------------

class IcuPluralRulesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rules_ = CreateIcuPluralRules();
    ASSERT_NE(rules_, nullptr);
  }

  std::string Cardinal(double n, const std::string& locale = "en") {
    return rules_->Select(n, locale, PluralType::kCardinal);
  }
  std::string Ordinal(double n, const std::string& locale = "en") {
    return rules_->Select(n, locale, PluralType::kOrdinal);
  }

  std::unique_ptr<PluralRules> rules_;
};

TEST_F(IcuPluralRulesTest, EnglishCardinal) {
  EXPECT_EQ(Cardinal(1), "one");
  EXPECT_EQ(Cardinal(0), "other");
  EXPECT_EQ(Cardinal(5), "other");
  EXPECT_EQ(Cardinal(1.5), "other");
}

TEST_F(IcuPluralRulesTest, EnglishOrdinal) {
  EXPECT_EQ(Ordinal(1), "one");
  EXPECT_EQ(Ordinal(2), "two");
  EXPECT_EQ(Ordinal(3), "few");
  EXPECT_EQ(Ordinal(4), "other");
  EXPECT_EQ(Ordinal(11), "other");
  EXPECT_EQ(Ordinal(21), "one");
  EXPECT_EQ(Ordinal(112), "other");
}

TEST_F(IcuPluralRulesTest, RoundsToThreeFractionDigits) {
  EXPECT_EQ(Cardinal(1.0004), "one");
}

TEST_F(IcuPluralRulesTest, OtherLocales) {
  EXPECT_EQ(Cardinal(3, "ru"), "few");
  EXPECT_EQ(Cardinal(5, "ru"), "many");
  EXPECT_EQ(Cardinal(2, "ar"), "two");
  EXPECT_EQ(Cardinal(1, "ja"), "other");
  EXPECT_EQ(Cardinal(0, "fr"), "one");
}

TEST_F(IcuPluralRulesTest, RegionTagsResolve) {
  EXPECT_EQ(Cardinal(1, "en-US"), "one");
  EXPECT_EQ(Cardinal(1, "pt-BR"), "one");
}

TEST_F(IcuPluralRulesTest, NonFiniteIsOther) {
  EXPECT_EQ(Cardinal(std::numeric_limits<double>::quiet_NaN()), "other");
  EXPECT_EQ(Cardinal(std::numeric_limits<double>::infinity()), "other");
  EXPECT_EQ(Ordinal(-std::numeric_limits<double>::infinity()), "other");
}

TEST_F(IcuPluralRulesTest, MalformedLocaleStillAnswers) {
  std::string category = Cardinal(1, "!!not a locale!!");
  EXPECT_FALSE(category.empty());
  EXPECT_EQ(Cardinal(1, ""), Cardinal(1, ""));
}

TEST(IcuPluralRulesCacheTest, MalformedTagsShareRootEntry) {
  IcuPluralRules rules;
  for (const char* tag : {"!!a!!", "!!b!!", "en_US", "--", "@@@"}) {
    EXPECT_EQ(rules.Select(1, tag, PluralType::kCardinal), "other") << tag;
  }
  EXPECT_EQ(rules.cached_entries(), 1u);
}

TEST(IcuPluralRulesCacheTest, EquivalentTagsShareEntry) {
  IcuPluralRules rules;
  EXPECT_EQ(rules.Select(1, "en-US", PluralType::kCardinal), "one");
  EXPECT_EQ(rules.Select(1, "en-us", PluralType::kCardinal), "one");
  EXPECT_EQ(rules.Select(1, "EN-US", PluralType::kCardinal), "one");
  EXPECT_EQ(rules.cached_entries(), 1u);

  EXPECT_EQ(rules.Select(1, "en-US", PluralType::kOrdinal), "one");
  EXPECT_EQ(rules.cached_entries(), 2u);
}

TEST_F(IcuPluralRulesTest, ConcurrentSelect) {
  std::vector<std::thread> threads;
  std::vector<std::string> results(8);
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, i, &results]() {
      for (int j = 0; j < 50; ++j) {
        results[i] = rules_->Select(1, i % 2 ? "de" : "en",
                                    PluralType::kCardinal);
      }
    });
  }
  for (auto& t : threads) t.join();
  for (const auto& r : results) EXPECT_EQ(r, "one");
}

// ---------------------------------------------------------------------------
// Callback backend
// ---------------------------------------------------------------------------

namespace {

struct CallbackRecord {
  int calls = 0;
  double number = 0;
  std::string locale;
  MsgVariantPluralType type = kMsgVariantPluralCardinal;
  const char* answer = "few";
};

const char* RecordingCallback(double number, const char* locale,
                              MsgVariantPluralType type, void* userdata) {
  auto* record = static_cast<CallbackRecord*>(userdata);
  ++record->calls;
  record->number = number;
  record->locale = locale ? locale : "";
  record->type = type;
  return record->answer;
}

}  // namespace

TEST(CallbackPluralRulesTest, NullCallbackYieldsNothing) {
  EXPECT_EQ(CreateCallbackPluralRules(nullptr, nullptr), nullptr);
}

TEST(CallbackPluralRulesTest, ForwardsArguments) {
  CallbackRecord record;
  auto rules = CreateCallbackPluralRules(RecordingCallback, &record);
  ASSERT_NE(rules, nullptr);

  EXPECT_EQ(rules->Select(3, "pl", PluralType::kOrdinal), "few");
  EXPECT_EQ(record.calls, 1);
  EXPECT_DOUBLE_EQ(record.number, 3.0);
  EXPECT_EQ(record.locale, "pl");
  EXPECT_EQ(record.type, kMsgVariantPluralOrdinal);
}

TEST(CallbackPluralRulesTest, EmptyAnswerIsOther) {
  CallbackRecord record;
  auto rules = CreateCallbackPluralRules(RecordingCallback, &record);
  record.answer = nullptr;
  EXPECT_EQ(rules->Select(1, "en", PluralType::kCardinal), "other");
  record.answer = "";
  EXPECT_EQ(rules->Select(1, "en", PluralType::kCardinal), "other");
}

TEST(CallbackPluralRulesTest, NaNSkipsCallback) {
  CallbackRecord record;
  auto rules = CreateCallbackPluralRules(RecordingCallback, &record);
  EXPECT_EQ(rules->Select(std::numeric_limits<double>::quiet_NaN(), "en",
                          PluralType::kCardinal),
            "other");
  EXPECT_EQ(record.calls, 0);
}
