// Copyright 2026 The msgvariant Authors
// Tests for: the header-only C++ wrapper (msgvariant.hpp)

#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "msgvariant/msgvariant.hpp"

namespace {

const char kItems[] =
    R"([{"declarations":["input count","local countPlural = count: plural"],)"
    R"("selectors":["countPlural"],)"
    R"("match":{"countPlural=one":"{count} item","countPlural=other":"{count} items"}}])";

}  // namespace

TEST(CppWrapperTest, RenderWithParams) {
  msgvariant::Context ctx;
  msgvariant::Params params;
  params.Set("count", 1);
  EXPECT_EQ(ctx.Render(kItems, params), "1 item");
  params.Set("count", 12);
  EXPECT_EQ(params.size(), 1);
  EXPECT_EQ(ctx.Render(kItems, params), "12 items");
}

TEST(CppWrapperTest, MixedParamKinds) {
  msgvariant::Context ctx;
  msgvariant::Params params;
  params.Set("name", "Ann").Set("score", 2.5).Set("ok", true);
  EXPECT_EQ(ctx.Render("{name}: {score} ({ok})", params), "Ann: 2.5 (true)");
}

TEST(CppWrapperTest, DetectAndForms) {
  msgvariant::Context ctx;
  msgvariant::Params params;
  params.Set("count", 7);
  EXPECT_EQ(ctx.DetectActiveKey(kItems, params), "countPlural=other");
  EXPECT_EQ(ctx.FormKeys(kItems),
            (std::vector<std::string>{"countPlural=one", "countPlural=other"}));
  EXPECT_EQ(ctx.FormTemplate(kItems, "countPlural=one"), "{count} item");
}

TEST(CppWrapperTest, ErrorsThrow) {
  msgvariant::Context ctx;
  try {
    ctx.DetectActiveKey("not a variant");
    FAIL() << "expected msgvariant::Error";
  } catch (const msgvariant::Error& e) {
    EXPECT_EQ(e.code(), kMsgVariantErrorNotVariant);
  }
  EXPECT_THROW(ctx.FormKeys("plain"), msgvariant::Error);
  EXPECT_THROW(ctx.FormTemplate(kItems, "nope"), msgvariant::Error);
  EXPECT_THROW(ctx.set_default_locale(""), msgvariant::Error);
}

TEST(CppWrapperTest, ActiveFormEquals) {
  msgvariant::Context ctx;
  msgvariant::Params params;
  params.Set("count", 1);
  EXPECT_TRUE(ctx.ActiveFormEquals(kItems, kItems, params));
}

TEST(CppWrapperTest, LocaleAndPluralCategory) {
  msgvariant::Context ctx;
  EXPECT_EQ(ctx.default_locale(), "en");
  EXPECT_EQ(ctx.PluralCategory(3, nullptr, kMsgVariantPluralOrdinal), "few");
  ctx.set_default_locale("ar");
  EXPECT_EQ(ctx.PluralCategory(2), "two");
}

TEST(CppWrapperTest, MoveTransfersOwnership) {
  msgvariant::Context a;
  MsgVariantContext* raw = a.get();
  msgvariant::Context b(std::move(a));
  EXPECT_EQ(a.get(), nullptr);
  EXPECT_EQ(b.get(), raw);

  msgvariant::Context c;
  c = std::move(b);
  EXPECT_EQ(c.get(), raw);
}

TEST(CppWrapperTest, IsVariantAndVersion) {
  EXPECT_TRUE(msgvariant::is_variant(kItems));
  EXPECT_FALSE(msgvariant::is_variant("plain"));
  EXPECT_STREQ(msgvariant::version_string(), MSGVARIANT_VERSION_STRING);
}
