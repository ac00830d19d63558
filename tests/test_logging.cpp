// Copyright 2026 The msgvariant Authors
// Tests for: msgvariant_set_log_level, msgvariant_set_log_callback,
//            msgvariant_log, level mapping, and the warnings emitted on
//            degraded input

#include <string>
#include <vector>

#include "core/logger.h"
#include "gtest/gtest.h"
#include "msgvariant/msgvariant.h"

// ---------------------------------------------------------------------------
// Helper: capture log messages via callback
// ---------------------------------------------------------------------------

struct LogEntry {
  MsgVariantLogLevel level;
  std::string message;
};

static void TestLogCallback(MsgVariantLogLevel level, const char* message,
                            void* userdata) {
  auto* entries = static_cast<std::vector<LogEntry>*>(userdata);
  entries->push_back({level, message ? message : ""});
}

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    entries_.clear();
    msgvariant_set_log_level(kMsgVariantLogTrace);
    msgvariant_set_log_callback(TestLogCallback, &entries_);
  }

  void TearDown() override {
    msgvariant_set_log_callback(nullptr, nullptr);
    msgvariant_set_log_level(kMsgVariantLogInfo);
  }

  bool Contains(const char* text, MsgVariantLogLevel level) const {
    for (const auto& e : entries_) {
      if (e.level == level && e.message.find(text) != std::string::npos)
        return true;
    }
    return false;
  }

  std::vector<LogEntry> entries_;
};

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, SetLogLevelDoesNotCrash) {
  msgvariant_set_log_level(kMsgVariantLogTrace);
  msgvariant_set_log_level(kMsgVariantLogDebug);
  msgvariant_set_log_level(kMsgVariantLogInfo);
  msgvariant_set_log_level(kMsgVariantLogWarn);
  msgvariant_set_log_level(kMsgVariantLogError);
  msgvariant_set_log_level(kMsgVariantLogFatal);
}

TEST_F(LoggingTest, LogCallbackReceivesMessage) {
  msgvariant_log(kMsgVariantLogInfo, "test message");
  EXPECT_TRUE(Contains("test message", kMsgVariantLogInfo));
}

TEST_F(LoggingTest, MessagesCarryLoggerPrefix) {
  msgvariant_log(kMsgVariantLogWarn, "prefixed");
  ASSERT_FALSE(entries_.empty());
  EXPECT_NE(entries_.back().message.find("[msgvariant]"), std::string::npos);
  EXPECT_NE(entries_.back().message.back(), '\n');
}

TEST_F(LoggingTest, EveryLevelReachesCallbackUnchanged) {
  const MsgVariantLogLevel levels[] = {
      kMsgVariantLogTrace, kMsgVariantLogDebug, kMsgVariantLogInfo,
      kMsgVariantLogWarn,  kMsgVariantLogError, kMsgVariantLogFatal};
  for (MsgVariantLogLevel level : levels) {
    EXPECT_EQ(msgvariant::internal::FromSpdlogLevel(
                  msgvariant::internal::ToSpdlogLevel(level)),
              level);
    entries_.clear();
    msgvariant_log(level, "level check");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, level);
  }
}

TEST_F(LoggingTest, LogLevelFiltering) {
  // At Warn, Info messages are dropped.
  msgvariant_set_log_level(kMsgVariantLogWarn);
  entries_.clear();

  msgvariant_log(kMsgVariantLogInfo, "should be filtered");
  msgvariant_log(kMsgVariantLogWarn, "should appear");

  EXPECT_FALSE(Contains("should be filtered", kMsgVariantLogInfo));
  EXPECT_TRUE(Contains("should appear", kMsgVariantLogWarn));
}

TEST_F(LoggingTest, UnregisterCallback) {
  msgvariant_set_log_callback(nullptr, nullptr);
  entries_.clear();
  msgvariant_log(kMsgVariantLogInfo, "after unregister");
  EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, LogNullMessage) {
  // Should not crash.
  msgvariant_log(kMsgVariantLogInfo, nullptr);
}

// ---------------------------------------------------------------------------
// Degraded input is reported at warn level
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, NoMatchFallbackWarns) {
  MsgVariantContext* ctx = msgvariant_context_create();
  ASSERT_NE(ctx, nullptr);

  MsgVariantParam param = {};
  param.name = "g";
  param.type = kMsgVariantParamString;
  param.string_value = "other";

  char* text = nullptr;
  ASSERT_EQ(msgvariant_render(ctx, R"([{"match":{"g=a":"A","g=b":"B"}}])",
                              &param, 1, nullptr, &text),
            kMsgVariantOk);
  EXPECT_STREQ(text, "A");
  msgvariant_free_string(text);
  EXPECT_TRUE(Contains("No matching variant entry", kMsgVariantLogWarn));

  msgvariant_context_destroy(ctx);
}

TEST_F(LoggingTest, InvalidDeclarationWarns) {
  MsgVariantContext* ctx = msgvariant_context_create();
  ASSERT_NE(ctx, nullptr);

  char* text = nullptr;
  ASSERT_EQ(msgvariant_render(
                ctx,
                R"([{"declarations":["local broken"],"match":{"x=*":"ok"}}])",
                nullptr, 0, nullptr, &text),
            kMsgVariantOk);
  EXPECT_STREQ(text, "ok");
  msgvariant_free_string(text);
  EXPECT_TRUE(Contains("Invalid declaration", kMsgVariantLogWarn));

  msgvariant_context_destroy(ctx);
}

TEST_F(LoggingTest, EmptyMatchWarns) {
  MsgVariantContext* ctx = msgvariant_context_create();
  ASSERT_NE(ctx, nullptr);

  char* text = nullptr;
  ASSERT_EQ(msgvariant_render(ctx, R"([{"match":{}}])", nullptr, 0, nullptr,
                              &text),
            kMsgVariantOk);
  EXPECT_STREQ(text, "");
  msgvariant_free_string(text);
  EXPECT_TRUE(Contains("match table is missing or empty", kMsgVariantLogWarn));

  msgvariant_context_destroy(ctx);
}
