// Copyright 2026 The msgvariant Authors

#include "core/logger.h"

#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace msgvariant {
namespace internal {

namespace {

// Lines read "[msgvariant][warning] Unknown plural type 'x' ...".
constexpr char kLogPattern[] = "[msgvariant][%l] %v";

struct LoggerState {
  std::once_flag once;
  std::shared_ptr<spdlog::logger> logger;
  std::shared_ptr<CallbackSink> callback_sink;
};

LoggerState& State() {
  static LoggerState state;
  return state;
}

}  // namespace

void InitLogger() {
  LoggerState& state = State();
  std::call_once(state.once, [&state]() {
    state.callback_sink = std::make_shared<CallbackSink>();
    spdlog::sinks_init_list sinks = {
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
        state.callback_sink};

    state.logger = std::make_shared<spdlog::logger>(kLoggerName, sinks);
    state.logger->set_pattern(kLogPattern);
    state.logger->set_level(spdlog::level::info);
    // Fallbacks to a first entry or to "other" are warnings; callers
    // watching stderr should see them before the rendered text.
    state.logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return State().logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return State().callback_sink;
}

void SetLogLevel(MsgVariantLogLevel level) {
  GetLogger()->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(MsgVariantLogLevel level) {
  switch (level) {
    case kMsgVariantLogTrace: return spdlog::level::trace;
    case kMsgVariantLogDebug: return spdlog::level::debug;
    case kMsgVariantLogInfo:  return spdlog::level::info;
    case kMsgVariantLogWarn:  return spdlog::level::warn;
    case kMsgVariantLogError: return spdlog::level::err;
    case kMsgVariantLogFatal: return spdlog::level::critical;
  }
  return spdlog::level::info;
}

MsgVariantLogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:    return kMsgVariantLogTrace;
    case spdlog::level::debug:    return kMsgVariantLogDebug;
    case spdlog::level::info:     return kMsgVariantLogInfo;
    case spdlog::level::warn:     return kMsgVariantLogWarn;
    case spdlog::level::err:      return kMsgVariantLogError;
    case spdlog::level::critical:
    case spdlog::level::off:      return kMsgVariantLogFatal;
    default:                      return kMsgVariantLogInfo;
  }
}

}  // namespace internal
}  // namespace msgvariant
