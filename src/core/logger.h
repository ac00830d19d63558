// Copyright 2026 The msgvariant Authors
//
// Process-wide diagnostics.  Resolution never fails hard on bad input; the
// degradations it tolerates (unparseable declarations, unknown plural
// types, tables with no matching entry) are reported here instead.

#ifndef MSGVARIANT_CORE_LOGGER_H_
#define MSGVARIANT_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "msgvariant/msgvariant.h"

namespace msgvariant {
namespace internal {

class CallbackSink;

/// Name of the spdlog logger every context writes to.
constexpr char kLoggerName[] = "msgvariant";

/// Build the logger on first use.  Later calls do nothing.
void InitLogger();

std::shared_ptr<spdlog::logger> GetLogger();

/// Sink that relays formatted lines to the msgvariant_set_log_callback()
/// target.
std::shared_ptr<CallbackSink> GetCallbackSink();

void SetLogLevel(MsgVariantLogLevel level);

/// Public level to spdlog level and back.  Unknown values read as info.
spdlog::level::level_enum ToSpdlogLevel(MsgVariantLogLevel level);
MsgVariantLogLevel FromSpdlogLevel(spdlog::level::level_enum level);

}  // namespace internal
}  // namespace msgvariant

#define MSGVARIANT_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::msgvariant::internal::GetLogger(), __VA_ARGS__)
#define MSGVARIANT_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::msgvariant::internal::GetLogger(), __VA_ARGS__)
#define MSGVARIANT_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::msgvariant::internal::GetLogger(), __VA_ARGS__)
#define MSGVARIANT_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::msgvariant::internal::GetLogger(), __VA_ARGS__)
#define MSGVARIANT_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::msgvariant::internal::GetLogger(), __VA_ARGS__)
#define MSGVARIANT_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::msgvariant::internal::GetLogger(), __VA_ARGS__)

#endif  // MSGVARIANT_CORE_LOGGER_H_
