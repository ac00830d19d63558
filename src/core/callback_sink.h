// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_CORE_CALLBACK_SINK_H_
#define MSGVARIANT_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "msgvariant/msgvariant.h"
#include "core/logger.h"

namespace msgvariant {
namespace internal {

/// Relays each formatted diagnostic, without its line ending, to the host's
/// msgvariant_log_callback_t.  With no callback installed it drops
/// everything; the stderr sink still prints.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  using Base = spdlog::sinks::base_sink<std::mutex>;

  /// nullptr detaches the current callback.
  void SetCallback(msgvariant_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(Base::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  // Runs under Base::mutex_, so the callback never sees two lines at once.
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t buf;
    Base::formatter_->format(msg, buf);
    std::string line(buf.data(), buf.size());
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      line.pop_back();

    callback_(FromSpdlogLevel(msg.level), line.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  msgvariant_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_CORE_CALLBACK_SINK_H_
