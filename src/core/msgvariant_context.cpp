// Copyright 2026 The msgvariant Authors

#include "core/msgvariant_context.h"

#include <atomic>
#include <unordered_map>

#include "core/logger.h"

namespace msgvariant {
namespace internal {

namespace {

constexpr char kNoError[] = "No error";

struct ErrorState {
  MsgVariantError code = kMsgVariantOk;
  std::string message = kNoError;
};

std::atomic<uint64_t> g_next_context_id{1};

// Last error of every context this thread has called into.
std::unordered_map<uint64_t, ErrorState>& ThreadErrors() {
  thread_local std::unordered_map<uint64_t, ErrorState> errors;
  return errors;
}

const ErrorState* FindThreadError(uint64_t id) {
  auto& errors = ThreadErrors();
  auto it = errors.find(id);
  return it == errors.end() ? nullptr : &it->second;
}

}  // namespace

MsgVariantContextImpl::MsgVariantContextImpl()
    : id_(g_next_context_id.fetch_add(1, std::memory_order_relaxed)) {}

// Slots left on other threads are unreachable once the id is retired.
MsgVariantContextImpl::~MsgVariantContextImpl() { ThreadErrors().erase(id_); }

bool MsgVariantContextImpl::Initialize() {
  if (plural_rules_) return true;

  plural_rules_ = CreateIcuPluralRules();
  if (!plural_rules_) {
    SetError(kMsgVariantErrorNotInitialized,
             "Failed to create ICU plural rules backend");
    return false;
  }

  MSGVARIANT_LOG_DEBUG("msgvariant context initialized (default locale '{}')",
                       default_locale_);
  ClearError();
  return true;
}

MsgVariantError MsgVariantContextImpl::last_error() const {
  const ErrorState* state = FindThreadError(id_);
  return state ? state->code : kMsgVariantOk;
}

const char* MsgVariantContextImpl::last_error_message() const {
  const ErrorState* state = FindThreadError(id_);
  return state ? state->message.c_str() : kNoError;
}

void MsgVariantContextImpl::SetError(MsgVariantError code,
                                     const std::string& message) {
  ErrorState& state = ThreadErrors()[id_];
  state.code = code;
  state.message = message;
  MSGVARIANT_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void MsgVariantContextImpl::ClearError() {
  // A thread that never failed keeps no slot.
  auto& errors = ThreadErrors();
  auto it = errors.find(id_);
  if (it != errors.end()) errors.erase(it);
}

std::string MsgVariantContextImpl::ResolveLocale(const char* locale) const {
  if (locale && locale[0]) return locale;
  return default_locale_;
}

void MsgVariantContextImpl::SetPluralCallback(
    msgvariant_plural_callback_t callback, void* userdata) {
  if (callback) {
    plural_rules_ = CreateCallbackPluralRules(callback, userdata);
    MSGVARIANT_LOG_DEBUG("Plural rules now provided by user callback");
  } else {
    plural_rules_ = CreateIcuPluralRules();
    MSGVARIANT_LOG_DEBUG("Plural rules restored to ICU");
  }
}

}  // namespace internal
}  // namespace msgvariant
