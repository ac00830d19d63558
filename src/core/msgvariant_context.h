// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_CORE_MSGVARIANT_CONTEXT_H_
#define MSGVARIANT_CORE_MSGVARIANT_CONTEXT_H_

#include <cstdint>
#include <memory>
#include <string>

#include "msgvariant/msgvariant.h"
#include "plural/plural_rules.h"

namespace msgvariant {
namespace internal {

/// Internal implementation of the opaque MsgVariantContext handle.
///
/// Owns the plural rules backend and the call defaults, and carries the
/// error state of the C API.  Evaluation itself is stateless; the context
/// only supplies its inputs.
///
/// The last error is kept per (context, thread), so concurrent calls on a
/// shared context never write the same state and each thread reads back
/// the outcome of its own last call.
class MsgVariantContextImpl {
 public:
  MsgVariantContextImpl();
  ~MsgVariantContextImpl();

  // Non-copyable.
  MsgVariantContextImpl(const MsgVariantContextImpl&) = delete;
  MsgVariantContextImpl& operator=(const MsgVariantContextImpl&) = delete;

  /// Create the default (ICU) plural rules backend.
  bool Initialize();

  bool is_initialized() const { return plural_rules_ != nullptr; }

  // -- Error state --

  MsgVariantError last_error() const;

  /// Valid until the calling thread's next call on this context.
  const char* last_error_message() const;

  void SetError(MsgVariantError code, const std::string& message);
  void ClearError();

  // -- Configuration --

  const std::string& default_locale() const { return default_locale_; }
  void set_default_locale(const std::string& locale) {
    default_locale_ = locale;
  }

  /// @p locale when given and non-empty, else the default locale.
  std::string ResolveLocale(const char* locale) const;

  /// Swap in a callback-backed categorizer; nullptr restores ICU.
  void SetPluralCallback(msgvariant_plural_callback_t callback,
                         void* userdata);

  const PluralRules& plural_rules() const { return *plural_rules_; }

 private:
  std::unique_ptr<PluralRules> plural_rules_;
  std::string default_locale_ = "en";

  // Key of this context's slot in the thread-local error table.  Never
  // reused, so a new context at a freed address starts clean.
  const uint64_t id_;
};

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_CORE_MSGVARIANT_CONTEXT_H_
