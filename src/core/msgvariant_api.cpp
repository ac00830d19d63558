// Copyright 2026 The msgvariant Authors
//
// This file implements all public C API functions declared in msgvariant.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "msgvariant/msgvariant.h"

#include <new>
#include <optional>
#include <string>
#include <vector>

#include <cstdlib>

#include "core/callback_sink.h"
#include "core/logger.h"
#include "core/msgvariant_context.h"
#include "core/string_util.h"
#include "plural/plural_rules.h"
#include "variant/param_value.h"
#include "variant/variant_codec.h"
#include "variant/variant_engine.h"

using msgvariant::internal::DupString;
using msgvariant::internal::ExtractVariantStructureFromText;
using msgvariant::internal::MsgVariantContextImpl;
using msgvariant::internal::Params;
using msgvariant::internal::PluralType;
using msgvariant::internal::VariantStructure;

// ---------------------------------------------------------------------------
// The opaque MsgVariantContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct MsgVariantContext {
  MsgVariantContextImpl impl;
};

// Convert the C parameter array. Returns false on a malformed array.
static bool ToParams(const MsgVariantParam* params, int param_count,
                     Params* out) {
  if (param_count < 0 || (!params && param_count > 0)) return false;
  for (int i = 0; i < param_count; ++i) {
    const MsgVariantParam& p = params[i];
    if (!p.name) continue;
    switch (p.type) {
      case kMsgVariantParamString:
        (*out)[p.name] = p.string_value ? p.string_value : "";
        break;
      case kMsgVariantParamNumber:
        (*out)[p.name] = p.number_value;
        break;
      case kMsgVariantParamBool:
        (*out)[p.name] = p.bool_value != 0;
        break;
      default:
        return false;
    }
  }
  return true;
}

// Hand a string to the caller, recording OOM on the context.
static MsgVariantError ReturnString(MsgVariantContext* ctx,
                                    const std::string& value, char** out) {
  *out = DupString(value);
  if (!*out) {
    ctx->impl.SetError(kMsgVariantErrorOutOfMemory,
                       "Failed to allocate result string");
    return kMsgVariantErrorOutOfMemory;
  }
  ctx->impl.ClearError();
  return kMsgVariantOk;
}

// Decode a stored value that must be a variant.
static std::optional<VariantStructure> RequireVariant(MsgVariantContext* ctx,
                                                      const char* value) {
  std::optional<VariantStructure> variant =
      ExtractVariantStructureFromText(value);
  if (!variant) {
    ctx->impl.SetError(kMsgVariantErrorNotVariant,
                       "Value is not a variant structure");
  }
  return variant;
}

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

MsgVariantContext* msgvariant_context_create(void) {
  auto* ctx = new (std::nothrow) MsgVariantContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize()) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void msgvariant_context_destroy(MsgVariantContext* ctx) {
  delete ctx;
}

MsgVariantError msgvariant_set_default_locale(MsgVariantContext* ctx,
                                              const char* locale) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  if (!locale || !locale[0]) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam, "locale is NULL or empty");
    return kMsgVariantErrorInvalidParam;
  }
  ctx->impl.set_default_locale(locale);
  ctx->impl.ClearError();
  return kMsgVariantOk;
}

const char* msgvariant_get_default_locale(const MsgVariantContext* ctx) {
  if (!ctx) return "";
  return ctx->impl.default_locale().c_str();
}

MsgVariantError msgvariant_set_plural_callback(
    MsgVariantContext* ctx, msgvariant_plural_callback_t callback,
    void* userdata) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  ctx->impl.SetPluralCallback(callback, userdata);
  ctx->impl.ClearError();
  return kMsgVariantOk;
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

MsgVariantError msgvariant_get_last_error(const MsgVariantContext* ctx) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* msgvariant_get_last_error_message(const MsgVariantContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Variant evaluation
// ---------------------------------------------------------------------------

int msgvariant_is_variant(const char* value) {
  if (!value) return 0;
  return ExtractVariantStructureFromText(value) ? 1 : 0;
}

MsgVariantError msgvariant_render(MsgVariantContext* ctx, const char* value,
                                  const MsgVariantParam* params,
                                  int param_count, const char* locale,
                                  char** out_text) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  if (!out_text) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam, "out_text is NULL");
    return kMsgVariantErrorInvalidParam;
  }
  *out_text = nullptr;

  Params converted;
  if (!value || !ToParams(params, param_count, &converted)) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam,
                       "Invalid value or parameter array");
    return kMsgVariantErrorInvalidParam;
  }

  std::string text = msgvariant::internal::RenderTemplate(
      value, converted, ctx->impl.ResolveLocale(locale),
      ctx->impl.plural_rules());
  return ReturnString(ctx, text, out_text);
}

MsgVariantError msgvariant_detect_active_key(MsgVariantContext* ctx,
                                             const char* value,
                                             const MsgVariantParam* params,
                                             int param_count,
                                             const char* locale,
                                             char** out_key) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  if (!out_key) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam, "out_key is NULL");
    return kMsgVariantErrorInvalidParam;
  }
  *out_key = nullptr;

  Params converted;
  if (!value || !ToParams(params, param_count, &converted)) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam,
                       "Invalid value or parameter array");
    return kMsgVariantErrorInvalidParam;
  }

  std::optional<VariantStructure> variant = RequireVariant(ctx, value);
  if (!variant) return kMsgVariantErrorNotVariant;

  std::optional<std::string> key = msgvariant::internal::DetectActiveKey(
      *variant, converted, ctx->impl.ResolveLocale(locale),
      ctx->impl.plural_rules());
  if (!key) {
    ctx->impl.SetError(kMsgVariantErrorNoActiveKey,
                       "Variant has no match entries");
    return kMsgVariantErrorNoActiveKey;
  }
  return ReturnString(ctx, *key, out_key);
}

int msgvariant_get_form_count(MsgVariantContext* ctx, const char* value) {
  if (!ctx) return -1;
  if (!value) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam, "value is NULL");
    return -1;
  }
  std::optional<VariantStructure> variant = RequireVariant(ctx, value);
  if (!variant) return -1;
  ctx->impl.ClearError();
  return static_cast<int>(variant->match.size());
}

MsgVariantError msgvariant_get_form_key(MsgVariantContext* ctx,
                                        const char* value, int index,
                                        char** out_key) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  if (!value || !out_key) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam,
                       "value or out_key is NULL");
    return kMsgVariantErrorInvalidParam;
  }
  *out_key = nullptr;

  std::optional<VariantStructure> variant = RequireVariant(ctx, value);
  if (!variant) return kMsgVariantErrorNotVariant;

  std::vector<std::string> keys = msgvariant::internal::VariantForms(*variant);
  if (index < 0 || index >= static_cast<int>(keys.size())) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam,
                       "Form index out of range");
    return kMsgVariantErrorInvalidParam;
  }
  return ReturnString(ctx, keys[index], out_key);
}

MsgVariantError msgvariant_get_form_template(MsgVariantContext* ctx,
                                             const char* value,
                                             const char* key,
                                             char** out_template) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  if (!value || !key || !out_template) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam,
                       "value, key or out_template is NULL");
    return kMsgVariantErrorInvalidParam;
  }
  *out_template = nullptr;

  std::optional<VariantStructure> variant = RequireVariant(ctx, value);
  if (!variant) return kMsgVariantErrorNotVariant;

  std::optional<std::string> tmpl =
      msgvariant::internal::FindTemplate(*variant, key);
  if (!tmpl) {
    ctx->impl.SetError(kMsgVariantErrorKeyNotFound,
                       std::string("Pattern key not found: ") + key);
    return kMsgVariantErrorKeyNotFound;
  }
  return ReturnString(ctx, *tmpl, out_template);
}

MsgVariantError msgvariant_active_form_equals(MsgVariantContext* ctx,
                                              const char* value,
                                              const char* other_value,
                                              const MsgVariantParam* params,
                                              int param_count,
                                              const char* locale,
                                              int* out_equal) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  if (!value || !other_value || !out_equal) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam,
                       "value, other_value or out_equal is NULL");
    return kMsgVariantErrorInvalidParam;
  }
  *out_equal = 0;

  Params converted;
  if (!ToParams(params, param_count, &converted)) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam,
                       "Invalid parameter array");
    return kMsgVariantErrorInvalidParam;
  }

  std::optional<VariantStructure> variant = RequireVariant(ctx, value);
  if (!variant) return kMsgVariantErrorNotVariant;
  std::optional<VariantStructure> other = RequireVariant(ctx, other_value);
  if (!other) return kMsgVariantErrorNotVariant;

  *out_equal = msgvariant::internal::ActiveFormEquals(
                   *variant, *other, converted,
                   ctx->impl.ResolveLocale(locale), ctx->impl.plural_rules())
                   ? 1
                   : 0;
  ctx->impl.ClearError();
  return kMsgVariantOk;
}

MsgVariantError msgvariant_plural_category(MsgVariantContext* ctx,
                                           double number, const char* locale,
                                           MsgVariantPluralType type,
                                           char** out_category) {
  if (!ctx) return kMsgVariantErrorInvalidParam;
  if (!out_category) {
    ctx->impl.SetError(kMsgVariantErrorInvalidParam, "out_category is NULL");
    return kMsgVariantErrorInvalidParam;
  }
  *out_category = nullptr;

  PluralType plural_type = type == kMsgVariantPluralOrdinal
                               ? PluralType::kOrdinal
                               : PluralType::kCardinal;
  std::string category = ctx->impl.plural_rules().Select(
      number, ctx->impl.ResolveLocale(locale), plural_type);
  return ReturnString(ctx, category, out_category);
}

void msgvariant_free_string(char* str) {
  std::free(str);
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* msgvariant_version_string(void) {
  return MSGVARIANT_VERSION_STRING;
}

int msgvariant_version_major(void) { return MSGVARIANT_VERSION_MAJOR; }
int msgvariant_version_minor(void) { return MSGVARIANT_VERSION_MINOR; }
int msgvariant_version_patch(void) { return MSGVARIANT_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void msgvariant_set_log_level(MsgVariantLogLevel level) {
  msgvariant::internal::SetLogLevel(level);
}

void msgvariant_set_log_callback(msgvariant_log_callback_t callback,
                                 void* userdata) {
  auto sink = msgvariant::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void msgvariant_log(MsgVariantLogLevel level, const char* message) {
  if (!message) return;
  auto logger = msgvariant::internal::GetLogger();
  if (logger) {
    logger->log(msgvariant::internal::ToSpdlogLevel(level), "{}", message);
  }
}
