// Copyright 2026 The msgvariant Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef MSGVARIANT_MSGVARIANT_H_
#define MSGVARIANT_MSGVARIANT_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(MSGVARIANT_STATIC)
#define MSGVARIANT_API
#elif defined(_WIN32)
#if defined(MSGVARIANT_BUILDING)
#define MSGVARIANT_API __declspec(dllexport)
#else
#define MSGVARIANT_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define MSGVARIANT_API __attribute__((visibility("default")))
#else
#define MSGVARIANT_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "msgvariant/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
// General rules:
//   - Variant evaluation holds no state between calls.  Every render /
//     detect call takes its full input and returns a new value.
//   - Each MsgVariantContext is independent.  The same context may be used
//     for concurrent render / detect / plural calls; its plural rule cache is
//     internally synchronized.
//   - The last error is tracked per thread: msgvariant_get_last_error()
//     reports the outcome of the calling thread's own last call on that
//     context, whatever other threads are doing with it.
//   - Mutating a context (default locale, plural callback) is NOT
//     synchronized.  Configure a context before sharing it.
//   - msgvariant_set_log_level() and msgvariant_set_log_callback() are
//     process-global and internally synchronized.
//   - msgvariant_version_*() and msgvariant_is_variant() are stateless.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct MsgVariantContext MsgVariantContext;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by msgvariant functions.
///
/// Malformed translation data is never an error: it degrades to a
/// best-effort result plus a warning on the log.  Errors report API misuse
/// or a question that has no answer for the given value.
typedef enum MsgVariantError {
  kMsgVariantOk = 0,
  kMsgVariantErrorNotInitialized = -1,
  kMsgVariantErrorInvalidParam = -2,
  kMsgVariantErrorOutOfMemory = -5,
  kMsgVariantErrorNotVariant = -30,    ///< Value is a plain template
  kMsgVariantErrorNoActiveKey = -31,   ///< Variant has no match entries
  kMsgVariantErrorKeyNotFound = -32,   ///< Pattern key not in match table
  kMsgVariantErrorUnknown = -99,
} MsgVariantError;

/// Type tag of a caller-supplied parameter.
typedef enum MsgVariantParamType {
  kMsgVariantParamString = 0,
  kMsgVariantParamNumber = 1,
  kMsgVariantParamBool = 2,
} MsgVariantParamType;

/// One named runtime parameter.  Only the field selected by @c type is read.
typedef struct MsgVariantParam {
  const char* name;           ///< Parameter name (entries with NULL are skipped)
  MsgVariantParamType type;
  const char* string_value;   ///< UTF-8, NULL is read as ""
  double number_value;
  int bool_value;             ///< Non-zero = true
} MsgVariantParam;

/// Plural categorization flavor.
typedef enum MsgVariantPluralType {
  kMsgVariantPluralCardinal = 0,   ///< "1 item", "5 items"
  kMsgVariantPluralOrdinal = 1,    ///< "1st", "2nd", "3rd"
} MsgVariantPluralType;

/// Log severity levels for the internal logging system.
typedef enum MsgVariantLogLevel {
  kMsgVariantLogTrace = 0,   ///< Very detailed diagnostic info
  kMsgVariantLogDebug = 1,   ///< Debug-level messages
  kMsgVariantLogInfo = 2,    ///< Informational messages (default)
  kMsgVariantLogWarn = 3,    ///< Warnings (data degradation is reported here)
  kMsgVariantLogError = 4,   ///< Errors
  kMsgVariantLogFatal = 5,   ///< Fatal / critical errors
} MsgVariantLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to msgvariant_set_log_callback.
typedef void (*msgvariant_log_callback_t)(MsgVariantLogLevel level,
                                          const char* message,
                                          void* userdata);

/// User-defined plural categorizer.
///
/// Must return one of "zero", "one", "two", "few", "many", "other".  The
/// returned string only needs to stay valid until the callback returns
/// again.  Returning NULL is read as "other".  The callback may be invoked
/// concurrently if the context is shared across threads.
typedef const char* (*msgvariant_plural_callback_t)(double number,
                                                    const char* locale,
                                                    MsgVariantPluralType type,
                                                    void* userdata);

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a new msgvariant context backed by the ICU plural rules.
/// The caller must destroy it with msgvariant_context_destroy().
///
/// @return A new context, or NULL on failure.
MSGVARIANT_API MsgVariantContext* msgvariant_context_create(void);

/// Destroy a context and release all associated resources.
///
/// @param ctx  Context to destroy. NULL is safely ignored.
MSGVARIANT_API void msgvariant_context_destroy(MsgVariantContext* ctx);

/// Set the locale used when a call passes NULL or "" as its locale.
/// Default is "en".
MSGVARIANT_API MsgVariantError msgvariant_set_default_locale(
    MsgVariantContext* ctx, const char* locale);

/// Get the context default locale. Never returns NULL.
MSGVARIANT_API const char* msgvariant_get_default_locale(
    const MsgVariantContext* ctx);

/// Replace the plural categorizer with a user callback.
/// Pass NULL as @p callback to restore the built-in ICU rules.
MSGVARIANT_API MsgVariantError msgvariant_set_plural_callback(
    MsgVariantContext* ctx, msgvariant_plural_callback_t callback,
    void* userdata);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

/// Get the error code from the calling thread's last operation on this
/// context.
MSGVARIANT_API MsgVariantError msgvariant_get_last_error(
    const MsgVariantContext* ctx);

/// Get a human-readable error message for the last failed operation.
///
/// Lifetime: The returned string is valid until the calling thread's next
/// API call on the same context.  Copy the string if you need it beyond that.
///
/// @return UTF-8 error message. Never returns NULL.
MSGVARIANT_API const char* msgvariant_get_last_error_message(
    const MsgVariantContext* ctx);

// ---------------------------------------------------------------------------
// Variant evaluation
// ---------------------------------------------------------------------------
//
// A stored value is either a plain template ("Hello {name}") or a variant:
// a JSON array whose first element is an object with an ordered "match"
// table and optional "declarations" / "selectors":
//
//   [{"declarations": ["input count", "local countPlural = count: plural"],
//     "selectors": ["countPlural"],
//     "match": {"countPlural=one": "1 item",
//               "countPlural=other": "{count} items"}}]
//

/// Check whether @p value holds a variant structure.
/// @return Non-zero if the value decodes as a variant.
MSGVARIANT_API int msgvariant_is_variant(const char* value);

/// Render a stored value with the given parameters.
///
/// Variants are resolved first-match-wins against the evaluated selectors;
/// plain templates go straight to placeholder substitution.  Unresolved
/// placeholders are kept verbatim.  Malformed variants render best-effort
/// (possibly "") and still return kMsgVariantOk.
///
/// @param ctx          Initialized context.
/// @param value        UTF-8 stored value.
/// @param params       Parameter array (may be NULL when @p param_count is 0).
/// @param param_count  Number of entries in @p params.
/// @param locale       BCP-47 locale tag, or NULL for the context default.
/// @param out_text     On success, receives a newly allocated UTF-8 string.
///                     Caller must free with msgvariant_free_string().
/// @return kMsgVariantOk on success.
MSGVARIANT_API MsgVariantError msgvariant_render(
    MsgVariantContext* ctx, const char* value, const MsgVariantParam* params,
    int param_count, const char* locale, char** out_text);

/// Get the pattern key of the variant branch that would be rendered.
///
/// When no entry matches, the first pattern key is reported (the same
/// branch msgvariant_render() falls back to).
///
/// @param out_key  On success, receives a newly allocated pattern key.
///                 Caller must free with msgvariant_free_string().
/// @return kMsgVariantOk, kMsgVariantErrorNotVariant for plain templates, or
///         kMsgVariantErrorNoActiveKey if the variant has no match entries.
MSGVARIANT_API MsgVariantError msgvariant_detect_active_key(
    MsgVariantContext* ctx, const char* value, const MsgVariantParam* params,
    int param_count, const char* locale, char** out_key);

/// Get the number of match entries (forms) of a variant.
/// @return Number of forms, or -1 if @p value is not a variant.
MSGVARIANT_API int msgvariant_get_form_count(MsgVariantContext* ctx,
                                             const char* value);

/// Get the pattern key of a form by index (match order, 0-based).
/// @param out_key  Receives a newly allocated string (free with
///                 msgvariant_free_string()).
MSGVARIANT_API MsgVariantError msgvariant_get_form_key(MsgVariantContext* ctx,
                                                       const char* value,
                                                       int index,
                                                       char** out_key);

/// Get the raw template stored under an exact pattern key.
/// @param out_template  Receives a newly allocated string (free with
///                      msgvariant_free_string()).
/// @return kMsgVariantErrorKeyNotFound if the key is not in the match table.
MSGVARIANT_API MsgVariantError msgvariant_get_form_template(
    MsgVariantContext* ctx, const char* value, const char* key,
    char** out_template);

/// Compare the active form of two variant values.
///
/// The active key is detected on @p value and the templates both values
/// store under that key are compared.  Used by editors to decide whether the
/// form currently on screen differs from a reference translation.
///
/// @param out_equal  Receives non-zero if both values hold the same template
///                   for the active key, 0 otherwise.
MSGVARIANT_API MsgVariantError msgvariant_active_form_equals(
    MsgVariantContext* ctx, const char* value, const char* other_value,
    const MsgVariantParam* params, int param_count, const char* locale,
    int* out_equal);

/// Categorize a number with the context plural rules.
/// @param out_category  Receives a newly allocated category label (free with
///                      msgvariant_free_string()).
MSGVARIANT_API MsgVariantError msgvariant_plural_category(
    MsgVariantContext* ctx, double number, const char* locale,
    MsgVariantPluralType type, char** out_category);

/// Free a string returned by msgvariant. NULL is safely ignored.
MSGVARIANT_API void msgvariant_free_string(char* str);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
MSGVARIANT_API const char* msgvariant_version_string(void);

/// Get the major version number.
MSGVARIANT_API int msgvariant_version_major(void);

/// Get the minor version number.
MSGVARIANT_API int msgvariant_version_minor(void);

/// Get the patch version number.
MSGVARIANT_API int msgvariant_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default level is kMsgVariantLogInfo.
MSGVARIANT_API void msgvariant_set_log_level(MsgVariantLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to the callback in addition to the default stderr
/// output.  Pass NULL as @p callback to unregister a previous callback.
///
/// @param callback  The callback function, or NULL to unregister.
/// @param userdata  Opaque pointer passed through to the callback.
MSGVARIANT_API void msgvariant_set_log_callback(
    msgvariant_log_callback_t callback, void* userdata);

/// Emit a log message at the given level through the msgvariant logging
/// system.
///
/// @param level    Severity level.
/// @param message  Null-terminated UTF-8 string.
MSGVARIANT_API void msgvariant_log(MsgVariantLogLevel level,
                                   const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // MSGVARIANT_MSGVARIANT_H_
