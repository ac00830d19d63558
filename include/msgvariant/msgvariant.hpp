// Copyright 2026 The msgvariant Authors
//
// C++ RAII wrapper for the msgvariant C API.
// Header-only; just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "msgvariant/msgvariant.hpp"
//   msgvariant::Context ctx;
//   msgvariant::Params params;
//   params.Set("count", 5);
//   std::string text = ctx.Render(stored_value, params, "en");

#ifndef MSGVARIANT_MSGVARIANT_HPP_
#define MSGVARIANT_MSGVARIANT_HPP_

#include "msgvariant/msgvariant.h"

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

namespace msgvariant {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(MsgVariantError code, const char* msg)
      : std::runtime_error(msg ? msg : "msgvariant error"), code_(code) {}
  MsgVariantError code() const noexcept { return code_; }

 private:
  MsgVariantError code_;
};

// ---------------------------------------------------------------------------
// Params  (owns the strings the raw MsgVariantParam array points into)
// ---------------------------------------------------------------------------

class Params {
 public:
  Params& Set(const std::string& name, const std::string& value) {
    Entry& e = Add(name, kMsgVariantParamString);
    e.text = value;
    return *this;
  }
  Params& Set(const std::string& name, const char* value) {
    return Set(name, std::string(value ? value : ""));
  }
  Params& Set(const std::string& name, double value) {
    Add(name, kMsgVariantParamNumber).number = value;
    return *this;
  }
  Params& Set(const std::string& name, int value) {
    return Set(name, static_cast<double>(value));
  }
  Params& Set(const std::string& name, bool value) {
    Add(name, kMsgVariantParamBool).flag = value;
    return *this;
  }

  bool empty() const noexcept { return entries_.empty(); }
  int size() const noexcept { return static_cast<int>(entries_.size()); }

  /// Build the C view. Valid while this object is alive and unmodified.
  std::vector<MsgVariantParam> raw() const {
    std::vector<MsgVariantParam> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
      MsgVariantParam p = {};
      p.name = e.name.c_str();
      p.type = e.type;
      p.string_value = e.text.c_str();
      p.number_value = e.number;
      p.bool_value = e.flag ? 1 : 0;
      out.push_back(p);
    }
    return out;
  }

 private:
  struct Entry {
    std::string name;
    MsgVariantParamType type = kMsgVariantParamString;
    std::string text;
    double number = 0.0;
    bool flag = false;
  };

  Entry& Add(const std::string& name, MsgVariantParamType type) {
    for (auto& e : entries_) {
      if (e.name == name) {
        e = Entry();
        e.name = name;
        e.type = type;
        return e;
      }
    }
    entries_.emplace_back();
    entries_.back().name = name;
    entries_.back().type = type;
    return entries_.back();
  }

  // deque keeps element addresses stable across push_back.
  std::deque<Entry> entries_;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(msgvariant_context_create()) {
    if (!raw_)
      throw Error(kMsgVariantErrorNotInitialized, "Context creation failed");
  }
  ~Context() { msgvariant_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      msgvariant_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  MsgVariantContext* get() const noexcept { return raw_; }

  MsgVariantError last_error() const {
    return msgvariant_get_last_error(raw_);
  }
  const char* last_error_message() const {
    return msgvariant_get_last_error_message(raw_);
  }

  // -- Configuration --

  void set_default_locale(const std::string& locale) {
    check(msgvariant_set_default_locale(raw_, locale.c_str()));
  }
  std::string default_locale() const {
    return msgvariant_get_default_locale(raw_);
  }

  void set_plural_callback(msgvariant_plural_callback_t cb, void* userdata) {
    check(msgvariant_set_plural_callback(raw_, cb, userdata));
  }

  // -- Evaluation --

  std::string Render(const std::string& value, const Params& params = {},
                     const char* locale = nullptr) {
    auto raw = params.raw();
    char* out = nullptr;
    check(msgvariant_render(raw_, value.c_str(), raw.data(), params.size(),
                            locale, &out));
    return take(out);
  }

  std::string DetectActiveKey(const std::string& value,
                              const Params& params = {},
                              const char* locale = nullptr) {
    auto raw = params.raw();
    char* out = nullptr;
    check(msgvariant_detect_active_key(raw_, value.c_str(), raw.data(),
                                       params.size(), locale, &out));
    return take(out);
  }

  std::vector<std::string> FormKeys(const std::string& value) {
    int n = msgvariant_get_form_count(raw_, value.c_str());
    if (n < 0) throw_last("FormKeys failed");
    std::vector<std::string> keys;
    keys.reserve(n);
    for (int i = 0; i < n; ++i) {
      char* out = nullptr;
      check(msgvariant_get_form_key(raw_, value.c_str(), i, &out));
      keys.push_back(take(out));
    }
    return keys;
  }

  std::string FormTemplate(const std::string& value, const std::string& key) {
    char* out = nullptr;
    check(msgvariant_get_form_template(raw_, value.c_str(), key.c_str(), &out));
    return take(out);
  }

  bool ActiveFormEquals(const std::string& value,
                        const std::string& other_value,
                        const Params& params = {},
                        const char* locale = nullptr) {
    auto raw = params.raw();
    int equal = 0;
    check(msgvariant_active_form_equals(raw_, value.c_str(),
                                        other_value.c_str(), raw.data(),
                                        params.size(), locale, &equal));
    return equal != 0;
  }

  std::string PluralCategory(double number, const char* locale = nullptr,
                             MsgVariantPluralType type =
                                 kMsgVariantPluralCardinal) {
    char* out = nullptr;
    check(msgvariant_plural_category(raw_, number, locale, type, &out));
    return take(out);
  }

 private:
  static std::string take(char* s) {
    std::string out = s ? s : "";
    msgvariant_free_string(s);
    return out;
  }
  void check(MsgVariantError err) {
    if (err != kMsgVariantOk)
      throw Error(err, msgvariant_get_last_error_message(raw_));
  }
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = msgvariant_get_last_error(raw_);
    const char* msg = msgvariant_get_last_error_message(raw_);
    throw Error(err != kMsgVariantOk ? err : kMsgVariantErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  MsgVariantContext* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

inline bool is_variant(const std::string& value) {
  return msgvariant_is_variant(value.c_str()) != 0;
}

inline const char* version_string() { return msgvariant_version_string(); }

}  // namespace msgvariant

#endif  // MSGVARIANT_MSGVARIANT_HPP_
