// Copyright 2026 The msgvariant Authors

#include "variant/template_renderer.h"

namespace msgvariant {
namespace internal {

namespace {

// ASCII only, like a regex \w.
bool IsWordChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

}  // namespace

std::string SubstituteParams(const std::string& tmpl, const Params& params) {
  std::string out;
  out.reserve(tmpl.size());

  size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] != '{') {
      out += tmpl[i++];
      continue;
    }
    size_t end = i + 1;
    while (end < tmpl.size() && IsWordChar(tmpl[end])) ++end;
    if (end == i + 1 || end >= tmpl.size() || tmpl[end] != '}') {
      // Not a placeholder; a later '{' may still start one.
      out += tmpl[i++];
      continue;
    }

    auto it = params.find(tmpl.substr(i + 1, end - i - 1));
    if (it != params.end()) {
      out += it->second.ToString();
    } else {
      out.append(tmpl, i, end - i + 1);
    }
    i = end + 1;
  }
  return out;
}

}  // namespace internal
}  // namespace msgvariant
