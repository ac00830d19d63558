// Copyright 2026 The msgvariant Authors

#include "variant/declaration.h"

#include <sstream>

#include "core/logger.h"
#include "core/string_util.h"

namespace msgvariant {
namespace internal {

namespace {

constexpr const char kInputPrefix[] = "input ";
constexpr const char kLocalPrefix[] = "local ";

Declaration Unknown(const std::string& text, const char* reason) {
  MSGVARIANT_LOG_WARN("Invalid declaration ({}): '{}'", reason, text);
  return UnknownDeclaration{text};
}

// "<name> = <source>: <transform> k=v ..." (text after "local ").
Declaration ParseLocal(const std::string& text, const std::string& rest) {
  size_t eq = rest.find('=');
  if (eq == std::string::npos) return Unknown(text, "missing '='");

  LocalDeclaration local;
  local.name = Trim(rest.substr(0, eq));
  std::string after_eq = Trim(rest.substr(eq + 1));

  size_t colon = after_eq.find(':');
  if (colon == std::string::npos) return Unknown(text, "missing ':'");

  local.source = Trim(after_eq.substr(0, colon));

  std::istringstream tokens(after_eq.substr(colon + 1));
  tokens >> local.transform;

  std::string token;
  while (tokens >> token) {
    size_t sep = token.find('=');
    if (sep == std::string::npos) continue;
    std::string key = token.substr(0, sep);
    // Only the text up to a second '=' is the value.
    std::string value = token.substr(sep + 1);
    value = value.substr(0, value.find('='));
    if (key.empty() || value.empty()) continue;
    local.options[key] = value;
  }
  return local;
}

}  // namespace

bool operator==(const InputDeclaration& a, const InputDeclaration& b) {
  return a.name == b.name;
}

bool operator==(const LocalDeclaration& a, const LocalDeclaration& b) {
  return a.name == b.name && a.source == b.source &&
         a.transform == b.transform && a.options == b.options;
}

bool operator==(const UnknownDeclaration& a, const UnknownDeclaration& b) {
  return a.raw == b.raw;
}

Declaration ParseDeclaration(const std::string& text) {
  if (StartsWith(text, kInputPrefix)) {
    std::string name = Trim(text.substr(sizeof(kInputPrefix) - 1));
    if (name.empty()) return Unknown(text, "missing input name");
    return InputDeclaration{name};
  }
  if (StartsWith(text, kLocalPrefix)) {
    return ParseLocal(text, Trim(text.substr(sizeof(kLocalPrefix) - 1)));
  }
  return Unknown(text, "unknown format");
}

std::vector<Declaration> ParseDeclarations(
    const std::vector<std::string>& texts) {
  std::vector<Declaration> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    if (text.empty()) continue;
    out.push_back(ParseDeclaration(text));
  }
  return out;
}

std::string FormatDeclaration(const Declaration& decl) {
  if (const auto* input = std::get_if<InputDeclaration>(&decl)) {
    return kInputPrefix + input->name;
  }
  if (const auto* local = std::get_if<LocalDeclaration>(&decl)) {
    std::string out = kLocalPrefix + local->name + " = " + local->source +
                      ": " + local->transform;
    for (const auto& kv : local->options) {
      out += " " + kv.first + "=" + kv.second;
    }
    return out;
  }
  return std::get<UnknownDeclaration>(decl).raw;
}

const std::string* DeclarationName(const Declaration& decl) {
  if (const auto* input = std::get_if<InputDeclaration>(&decl))
    return &input->name;
  if (const auto* local = std::get_if<LocalDeclaration>(&decl))
    return &local->name;
  return nullptr;
}

const Declaration* FindDeclaration(const std::vector<Declaration>& decls,
                                   const std::string& name) {
  for (const auto& decl : decls) {
    const std::string* bound = DeclarationName(decl);
    if (bound && *bound == name) return &decl;
  }
  return nullptr;
}

}  // namespace internal
}  // namespace msgvariant
