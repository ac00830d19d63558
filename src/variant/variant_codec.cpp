// Copyright 2026 The msgvariant Authors

#include "variant/variant_codec.h"

#include <cmath>
#include <utility>

#include "core/logger.h"
#include "core/string_util.h"

namespace msgvariant {
namespace internal {

namespace {

// Opening of the wrapping array-of-objects shape.
constexpr const char kWrappedVariantToken[] = "[{";

constexpr const char kDeclarationsField[] = "declarations";
constexpr const char kSelectorsField[] = "selectors";
constexpr const char kMatchField[] = "match";

// Loose truthiness of a JSON value (null, false, 0, NaN and "" are false).
bool IsTruthy(const Json& v) {
  switch (v.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
      return false;
    case Json::value_t::boolean:
      return v.get<bool>();
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned:
    case Json::value_t::number_float: {
      double d = v.get<double>();
      return d != 0.0 && !std::isnan(d);
    }
    case Json::value_t::string:
      return !v.get_ref<const std::string&>().empty();
    default:
      return true;
  }
}

std::string TemplateText(const Json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_null()) return {};
  return v.dump(-1, ' ', false, Json::error_handler_t::replace);
}

VariantStructure FromObject(const Json& obj) {
  VariantStructure variant;

  auto decls = obj.find(kDeclarationsField);
  if (decls != obj.end()) {
    variant.declarations = ParseDeclarationList(*decls);
  }

  auto selectors = obj.find(kSelectorsField);
  if (selectors != obj.end() && selectors->is_array()) {
    for (const auto& s : *selectors) {
      if (s.is_string() && !s.get_ref<const std::string&>().empty())
        variant.selectors.push_back(s.get<std::string>());
    }
  }

  const Json& match = obj.at(kMatchField);
  if (match.is_object()) {
    for (const auto& item : match.items()) {
      variant.match.emplace_back(item.key(), TemplateText(item.value()));
    }
  } else {
    MSGVARIANT_LOG_WARN("Variant match is not an object (type {})",
                        match.type_name());
  }
  return variant;
}

std::optional<VariantStructure> FromWrapped(const Json& value) {
  if (!value.is_array() || value.empty()) return std::nullopt;
  const Json& first = value.front();
  if (!first.is_object()) return std::nullopt;
  auto match = first.find(kMatchField);
  if (match == first.end() || !IsTruthy(*match)) return std::nullopt;
  return FromObject(first);
}

}  // namespace

std::optional<VariantStructure> ExtractVariantStructure(const Json& value) {
  if (!value.is_string()) return FromWrapped(value);

  const std::string& text = value.get_ref<const std::string&>();
  if (!StartsWith(Trim(text), kWrappedVariantToken)) return std::nullopt;

  Json parsed = Json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    MSGVARIANT_LOG_DEBUG("Variant-looking text is not valid JSON");
    return std::nullopt;
  }
  return FromWrapped(parsed);
}

std::optional<VariantStructure> ExtractVariantStructureFromText(
    const std::string& text) {
  return ExtractVariantStructure(Json(text));
}

std::vector<Declaration> ParseDeclarationList(const Json& list) {
  std::vector<std::string> texts;
  if (list.is_array()) {
    for (const auto& entry : list) {
      if (entry.is_string()) texts.push_back(entry.get<std::string>());
    }
  }
  return ParseDeclarations(texts);
}

Json VariantToJson(const VariantStructure& variant) {
  Json obj = Json::object();
  if (!variant.declarations.empty()) {
    Json decls = Json::array();
    for (const auto& decl : variant.declarations) {
      decls.push_back(FormatDeclaration(decl));
    }
    obj[kDeclarationsField] = std::move(decls);
  }
  if (!variant.selectors.empty()) {
    obj[kSelectorsField] = variant.selectors;
  }
  Json match = Json::object();
  for (const auto& entry : variant.match) {
    match[entry.first] = entry.second;
  }
  obj[kMatchField] = std::move(match);

  Json wrapped = Json::array();
  wrapped.push_back(std::move(obj));
  return wrapped;
}

std::string EncodeVariantStructure(const VariantStructure& variant) {
  return VariantToJson(variant).dump(-1, ' ', false,
                                     Json::error_handler_t::replace);
}

}  // namespace internal
}  // namespace msgvariant
