// Copyright 2026 The msgvariant Authors
//
// Storage shape of a variant: a one-element JSON array wrapping the
// structure object.
//
//   [{"declarations": [...], "selectors": [...], "match": {"k=v": "..."}}]
//
// The wrapper array is kept for compatibility with the message compiler
// that produces this data.  Object key order of "match" is significant, so
// all JSON here is nlohmann::ordered_json.

#ifndef MSGVARIANT_VARIANT_VARIANT_CODEC_H_
#define MSGVARIANT_VARIANT_VARIANT_CODEC_H_

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "variant/declaration.h"
#include "variant/variant_structure.h"

namespace msgvariant {
namespace internal {

using Json = nlohmann::ordered_json;

/// Normalize a stored value into a variant structure.
///
/// Accepts an array whose first element is an object with a "match" field,
/// or a string whose trimmed text starts with "[{" and decodes to such an
/// array.  Everything else (plain templates, undecodable text, scalars,
/// null) yields nullopt: the value is not a variant.
std::optional<VariantStructure> ExtractVariantStructure(const Json& value);

/// ExtractVariantStructure() on text as it comes out of storage.
std::optional<VariantStructure> ExtractVariantStructureFromText(
    const std::string& text);

/// Parse a JSON list of declaration strings; other entries are dropped.
std::vector<Declaration> ParseDeclarationList(const Json& list);

/// Storage shape of @p variant as a JSON value.
Json VariantToJson(const VariantStructure& variant);

/// Storage shape of @p variant as compact JSON text.
std::string EncodeVariantStructure(const VariantStructure& variant);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_VARIANT_CODEC_H_
