// Copyright 2026 The msgvariant Authors
//
// Declarations name the values a variant selects on.  Two textual forms
// are recognized:
//
//   input <name>
//   local <name> = <source>: <transform> [<key>=<value> ...]
//
// Anything else parses to UnknownDeclaration.  Parsing is total: it never
// fails, it only degrades.

#ifndef MSGVARIANT_VARIANT_DECLARATION_H_
#define MSGVARIANT_VARIANT_DECLARATION_H_

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace msgvariant {
namespace internal {

/// Value taken verbatim from the caller parameter @c name.
struct InputDeclaration {
  std::string name;
};

/// Value derived from parameter @c source by applying @c transform.
struct LocalDeclaration {
  std::string name;
  std::string source;
  std::string transform;                       // e.g. "plural"
  std::map<std::string, std::string> options;  // e.g. {type: ordinal}
};

/// Declaration text that matched neither grammar.
struct UnknownDeclaration {
  std::string raw;
};

using Declaration =
    std::variant<InputDeclaration, LocalDeclaration, UnknownDeclaration>;

bool operator==(const InputDeclaration& a, const InputDeclaration& b);
bool operator==(const LocalDeclaration& a, const LocalDeclaration& b);
bool operator==(const UnknownDeclaration& a, const UnknownDeclaration& b);

/// Parse one declaration string. Emits a warning for unrecognized text.
Declaration ParseDeclaration(const std::string& text);

/// Parse a list of declaration strings. Empty strings are dropped.
std::vector<Declaration> ParseDeclarations(
    const std::vector<std::string>& texts);

/// Canonical text of a declaration. ParseDeclaration(FormatDeclaration(d))
/// yields @p d again for every declaration ParseDeclaration can produce.
std::string FormatDeclaration(const Declaration& decl);

/// Name bound by the declaration, or nullptr for UnknownDeclaration.
const std::string* DeclarationName(const Declaration& decl);

/// Find the first declaration binding @p name.
const Declaration* FindDeclaration(const std::vector<Declaration>& decls,
                                   const std::string& name);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_DECLARATION_H_
