// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_CORE_STRING_UTIL_H_
#define MSGVARIANT_CORE_STRING_UTIL_H_

#include <string>
#include <vector>

namespace msgvariant {
namespace internal {

/// Strip leading and trailing ASCII whitespace.
std::string Trim(const std::string& s);

/// Split on every occurrence of @p sep. Always returns at least one part.
std::vector<std::string> Split(const std::string& s, char sep);

bool StartsWith(const std::string& s, const char* prefix);

/// Copy @p s into a malloc'ed C string (released by msgvariant_free_string).
/// Returns nullptr on allocation failure.
char* DupString(const std::string& s);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_CORE_STRING_UTIL_H_
