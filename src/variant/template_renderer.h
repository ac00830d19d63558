// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_VARIANT_TEMPLATE_RENDERER_H_
#define MSGVARIANT_VARIANT_TEMPLATE_RENDERER_H_

#include <string>

#include "variant/param_value.h"

namespace msgvariant {
namespace internal {

/// Replace each {identifier} (ASCII letters, digits, '_') with the named
/// parameter.  Placeholders without a parameter stay as written.  Single
/// pass: substituted text is not scanned again.
std::string SubstituteParams(const std::string& tmpl, const Params& params);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_TEMPLATE_RENDERER_H_
