// Copyright 2026 The msgvariant Authors

#ifndef MSGVARIANT_VARIANT_PARAM_VALUE_H_
#define MSGVARIANT_VARIANT_PARAM_VALUE_H_

#include <map>
#include <string>
#include <utility>

namespace msgvariant {
namespace internal {

/// A caller-supplied scalar parameter: string, number or boolean.
///
/// Constructors are implicit so parameter maps read naturally:
///   Params params = {{"count", 5}, {"name", "Ada"}};
class ParamValue {
 public:
  enum class Kind { kString, kNumber, kBool };

  ParamValue() = default;
  ParamValue(const char* s) : string_(s ? s : "") {}
  ParamValue(std::string s) : string_(std::move(s)) {}
  ParamValue(int n) : kind_(Kind::kNumber), number_(n) {}
  ParamValue(long n) : kind_(Kind::kNumber), number_(static_cast<double>(n)) {}
  ParamValue(long long n)
      : kind_(Kind::kNumber), number_(static_cast<double>(n)) {}
  ParamValue(double n) : kind_(Kind::kNumber), number_(n) {}
  ParamValue(bool b) : kind_(Kind::kBool), bool_(b) {}

  Kind kind() const { return kind_; }
  const std::string& string_value() const { return string_; }
  double number_value() const { return number_; }
  bool bool_value() const { return bool_; }

  /// Text form used for selector comparison and placeholder substitution.
  /// Numbers use the shortest round-trip decimal ("5", "5.5", "-0.25").
  std::string ToString() const;

  /// Numeric coercion used by plural selectors.
  /// Strings are trimmed; "" reads as 0, booleans as 1/0, and anything that
  /// is not a decimal number (or "Infinity") reads as NaN.
  double ToNumber() const;

  bool operator==(const ParamValue& other) const;
  bool operator!=(const ParamValue& other) const { return !(*this == other); }

 private:
  Kind kind_ = Kind::kString;
  std::string string_;
  double number_ = 0.0;
  bool bool_ = false;
};

/// Runtime parameters keyed by name.
using Params = std::map<std::string, ParamValue>;

/// Format a number the way ParamValue::ToString() does.
std::string FormatNumber(double n);

/// Parse a decimal string with the coercion rules of ParamValue::ToNumber().
double ParseNumber(const std::string& text);

}  // namespace internal
}  // namespace msgvariant

#endif  // MSGVARIANT_VARIANT_PARAM_VALUE_H_
