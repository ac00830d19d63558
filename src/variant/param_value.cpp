// Copyright 2026 The msgvariant Authors

#include "variant/param_value.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

#include "spdlog/fmt/fmt.h"

#include "core/string_util.h"

namespace msgvariant {
namespace internal {

namespace {

// Fixed notation is used for decimal exponents in (-7, 21], as Number's
// toString does; everything else is written as d[.ddd]e+/-x.
constexpr int kMinFixedPoint = -6;
constexpr int kMaxFixedPoint = 21;

// Split the shortest round-trip text of |n| (n finite, non-zero) into its
// significant digits and the position of the decimal point relative to
// them, so that |n| == 0.<digits> * 10^point.
void ShortestDigits(double n, std::string* digits, int* point) {
  std::string text = fmt::format("{}", std::fabs(n));
  int exponent = 0;
  size_t e = text.find_first_of("eE");
  if (e != std::string::npos) {
    exponent = std::atoi(text.c_str() + e + 1);
    text.erase(e);
  }
  size_t dot = text.find('.');
  int int_len = static_cast<int>(dot == std::string::npos ? text.size() : dot);
  if (dot != std::string::npos) text.erase(dot, 1);

  size_t first = text.find_first_not_of('0');
  size_t last = text.find_last_not_of('0');
  *digits = text.substr(first, last - first + 1);
  *point = int_len + exponent - static_cast<int>(first);
}

}  // namespace

std::string FormatNumber(double n) {
  if (std::isnan(n)) return "NaN";
  if (std::isinf(n)) return n > 0 ? "Infinity" : "-Infinity";
  if (n == 0.0) return "0";  // also folds -0

  std::string digits;
  int point = 0;
  ShortestDigits(n, &digits, &point);
  const int k = static_cast<int>(digits.size());

  std::string out = n < 0 ? "-" : "";
  if (point >= k && point <= kMaxFixedPoint) {
    out += digits;
    out.append(point - k, '0');
  } else if (point > 0 && point <= kMaxFixedPoint) {
    out += digits.substr(0, point);
    out += '.';
    out += digits.substr(point);
  } else if (point > kMinFixedPoint && point <= 0) {
    out += "0.";
    out.append(-point, '0');
    out += digits;
  } else {
    int exponent = point - 1;
    out += digits[0];
    if (k > 1) {
      out += '.';
      out += digits.substr(1);
    }
    out += exponent < 0 ? "e-" : "e+";
    out += std::to_string(exponent < 0 ? -exponent : exponent);
  }
  return out;
}

double ParseNumber(const std::string& text) {
  const double kNaN = std::numeric_limits<double>::quiet_NaN();
  std::string s = Trim(text);
  if (s.empty()) return 0.0;

  size_t digits_at = (s[0] == '+' || s[0] == '-') ? 1 : 0;
  if (s.compare(digits_at, std::string::npos, "Infinity") == 0) {
    return s[0] == '-' ? -std::numeric_limits<double>::infinity()
                       : std::numeric_limits<double>::infinity();
  }
  // strtod also accepts "inf", "nan" and hex floats; only decimals count.
  if (digits_at >= s.size()) return kNaN;
  char lead = s[digits_at];
  if (!std::isdigit(static_cast<unsigned char>(lead)) && lead != '.')
    return kNaN;
  if (s.size() > digits_at + 1 && lead == '0' &&
      (s[digits_at + 1] == 'x' || s[digits_at + 1] == 'X'))
    return kNaN;

  char* end = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return kNaN;
  return value;
}

std::string ParamValue::ToString() const {
  switch (kind_) {
    case Kind::kString: return string_;
    case Kind::kNumber: return FormatNumber(number_);
    case Kind::kBool:   return bool_ ? "true" : "false";
  }
  return string_;
}

double ParamValue::ToNumber() const {
  switch (kind_) {
    case Kind::kString: return ParseNumber(string_);
    case Kind::kNumber: return number_;
    case Kind::kBool:   return bool_ ? 1.0 : 0.0;
  }
  return std::numeric_limits<double>::quiet_NaN();
}

bool ParamValue::operator==(const ParamValue& other) const {
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case Kind::kString: return string_ == other.string_;
    case Kind::kNumber: return number_ == other.number_;
    case Kind::kBool:   return bool_ == other.bool_;
  }
  return false;
}

}  // namespace internal
}  // namespace msgvariant
