#pragma once

#include <charconv>
#include <cmath>
#include <cstdio>
#include <string>
#include <system_error>

namespace StringUtils {

// Fixed point formatting, e.g. FormatFixed(3.14159, 2) -> "3.14".
inline std::string FormatFixed(double value, int decimals) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  if (n < 0)
    return {};
  if (static_cast<size_t>(n) >= sizeof(buf)) {
    std::string big(static_cast<size_t>(n) + 1, '\0');
    std::snprintf(&big[0], big.size(), "%.*f", decimals, value);
    big.resize(static_cast<size_t>(n));
    return big;
  }
  return std::string(buf, static_cast<size_t>(n));
}

// Fixed point formatting that rounds half-up on the shortest decimal text of
// the value: FormatFixedHalfUp(0.25, 1) -> "0.3" while FormatFixed gives
// "0.2" because the exact binary value is rounded half-even.
inline std::string FormatFixedHalfUp(double value, int decimals) {
  if (!std::isfinite(value) || decimals < 0)
    return FormatFixed(value, decimals);

  char buf[512];
  auto res = std::to_chars(buf, buf + sizeof(buf), value,
                           std::chars_format::fixed);
  if (res.ec != std::errc{})
    return FormatFixed(value, decimals);

  std::string text(buf, res.ptr);
  bool negative = !text.empty() && text[0] == '-';
  if (negative)
    text.erase(0, 1);

  size_t dot = text.find('.');
  std::string whole = dot == std::string::npos ? text : text.substr(0, dot);
  std::string frac = dot == std::string::npos ? "" : text.substr(dot + 1);

  bool roundUp = frac.size() > static_cast<size_t>(decimals) &&
                 frac[decimals] >= '5';
  frac.resize(decimals, '0');

  std::string digits = whole + frac;
  bool carry = roundUp;
  for (size_t i = digits.size(); carry && i > 0; --i) {
    if (digits[i - 1] == '9') {
      digits[i - 1] = '0';
    } else {
      ++digits[i - 1];
      carry = false;
    }
  }
  if (carry)
    digits.insert(digits.begin(), '1');

  std::string out = negative ? "-" : "";
  out += digits.substr(0, digits.size() - decimals);
  if (decimals > 0)
    out += "." + digits.substr(digits.size() - decimals);
  return out;
}

// Inserts ',' every three digits in the integer part of an already formatted
// number. A leading sign and the fractional part are preserved.
inline std::string GroupThousands(const std::string &number) {
  size_t start = (!number.empty() && (number[0] == '-' || number[0] == '+'))
                     ? 1
                     : 0;
  size_t end = number.find('.', start);
  if (end == std::string::npos)
    end = number.size();

  std::string out = number.substr(0, start);
  size_t digits = end - start;
  for (size_t i = 0; i < digits; ++i) {
    if (i > 0 && (digits - i) % 3 == 0)
      out += ',';
    out += number[start + i];
  }
  out += number.substr(end);
  return out;
}

// Formats like the "#,##0.0" pattern for one decimal: 1234.56 -> "1,234.6".
inline std::string FormatGrouped(double value, int decimals = 1) {
  return GroupThousands(FormatFixed(value, decimals));
}

// True when the text is empty or contains only whitespace/control characters.
inline bool IsBlank(const std::string &text) {
  for (char c : text) {
    if (static_cast<unsigned char>(c) > ' ')
      return false;
  }
  return true;
}

} // namespace StringUtils
