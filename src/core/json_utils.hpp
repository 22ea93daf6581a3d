#ifndef PROBEKIT_CORE_JSON_UTILS_HPP_
#define PROBEKIT_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace probekit::core {

// Appends `input` to `out` with JSON string escaping applied. Control
// characters without a short escape are written as \u00XX.
inline void AppendEscapedJson(std::string& out, std::string_view input) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      continue;
    case '\\':
      out += "\\\\";
      continue;
    case '\b':
      out += "\\b";
      continue;
    case '\f':
      out += "\\f";
      continue;
    case '\n':
      out += "\\n";
      continue;
    case '\r':
      out += "\\r";
      continue;
    case '\t':
      out += "\\t";
      continue;
    default:
      break;
    }
    const auto code = static_cast<unsigned char>(ch);
    if (code < 0x20U) {
      out += "\\u00";
      out.push_back(kHex[code >> 4U]);
      out.push_back(kHex[code & 0x0FU]);
    } else {
      out.push_back(ch);
    }
  }
}

inline std::string Quoted(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 2U);
  out.push_back('"');
  AppendEscapedJson(out, input);
  out.push_back('"');
  return out;
}

// Fixed-precision number text. Non-finite values are emitted as 0 so reports
// always stay valid JSON.
inline std::string FormatFixedDouble(double value, int precision) {
  if (!std::isfinite(value)) {
    value = 0.0;
  }
  char text[64];
  const int written = std::snprintf(text, sizeof(text), "%.*f", precision, value);
  if (written <= 0) {
    return "0";
  }
  if (static_cast<std::size_t>(written) < sizeof(text)) {
    return std::string(text, static_cast<std::size_t>(written));
  }
  std::string large(static_cast<std::size_t>(written) + 1U, '\0');
  std::snprintf(large.data(), large.size(), "%.*f", precision, value);
  large.resize(static_cast<std::size_t>(written));
  return large;
}

} // namespace probekit::core

#endif // PROBEKIT_CORE_JSON_UTILS_HPP_
