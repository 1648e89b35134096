#ifndef DETPLAN_CORE_JSON_UTILS_HPP_
#define DETPLAN_CORE_JSON_UTILS_HPP_

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace detplan::core {

// Shared JSON string escaping for plan output, canonical forms and reports.
// Bytes >= 0x80 pass through untouched so UTF-8 text is emitted unescaped.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Numbers are stored as double in the DOM. Integral values inside the exactly
// representable range print without a fraction (`8000`, not `8000.0`); other
// finite values use the shortest round-trip form. Non-finite values have no
// JSON spelling and print as `null`.
inline std::string FormatJsonNumber(double value) {
  constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53
  if (!std::isfinite(value)) {
    return "null";
  }
  if (value == 0.0) {
    return "0";
  }
  if (std::floor(value) == value && std::fabs(value) <= kMaxExactInteger) {
    return std::to_string(static_cast<std::int64_t>(value));
  }

  std::array<char, 64> buffer{};
  const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    return "null";
  }
  return std::string(buffer.data(), ptr);
}

} // namespace detplan::core

#endif // DETPLAN_CORE_JSON_UTILS_HPP_
