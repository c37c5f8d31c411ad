#ifndef AUTOPSY_CORE_JSON_UTILS_HPP_
#define AUTOPSY_CORE_JSON_UTILS_HPP_

#include <array>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace autopsy::core {

// Shared JSON string escaping for metadata, result, and config-key encoding.
// Keeping one implementation keeps cache keys stable across writers.
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

// Shortest round-trip decimal form of a double. Reparsing the text yields the
// identical value (negative zero reads back as zero). Non-finite values have
// no JSON spelling and are emitted as null.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  // Both zeros share one spelling so equal configs hash to one key.
  if (value == 0.0) {
    return "0";
  }

  std::array<char, 64> buffer{};
  const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    std::ostringstream out;
    out << std::setprecision(17) << value;
    return out.str();
  }
  return std::string(buffer.data(), ptr);
}

} // namespace autopsy::core

#endif // AUTOPSY_CORE_JSON_UTILS_HPP_
