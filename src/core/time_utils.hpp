#ifndef AUTOPSY_CORE_TIME_UTILS_HPP_
#define AUTOPSY_CORE_TIME_UTILS_HPP_

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace autopsy::core {

// Canonical UTC timestamp formatter used by logs and persisted artifacts.
// Millisecond precision keeps artifacts readable and round-trippable.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::time_point(std::chrono::milliseconds(
          millis_since_epoch - millis_component)));
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::chrono::system_clock::time_point
TruncateToMilliseconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()));
}

namespace detail {

// Howard Hinnant's days_from_civil / civil_from_days (proleptic Gregorian).
constexpr std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
  std::int64_t year = 1970;
  unsigned month = 1;
  unsigned day = 1;
};

constexpr CivilDate CivilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{y + (m <= 2 ? 1 : 0), m, d};
}

constexpr bool IsLeapYear(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr unsigned DaysInMonth(std::int64_t y, unsigned m) {
  constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && IsLeapYear(y)) ? 29U : kDays[m - 1];
}

class IsoCursor {
public:
  explicit IsoCursor(std::string_view text) : text_(text) {}

  bool AtEnd() const {
    return pos_ >= text_.size();
  }

  char Peek() const {
    return AtEnd() ? '\0' : text_[pos_];
  }

  bool Match(char expected) {
    if (Peek() != expected || AtEnd()) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool ReadDigits(std::size_t count, unsigned& value) {
    value = 0;
    for (std::size_t i = 0; i < count; ++i) {
      if (AtEnd() || std::isdigit(static_cast<unsigned char>(text_[pos_])) == 0) {
        return false;
      }
      value = value * 10U + static_cast<unsigned>(text_[pos_] - '0');
      ++pos_;
    }
    return true;
  }

  double ReadFraction() {
    double scale = 0.1;
    double fraction = 0.0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      fraction += scale * static_cast<double>(text_[pos_] - '0');
      scale *= 0.1;
      ++pos_;
    }
    return fraction;
  }

private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

} // namespace detail

// Parses an ISO-8601 style absolute timestamp into UTC epoch seconds.
//
// Accepted shapes:
// - YYYY-MM-DD
// - YYYY-MM-DD(T| )HH:MM[:SS[.fraction]]
// - optional zone suffix: Z, +HH, +HH:MM, +HHMM (or '-')
// Timestamps without a zone are interpreted as UTC.
inline std::optional<double> ParseIsoTimestamp(std::string_view raw) {
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())) != 0) {
    raw.remove_prefix(1);
  }
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back())) != 0) {
    raw.remove_suffix(1);
  }

  detail::IsoCursor cursor(raw);
  unsigned year = 0;
  unsigned month = 0;
  unsigned day = 0;
  if (!cursor.ReadDigits(4, year) || !cursor.Match('-') || !cursor.ReadDigits(2, month) ||
      !cursor.Match('-') || !cursor.ReadDigits(2, day)) {
    return std::nullopt;
  }
  if (month < 1U || month > 12U || day < 1U || day > detail::DaysInMonth(year, month)) {
    return std::nullopt;
  }

  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;
  double fraction = 0.0;
  if (cursor.Match('T') || cursor.Match('t') || cursor.Match(' ')) {
    if (!cursor.ReadDigits(2, hour) || !cursor.Match(':') || !cursor.ReadDigits(2, minute)) {
      return std::nullopt;
    }
    if (cursor.Match(':')) {
      if (!cursor.ReadDigits(2, second)) {
        return std::nullopt;
      }
      if (cursor.Match('.') || cursor.Match(',')) {
        fraction = cursor.ReadFraction();
      }
    }
    if (hour > 23U || minute > 59U || second > 60U) {
      return std::nullopt;
    }
  }

  std::int64_t offset_seconds = 0;
  if (cursor.Match('Z') || cursor.Match('z')) {
    // UTC
  } else if (cursor.Peek() == '+' || cursor.Peek() == '-') {
    const bool negative = cursor.Peek() == '-';
    cursor.Match(cursor.Peek());
    unsigned offset_hours = 0;
    unsigned offset_minutes = 0;
    if (!cursor.ReadDigits(2, offset_hours)) {
      return std::nullopt;
    }
    const bool has_colon = cursor.Match(':');
    if (has_colon || !cursor.AtEnd()) {
      if (!cursor.ReadDigits(2, offset_minutes)) {
        return std::nullopt;
      }
    }
    if (offset_hours > 23U || offset_minutes > 59U) {
      return std::nullopt;
    }
    offset_seconds = static_cast<std::int64_t>(offset_hours) * 3600 +
                     static_cast<std::int64_t>(offset_minutes) * 60;
    if (negative) {
      offset_seconds = -offset_seconds;
    }
  }

  if (!cursor.AtEnd()) {
    return std::nullopt;
  }

  const std::int64_t days = detail::DaysFromCivil(year, month, day);
  const std::int64_t whole_seconds = days * 86400 + static_cast<std::int64_t>(hour) * 3600 +
                                     static_cast<std::int64_t>(minute) * 60 + second -
                                     offset_seconds;
  return static_cast<double>(whole_seconds) + fraction;
}

// Formats UTC epoch seconds as an ISO-8601 string with an explicit +00:00
// offset. Microseconds are emitted only when non-zero.
inline std::string FormatIsoSeconds(double epoch_seconds) {
  const auto total_us = static_cast<std::int64_t>(std::llround(epoch_seconds * 1'000'000.0));
  std::int64_t whole = total_us / 1'000'000;
  std::int64_t micros = total_us % 1'000'000;
  if (micros < 0) {
    micros += 1'000'000;
    whole -= 1;
  }

  std::int64_t days = whole / 86400;
  std::int64_t day_seconds = whole % 86400;
  if (day_seconds < 0) {
    day_seconds += 86400;
    days -= 1;
  }
  const detail::CivilDate date = detail::CivilFromDays(days);

  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month
      << '-' << std::setw(2) << date.day << 'T' << std::setw(2) << (day_seconds / 3600) << ':'
      << std::setw(2) << ((day_seconds % 3600) / 60) << ':' << std::setw(2) << (day_seconds % 60);
  if (micros != 0) {
    out << '.' << std::setw(6) << micros;
  }
  out << "+00:00";
  return out.str();
}

} // namespace autopsy::core

#endif // AUTOPSY_CORE_TIME_UTILS_HPP_
