#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace autopsy::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing log level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// logfmt-style line logger. Every line carries the measurement currently being
// processed so interleaved cache/engine output stays attributable.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetMeasurementId(std::string measurement_id) {
    measurement_id_ = measurement_id.empty() ? "-" : std::move(measurement_id);
  }

  const std::string& MeasurementId() const {
    return measurement_id_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    (*out_) << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
            << " level=" << ToString(level) << " measurement_id=" << Quote(measurement_id_)
            << " msg=" << Quote(message);

    for (const auto& field : fields) {
      (*out_) << ' ' << field.key << '=' << Quote(field.value);
    }

    (*out_) << '\n';
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string measurement_id_ = "-";
};

// Tags lines logged during its lifetime with one measurement, then restores the
// previous tag. A null logger is accepted and ignored.
class ScopedMeasurementId {
public:
  ScopedMeasurementId(Logger* logger, std::string measurement_id) : logger_(logger) {
    if (logger_ != nullptr) {
      previous_ = logger_->MeasurementId();
      logger_->SetMeasurementId(std::move(measurement_id));
    }
  }

  ~ScopedMeasurementId() {
    if (logger_ != nullptr) {
      logger_->SetMeasurementId(std::move(previous_));
    }
  }

  ScopedMeasurementId(const ScopedMeasurementId&) = delete;
  ScopedMeasurementId& operator=(const ScopedMeasurementId&) = delete;

private:
  Logger* logger_;
  std::string previous_;
};

} // namespace autopsy::core::logging
