#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace autopsy::core::errors {

// Stable failure taxonomy shared by the store, overview, and pass-1 layers.
//
// Callers branch on `kind`; `message` is human-readable and names the
// offending path, column, or field.
enum class ErrorKind {
  kNone = 0,
  kNotFound,
  kInvalidConfig,
  kDataShape,
  kUnsupportedFormat,
  kIo,
  kInternal,
};

struct Error {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
  }

  bool HasError() const {
    return kind != ErrorKind::kNone;
  }
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kNotFound:
    return "not_found";
  case ErrorKind::kInvalidConfig:
    return "invalid_config";
  case ErrorKind::kDataShape:
    return "data_shape";
  case ErrorKind::kUnsupportedFormat:
    return "unsupported_format";
  case ErrorKind::kIo:
    return "io_error";
  case ErrorKind::kInternal:
    return "internal";
  }
  return "internal";
}

// Fills `error` and returns false so call sites can `return Fail(...)`.
inline bool Fail(Error& error, ErrorKind kind, std::string message) {
  error.kind = kind;
  error.message = std::move(message);
  return false;
}

// Wraps a leaf-level string error with a taxonomy kind and optional context.
inline bool FailWith(Error& error, ErrorKind kind, std::string_view context,
                     const std::string& detail) {
  if (context.empty()) {
    return Fail(error, kind, detail);
  }
  return Fail(error, kind, std::string(context) + ": " + detail);
}

} // namespace autopsy::core::errors
