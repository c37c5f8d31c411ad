#ifndef AUTOPSY_TESTS_COMMON_ASSERTIONS_HPP_
#define AUTOPSY_TESTS_COMMON_ASSERTIONS_HPP_

#include "core/errors/error.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace autopsy::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertTrue(bool condition, std::string_view message) {
  if (!condition) {
    Fail(message);
  }
}

inline void AssertNear(double actual, double expected, double tolerance, std::string_view label) {
  if (std::fabs(actual - expected) <= tolerance) {
    return;
  }
  std::cerr << label << ": expected " << expected << " +/- " << tolerance << ", got " << actual
            << '\n';
  std::abort();
}

// Aborts with the error text when a bool/Error call fails.
inline void RequireOk(bool ok, const core::errors::Error& error, std::string_view context) {
  if (ok) {
    return;
  }
  std::cerr << context << " failed [" << core::errors::ToString(error.kind)
            << "]: " << error.message << '\n';
  std::abort();
}

inline void RequireErrorKind(bool ok, const core::errors::Error& error,
                             core::errors::ErrorKind expected, std::string_view context) {
  if (!ok && error.kind == expected) {
    return;
  }
  std::cerr << context << ": expected failure kind " << core::errors::ToString(expected)
            << ", got ok=" << ok << " kind=" << core::errors::ToString(error.kind)
            << " message=" << error.message << '\n';
  std::abort();
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

} // namespace autopsy::tests::common

#endif // AUTOPSY_TESTS_COMMON_ASSERTIONS_HPP_
