#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using autopsy::core::logging::Logger;
using autopsy::core::logging::LogLevel;
using autopsy::core::logging::ParseLogLevel;

TEST_CASE("Log levels parse case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE(ParseLogLevel("error", level, error));
  REQUIRE(level == LogLevel::kError);

  REQUIRE_FALSE(ParseLogLevel("", level, error));
  REQUIRE(error.find("missing log level") != std::string::npos);
  REQUIRE_FALSE(ParseLogLevel("loud", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
}

TEST_CASE("Lines are logfmt with measurement id and quoted fields", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.Debug("hidden");
  logger.SetMeasurementId("m_0123456789ab");
  logger.Info("overview built", {{"key", "abc"}, {"path", "a \"b\"\n"}});

  const std::string line = out.str();
  REQUIRE(line.find("hidden") == std::string::npos);
  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  REQUIRE(line.find(" level=INFO measurement_id=\"m_0123456789ab\" msg=\"overview built\"") !=
          std::string::npos);
  REQUIRE(line.find(" key=\"abc\" path=\"a \\\"b\\\"\\n\"\n") != std::string::npos);
}

TEST_CASE("Empty measurement id renders as a dash", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, out);
  logger.SetMeasurementId("");
  logger.Warn("cache artifact unreadable");
  REQUIRE(logger.MeasurementId() == "-");
  REQUIRE(out.str().find("measurement_id=\"-\"") != std::string::npos);
}

TEST_CASE("Scoped measurement tag restores the previous one", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.SetMeasurementId("m_outer");
  {
    const autopsy::core::logging::ScopedMeasurementId scope(&logger, "m_inner");
    logger.Info("inside");
    REQUIRE(logger.MeasurementId() == "m_inner");
  }
  REQUIRE(logger.MeasurementId() == "m_outer");

  const autopsy::core::logging::ScopedMeasurementId detached(nullptr, "m_ignored");
  REQUIRE(out.str().find("measurement_id=\"m_inner\" msg=\"inside\"") != std::string::npos);
}
