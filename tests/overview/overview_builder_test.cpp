#include "overview/overview_builder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>
#include <vector>

using autopsy::core::errors::Error;
using autopsy::core::errors::ErrorKind;
using autopsy::overview::Aggregate;
using autopsy::overview::BuildOverviewTable;
using autopsy::overview::CsvReadOptions;
using autopsy::overview::OverviewConfig;
using autopsy::overview::OverviewTable;
using autopsy::overview::RawTable;

namespace {

RawTable ParseOrDie(const std::string& text) {
  RawTable raw;
  Error error;
  REQUIRE(autopsy::overview::ParseCsvTable(text, CsvReadOptions{}, raw, error));
  return raw;
}

} // namespace

TEST_CASE("Rows are bucketed and aggregated per signal", "[overview][builder]") {
  const RawTable raw = ParseOrDie("timestamp,speed,label\n"
                                  "0.0,1,x\n"
                                  "0.5,3,y\n"
                                  "1.2,,z\n"
                                  "3.9,10,w\n"
                                  "3.1,20,v\n");
  OverviewConfig config;
  config.signals = std::vector<std::string>{"speed"};

  OverviewTable table;
  Error error;
  REQUIRE(BuildOverviewTable(raw, config, table, error));

  REQUIRE_FALSE(table.absolute_time);
  REQUIRE(table.buckets == std::vector<std::int64_t>{0, 1, 3});
  REQUIRE(table.times == std::vector<double>{0.0, 1.0, 3.0});
  REQUIRE(table.columns.size() == 3U);
  REQUIRE(table.columns[0].name == "speed_min");
  REQUIRE(table.columns[1].name == "speed_mean");
  REQUIRE(table.columns[2].name == "speed_max");

  const auto& mean = table.FindColumn("speed_mean")->values;
  REQUIRE(mean[0] == 2.0);
  REQUIRE(std::isnan(mean[1]));
  REQUIRE(mean[2] == 15.0);
  REQUIRE(table.FindColumn("speed_min")->values[2] == 10.0);
  REQUIRE(table.FindColumn("speed_max")->values[2] == 20.0);
}

TEST_CASE("Bucket width follows hz", "[overview][builder]") {
  const RawTable raw = ParseOrDie("timestamp,v\n0.0,1\n0.24,2\n0.26,3\n0.74,4\n");
  OverviewConfig config;
  config.hz = 4.0;
  config.agg = {Aggregate::kMean};

  OverviewTable table;
  Error error;
  REQUIRE(BuildOverviewTable(raw, config, table, error));
  REQUIRE(table.buckets == std::vector<std::int64_t>{0, 1, 2});
  REQUIRE(table.times == std::vector<double>{0.0, 0.25, 0.5});
  REQUIRE(table.FindColumn("v_mean")->values == std::vector<double>{1.5, 3.0, 4.0});
}

TEST_CASE("Unset signals infer numeric non-time columns", "[overview][builder]") {
  const RawTable raw = ParseOrDie("a,timestamp,text,b\n1,0,x,2\nNaN,1,y,\n");
  REQUIRE(autopsy::overview::InferRawSignals(raw, "timestamp") ==
          std::vector<std::string>{"a", "b"});
}

TEST_CASE("ISO time columns produce absolute buckets", "[overview][builder]") {
  const RawTable raw = ParseOrDie("timestamp,v\n"
                                  "2024-01-01T00:00:00Z,1\n"
                                  "2024-01-01T00:00:00.5Z,3\n"
                                  "not-a-time,99\n"
                                  "2024-01-01T00:00:02Z,5\n");
  OverviewConfig config;
  config.agg = {Aggregate::kMean};

  OverviewTable table;
  Error error;
  REQUIRE(BuildOverviewTable(raw, config, table, error));
  REQUIRE(table.absolute_time);
  REQUIRE(table.buckets == std::vector<std::int64_t>{1704067200, 1704067202});
  REQUIRE(table.FindColumn("v_mean")->values == std::vector<double>{2.0, 5.0});
}

TEST_CASE("Missing time column falls back to row ordinal", "[overview][builder]") {
  const RawTable raw = ParseOrDie("v\n1\n2\n3\n");
  OverviewConfig config;
  config.hz = 0.5;
  config.agg = {Aggregate::kMax};

  OverviewTable table;
  Error error;
  REQUIRE(BuildOverviewTable(raw, config, table, error));
  REQUIRE(table.buckets == std::vector<std::int64_t>{0, 1});
  REQUIRE(table.FindColumn("v_max")->values == std::vector<double>{2.0, 3.0});
}

TEST_CASE("Absent signal column is a data-shape error naming it", "[overview][builder]") {
  const RawTable raw = ParseOrDie("timestamp,v\n0,1\n");
  OverviewConfig config;
  config.signals = std::vector<std::string>{"v", "ghost"};

  OverviewTable table;
  Error error;
  REQUIRE_FALSE(BuildOverviewTable(raw, config, table, error));
  REQUIRE(error.kind == ErrorKind::kDataShape);
  REQUIRE(error.message.find("ghost") != std::string::npos);
}

TEST_CASE("Non-positive hz is rejected", "[overview][builder]") {
  const RawTable raw = ParseOrDie("timestamp,v\n0,1\n");
  OverviewConfig config;
  config.hz = 0.0;

  OverviewTable table;
  Error error;
  REQUIRE_FALSE(BuildOverviewTable(raw, config, table, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
}

TEST_CASE("Infinite cells are absent and huge means stay finite", "[overview][builder]") {
  const RawTable raw = ParseOrDie("timestamp,v\n"
                                  "0.0,1e308\n"
                                  "0.5,1e308\n"
                                  "1.0,inf\n"
                                  "2.0,-Infinity\n"
                                  "2.5,4\n");
  OverviewConfig config;
  config.agg = {Aggregate::kMean};

  OverviewTable table;
  Error error;
  REQUIRE(BuildOverviewTable(raw, config, table, error));
  REQUIRE(table.columns.size() == 1U);
  const auto& mean = table.FindColumn("v_mean")->values;
  REQUIRE(mean[0] == 1e308);
  REQUIRE(std::isnan(mean[1]));
  REQUIRE(mean[2] == 4.0);
}
