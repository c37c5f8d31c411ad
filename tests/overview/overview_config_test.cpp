#include "overview/overview_config.hpp"
#include "pass1/pass1_config.hpp"

#include "../common/measurement_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using autopsy::core::errors::Error;
using autopsy::core::errors::ErrorKind;
using autopsy::overview::Aggregate;
using autopsy::overview::OverviewConfig;
using autopsy::pass1::Pass1Config;

TEST_CASE("Overview config defaults apply to missing keys", "[overview][config]") {
  OverviewConfig config;
  Error error;
  REQUIRE(autopsy::overview::ParseOverviewConfigText(R"({"hz": 2})", config, error));
  REQUIRE(config.hz == 2.0);
  REQUIRE_FALSE(config.signals.has_value());
  REQUIRE(config.agg ==
          std::vector<Aggregate>{Aggregate::kMin, Aggregate::kMean, Aggregate::kMax});
  REQUIRE(config.time_col == "timestamp");
}

TEST_CASE("Overview config parses explicit signals and agg order", "[overview][config]") {
  OverviewConfig config;
  Error error;
  REQUIRE(autopsy::overview::ParseOverviewConfigText(
      R"({"signals":["b","a"],"agg":["max","min"],"time_col":"t"})", config, error));
  REQUIRE(config.signals == std::vector<std::string>{"b", "a"});
  REQUIRE(config.agg == std::vector<Aggregate>{Aggregate::kMax, Aggregate::kMin});
  REQUIRE(config.time_col == "t");
}

TEST_CASE("Overview config rejects invalid values", "[overview][config]") {
  OverviewConfig config;
  Error error;
  REQUIRE_FALSE(autopsy::overview::ParseOverviewConfigText(R"({"hz": -1})", config, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
  REQUIRE_FALSE(
      autopsy::overview::ParseOverviewConfigText(R"({"agg": ["median"]})", config, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
  REQUIRE_FALSE(autopsy::overview::ParseOverviewConfigText(R"({"hz": "fast"})", config, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
}

TEST_CASE("Overview config JSON form feeds the cache key", "[overview][config]") {
  OverviewConfig config;
  config.signals = std::vector<std::string>{"a"};
  const std::string text = autopsy::core::json::Serialize(autopsy::overview::ToJsonValue(config));
  REQUIRE(text == R"({"agg":["min","mean","max"],"hz":1,"signals":["a"],"time_col":"timestamp"})");
}

TEST_CASE("Pass1 config defaults and validation", "[pass1][config]") {
  Pass1Config config;
  Error error;
  REQUIRE(autopsy::pass1::ParsePass1ConfigText("{}", config, error));
  REQUIRE(config.missing_rate == 0.1);
  REQUIRE(config.flatline_eps == 0.01);
  REQUIRE(config.flatline_min_run == 10);
  REQUIRE(config.spike_mad_z == 5.0);
  REQUIRE(config.top_k_windows == 5);
  REQUIRE(config.top_n_signals == 3);

  REQUIRE_FALSE(autopsy::pass1::ParsePass1ConfigText(R"({"missing_rate": 1.5})", config, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
  REQUIRE_FALSE(
      autopsy::pass1::ParsePass1ConfigText(R"({"flatline_min_run": 2.5})", config, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
  REQUIRE_FALSE(autopsy::pass1::ParsePass1ConfigText(R"({"spike_mad_z": 0})", config, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
}

TEST_CASE("Config files load and prefix errors with their path", "[overview][pass1][config]") {
  const std::filesystem::path root = autopsy::tests::common::CreateUniqueTempDir("autopsy-config");
  const std::filesystem::path overview_path = root / "overview.json";
  const std::filesystem::path pass1_path = root / "pass1.json";
  const std::filesystem::path bad_path = root / "bad.json";
  autopsy::tests::common::WriteFixtureFile(overview_path, R"({"hz": 4, "agg": ["mean"]})");
  autopsy::tests::common::WriteFixtureFile(pass1_path, R"({"spike_mad_z": 3.5, "extra": true})");
  autopsy::tests::common::WriteFixtureFile(bad_path, R"({"hz": 0})");

  Error error;
  OverviewConfig overview;
  REQUIRE(autopsy::overview::LoadOverviewConfigFile(overview_path, overview, error));
  REQUIRE(overview.hz == 4.0);
  REQUIRE(overview.agg == std::vector<Aggregate>{Aggregate::kMean});

  Pass1Config pass1;
  REQUIRE(autopsy::pass1::LoadPass1ConfigFile(pass1_path, pass1, error));
  REQUIRE(pass1.spike_mad_z == 3.5);
  REQUIRE(pass1.top_k_windows == 5);

  REQUIRE_FALSE(autopsy::overview::LoadOverviewConfigFile(bad_path, overview, error));
  REQUIRE(error.kind == ErrorKind::kInvalidConfig);
  REQUIRE(error.message.rfind(bad_path.string() + ": ", 0) == 0U);

  REQUIRE_FALSE(autopsy::pass1::LoadPass1ConfigFile(bad_path.string() + ".missing", pass1, error));
  REQUIRE(error.kind == ErrorKind::kIo);
  REQUIRE(error.message.find("bad.json.missing") != std::string::npos);

  REQUIRE_FALSE(autopsy::overview::LoadOverviewConfigFile(root / "absent.json", overview, error));
  REQUIRE(error.kind == ErrorKind::kIo);

  autopsy::tests::common::RemovePathBestEffort(root);
}
