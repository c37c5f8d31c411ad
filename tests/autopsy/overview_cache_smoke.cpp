#include "autopsy/autopsy_service.hpp"

#include "../common/assertions.hpp"
#include "../common/measurement_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using autopsy::core::errors::Error;
using autopsy::core::errors::ErrorKind;
using autopsy::overview::Aggregate;
using autopsy::overview::OverviewConfig;
using autopsy::tests::common::AssertContains;
using autopsy::tests::common::AssertNear;
using autopsy::tests::common::AssertTrue;
using autopsy::tests::common::RequireErrorKind;
using autopsy::tests::common::RequireOk;

namespace {

std::string RegisterOrFail(const autopsy::store::MeasurementStore& store, const fs::path& path) {
  Error error;
  autopsy::store::MeasurementRef ref;
  RequireOk(store.Register(path, std::nullopt, ref, error), error, "register " + path.string());
  return ref.id;
}

} // namespace

int main() {
  const fs::path root = autopsy::tests::common::CreateUniqueTempDir("autopsy-overview-cache");
  const fs::path csv_path = root / "drive.csv";
  autopsy::tests::common::WriteFixtureFile(csv_path,
                                           autopsy::tests::common::BuildTwoSignalMeasurementCsv());

  std::ostringstream log_sink;
  autopsy::core::logging::Logger logger(autopsy::core::logging::LogLevel::kInfo, log_sink);
  const autopsy::store::MeasurementStore store(root / "cache", &logger);
  const autopsy::AutopsyService service(store, &logger);
  const std::string id = RegisterOrFail(store, csv_path);

  OverviewConfig config;
  Error error;

  // Unbuilt overview is not found.
  autopsy::overview::OverviewTable table;
  RequireErrorKind(service.LoadOverview(id, config, table, error), error, ErrorKind::kNotFound,
                   "load before build");

  autopsy::OverviewBuildResult first;
  RequireOk(service.BuildOverview(id, config, first, error), error, "first build");
  AssertTrue(!first.cache_hit, "first build must miss");
  AssertTrue(first.path == root / "cache" / "artifacts" / id / "overview" / (first.key + ".parquet"),
             "overview artifact layout");
  AssertTrue(fs::exists(first.path), "overview artifact must exist");
  AssertContains(log_sink.str(), "msg=\"overview built\"");
  const auto first_mtime = fs::last_write_time(first.path);

  autopsy::OverviewBuildResult second;
  RequireOk(service.BuildOverview(id, config, second, error), error, "second build");
  AssertTrue(second.cache_hit, "second build must hit");
  AssertTrue(second.key == first.key && second.path == first.path, "same key and path");
  AssertTrue(fs::last_write_time(second.path) == first_mtime, "hit must not rewrite artifact");
  AssertContains(log_sink.str(), "msg=\"overview cache hit\"");

  RequireOk(service.LoadOverview(id, config, table, error), error, "load overview");
  AssertTrue(table.RowCount() == 100U, "one row per bucket");
  AssertTrue(!table.absolute_time, "numeric time column is relative");
  AssertTrue(table.buckets.front() == 0 && table.buckets.back() == 99, "bucket range");
  const std::vector<std::string> expected_columns{"signal_a_min", "signal_a_mean", "signal_a_max",
                                                  "signal_b_min", "signal_b_mean", "signal_b_max"};
  AssertTrue(table.columns.size() == expected_columns.size(), "aggregate column count");
  for (std::size_t i = 0; i < expected_columns.size(); ++i) {
    AssertTrue(table.columns[i].name == expected_columns[i], "column order " + expected_columns[i]);
  }
  AssertNear(table.FindColumn("signal_a_mean")->values[40], 40.25, 1e-12, "signal_a mean");
  AssertNear(table.FindColumn("signal_b_max")->values[51], 100.375, 1e-12, "signal_b max");

  // Any config change is a different artifact.
  OverviewConfig half_hz = config;
  half_hz.hz = 0.5;
  std::string half_key;
  RequireOk(service.OverviewKey(id, half_hz, half_key, error), error, "half hz key");
  AssertTrue(half_key != first.key, "hz participates in the key");
  RequireErrorKind(service.LoadOverview(id, half_hz, table, error), error, ErrorKind::kNotFound,
                   "unbuilt half hz");

  OverviewConfig reordered = config;
  reordered.agg = {Aggregate::kMax, Aggregate::kMin, Aggregate::kMean};
  std::string reordered_key;
  RequireOk(service.OverviewKey(id, reordered, reordered_key, error), error, "reordered key");
  AssertTrue(reordered_key != first.key, "aggregate order participates in the key");

  OverviewConfig only_b = config;
  only_b.signals = std::vector<std::string>{"signal_b"};
  only_b.agg = {Aggregate::kMean};
  autopsy::OverviewBuildResult only_b_build;
  RequireOk(service.BuildOverview(id, only_b, only_b_build, error), error, "signal subset");
  RequireOk(service.LoadOverviewByKey(id, only_b_build.key, table, error), error,
            "load by key");
  AssertTrue(table.columns.size() == 1U && table.columns[0].name == "signal_b_mean",
             "subset columns");

  OverviewConfig missing_signal = config;
  missing_signal.signals = std::vector<std::string>{"signal_c"};
  autopsy::OverviewBuildResult failed;
  RequireErrorKind(service.BuildOverview(id, missing_signal, failed, error), error,
                   ErrorKind::kDataShape, "missing signal");
  AssertContains(error.message, "signal_c");

  OverviewConfig invalid = config;
  invalid.hz = 0.0;
  RequireErrorKind(service.BuildOverview(id, invalid, failed, error), error,
                   ErrorKind::kInvalidConfig, "zero hz");

  RequireErrorKind(service.BuildOverview("m_ffffffffffff", config, failed, error), error,
                   ErrorKind::kNotFound, "unknown measurement");

  const fs::path blob = root / "capture.bin";
  autopsy::tests::common::WriteFixtureFile(blob, "opaque");
  const std::string blob_id = RegisterOrFail(store, blob);
  RequireErrorKind(service.BuildOverview(blob_id, config, failed, error), error,
                   ErrorKind::kUnsupportedFormat, "binary source");

  // ISO timestamps round-trip as absolute time.
  const fs::path iso_path = root / "iso.csv";
  autopsy::tests::common::WriteFixtureFile(iso_path, "timestamp,speed\n"
                                                     "2024-01-01T00:00:00Z,10\n"
                                                     "2024-01-01T00:00:00.5Z,20\n"
                                                     "2024-01-01T00:00:01Z,30\n");
  const std::string iso_id = RegisterOrFail(store, iso_path);
  OverviewConfig iso_config;
  iso_config.agg = {Aggregate::kMean};
  autopsy::OverviewBuildResult iso_build;
  RequireOk(service.BuildOverview(iso_id, iso_config, iso_build, error), error, "iso build");
  RequireOk(service.LoadOverview(iso_id, iso_config, table, error), error, "iso load");
  AssertTrue(table.absolute_time, "iso time column is absolute");
  AssertTrue(table.buckets == std::vector<std::int64_t>({1704067200, 1704067201}), "iso buckets");
  AssertNear(table.times[1], 1704067201.0, 1e-6, "iso bucket time");
  AssertNear(table.FindColumn("speed_mean")->values[0], 15.0, 1e-12, "iso mean");

  autopsy::tests::common::RemovePathBestEffort(root);
  return 0;
}
