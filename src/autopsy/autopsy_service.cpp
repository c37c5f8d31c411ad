#include "autopsy/autopsy_service.hpp"

#include "core/fs_utils.hpp"
#include "overview/csv_table.hpp"
#include "overview/overview_builder.hpp"
#include "overview/overview_parquet.hpp"
#include "pass1/pass1_engine.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace autopsy {

using core::errors::ErrorKind;
using JsonValue = core::json::Value;

namespace {

constexpr std::string_view kDelimitedTextExtension = "csv";

bool ArtifactExists(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

} // namespace

bool AutopsyService::OverviewKey(std::string_view measurement_id,
                                 const overview::OverviewConfig& config, std::string& key,
                                 core::errors::Error& error) const {
  JsonValue key_config = overview::ToJsonValue(config);
  key_config.object_value["measurement_id"] = JsonValue::MakeString(std::string(measurement_id));
  return store_->ConfigKey(key_config, key, error);
}

bool AutopsyService::Pass1Key(std::string_view measurement_id,
                              const overview::OverviewConfig& overview_cfg,
                              const pass1::Pass1Config& pass1_cfg, std::string& key,
                              core::errors::Error& error) const {
  JsonValue::Object key_config;
  key_config["measurement_id"] = JsonValue::MakeString(std::string(measurement_id));
  key_config["overview_cfg"] = overview::ToJsonValue(overview_cfg);
  key_config["pass1_cfg"] = pass1::ToJsonValue(pass1_cfg);
  return store_->ConfigKey(JsonValue::MakeObject(std::move(key_config)), key, error);
}

bool AutopsyService::BuildOverview(std::string_view measurement_id,
                                   const overview::OverviewConfig& config,
                                   OverviewBuildResult& build, core::errors::Error& error) const {
  error.Clear();
  build = OverviewBuildResult{};
  if (!overview::ValidateOverviewConfig(config, error)) {
    return false;
  }

  store::MeasurementMeta meta;
  if (!store_->Metadata(measurement_id, meta, error)) {
    return false;
  }
  const core::logging::ScopedMeasurementId log_scope(logger_, meta.measurement_id);
  const std::string extension = store::NormalizedExtension(meta.path);
  if (extension != kDelimitedTextExtension) {
    return core::errors::Fail(error, ErrorKind::kUnsupportedFormat,
                              "overview building supports only ." +
                                  std::string(kDelimitedTextExtension) + " sources, got '" +
                                  meta.path + "'");
  }

  if (!OverviewKey(measurement_id, config, build.key, error) ||
      !store_->CachePath(measurement_id, kOverviewArtifactKind, build.key,
                         kOverviewArtifactSuffix, build.path, error)) {
    return false;
  }

  if (ArtifactExists(build.path)) {
    build.cache_hit = true;
    if (logger_ != nullptr) {
      logger_->Info("overview cache hit", {{"key", build.key}});
    }
    return true;
  }

  overview::RawTable raw;
  if (!overview::ReadCsvTable(meta.path, overview::CsvReadOptions{}, raw, error)) {
    return false;
  }
  overview::OverviewTable table;
  if (!overview::BuildOverviewTable(raw, config, table, error)) {
    return false;
  }
  if (!overview::WriteOverviewParquet(table, build.path, error)) {
    return false;
  }

  if (logger_ != nullptr) {
    logger_->Info("overview built", {{"key", build.key},
                                     {"rows", std::to_string(table.RowCount())},
                                     {"path", build.path.string()}});
  }
  return true;
}

bool AutopsyService::LoadOverview(std::string_view measurement_id,
                                  const overview::OverviewConfig& config,
                                  overview::OverviewTable& table,
                                  core::errors::Error& error) const {
  std::string key;
  if (!OverviewKey(measurement_id, config, key, error)) {
    return false;
  }
  return LoadOverviewByKey(measurement_id, key, table, error);
}

bool AutopsyService::LoadOverviewByKey(std::string_view measurement_id, std::string_view key,
                                       overview::OverviewTable& table,
                                       core::errors::Error& error) const {
  error.Clear();
  fs::path path;
  if (!store_->CachePath(measurement_id, kOverviewArtifactKind, key, kOverviewArtifactSuffix,
                         path, error)) {
    return false;
  }
  if (!ArtifactExists(path)) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "overview not built for " + std::string(measurement_id) + " (key " +
                                  std::string(key) + ")");
  }
  return overview::ReadOverviewParquet(path, table, error);
}

bool AutopsyService::ReadPass1Artifact(const fs::path& path, pass1::Pass1Result& result,
                                       core::errors::Error& error) const {
  std::string text;
  std::string detail;
  if (!core::ReadTextFile(path, text, detail)) {
    return core::errors::Fail(error, ErrorKind::kIo, detail);
  }
  if (!pass1::ParsePass1ResultText(text, result, detail)) {
    return core::errors::FailWith(error, ErrorKind::kIo, path.string(), detail);
  }
  result.cache_hit = true;
  return true;
}

bool AutopsyService::RunPass1(std::string_view measurement_id,
                              const overview::OverviewConfig& overview_cfg,
                              const pass1::Pass1Config& pass1_cfg, pass1::Pass1Result& result,
                              core::errors::Error& error) const {
  error.Clear();
  if (!overview::ValidateOverviewConfig(overview_cfg, error) ||
      !pass1::ValidatePass1Config(pass1_cfg, error)) {
    return false;
  }

  const core::logging::ScopedMeasurementId log_scope(logger_, std::string(measurement_id));
  std::string key;
  fs::path result_path;
  if (!Pass1Key(measurement_id, overview_cfg, pass1_cfg, key, error) ||
      !store_->CachePath(measurement_id, kPass1ArtifactKind, key, kPass1ArtifactSuffix,
                         result_path, error)) {
    return false;
  }

  if (ArtifactExists(result_path)) {
    core::errors::Error read_error;
    if (ReadPass1Artifact(result_path, result, read_error)) {
      if (logger_ != nullptr) {
        logger_->Info("pass1 cache hit", {{"key", key}});
      }
      return true;
    }
    if (logger_ != nullptr) {
      logger_->Warn("pass1 cache artifact unreadable; recomputing",
                    {{"key", key}, {"error", read_error.message}});
    }
  }

  OverviewBuildResult build;
  if (!BuildOverview(measurement_id, overview_cfg, build, error)) {
    return false;
  }
  overview::OverviewTable table;
  if (!LoadOverviewByKey(measurement_id, build.key, table, error)) {
    return false;
  }

  pass1::Pass1Result computed;
  if (!pass1::ComputePass1(table, measurement_id, overview_cfg, pass1_cfg, key, computed, error)) {
    return false;
  }

  std::string io_error;
  if (!core::WriteTextFileAtomic(result_path, pass1::ToJson(computed), io_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, io_error);
  }
  if (logger_ != nullptr) {
    logger_->Info("pass1 computed", {{"key", key},
                                     {"windows", std::to_string(computed.windows.size())},
                                     {"path", result_path.string()}});
  }

  result = std::move(computed);
  return true;
}

bool AutopsyService::LoadPass1(std::string_view measurement_id,
                               const overview::OverviewConfig& overview_cfg,
                               const pass1::Pass1Config& pass1_cfg, pass1::Pass1Result& result,
                               core::errors::Error& error) const {
  error.Clear();
  std::string key;
  fs::path result_path;
  if (!Pass1Key(measurement_id, overview_cfg, pass1_cfg, key, error) ||
      !store_->CachePath(measurement_id, kPass1ArtifactKind, key, kPass1ArtifactSuffix,
                         result_path, error)) {
    return false;
  }
  if (!ArtifactExists(result_path)) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "pass1 result not computed for " + std::string(measurement_id) +
                                  " (key " + std::string(key) + ")");
  }
  return ReadPass1Artifact(result_path, result, error);
}

} // namespace autopsy
