#pragma once

#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "overview/overview_config.hpp"
#include "overview/overview_table.hpp"
#include "pass1/pass1_config.hpp"
#include "pass1/pass1_result.hpp"
#include "store/measurement_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace autopsy {

inline constexpr std::string_view kOverviewArtifactKind = "overview";
inline constexpr std::string_view kOverviewArtifactSuffix = ".parquet";
inline constexpr std::string_view kPass1ArtifactKind = "pass1";
inline constexpr std::string_view kPass1ArtifactSuffix = ".json";

struct OverviewBuildResult {
  std::filesystem::path path;
  std::string key;
  bool cache_hit = false;
};

// Cached overview and Pass-1 computation for registered measurements.
//
// Artifacts are addressed by `ConfigKey` of the full configuration and are
// never recomputed once published:
//   overview: {measurement_id, signals, hz, agg, time_col} -> .parquet
//   pass1:    {measurement_id, overview_cfg, pass1_cfg}     -> .json
class AutopsyService {
public:
  explicit AutopsyService(const store::MeasurementStore& store,
                          core::logging::Logger* logger = nullptr)
      : store_(&store), logger_(logger) {}

  bool OverviewKey(std::string_view measurement_id, const overview::OverviewConfig& config,
                   std::string& key, core::errors::Error& error) const;

  // Builds the overview artifact unless one already exists for the key.
  // kNotFound for an unknown measurement; kUnsupportedFormat for sources that
  // are not delimited text.
  bool BuildOverview(std::string_view measurement_id, const overview::OverviewConfig& config,
                     OverviewBuildResult& build, core::errors::Error& error) const;

  // kNotFound when the artifact has not been built.
  bool LoadOverview(std::string_view measurement_id, const overview::OverviewConfig& config,
                    overview::OverviewTable& table, core::errors::Error& error) const;
  bool LoadOverviewByKey(std::string_view measurement_id, std::string_view key,
                         overview::OverviewTable& table, core::errors::Error& error) const;

  bool Pass1Key(std::string_view measurement_id, const overview::OverviewConfig& overview_cfg,
                const pass1::Pass1Config& pass1_cfg, std::string& key,
                core::errors::Error& error) const;

  // Returns the cached result with `cache_hit=true` when present, otherwise
  // builds/loads the overview, computes, publishes, and returns
  // `cache_hit=false`. A corrupt cached artifact is recomputed.
  bool RunPass1(std::string_view measurement_id, const overview::OverviewConfig& overview_cfg,
                const pass1::Pass1Config& pass1_cfg, pass1::Pass1Result& result,
                core::errors::Error& error) const;

  // kNotFound when no result exists for the configuration.
  bool LoadPass1(std::string_view measurement_id, const overview::OverviewConfig& overview_cfg,
                 const pass1::Pass1Config& pass1_cfg, pass1::Pass1Result& result,
                 core::errors::Error& error) const;

private:
  bool ReadPass1Artifact(const std::filesystem::path& path, pass1::Pass1Result& result,
                         core::errors::Error& error) const;

  const store::MeasurementStore* store_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace autopsy
