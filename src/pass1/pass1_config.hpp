#pragma once

#include "core/errors/error.hpp"
#include "core/json_dom.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace autopsy::pass1 {

// Pass-1 detector thresholds.
//
// Every field is hashed into the result cache key, including the presentation
// caps `top_k_windows` and `top_n_signals`.
struct Pass1Config {
  // Fraction in [0,1]; missing-mean buckets are flagged once a signal's
  // missing rate reaches it.
  double missing_rate = 0.1;
  // Max-min spread at or below which a bucket is a flatline candidate.
  double flatline_eps = 0.01;
  // Minimum consecutive candidates for a flatline run.
  std::int64_t flatline_min_run = 10;
  // Robust z-score threshold on the first difference of the mean.
  double spike_mad_z = 5.0;
  std::int64_t top_k_windows = 5;
  std::int64_t top_n_signals = 3;
};

bool ValidatePass1Config(const Pass1Config& config, core::errors::Error& error);

core::json::Value ToJsonValue(const Pass1Config& config);

// Missing keys keep defaults; unknown keys are ignored; wrong types and
// out-of-range values are kInvalidConfig.
bool ParsePass1ConfigValue(const core::json::Value& value, Pass1Config& config,
                           core::errors::Error& error);
bool ParsePass1ConfigText(std::string_view json_text, Pass1Config& config,
                          core::errors::Error& error);
bool LoadPass1ConfigFile(const std::filesystem::path& path, Pass1Config& config,
                         core::errors::Error& error);

} // namespace autopsy::pass1
