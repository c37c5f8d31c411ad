#pragma once

#include "core/errors/error.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autopsy::overview {

enum class Aggregate {
  kMin,
  kMean,
  kMax,
};

const char* ToString(Aggregate aggregate);
bool ParseAggregate(std::string_view text, Aggregate& aggregate);

// Caller-supplied overview configuration.
//
// Defaults:
// - signals: unset (infer every numeric non-time column)
// - hz: 1.0 (one-second buckets)
// - agg: [min, mean, max]
// - time_col: "timestamp"
//
// `signals` and `agg` are order-sensitive: they are hashed verbatim into the
// cache key and define output column order.
struct OverviewConfig {
  std::optional<std::vector<std::string>> signals;
  double hz = 1.0;
  std::vector<Aggregate> agg = {Aggregate::kMin, Aggregate::kMean, Aggregate::kMax};
  std::string time_col = "timestamp";
};

// kInvalidConfig for non-positive/non-finite hz, empty agg, empty time_col, or
// empty signal names.
bool ValidateOverviewConfig(const OverviewConfig& config, core::errors::Error& error);

// `{"agg":[...],"hz":..,"signals":null|[...],"time_col":".."}`
core::json::Value ToJsonValue(const OverviewConfig& config);

// Parses a JSON object. Missing keys keep their defaults; unknown keys are
// ignored; wrong types are kInvalidConfig. The parsed config is validated.
bool ParseOverviewConfigValue(const core::json::Value& value, OverviewConfig& config,
                              core::errors::Error& error);
bool ParseOverviewConfigText(std::string_view json_text, OverviewConfig& config,
                             core::errors::Error& error);
bool LoadOverviewConfigFile(const std::filesystem::path& path, OverviewConfig& config,
                            core::errors::Error& error);

} // namespace autopsy::overview
