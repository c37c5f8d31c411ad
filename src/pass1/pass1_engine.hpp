#pragma once

#include "core/errors/error.hpp"
#include "overview/overview_config.hpp"
#include "overview/overview_table.hpp"
#include "pass1/pass1_config.hpp"
#include "pass1/pass1_result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace autopsy::pass1 {

// Deterministic first-pass anomaly scan over an overview table.
//
// Per signal (needs `_mean`, `_min`, `_max` columns):
// - missing: buckets with an absent mean, flagged only once the signal's
//   missing rate reaches `missing_rate`
// - flatline: runs of >= `flatline_min_run` buckets with max-min <= eps
// - spike: |MAD z| of the first difference of the mean >= `spike_mad_z`
//
// Flagged buckets of all signals are OR-ed; maximal flagged runs become
// windows. A window's per-signal score is its flagged count in the window plus
// the signal's global spike_mad_z_max; the window score is their sum.
//
// Contract:
// - kInvalidConfig / kDataShape abort with no partial result
// - identical inputs produce identical results apart from `created_at`
// - `cache_hit` is always false; the result cache sets it
bool ComputePass1(const overview::OverviewTable& overview, std::string_view measurement_id,
                  const overview::OverviewConfig& overview_cfg, const Pass1Config& pass1_cfg,
                  std::string_view key, Pass1Result& result, core::errors::Error& error);

// Signals analysed when the overview config leaves them unset: sorted column
// prefixes `P` that have a `P_<agg>` column for a configured aggregate.
std::vector<std::string> InferOverviewSignals(const overview::OverviewTable& overview,
                                              const std::vector<overview::Aggregate>& agg);

} // namespace autopsy::pass1
