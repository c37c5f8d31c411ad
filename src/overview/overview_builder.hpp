#pragma once

#include "core/errors/error.hpp"
#include "overview/csv_table.hpp"
#include "overview/overview_config.hpp"
#include "overview/overview_table.hpp"

#include <string>
#include <vector>

namespace autopsy::overview {

// Buckets raw rows into fixed-width `1/hz` intervals and aggregates each
// configured signal per bucket.
//
// Time per row:
// - `time_col` present and numeric => value used as seconds
// - `time_col` present, not numeric => ISO-8601 timestamp, UTC epoch seconds
// - `time_col` absent => row ordinal as a synthetic 1 Hz second
// Rows whose time cell is missing or unparsable are dropped.
//
// Contract:
// - bucket = floor(seconds * hz), bucket time = bucket / hz
// - rows ordered by ascending bucket; empty buckets are omitted
// - aggregates skip missing/non-numeric cells; all-missing => NaN
// - unset `signals` => every non-time column whose cells are all numeric
// - kInvalidConfig for invalid config, kDataShape naming a missing column
// - pure: identical inputs yield an identical table
bool BuildOverviewTable(const RawTable& raw, const OverviewConfig& config, OverviewTable& table,
                        core::errors::Error& error);

// Signals used when the config leaves them unset.
std::vector<std::string> InferRawSignals(const RawTable& raw, const std::string& time_col);

} // namespace autopsy::overview
