#pragma once

#include "core/errors/error.hpp"
#include "overview/overview_table.hpp"

#include <filesystem>

namespace autopsy::overview {

// Overview artifact layout (one Parquet file per overview key):
// - column 0: `time_col`; float64 seconds, or timestamp[ns, UTC] when absolute
// - column 1: `bucket`, int64
// - remaining columns: nullable float64 `<signal>_<agg>` in table order
//
// Writes go to a unique temporary sibling that is renamed into place, so a
// reader never observes a partially written artifact.
bool WriteOverviewParquet(const OverviewTable& table, const std::filesystem::path& output_path,
                          core::errors::Error& error);

// Reads an artifact written by WriteOverviewParquet. Missing file => kNotFound;
// unreadable or foreign layout => kIo / kDataShape.
bool ReadOverviewParquet(const std::filesystem::path& input_path, OverviewTable& table,
                         core::errors::Error& error);

} // namespace autopsy::overview
