#pragma once

#include "overview/overview_config.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace autopsy::overview {

inline constexpr std::string_view kBucketColumn = "bucket";

// One `<signal>_<agg>` aggregate column. NaN marks an absent aggregate.
struct OverviewColumn {
  std::string name;
  std::vector<double> values;
};

// Downsampled per-bucket table.
//
// Invariants:
// - `buckets` strictly increases
// - `times`, `buckets`, and every column's `values` share one length
// - `times[i] == buckets[i] / hz`; epoch seconds when `absolute_time`
struct OverviewTable {
  std::string time_col = "timestamp";
  bool absolute_time = false;
  std::vector<std::int64_t> buckets;
  std::vector<double> times;
  std::vector<OverviewColumn> columns;

  std::size_t RowCount() const {
    return buckets.size();
  }

  const OverviewColumn* FindColumn(std::string_view name) const {
    for (const OverviewColumn& column : columns) {
      if (column.name == name) {
        return &column;
      }
    }
    return nullptr;
  }
};

inline std::string AggregateColumnName(std::string_view signal, Aggregate aggregate) {
  return std::string(signal) + "_" + ToString(aggregate);
}

} // namespace autopsy::overview
