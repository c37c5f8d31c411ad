#include "overview/overview_builder.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>

namespace autopsy::overview {

using core::errors::ErrorKind;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Associative running statistics for one signal inside one bucket.
struct SignalAccumulator {
  double min = std::numeric_limits<double>::infinity();
  double max = -std::numeric_limits<double>::infinity();
  double sum = 0.0;
  // Running mean, used only when `sum` overflows.
  double running_mean = 0.0;
  std::uint64_t count = 0;

  void Add(const double value) {
    min = std::min(min, value);
    max = std::max(max, value);
    sum += value;
    ++count;
    const double n = static_cast<double>(count);
    running_mean = running_mean - running_mean / n + value / n;
  }

  double Value(const Aggregate aggregate) const {
    if (count == 0U) {
      return kNaN;
    }
    switch (aggregate) {
    case Aggregate::kMin:
      return min;
    case Aggregate::kMean:
      return std::isfinite(sum) ? sum / static_cast<double>(count) : running_mean;
    case Aggregate::kMax:
      return max;
    }
    return kNaN;
  }
};

bool IsNumericColumn(const RawTable& raw, const std::size_t column) {
  double ignored = 0.0;
  for (const auto& row : raw.rows) {
    const std::string& cell = row[column];
    if (IsMissingCell(cell)) {
      continue;
    }
    if (!ParseNumericCell(cell, ignored)) {
      return false;
    }
  }
  return true;
}

// Per-row time in seconds; nullopt rows are dropped from bucketing.
std::vector<std::optional<double>> ResolveRowSeconds(const RawTable& raw,
                                                     const std::string& time_col,
                                                     bool& absolute_time) {
  std::vector<std::optional<double>> seconds(raw.rows.size());
  absolute_time = false;

  const std::optional<std::size_t> time_index = raw.ColumnIndex(time_col);
  if (!time_index.has_value()) {
    for (std::size_t i = 0; i < raw.rows.size(); ++i) {
      seconds[i] = static_cast<double>(i);
    }
    return seconds;
  }

  const std::size_t column = time_index.value();
  if (IsNumericColumn(raw, column)) {
    for (std::size_t i = 0; i < raw.rows.size(); ++i) {
      double value = 0.0;
      if (ParseNumericCell(raw.rows[i][column], value) && std::isfinite(value)) {
        seconds[i] = value;
      }
    }
    return seconds;
  }

  absolute_time = true;
  for (std::size_t i = 0; i < raw.rows.size(); ++i) {
    seconds[i] = core::ParseIsoTimestamp(raw.rows[i][column]);
  }
  return seconds;
}

} // namespace

std::vector<std::string> InferRawSignals(const RawTable& raw, const std::string& time_col) {
  std::vector<std::string> signals;
  for (std::size_t i = 0; i < raw.columns.size(); ++i) {
    const std::string& name = raw.columns[i];
    if (name == time_col || name == kBucketColumn) {
      continue;
    }
    if (IsNumericColumn(raw, i)) {
      signals.push_back(name);
    }
  }
  return signals;
}

bool BuildOverviewTable(const RawTable& raw, const OverviewConfig& config, OverviewTable& table,
                        core::errors::Error& error) {
  error.Clear();
  table = OverviewTable{};
  if (!ValidateOverviewConfig(config, error)) {
    return false;
  }

  const std::vector<std::string> signals =
      config.signals.has_value() ? config.signals.value() : InferRawSignals(raw, config.time_col);

  std::vector<std::size_t> signal_columns;
  signal_columns.reserve(signals.size());
  for (const std::string& signal : signals) {
    const std::optional<std::size_t> index = raw.ColumnIndex(signal);
    if (!index.has_value()) {
      return core::errors::Fail(error, ErrorKind::kDataShape,
                                "missing column '" + signal + "' in measurement data");
    }
    signal_columns.push_back(index.value());
  }

  bool absolute_time = false;
  const std::vector<std::optional<double>> row_seconds =
      ResolveRowSeconds(raw, config.time_col, absolute_time);

  // Ordered map keeps output buckets ascending without a separate sort.
  std::map<std::int64_t, std::vector<SignalAccumulator>> buckets;
  for (std::size_t row = 0; row < raw.rows.size(); ++row) {
    if (!row_seconds[row].has_value()) {
      continue;
    }
    const double scaled = std::floor(row_seconds[row].value() * config.hz);
    if (!std::isfinite(scaled) ||
        std::fabs(scaled) > static_cast<double>(std::numeric_limits<std::int64_t>::max() / 2)) {
      continue;
    }
    const auto bucket = static_cast<std::int64_t>(scaled);

    auto [it, inserted] = buckets.try_emplace(bucket);
    if (inserted) {
      it->second.resize(signals.size());
    }
    for (std::size_t s = 0; s < signals.size(); ++s) {
      double value = 0.0;
      if (ParseNumericCell(raw.rows[row][signal_columns[s]], value)) {
        it->second[s].Add(value);
      }
    }
  }

  table.time_col = config.time_col;
  table.absolute_time = absolute_time;
  table.buckets.reserve(buckets.size());
  table.times.reserve(buckets.size());
  for (const std::string& signal : signals) {
    for (const Aggregate aggregate : config.agg) {
      OverviewColumn column;
      column.name = AggregateColumnName(signal, aggregate);
      column.values.reserve(buckets.size());
      table.columns.push_back(std::move(column));
    }
  }

  for (const auto& [bucket, accumulators] : buckets) {
    table.buckets.push_back(bucket);
    table.times.push_back(static_cast<double>(bucket) / config.hz);
    std::size_t column_index = 0;
    for (std::size_t s = 0; s < signals.size(); ++s) {
      for (const Aggregate aggregate : config.agg) {
        table.columns[column_index++].values.push_back(accumulators[s].Value(aggregate));
      }
    }
  }

  return true;
}

} // namespace autopsy::overview
