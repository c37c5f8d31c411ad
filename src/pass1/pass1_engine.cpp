#include "pass1/pass1_engine.hpp"

#include "core/time_utils.hpp"
#include "pass1/detectors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>

namespace autopsy::pass1 {

using core::errors::ErrorKind;
using overview::Aggregate;
using overview::OverviewColumn;
using overview::OverviewTable;

namespace {

constexpr double kGapFactor = 1.5;

struct SignalColumns {
  const OverviewColumn* mean = nullptr;
  const OverviewColumn* min = nullptr;
  const OverviewColumn* max = nullptr;
};

struct SignalAnalysis {
  std::string name;
  SignalStats stats;
  std::vector<bool> flagged;
};

// Overview rows in ascending bucket order.
struct OrderedRows {
  std::vector<std::size_t> order;

  template <typename T> std::vector<T> Gather(const std::vector<T>& values) const {
    std::vector<T> gathered;
    gathered.reserve(order.size());
    for (const std::size_t index : order) {
      gathered.push_back(values[index]);
    }
    return gathered;
  }
};

bool ResolveSignalColumns(const OverviewTable& overview, const std::string& signal,
                          SignalColumns& columns, core::errors::Error& error) {
  const std::string mean_name = overview::AggregateColumnName(signal, Aggregate::kMean);
  const std::string min_name = overview::AggregateColumnName(signal, Aggregate::kMin);
  const std::string max_name = overview::AggregateColumnName(signal, Aggregate::kMax);
  columns.mean = overview.FindColumn(mean_name);
  columns.min = overview.FindColumn(min_name);
  columns.max = overview.FindColumn(max_name);
  for (const auto& [column, name] : {std::pair{columns.mean, &mean_name},
                                     std::pair{columns.min, &min_name},
                                     std::pair{columns.max, &max_name}}) {
    if (column == nullptr) {
      return core::errors::Fail(error, ErrorKind::kDataShape,
                                "missing column '" + *name + "' in overview for signal '" +
                                    signal + "'");
    }
    if (column->values.size() != overview.RowCount()) {
      return core::errors::Fail(error, ErrorKind::kDataShape,
                                "overview column '" + *name + "' has " +
                                    std::to_string(column->values.size()) + " rows, expected " +
                                    std::to_string(overview.RowCount()));
    }
  }
  return true;
}

TimestampChecks CheckTimestamps(const std::vector<double>& seconds,
                                const std::vector<std::int64_t>& buckets, const double hz) {
  TimestampChecks checks;
  checks.expected_gap_seconds = 1.0 / hz;
  const double gap_threshold = checks.expected_gap_seconds * kGapFactor;
  for (std::size_t i = 1; i < seconds.size(); ++i) {
    const double diff = seconds[i] - seconds[i - 1U];
    if (std::isnan(diff)) {
      continue;
    }
    if (diff < 0.0) {
      checks.monotonic = false;
    }
    if (diff > gap_threshold) {
      checks.gap_indices.push_back(static_cast<std::int64_t>(i));
      checks.gap_buckets.push_back(buckets[i]);
    }
  }
  checks.gap_count = static_cast<std::int64_t>(checks.gap_indices.size());
  return checks;
}

SignalAnalysis AnalyzeSignal(const std::string& name, const std::vector<double>& mean,
                             const std::vector<double>& min, const std::vector<double>& max,
                             const std::vector<std::int64_t>& buckets, const Pass1Config& config) {
  SignalAnalysis analysis;
  analysis.name = name;
  const std::size_t rows = mean.size();

  std::vector<bool> missing(rows, false);
  std::size_t missing_count = 0;
  for (std::size_t i = 0; i < rows; ++i) {
    if (std::isnan(mean[i])) {
      missing[i] = true;
      ++missing_count;
    }
  }
  SignalStats& stats = analysis.stats;
  stats.missing_rate = rows == 0U ? 0.0 : static_cast<double>(missing_count) / rows;
  stats.missing_rate_flagged = rows != 0U && stats.missing_rate >= config.missing_rate;

  const std::vector<bool> flatline =
      FlatlineMask(min, max, config.flatline_eps, config.flatline_min_run);
  for (const BoolRun& run : FindTrueRuns(flatline)) {
    ++stats.flatline_run_count;
    stats.flatline_max_run = std::max(stats.flatline_max_run, static_cast<std::int64_t>(run.length));
  }

  const std::vector<double> z_scores = MadZScores(FirstDifference(mean));
  std::vector<bool> spike(rows, false);
  for (std::size_t i = 0; i < rows; ++i) {
    const double magnitude = std::fabs(z_scores[i]);
    spike[i] = magnitude >= config.spike_mad_z;
    stats.spike_mad_z_max = std::max(stats.spike_mad_z_max, magnitude);
  }

  analysis.flagged.assign(rows, false);
  for (std::size_t i = 0; i < rows; ++i) {
    const bool flagged = (missing[i] && stats.missing_rate_flagged) || flatline[i] || spike[i];
    analysis.flagged[i] = flagged;
    if (flagged) {
      stats.flagged_buckets.push_back(buckets[i]);
    }
  }
  stats.flagged_bucket_count = static_cast<std::int64_t>(stats.flagged_buckets.size());
  return analysis;
}

WindowTime FormatWindowTime(const double seconds, const bool absolute_time) {
  if (absolute_time) {
    return core::FormatIsoSeconds(seconds);
  }
  return seconds;
}

std::vector<AnomalyWindow> MergeWindows(const std::vector<SignalAnalysis>& analyses,
                                        const std::vector<std::int64_t>& buckets,
                                        const std::vector<double>& seconds,
                                        const bool absolute_time) {
  std::vector<bool> union_mask(buckets.size(), false);
  for (const SignalAnalysis& analysis : analyses) {
    for (std::size_t i = 0; i < union_mask.size(); ++i) {
      union_mask[i] = union_mask[i] || analysis.flagged[i];
    }
  }

  std::vector<AnomalyWindow> windows;
  for (const BoolRun& run : FindTrueRuns(union_mask)) {
    AnomalyWindow window;
    window.start_bucket = buckets[run.start];
    window.end_bucket = buckets[run.End()];
    window.start_time = FormatWindowTime(seconds[run.start], absolute_time);
    window.end_time = FormatWindowTime(seconds[run.End()], absolute_time);
    window.duration_buckets = window.end_bucket - window.start_bucket + 1;

    for (const SignalAnalysis& analysis : analyses) {
      WindowSignal signal;
      signal.signal = analysis.name;
      signal.flagged_bucket_count = static_cast<std::int64_t>(
          std::count(analysis.flagged.begin() + static_cast<std::ptrdiff_t>(run.start),
                     analysis.flagged.begin() + static_cast<std::ptrdiff_t>(run.End() + 1U),
                     true));
      signal.spike_mad_z_max = analysis.stats.spike_mad_z_max;
      signal.score = static_cast<double>(signal.flagged_bucket_count) + signal.spike_mad_z_max;
      window.score += signal.score;
      window.signals.push_back(std::move(signal));
    }
    std::sort(window.signals.begin(), window.signals.end(),
              [](const WindowSignal& lhs, const WindowSignal& rhs) {
                if (lhs.score != rhs.score) {
                  return lhs.score > rhs.score;
                }
                return lhs.signal < rhs.signal;
              });
    windows.push_back(std::move(window));
  }

  std::sort(windows.begin(), windows.end(), [](const AnomalyWindow& lhs, const AnomalyWindow& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.start_bucket < rhs.start_bucket;
  });
  return windows;
}

} // namespace

std::vector<std::string> InferOverviewSignals(const OverviewTable& overview,
                                              const std::vector<Aggregate>& agg) {
  std::set<std::string> prefixes;
  for (const OverviewColumn& column : overview.columns) {
    const std::size_t split = column.name.rfind('_');
    if (split == std::string::npos) {
      continue;
    }
    Aggregate aggregate = Aggregate::kMean;
    if (!overview::ParseAggregate(std::string_view(column.name).substr(split + 1U), aggregate) ||
        std::find(agg.begin(), agg.end(), aggregate) == agg.end()) {
      continue;
    }
    prefixes.insert(column.name.substr(0, split));
  }
  return std::vector<std::string>(prefixes.begin(), prefixes.end());
}

bool ComputePass1(const OverviewTable& overview, std::string_view measurement_id,
                  const overview::OverviewConfig& overview_cfg, const Pass1Config& pass1_cfg,
                  std::string_view key, Pass1Result& result, core::errors::Error& error) {
  error.Clear();
  if (!overview::ValidateOverviewConfig(overview_cfg, error) ||
      !ValidatePass1Config(pass1_cfg, error)) {
    return false;
  }
  if (overview.times.size() != overview.RowCount()) {
    return core::errors::Fail(error, ErrorKind::kDataShape,
                              "overview time column length does not match bucket column");
  }

  const std::vector<std::string> signals = overview_cfg.signals.has_value()
                                               ? overview_cfg.signals.value()
                                               : InferOverviewSignals(overview, overview_cfg.agg);

  std::vector<SignalColumns> signal_columns(signals.size());
  for (std::size_t s = 0; s < signals.size(); ++s) {
    if (!ResolveSignalColumns(overview, signals[s], signal_columns[s], error)) {
      return false;
    }
  }

  OrderedRows rows;
  rows.order.resize(overview.RowCount());
  std::iota(rows.order.begin(), rows.order.end(), std::size_t{0});
  std::stable_sort(rows.order.begin(), rows.order.end(),
                   [&overview](const std::size_t lhs, const std::size_t rhs) {
                     return overview.buckets[lhs] < overview.buckets[rhs];
                   });
  const std::vector<std::int64_t> buckets = rows.Gather(overview.buckets);
  const std::vector<double> seconds = rows.Gather(overview.times);

  std::vector<SignalAnalysis> analyses;
  analyses.reserve(signals.size());
  for (std::size_t s = 0; s < signals.size(); ++s) {
    analyses.push_back(AnalyzeSignal(signals[s], rows.Gather(signal_columns[s].mean->values),
                                     rows.Gather(signal_columns[s].min->values),
                                     rows.Gather(signal_columns[s].max->values), buckets,
                                     pass1_cfg));
  }

  Pass1Result computed;
  computed.measurement_id = std::string(measurement_id);
  computed.overview_cfg = overview_cfg;
  computed.pass1_cfg = pass1_cfg;
  computed.key = std::string(key);
  computed.created_at = core::TruncateToMilliseconds(std::chrono::system_clock::now());
  computed.timestamp_checks = CheckTimestamps(seconds, buckets, overview_cfg.hz);
  computed.windows = MergeWindows(analyses, buckets, seconds, overview.absolute_time);
  for (SignalAnalysis& analysis : analyses) {
    computed.per_signal[analysis.name] = std::move(analysis.stats);
  }
  computed.cache_hit = false;

  result = std::move(computed);
  return true;
}

} // namespace autopsy::pass1
