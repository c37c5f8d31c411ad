#pragma once

#include "core/json_dom.hpp"
#include "overview/overview_config.hpp"
#include "pass1/pass1_config.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace autopsy::pass1 {

struct SignalStats {
  double missing_rate = 0.0;
  bool missing_rate_flagged = false;
  std::int64_t flatline_run_count = 0;
  std::int64_t flatline_max_run = 0;
  double spike_mad_z_max = 0.0;
  std::int64_t flagged_bucket_count = 0;
  std::vector<std::int64_t> flagged_buckets;

  bool operator==(const SignalStats&) const = default;
};

struct TimestampChecks {
  bool monotonic = true;
  std::int64_t gap_count = 0;
  // Row positions `i` whose time exceeds row `i-1` by more than 1.5 bucket
  // widths.
  std::vector<std::int64_t> gap_indices;
  // Bucket ids of the same rows.
  std::vector<std::int64_t> gap_buckets;
  double expected_gap_seconds = 1.0;

  bool operator==(const TimestampChecks&) const = default;
};

struct WindowSignal {
  std::string signal;
  std::int64_t flagged_bucket_count = 0;
  double spike_mad_z_max = 0.0;
  double score = 0.0;

  bool operator==(const WindowSignal&) const = default;
};

// Seconds for relative overviews, ISO-8601 text for absolute ones.
using WindowTime = std::variant<double, std::string>;

struct AnomalyWindow {
  std::int64_t start_bucket = 0;
  std::int64_t end_bucket = 0;
  WindowTime start_time = 0.0;
  WindowTime end_time = 0.0;
  std::int64_t duration_buckets = 0;
  double score = 0.0;
  // Ranked by descending score, then ascending name.
  std::vector<WindowSignal> signals;

  bool operator==(const AnomalyWindow&) const = default;
};

struct Pass1Result {
  std::string measurement_id;
  overview::OverviewConfig overview_cfg;
  Pass1Config pass1_cfg;
  std::string key;
  std::chrono::system_clock::time_point created_at{};
  std::map<std::string, SignalStats> per_signal;
  TimestampChecks timestamp_checks;
  // Ranked by descending score, then ascending start bucket.
  std::vector<AnomalyWindow> windows;
  bool cache_hit = false;
};

core::json::Value ToJsonValue(const Pass1Result& result);

// Pretty-printed (2-space) JSON artifact text.
std::string ToJson(const Pass1Result& result);

bool ParsePass1ResultValue(const core::json::Value& value, Pass1Result& result,
                           std::string& error);
bool ParsePass1ResultText(std::string_view text, Pass1Result& result, std::string& error);

// Top `top_k_windows` windows, each trimmed to its top `top_n_signals`
// signals. The full ranking stays in the result.
std::vector<AnomalyWindow> SummarizeTopWindows(const Pass1Result& result);

// One human-readable line per summarized window, e.g.
// "buckets 20..29 (10 buckets) score=1356.21 signals: signal_a=10.00, signal_b=1346.21".
std::vector<std::string> BuildWindowHighlights(const Pass1Result& result);

} // namespace autopsy::pass1
