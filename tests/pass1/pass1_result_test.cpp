#include "pass1/pass1_result.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using autopsy::pass1::AnomalyWindow;
using autopsy::pass1::Pass1Result;
using autopsy::pass1::WindowSignal;

namespace {

WindowSignal Signal(std::string name, std::int64_t flagged, double spike) {
  return WindowSignal{std::move(name), flagged, spike, static_cast<double>(flagged) + spike};
}

Pass1Result SampleResult() {
  Pass1Result result;
  result.measurement_id = "m_0123456789ab";
  result.overview_cfg.signals = std::vector<std::string>{"speed", "rpm"};
  result.overview_cfg.hz = 10.0;
  result.pass1_cfg.top_k_windows = 1;
  result.pass1_cfg.top_n_signals = 1;
  result.key = "00ff00ff00ff00ff";
  result.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'700'000'000'123));

  auto& speed = result.per_signal["speed"];
  speed.missing_rate = 1.0 / 3.0;
  speed.missing_rate_flagged = true;
  speed.spike_mad_z_max = 12.345678901234567;
  speed.flagged_bucket_count = 2;
  speed.flagged_buckets = {4, 5};
  result.per_signal["rpm"] = autopsy::pass1::SignalStats{};

  result.timestamp_checks.gap_count = 1;
  result.timestamp_checks.gap_indices = {3};
  result.timestamp_checks.gap_buckets = {7};
  result.timestamp_checks.expected_gap_seconds = 0.1;

  AnomalyWindow first;
  first.start_bucket = 4;
  first.end_bucket = 5;
  first.start_time = 0.4;
  first.end_time = 0.5;
  first.duration_buckets = 2;
  first.signals = {Signal("speed", 2, 12.345678901234567), Signal("rpm", 0, 0.0)};
  first.score = first.signals[0].score;

  AnomalyWindow second;
  second.start_bucket = 9;
  second.end_bucket = 9;
  second.start_time = std::string("2024-01-01T00:00:00.900000+00:00");
  second.end_time = std::string("2024-01-01T00:00:00.900000+00:00");
  second.duration_buckets = 1;
  second.signals = {Signal("rpm", 1, 0.0)};
  second.score = 1.0;

  result.windows = {first, second};
  return result;
}

} // namespace

TEST_CASE("Pass1 result JSON reloads to an identical result", "[pass1][result]") {
  const Pass1Result original = SampleResult();
  const std::string text = autopsy::pass1::ToJson(original);

  Pass1Result reloaded;
  std::string error;
  REQUIRE(autopsy::pass1::ParsePass1ResultText(text, reloaded, error));
  REQUIRE(reloaded.measurement_id == original.measurement_id);
  REQUIRE(reloaded.key == original.key);
  REQUIRE(reloaded.created_at == original.created_at);
  REQUIRE(reloaded.overview_cfg.signals == original.overview_cfg.signals);
  REQUIRE(reloaded.overview_cfg.hz == original.overview_cfg.hz);
  REQUIRE(reloaded.pass1_cfg.top_k_windows == 1);
  REQUIRE(reloaded.per_signal == original.per_signal);
  REQUIRE(reloaded.timestamp_checks == original.timestamp_checks);
  REQUIRE(reloaded.windows == original.windows);
  REQUIRE(autopsy::pass1::ToJson(reloaded) == text);
}

TEST_CASE("Pass1 result JSON carries the documented fields", "[pass1][result]") {
  const std::string text = autopsy::pass1::ToJson(SampleResult());
  for (const char* field :
       {"\"measurement_id\"", "\"overview_cfg\"", "\"pass1_cfg\"", "\"key\"", "\"created_at_utc\"",
        "\"per_signal\"", "\"timestamp_checks\"", "\"windows\"", "\"cache_hit\": false",
        "\"created_at_utc\": \"2023-11-14T22:13:20.123Z\""}) {
    INFO(field);
    REQUIRE(text.find(field) != std::string::npos);
  }
}

TEST_CASE("Truncated or foreign JSON is rejected", "[pass1][result]") {
  Pass1Result result;
  std::string error;
  REQUIRE_FALSE(autopsy::pass1::ParsePass1ResultText("{\"measurement_id\":", result, error));
  REQUIRE_FALSE(autopsy::pass1::ParsePass1ResultText("[]", result, error));
  REQUIRE_FALSE(
      autopsy::pass1::ParsePass1ResultText(R"({"measurement_id":"m","key":"k"})", result, error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("Summaries apply top-k windows and top-n signals", "[pass1][result]") {
  const Pass1Result result = SampleResult();
  const std::vector<AnomalyWindow> summary = autopsy::pass1::SummarizeTopWindows(result);
  REQUIRE(summary.size() == 1U);
  REQUIRE(summary[0].start_bucket == 4);
  REQUIRE(summary[0].signals.size() == 1U);
  REQUIRE(summary[0].signals[0].signal == "speed");
  REQUIRE(result.windows[0].signals.size() == 2U);

  const std::vector<std::string> highlights = autopsy::pass1::BuildWindowHighlights(result);
  REQUIRE(highlights == std::vector<std::string>{
                            "buckets 4..5 (2 buckets) score=14.35 signals: speed=14.35"});
}
