#include "pass1/pass1_result.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace autopsy::pass1 {

namespace {

using JsonValue = core::json::Value;
using JsonObject = JsonValue::Object;

JsonValue IntArray(const std::vector<std::int64_t>& values) {
  JsonValue::Array array;
  array.reserve(values.size());
  for (const std::int64_t value : values) {
    array.push_back(JsonValue::MakeNumber(static_cast<double>(value)));
  }
  return JsonValue::MakeArray(std::move(array));
}

JsonValue IntValue(const std::int64_t value) {
  return JsonValue::MakeNumber(static_cast<double>(value));
}

JsonValue TimeValue(const WindowTime& time) {
  if (const auto* text = std::get_if<std::string>(&time)) {
    return JsonValue::MakeString(*text);
  }
  return JsonValue::MakeNumber(std::get<double>(time));
}

JsonValue SignalStatsJson(const SignalStats& stats) {
  JsonObject object;
  object["missing_rate"] = JsonValue::MakeNumber(stats.missing_rate);
  object["missing_rate_flagged"] = JsonValue::MakeBool(stats.missing_rate_flagged);
  object["flatline_run_count"] = IntValue(stats.flatline_run_count);
  object["flatline_max_run"] = IntValue(stats.flatline_max_run);
  object["spike_mad_z_max"] = JsonValue::MakeNumber(stats.spike_mad_z_max);
  object["flagged_bucket_count"] = IntValue(stats.flagged_bucket_count);
  object["flagged_buckets"] = IntArray(stats.flagged_buckets);
  return JsonValue::MakeObject(std::move(object));
}

JsonValue TimestampChecksJson(const TimestampChecks& checks) {
  JsonObject object;
  object["monotonic"] = JsonValue::MakeBool(checks.monotonic);
  object["gap_count"] = IntValue(checks.gap_count);
  object["gap_indices"] = IntArray(checks.gap_indices);
  object["gap_buckets"] = IntArray(checks.gap_buckets);
  object["expected_gap_seconds"] = JsonValue::MakeNumber(checks.expected_gap_seconds);
  return JsonValue::MakeObject(std::move(object));
}

JsonValue WindowJson(const AnomalyWindow& window) {
  JsonValue::Array signals;
  signals.reserve(window.signals.size());
  for (const WindowSignal& signal : window.signals) {
    JsonObject entry;
    entry["signal"] = JsonValue::MakeString(signal.signal);
    entry["flagged_bucket_count"] = IntValue(signal.flagged_bucket_count);
    entry["spike_mad_z_max"] = JsonValue::MakeNumber(signal.spike_mad_z_max);
    entry["score"] = JsonValue::MakeNumber(signal.score);
    signals.push_back(JsonValue::MakeObject(std::move(entry)));
  }

  JsonObject object;
  object["start_bucket"] = IntValue(window.start_bucket);
  object["end_bucket"] = IntValue(window.end_bucket);
  object["start_time"] = TimeValue(window.start_time);
  object["end_time"] = TimeValue(window.end_time);
  object["duration_buckets"] = IntValue(window.duration_buckets);
  object["score"] = JsonValue::MakeNumber(window.score);
  object["signals"] = JsonValue::MakeArray(std::move(signals));
  return JsonValue::MakeObject(std::move(object));
}

const JsonValue* RequireField(const JsonValue& object, std::string_view key,
                              JsonValue::Type type, std::string_view context,
                              std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr || field->type != type) {
    error = std::string(context) + " field '" + std::string(key) + "' is missing or mistyped";
    return nullptr;
  }
  return field;
}

bool ParseNumberField(const JsonValue& object, std::string_view key, std::string_view context,
                      double& out, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kNumber, context, error);
  if (field == nullptr) {
    return false;
  }
  out = field->number_value;
  return true;
}

bool ParseIntField(const JsonValue& object, std::string_view key, std::string_view context,
                   std::int64_t& out, std::string& error) {
  double raw = 0.0;
  if (!ParseNumberField(object, key, context, raw, error)) {
    return false;
  }
  if (!std::isfinite(raw) || std::floor(raw) != raw) {
    error = std::string(context) + " field '" + std::string(key) + "' must be an integer";
    return false;
  }
  out = static_cast<std::int64_t>(raw);
  return true;
}

bool ParseBoolField(const JsonValue& object, std::string_view key, std::string_view context,
                    bool& out, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kBool, context, error);
  if (field == nullptr) {
    return false;
  }
  out = field->bool_value;
  return true;
}

bool ParseStringField(const JsonValue& object, std::string_view key, std::string_view context,
                      std::string& out, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kString, context, error);
  if (field == nullptr) {
    return false;
  }
  out = field->string_value;
  return true;
}

bool ParseIntArrayField(const JsonValue& object, std::string_view key, std::string_view context,
                        std::vector<std::int64_t>& out, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kArray, context, error);
  if (field == nullptr) {
    return false;
  }
  out.clear();
  out.reserve(field->array_value.size());
  for (const JsonValue& item : field->array_value) {
    if (item.type != JsonValue::Type::kNumber || std::floor(item.number_value) != item.number_value) {
      error = std::string(context) + " field '" + std::string(key) + "' must hold integers";
      return false;
    }
    out.push_back(static_cast<std::int64_t>(item.number_value));
  }
  return true;
}

bool ParseTimeField(const JsonValue& object, std::string_view key, WindowTime& out,
                    std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field != nullptr && field->type == JsonValue::Type::kString) {
    out = field->string_value;
    return true;
  }
  if (field != nullptr && field->type == JsonValue::Type::kNumber) {
    out = field->number_value;
    return true;
  }
  error = "window field '" + std::string(key) + "' must be a number or string";
  return false;
}

bool ParseSignalStats(const JsonValue& value, SignalStats& stats, std::string& error) {
  constexpr std::string_view kContext = "per_signal";
  return ParseNumberField(value, "missing_rate", kContext, stats.missing_rate, error) &&
         ParseBoolField(value, "missing_rate_flagged", kContext, stats.missing_rate_flagged,
                        error) &&
         ParseIntField(value, "flatline_run_count", kContext, stats.flatline_run_count, error) &&
         ParseIntField(value, "flatline_max_run", kContext, stats.flatline_max_run, error) &&
         ParseNumberField(value, "spike_mad_z_max", kContext, stats.spike_mad_z_max, error) &&
         ParseIntField(value, "flagged_bucket_count", kContext, stats.flagged_bucket_count,
                       error) &&
         ParseIntArrayField(value, "flagged_buckets", kContext, stats.flagged_buckets, error);
}

bool ParseTimestampChecks(const JsonValue& value, TimestampChecks& checks, std::string& error) {
  constexpr std::string_view kContext = "timestamp_checks";
  if (!ParseBoolField(value, "monotonic", kContext, checks.monotonic, error) ||
      !ParseIntField(value, "gap_count", kContext, checks.gap_count, error) ||
      !ParseIntArrayField(value, "gap_indices", kContext, checks.gap_indices, error) ||
      !ParseNumberField(value, "expected_gap_seconds", kContext, checks.expected_gap_seconds,
                        error)) {
    return false;
  }
  checks.gap_buckets.clear();
  if (value.Find("gap_buckets") != nullptr) {
    return ParseIntArrayField(value, "gap_buckets", kContext, checks.gap_buckets, error);
  }
  return true;
}

bool ParseWindow(const JsonValue& value, AnomalyWindow& window, std::string& error) {
  constexpr std::string_view kContext = "window";
  if (value.type != JsonValue::Type::kObject ||
      !ParseIntField(value, "start_bucket", kContext, window.start_bucket, error) ||
      !ParseIntField(value, "end_bucket", kContext, window.end_bucket, error) ||
      !ParseTimeField(value, "start_time", window.start_time, error) ||
      !ParseTimeField(value, "end_time", window.end_time, error) ||
      !ParseIntField(value, "duration_buckets", kContext, window.duration_buckets, error) ||
      !ParseNumberField(value, "score", kContext, window.score, error)) {
    if (error.empty()) {
      error = "window entries must be objects";
    }
    return false;
  }

  const JsonValue* signals =
      RequireField(value, "signals", JsonValue::Type::kArray, kContext, error);
  if (signals == nullptr) {
    return false;
  }
  for (const JsonValue& item : signals->array_value) {
    WindowSignal signal;
    constexpr std::string_view kSignalContext = "window signal";
    if (!ParseStringField(item, "signal", kSignalContext, signal.signal, error) ||
        !ParseIntField(item, "flagged_bucket_count", kSignalContext, signal.flagged_bucket_count,
                       error) ||
        !ParseNumberField(item, "spike_mad_z_max", kSignalContext, signal.spike_mad_z_max,
                          error) ||
        !ParseNumberField(item, "score", kSignalContext, signal.score, error)) {
      return false;
    }
    window.signals.push_back(std::move(signal));
  }
  return true;
}

std::string FormatFixed(const double value, const int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

} // namespace

JsonValue ToJsonValue(const Pass1Result& result) {
  JsonObject per_signal;
  for (const auto& [name, stats] : result.per_signal) {
    per_signal[name] = SignalStatsJson(stats);
  }

  JsonValue::Array windows;
  windows.reserve(result.windows.size());
  for (const AnomalyWindow& window : result.windows) {
    windows.push_back(WindowJson(window));
  }

  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          result.created_at.time_since_epoch())
                          .count();

  JsonObject object;
  object["measurement_id"] = JsonValue::MakeString(result.measurement_id);
  object["overview_cfg"] = overview::ToJsonValue(result.overview_cfg);
  object["pass1_cfg"] = ToJsonValue(result.pass1_cfg);
  object["key"] = JsonValue::MakeString(result.key);
  object["created_at_utc"] = JsonValue::MakeString(core::FormatUtcTimestamp(result.created_at));
  object["created_at_unix"] = JsonValue::MakeNumber(static_cast<double>(millis) / 1000.0);
  object["per_signal"] = JsonValue::MakeObject(std::move(per_signal));
  object["timestamp_checks"] = TimestampChecksJson(result.timestamp_checks);
  object["windows"] = JsonValue::MakeArray(std::move(windows));
  object["cache_hit"] = JsonValue::MakeBool(result.cache_hit);
  return JsonValue::MakeObject(std::move(object));
}

std::string ToJson(const Pass1Result& result) {
  return core::json::Serialize(ToJsonValue(result), /*indent=*/2) + "\n";
}

bool ParsePass1ResultValue(const JsonValue& value, Pass1Result& result, std::string& error) {
  result = Pass1Result{};
  error.clear();
  if (value.type != JsonValue::Type::kObject) {
    error = "pass1 result must be a JSON object";
    return false;
  }

  constexpr std::string_view kContext = "pass1 result";
  if (!ParseStringField(value, "measurement_id", kContext, result.measurement_id, error) ||
      !ParseStringField(value, "key", kContext, result.key, error)) {
    return false;
  }

  const JsonValue* overview_cfg =
      RequireField(value, "overview_cfg", JsonValue::Type::kObject, kContext, error);
  const JsonValue* pass1_cfg =
      overview_cfg == nullptr
          ? nullptr
          : RequireField(value, "pass1_cfg", JsonValue::Type::kObject, kContext, error);
  if (pass1_cfg == nullptr) {
    return false;
  }
  core::errors::Error config_error;
  if (!overview::ParseOverviewConfigValue(*overview_cfg, result.overview_cfg, config_error) ||
      !ParsePass1ConfigValue(*pass1_cfg, result.pass1_cfg, config_error)) {
    error = config_error.message;
    return false;
  }

  double created_unix = 0.0;
  if (!ParseNumberField(value, "created_at_unix", kContext, created_unix, error)) {
    return false;
  }
  result.created_at = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(std::llround(created_unix * 1000.0)));

  const JsonValue* per_signal =
      RequireField(value, "per_signal", JsonValue::Type::kObject, kContext, error);
  if (per_signal == nullptr) {
    return false;
  }
  for (const auto& [name, stats_value] : per_signal->object_value) {
    SignalStats stats;
    if (!ParseSignalStats(stats_value, stats, error)) {
      error = "signal '" + name + "': " + error;
      return false;
    }
    result.per_signal.emplace(name, std::move(stats));
  }

  const JsonValue* checks =
      RequireField(value, "timestamp_checks", JsonValue::Type::kObject, kContext, error);
  if (checks == nullptr || !ParseTimestampChecks(*checks, result.timestamp_checks, error)) {
    return false;
  }

  const JsonValue* windows =
      RequireField(value, "windows", JsonValue::Type::kArray, kContext, error);
  if (windows == nullptr) {
    return false;
  }
  for (const JsonValue& item : windows->array_value) {
    AnomalyWindow window;
    if (!ParseWindow(item, window, error)) {
      return false;
    }
    result.windows.push_back(std::move(window));
  }

  const JsonValue* cache_hit = value.Find("cache_hit");
  result.cache_hit = cache_hit != nullptr && cache_hit->type == JsonValue::Type::kBool &&
                     cache_hit->bool_value;
  return true;
}

bool ParsePass1ResultText(std::string_view text, Pass1Result& result, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid pass1 result JSON: " + error;
    return false;
  }
  return ParsePass1ResultValue(root, result, error);
}

std::vector<AnomalyWindow> SummarizeTopWindows(const Pass1Result& result) {
  const auto top_k = static_cast<std::size_t>(std::max<std::int64_t>(0, result.pass1_cfg.top_k_windows));
  const auto top_n = static_cast<std::size_t>(std::max<std::int64_t>(0, result.pass1_cfg.top_n_signals));

  std::vector<AnomalyWindow> summary(
      result.windows.begin(),
      result.windows.begin() + static_cast<std::ptrdiff_t>(std::min(top_k, result.windows.size())));
  for (AnomalyWindow& window : summary) {
    if (window.signals.size() > top_n) {
      window.signals.resize(top_n);
    }
  }
  return summary;
}

std::vector<std::string> BuildWindowHighlights(const Pass1Result& result) {
  std::vector<std::string> highlights;
  for (const AnomalyWindow& window : SummarizeTopWindows(result)) {
    std::string line = "buckets " + std::to_string(window.start_bucket) + ".." +
                       std::to_string(window.end_bucket) + " (" +
                       std::to_string(window.duration_buckets) + " buckets) score=" +
                       FormatFixed(window.score, 2);
    if (!window.signals.empty()) {
      line += " signals:";
      for (std::size_t i = 0; i < window.signals.size(); ++i) {
        line += (i == 0U ? " " : ", ") + window.signals[i].signal + "=" +
                FormatFixed(window.signals[i].score, 2);
      }
    }
    highlights.push_back(std::move(line));
  }
  return highlights;
}

} // namespace autopsy::pass1
