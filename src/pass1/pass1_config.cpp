#include "pass1/pass1_config.hpp"

#include "core/fs_utils.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace autopsy::pass1 {

using core::errors::ErrorKind;
using JsonValue = core::json::Value;

namespace {

bool ParseOptionalDouble(const JsonValue& object, std::string_view key, double& out,
                         core::errors::Error& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return true;
  }
  if (field->type != JsonValue::Type::kNumber) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "pass1 config " + std::string(key) + " must be a number");
  }
  out = field->number_value;
  return true;
}

bool ParseOptionalInteger(const JsonValue& object, std::string_view key, std::int64_t& out,
                          core::errors::Error& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return true;
  }
  const double raw = field->number_value;
  if (field->type != JsonValue::Type::kNumber || !std::isfinite(raw) || std::floor(raw) != raw ||
      std::fabs(raw) > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "pass1 config " + std::string(key) + " must be an integer");
  }
  out = static_cast<std::int64_t>(raw);
  return true;
}

} // namespace

bool ValidatePass1Config(const Pass1Config& config, core::errors::Error& error) {
  if (!std::isfinite(config.missing_rate) || config.missing_rate < 0.0 ||
      config.missing_rate > 1.0) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "missing_rate must be within [0, 1]");
  }
  if (!std::isfinite(config.flatline_eps) || config.flatline_eps < 0.0) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "flatline_eps must be non-negative");
  }
  if (config.flatline_min_run < 1) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "flatline_min_run must be at least 1");
  }
  if (!std::isfinite(config.spike_mad_z) || config.spike_mad_z <= 0.0) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig, "spike_mad_z must be positive");
  }
  if (config.top_k_windows < 0 || config.top_n_signals < 0) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "top_k_windows and top_n_signals must be non-negative");
  }
  return true;
}

JsonValue ToJsonValue(const Pass1Config& config) {
  JsonValue::Object object;
  object["flatline_eps"] = JsonValue::MakeNumber(config.flatline_eps);
  object["flatline_min_run"] = JsonValue::MakeNumber(static_cast<double>(config.flatline_min_run));
  object["missing_rate"] = JsonValue::MakeNumber(config.missing_rate);
  object["spike_mad_z"] = JsonValue::MakeNumber(config.spike_mad_z);
  object["top_k_windows"] = JsonValue::MakeNumber(static_cast<double>(config.top_k_windows));
  object["top_n_signals"] = JsonValue::MakeNumber(static_cast<double>(config.top_n_signals));
  return JsonValue::MakeObject(std::move(object));
}

bool ParsePass1ConfigValue(const JsonValue& value, Pass1Config& config,
                           core::errors::Error& error) {
  error.Clear();
  config = Pass1Config{};
  if (value.type != JsonValue::Type::kObject) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "pass1 config must be a JSON object");
  }

  if (!ParseOptionalDouble(value, "missing_rate", config.missing_rate, error) ||
      !ParseOptionalDouble(value, "flatline_eps", config.flatline_eps, error) ||
      !ParseOptionalInteger(value, "flatline_min_run", config.flatline_min_run, error) ||
      !ParseOptionalDouble(value, "spike_mad_z", config.spike_mad_z, error) ||
      !ParseOptionalInteger(value, "top_k_windows", config.top_k_windows, error) ||
      !ParseOptionalInteger(value, "top_n_signals", config.top_n_signals, error)) {
    return false;
  }
  return ValidatePass1Config(config, error);
}

bool ParsePass1ConfigText(std::string_view json_text, Pass1Config& config,
                          core::errors::Error& error) {
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    return core::errors::FailWith(error, ErrorKind::kInvalidConfig, "invalid pass1 config JSON",
                                  parse_error);
  }
  return ParsePass1ConfigValue(root, config, error);
}

bool LoadPass1ConfigFile(const std::filesystem::path& path, Pass1Config& config,
                         core::errors::Error& error) {
  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(path, text, read_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, read_error);
  }
  if (!ParsePass1ConfigText(text, config, error)) {
    error.message = path.string() + ": " + error.message;
    return false;
  }
  return true;
}

} // namespace autopsy::pass1
