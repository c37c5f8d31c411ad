#include "overview/overview_config.hpp"

#include "core/fs_utils.hpp"

#include <cmath>

namespace autopsy::overview {

using core::errors::ErrorKind;
using JsonValue = core::json::Value;

const char* ToString(const Aggregate aggregate) {
  switch (aggregate) {
  case Aggregate::kMin:
    return "min";
  case Aggregate::kMean:
    return "mean";
  case Aggregate::kMax:
    return "max";
  }
  return "mean";
}

bool ParseAggregate(std::string_view text, Aggregate& aggregate) {
  if (text == "min") {
    aggregate = Aggregate::kMin;
    return true;
  }
  if (text == "mean") {
    aggregate = Aggregate::kMean;
    return true;
  }
  if (text == "max") {
    aggregate = Aggregate::kMax;
    return true;
  }
  return false;
}

bool ValidateOverviewConfig(const OverviewConfig& config, core::errors::Error& error) {
  if (!std::isfinite(config.hz) || config.hz <= 0.0) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig, "hz must be positive");
  }
  if (config.agg.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "agg must list at least one of min|mean|max");
  }
  if (config.time_col.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig, "time_col cannot be empty");
  }
  if (config.signals.has_value()) {
    for (const std::string& signal : config.signals.value()) {
      if (signal.empty()) {
        return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                                  "signals cannot contain empty names");
      }
    }
  }
  return true;
}

JsonValue ToJsonValue(const OverviewConfig& config) {
  JsonValue::Array agg;
  agg.reserve(config.agg.size());
  for (const Aggregate aggregate : config.agg) {
    agg.push_back(JsonValue::MakeString(ToString(aggregate)));
  }

  JsonValue signals = JsonValue::MakeNull();
  if (config.signals.has_value()) {
    JsonValue::Array names;
    for (const std::string& name : config.signals.value()) {
      names.push_back(JsonValue::MakeString(name));
    }
    signals = JsonValue::MakeArray(std::move(names));
  }

  JsonValue::Object object;
  object["agg"] = JsonValue::MakeArray(std::move(agg));
  object["hz"] = JsonValue::MakeNumber(config.hz);
  object["signals"] = std::move(signals);
  object["time_col"] = JsonValue::MakeString(config.time_col);
  return JsonValue::MakeObject(std::move(object));
}

bool ParseOverviewConfigValue(const JsonValue& value, OverviewConfig& config,
                              core::errors::Error& error) {
  error.Clear();
  config = OverviewConfig{};
  if (value.type != JsonValue::Type::kObject) {
    return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                              "overview config must be a JSON object");
  }

  if (const JsonValue* signals = value.Find("signals"); signals != nullptr) {
    if (signals->type == JsonValue::Type::kArray) {
      std::vector<std::string> names;
      for (const JsonValue& item : signals->array_value) {
        if (item.type != JsonValue::Type::kString) {
          return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                                    "overview config signals must be strings");
        }
        names.push_back(item.string_value);
      }
      config.signals = std::move(names);
    } else if (signals->type == JsonValue::Type::kString && signals->string_value == "infer") {
      config.signals.reset();
    } else if (!signals->IsNull()) {
      return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                                "overview config signals must be an array, \"infer\", or null");
    }
  }

  if (const JsonValue* hz = value.Find("hz"); hz != nullptr) {
    if (hz->type != JsonValue::Type::kNumber) {
      return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                                "overview config hz must be a number");
    }
    config.hz = hz->number_value;
  }

  if (const JsonValue* agg = value.Find("agg"); agg != nullptr) {
    if (agg->type != JsonValue::Type::kArray) {
      return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                                "overview config agg must be an array");
    }
    config.agg.clear();
    for (const JsonValue& item : agg->array_value) {
      Aggregate aggregate = Aggregate::kMean;
      if (item.type != JsonValue::Type::kString || !ParseAggregate(item.string_value, aggregate)) {
        return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                                  "overview config agg entries must be one of min|mean|max");
      }
      config.agg.push_back(aggregate);
    }
  }

  if (const JsonValue* time_col = value.Find("time_col"); time_col != nullptr) {
    if (time_col->type != JsonValue::Type::kString) {
      return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                                "overview config time_col must be a string");
    }
    config.time_col = time_col->string_value;
  }

  return ValidateOverviewConfig(config, error);
}

bool ParseOverviewConfigText(std::string_view json_text, OverviewConfig& config,
                             core::errors::Error& error) {
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    return core::errors::FailWith(error, ErrorKind::kInvalidConfig, "invalid overview config JSON",
                                  parse_error);
  }
  return ParseOverviewConfigValue(root, config, error);
}

bool LoadOverviewConfigFile(const std::filesystem::path& path, OverviewConfig& config,
                            core::errors::Error& error) {
  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(path, text, read_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, read_error);
  }
  if (!ParseOverviewConfigText(text, config, error)) {
    error.message = path.string() + ": " + error.message;
    return false;
  }
  return true;
}

} // namespace autopsy::overview
