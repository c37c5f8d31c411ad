#include "store/measurement_store.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "store/config_key.hpp"
#include "store/fingerprint.hpp"

#include <cmath>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace autopsy::store {

using core::errors::ErrorKind;
using JsonValue = core::json::Value;
using JsonObject = JsonValue::Object;

namespace {

constexpr std::string_view kMetaDir = "meta";
constexpr std::string_view kArtifactsDir = "artifacts";

bool IsSafePathComponent(std::string_view component) {
  if (component.empty() || component == "." || component == "..") {
    return false;
  }
  return component.find('/') == std::string_view::npos &&
         component.find('\\') == std::string_view::npos &&
         component.find('\0') == std::string_view::npos;
}

bool RequireSafeComponent(std::string_view name, std::string_view component,
                          core::errors::Error& error) {
  if (IsSafePathComponent(component)) {
    return true;
  }
  return core::errors::Fail(error, ErrorKind::kInvalidConfig,
                            "invalid " + std::string(name) + " '" + std::string(component) +
                                "' for cache path");
}

bool ParseRequiredString(const JsonObject& object, std::string_view key, std::string& out,
                         std::string& error) {
  const auto it = object.find(std::string(key));
  if (it == object.end() || it->second.type != JsonValue::Type::kString) {
    error = "metadata field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = it->second.string_value;
  return true;
}

bool ParseOptionalString(const JsonObject& object, std::string_view key,
                         std::optional<std::string>& out, std::string& error) {
  out.reset();
  const auto it = object.find(std::string(key));
  if (it == object.end() || it->second.IsNull()) {
    return true;
  }
  if (it->second.type != JsonValue::Type::kString) {
    error = "metadata field '" + std::string(key) + "' must be a string or null";
    return false;
  }
  out = it->second.string_value;
  return true;
}

bool ReadMetaDocument(const fs::path& meta_path, JsonValue& root, core::errors::Error& error) {
  std::string text;
  std::string io_error;
  if (!core::ReadTextFile(meta_path, text, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, io_error);
  }
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error) || root.type != JsonValue::Type::kObject) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "corrupt metadata record '" + meta_path.string() + "': " +
                                  (parse_error.empty() ? "expected object" : parse_error));
  }
  return true;
}

std::optional<std::string> LabelOf(const JsonValue& root) {
  const JsonValue* label = root.Find("label");
  if (label == nullptr || label->type != JsonValue::Type::kString) {
    return std::nullopt;
  }
  return label->string_value;
}

} // namespace

fs::path DefaultStoreRoot() {
  const char* raw = std::getenv(std::string(kCacheDirEnvVar).c_str());
  if (raw != nullptr && raw[0] != '\0') {
    return fs::path(raw);
  }
  return fs::path(std::string(kDefaultCacheDir));
}

std::string MeasurementIdFromFingerprint(std::string_view fingerprint) {
  return std::string(kMeasurementIdPrefix) +
         std::string(fingerprint.substr(0, kMeasurementIdHexLength));
}

JsonValue ToJsonValue(const MeasurementMeta& meta) {
  JsonObject object = meta.extra;
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          meta.created_at.time_since_epoch())
                          .count();
  object["measurement_id"] = JsonValue::MakeString(meta.measurement_id);
  object["file_fingerprint"] = JsonValue::MakeString(meta.file_fingerprint);
  object["path"] = JsonValue::MakeString(meta.path);
  object["label"] =
      meta.label.has_value() ? JsonValue::MakeString(meta.label.value()) : JsonValue::MakeNull();
  object["created_at_utc"] = JsonValue::MakeString(core::FormatUtcTimestamp(meta.created_at));
  object["created_at_unix"] = JsonValue::MakeNumber(static_cast<double>(millis) / 1000.0);
  object["format"] = JsonValue::MakeString(meta.format);
  return JsonValue::MakeObject(std::move(object));
}

bool ParseMeasurementMeta(const JsonValue& value, MeasurementMeta& meta, std::string& error) {
  meta = MeasurementMeta{};
  if (value.type != JsonValue::Type::kObject) {
    error = "metadata record must be a JSON object";
    return false;
  }
  const JsonObject& object = value.object_value;
  if (!ParseRequiredString(object, "measurement_id", meta.measurement_id, error) ||
      !ParseRequiredString(object, "file_fingerprint", meta.file_fingerprint, error) ||
      !ParseRequiredString(object, "path", meta.path, error) ||
      !ParseOptionalString(object, "label", meta.label, error)) {
    return false;
  }

  const JsonValue* format = value.Find("format");
  if (format != nullptr && format->type == JsonValue::Type::kString) {
    meta.format = format->string_value;
  }

  const JsonValue* created = value.Find("created_at_unix");
  if (created == nullptr || created->type != JsonValue::Type::kNumber ||
      !std::isfinite(created->number_value)) {
    error = "metadata field 'created_at_unix' must be a number";
    return false;
  }
  meta.created_at = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(std::llround(created->number_value * 1000.0)));

  for (const auto& [key, field] : object) {
    if (key == "measurement_id" || key == "file_fingerprint" || key == "path" || key == "label" ||
        key == "created_at_unix" || key == "created_at_utc" || key == "format") {
      continue;
    }
    meta.extra.emplace(key, field);
  }
  return true;
}

MeasurementStore::MeasurementStore(fs::path root, core::logging::Logger* logger)
    : MeasurementStore(std::move(root), MetadataExtractorRegistry::WithBuiltins(), logger) {}

MeasurementStore::MeasurementStore(fs::path root, MetadataExtractorRegistry extractors,
                                   core::logging::Logger* logger)
    : root_(std::move(root)), extractors_(std::move(extractors)), logger_(logger) {}

fs::path MeasurementStore::MetaPath(std::string_view measurement_id) const {
  return root_ / std::string(kMetaDir) / (std::string(measurement_id) + ".json");
}

bool MeasurementStore::WriteMeta(const MeasurementMeta& meta, core::errors::Error& error) const {
  const std::string text = core::json::Serialize(ToJsonValue(meta), /*indent=*/2) + "\n";
  std::string io_error;
  if (!core::WriteTextFileAtomic(MetaPath(meta.measurement_id), text, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, io_error);
  }
  return true;
}

bool MeasurementStore::UpdateLabel(std::string_view measurement_id, const std::string& label,
                                   std::optional<std::string>& stored_label,
                                   core::errors::Error& error) const {
  const fs::path meta_path = MetaPath(measurement_id);
  JsonValue root;
  if (!ReadMetaDocument(meta_path, root, error)) {
    return false;
  }
  stored_label = LabelOf(root);
  if (stored_label.has_value() && stored_label.value() == label) {
    return true;
  }

  root.object_value["label"] = JsonValue::MakeString(label);
  const std::string text = core::json::Serialize(root, /*indent=*/2) + "\n";
  std::string io_error;
  if (!core::WriteTextFileAtomic(meta_path, text, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, io_error);
  }
  stored_label = label;
  if (logger_ != nullptr) {
    logger_->Info("measurement label updated", {{"label", label}});
  }
  return true;
}

bool MeasurementStore::Register(const fs::path& path, const std::optional<std::string>& label,
                                MeasurementRef& ref, core::errors::Error& error) const {
  error.Clear();
  ref = MeasurementRef{};

  std::error_code ec;
  const fs::path absolute = fs::absolute(path, ec);
  const fs::path resolved = ec ? path : fs::weakly_canonical(absolute, ec);
  if (ec || !fs::exists(resolved, ec)) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "measurement file not found: " + path.string());
  }

  std::string fingerprint;
  if (!FingerprintFile(resolved, fingerprint, error)) {
    return false;
  }
  const std::string measurement_id = MeasurementIdFromFingerprint(fingerprint);
  const core::logging::ScopedMeasurementId log_scope(logger_, measurement_id);

  const fs::path meta_path = MetaPath(measurement_id);
  std::optional<std::string> stored_label;
  const bool has_record = fs::exists(meta_path, ec);
  if (ec) {
    return core::errors::FailWith(error, ErrorKind::kIo, meta_path.string(),
                                  "unable to check metadata record: " + ec.message());
  }
  if (!has_record) {
    MeasurementMeta meta;
    meta.extra = ExtractMetadata(extractors_, resolved, logger_);
    const auto format = meta.extra.find("format");
    if (format != meta.extra.end()) {
      meta.format = format->second.string_value;
      meta.extra.erase(format);
    }
    meta.measurement_id = measurement_id;
    meta.file_fingerprint = fingerprint;
    meta.path = resolved.string();
    meta.label = label;
    meta.created_at = core::TruncateToMilliseconds(std::chrono::system_clock::now());
    if (!WriteMeta(meta, error)) {
      return false;
    }
    stored_label = label;
    if (logger_ != nullptr) {
      logger_->Info("measurement registered",
                    {{"path", meta.path}, {"format", meta.format}, {"fingerprint", fingerprint}});
    }
  } else if (label.has_value()) {
    if (!UpdateLabel(measurement_id, label.value(), stored_label, error)) {
      return false;
    }
  } else {
    JsonValue root;
    if (!ReadMetaDocument(meta_path, root, error)) {
      return false;
    }
    stored_label = LabelOf(root);
    if (logger_ != nullptr) {
      logger_->Debug("measurement already registered", {{"path", resolved.string()}});
    }
  }

  ref.id = measurement_id;
  ref.path = resolved.string();
  ref.label = label.has_value() ? label : stored_label;
  return true;
}

bool MeasurementStore::Metadata(std::string_view measurement_id, MeasurementMeta& meta,
                                core::errors::Error& error) const {
  error.Clear();
  if (!IsSafePathComponent(measurement_id)) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "unknown measurement_id: " + std::string(measurement_id));
  }
  const fs::path meta_path = MetaPath(measurement_id);
  std::error_code ec;
  if (!fs::exists(meta_path, ec)) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "unknown measurement_id: " + std::string(measurement_id));
  }

  JsonValue root;
  if (!ReadMetaDocument(meta_path, root, error)) {
    return false;
  }
  std::string parse_error;
  if (!ParseMeasurementMeta(root, meta, parse_error)) {
    return core::errors::FailWith(error, ErrorKind::kIo, meta_path.string(), parse_error);
  }
  return true;
}

bool MeasurementStore::ConfigKey(const JsonValue& config, std::string& key,
                                 core::errors::Error& error) const {
  std::string hash_error;
  if (!store::ConfigKey(config, key, hash_error)) {
    return core::errors::Fail(error, ErrorKind::kInternal, hash_error);
  }
  return true;
}

bool MeasurementStore::CachePath(std::string_view measurement_id, std::string_view kind,
                                 std::string_view key, std::string_view suffix, fs::path& path,
                                 core::errors::Error& error) const {
  error.Clear();
  if (!RequireSafeComponent("measurement_id", measurement_id, error) ||
      !RequireSafeComponent("kind", kind, error) ||
      !RequireSafeComponent("key", key, error) ||
      !RequireSafeComponent("key", std::string(key) + std::string(suffix), error)) {
    return false;
  }

  path = root_ / std::string(kArtifactsDir) / std::string(measurement_id) / std::string(kind) /
         (std::string(key) + std::string(suffix));
  std::string io_error;
  if (!core::EnsureParentDirectory(path, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, io_error);
  }
  return true;
}

} // namespace autopsy::store
