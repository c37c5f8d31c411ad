#pragma once

#include "core/errors/error.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "store/metadata_extractor.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace autopsy::store {

inline constexpr std::string_view kMeasurementIdPrefix = "m_";
inline constexpr std::size_t kMeasurementIdHexLength = 12;
inline constexpr std::string_view kCacheDirEnvVar = "AUTOPSY_CACHE_DIR";
inline constexpr std::string_view kDefaultCacheDir = ".autopsy_cache";

struct MeasurementRef {
  std::string id;
  std::string path;
  std::optional<std::string> label;
};

// Persisted per-measurement record (`<root>/meta/<id>.json`).
struct MeasurementMeta {
  std::string measurement_id;
  std::string file_fingerprint;
  std::string path;
  std::optional<std::string> label;
  std::chrono::system_clock::time_point created_at{};
  std::string format;
  // Format-specific fields (columns, channels, metadata_error, ...).
  core::json::Value::Object extra;
};

// `AUTOPSY_CACHE_DIR` when set and non-empty, otherwise `.autopsy_cache`.
std::filesystem::path DefaultStoreRoot();

// "m_" + first 12 hex chars of the fingerprint.
std::string MeasurementIdFromFingerprint(std::string_view fingerprint);

// Content-addressed registry of measurement files plus the deterministic
// artifact cache layout:
//
//   <root>/meta/<id>.json
//   <root>/artifacts/<id>/<kind>/<key><suffix>
//
// Registration is idempotent per fingerprint. Records are published through
// temp file + rename, so concurrent registrations of one file converge on an
// equivalent record.
class MeasurementStore {
public:
  explicit MeasurementStore(std::filesystem::path root, core::logging::Logger* logger = nullptr);
  MeasurementStore(std::filesystem::path root, MetadataExtractorRegistry extractors,
                   core::logging::Logger* logger = nullptr);

  const std::filesystem::path& Root() const {
    return root_;
  }

  // Fingerprints `path` and creates its record when none exists. A supplied
  // label that differs from the stored one rewrites only the label. The
  // returned label is the supplied one, else the stored one.
  // Missing/unreadable file => kIo.
  bool Register(const std::filesystem::path& path, const std::optional<std::string>& label,
                MeasurementRef& ref, core::errors::Error& error) const;

  // kNotFound when no record exists for `measurement_id`.
  bool Metadata(std::string_view measurement_id, MeasurementMeta& meta,
                core::errors::Error& error) const;

  bool ConfigKey(const core::json::Value& config, std::string& key,
                 core::errors::Error& error) const;

  // Pure path derivation; creates the parent directory. Components containing
  // path separators or dot segments are kInvalidConfig.
  bool CachePath(std::string_view measurement_id, std::string_view kind, std::string_view key,
                 std::string_view suffix, std::filesystem::path& path,
                 core::errors::Error& error) const;

private:
  std::filesystem::path MetaPath(std::string_view measurement_id) const;
  bool WriteMeta(const MeasurementMeta& meta, core::errors::Error& error) const;
  bool UpdateLabel(std::string_view measurement_id, const std::string& label,
                   std::optional<std::string>& stored_label, core::errors::Error& error) const;

  std::filesystem::path root_;
  MetadataExtractorRegistry extractors_;
  core::logging::Logger* logger_ = nullptr;
};

core::json::Value ToJsonValue(const MeasurementMeta& meta);
bool ParseMeasurementMeta(const core::json::Value& value, MeasurementMeta& meta,
                          std::string& error);

} // namespace autopsy::store
