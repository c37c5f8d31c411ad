#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace autopsy::store {

// Lightweight, format-specific metadata read at registration time. An
// extractor must never load sample data.
class IMetadataExtractor {
public:
  virtual ~IMetadataExtractor() = default;

  // Value stored as the record's `format` field.
  virtual std::string FormatTag() const = 0;

  // Adds format-specific fields. Returns false with `error` on failure;
  // fields added before the failure are discarded by the caller.
  virtual bool Extract(const std::filesystem::path& path, core::json::Value::Object& fields,
                       std::string& error) const = 0;
};

// Extractors keyed by lowercase file extension without the dot.
class MetadataExtractorRegistry {
public:
  // Registry with the csv and mf4/mdf extractors installed.
  static MetadataExtractorRegistry WithBuiltins();

  void Register(std::string extension, std::shared_ptr<const IMetadataExtractor> extractor);
  const IMetadataExtractor* Find(std::string_view extension) const;

private:
  std::map<std::string, std::shared_ptr<const IMetadataExtractor>, std::less<>> extractors_;
};

// Lowercase extension without the dot ("" when there is none).
std::string NormalizedExtension(const std::filesystem::path& path);

// Never fails. Unknown extensions produce `{format, note: "minimal metadata"}`;
// an extractor failure produces `{format, metadata_error}` and a warning.
core::json::Value::Object ExtractMetadata(const MetadataExtractorRegistry& registry,
                                          const std::filesystem::path& path,
                                          core::logging::Logger* logger);

} // namespace autopsy::store
