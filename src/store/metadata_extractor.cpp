#include "store/metadata_extractor.hpp"

#include "overview/csv_table.hpp"
#include "store/mdf4_reader.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <vector>

namespace autopsy::store {

using JsonValue = core::json::Value;

namespace {

JsonValue StringArray(const std::vector<std::string>& items, std::size_t cap) {
  JsonValue::Array array;
  const std::size_t count = std::min(items.size(), cap);
  array.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    array.push_back(JsonValue::MakeString(items[i]));
  }
  return JsonValue::MakeArray(std::move(array));
}

class CsvMetadataExtractor final : public IMetadataExtractor {
public:
  std::string FormatTag() const override {
    return "csv";
  }

  bool Extract(const std::filesystem::path& path, JsonValue::Object& fields,
               std::string& error) const override {
    std::vector<std::string> columns;
    if (!overview::ReadCsvHeader(path, overview::CsvReadOptions{}, columns, error)) {
      return false;
    }
    fields["columns_count"] = JsonValue::MakeNumber(static_cast<double>(columns.size()));
    fields["columns"] = StringArray(columns, kMaxListedChannels);
    fields["columns_truncated"] = JsonValue::MakeBool(columns.size() > kMaxListedChannels);
    return true;
  }
};

class Mdf4MetadataExtractor final : public IMetadataExtractor {
public:
  std::string FormatTag() const override {
    return "mf4";
  }

  bool Extract(const std::filesystem::path& path, JsonValue::Object& fields,
               std::string& error) const override {
    Mdf4Summary summary;
    if (!ReadMdf4Summary(path, summary, error)) {
      return false;
    }
    fields["mdf_version"] = JsonValue::MakeNumber(summary.version);
    fields["channels_count"] = JsonValue::MakeNumber(static_cast<double>(summary.channels.size()));
    fields["channels"] = StringArray(summary.channels, kMaxListedChannels);
    fields["channels_truncated"] = JsonValue::MakeBool(summary.channels.size() > kMaxListedChannels);
    fields["start_time_unix"] = summary.start_time_unix.has_value()
                                    ? JsonValue::MakeNumber(summary.start_time_unix.value())
                                    : JsonValue::MakeNull();
    if (!summary.finalized) {
      fields["mdf_finalized"] = JsonValue::MakeBool(false);
    }
    return true;
  }
};

} // namespace

MetadataExtractorRegistry MetadataExtractorRegistry::WithBuiltins() {
  MetadataExtractorRegistry registry;
  auto mdf = std::make_shared<const Mdf4MetadataExtractor>();
  registry.Register("csv", std::make_shared<const CsvMetadataExtractor>());
  registry.Register("mf4", mdf);
  registry.Register("mdf", mdf);
  return registry;
}

void MetadataExtractorRegistry::Register(std::string extension,
                                         std::shared_ptr<const IMetadataExtractor> extractor) {
  extractors_[std::move(extension)] = std::move(extractor);
}

const IMetadataExtractor* MetadataExtractorRegistry::Find(std::string_view extension) const {
  const auto it = extractors_.find(extension);
  return it == extractors_.end() ? nullptr : it->second.get();
}

std::string NormalizedExtension(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return extension;
}

JsonValue::Object ExtractMetadata(const MetadataExtractorRegistry& registry,
                                  const std::filesystem::path& path,
                                  core::logging::Logger* logger) {
  const std::string extension = NormalizedExtension(path);
  const IMetadataExtractor* extractor = registry.Find(extension);

  JsonValue::Object fields;
  if (extractor == nullptr) {
    fields["format"] = JsonValue::MakeString(extension);
    fields["note"] = JsonValue::MakeString("minimal metadata");
    return fields;
  }

  std::string error;
  bool ok = false;
  // Extraction is best effort: a parser that throws (for example bad_alloc on
  // a hostile length field) is reported like any other extraction failure.
  try {
    ok = extractor->Extract(path, fields, error);
  } catch (const std::exception& ex) {
    ok = false;
    error = std::string("extractor threw: ") + ex.what();
  }

  if (!ok) {
    fields.clear();
    fields["metadata_error"] = JsonValue::MakeString(error);
    if (logger != nullptr) {
      logger->Warn("metadata extraction failed",
                   {{"path", path.string()}, {"format", extractor->FormatTag()}, {"error", error}});
    }
  }
  fields["format"] = JsonValue::MakeString(extractor->FormatTag());
  return fields;
}

} // namespace autopsy::store
