#include "overview/csv_table.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace autopsy::overview {

using core::errors::ErrorKind;

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

void StripUtf8Bom(std::vector<std::string>& header) {
  if (!header.empty() && header.front().rfind("\xEF\xBB\xBF", 0) == 0U) {
    header.front().erase(0, 3);
  }
}

bool ReadTable(std::istream& input, const CsvReadOptions& options, std::string_view source,
               RawTable& table, core::errors::Error& error) {
  table = RawTable{};
  error.Clear();

  CsvRecordReader reader(input, options.delimiter);
  std::string read_error;
  if (!reader.Next(table.columns, read_error)) {
    if (!read_error.empty()) {
      return core::errors::FailWith(error, ErrorKind::kDataShape, source, read_error);
    }
    return core::errors::Fail(error, ErrorKind::kDataShape,
                              "delimited text has no header row: " + std::string(source));
  }
  StripUtf8Bom(table.columns);

  std::vector<std::string> fields;
  while (reader.Next(fields, read_error)) {
    if (fields.size() > table.columns.size()) {
      return core::errors::Fail(
          error, ErrorKind::kDataShape,
          std::string(source) + ": line " + std::to_string(reader.LineNumber()) + " has " +
              std::to_string(fields.size()) + " fields, expected " +
              std::to_string(table.columns.size()));
    }
    fields.resize(table.columns.size());
    table.rows.push_back(fields);
  }
  if (!read_error.empty()) {
    return core::errors::FailWith(error, ErrorKind::kDataShape, source, read_error);
  }
  if (input.bad()) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "failed while reading delimited text: " + std::string(source));
  }
  return true;
}

} // namespace

std::optional<std::size_t> RawTable::ColumnIndex(std::string_view name) const {
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (columns[i] == name) {
      return i;
    }
  }
  return std::nullopt;
}

bool CsvRecordReader::Next(std::vector<std::string>& fields, std::string& error) {
  fields.clear();
  error.clear();

  std::string line;
  while (true) {
    if (!std::getline(*input_, line)) {
      return false;
    }
    ++line_;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      break;
    }
  }

  const std::size_t record_start_line = line_;
  std::string field;
  bool in_quotes = false;
  bool field_was_quoted = false;
  std::size_t pos = 0;
  while (true) {
    if (pos >= line.size()) {
      if (!in_quotes) {
        break;
      }
      // Quoted field spans a line break.
      std::string continuation;
      if (!std::getline(*input_, continuation)) {
        error = "unterminated quoted field starting on line " +
                std::to_string(record_start_line);
        return false;
      }
      ++line_;
      if (!continuation.empty() && continuation.back() == '\r') {
        continuation.pop_back();
      }
      field.push_back('\n');
      line = std::move(continuation);
      pos = 0;
      continue;
    }

    const char c = line[pos++];
    if (in_quotes) {
      if (c == '"') {
        if (pos < line.size() && line[pos] == '"') {
          field.push_back('"');
          ++pos;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == delimiter_) {
      fields.push_back(std::move(field));
      field.clear();
      field_was_quoted = false;
    } else if (c == '"' && !field_was_quoted && Trim(field).empty()) {
      field.clear();
      in_quotes = true;
      field_was_quoted = true;
    } else {
      field.push_back(c);
    }
  }
  fields.push_back(std::move(field));
  return true;
}

bool ParseCsvTable(std::string_view text, const CsvReadOptions& options, RawTable& table,
                   core::errors::Error& error) {
  std::istringstream input{std::string(text)};
  return ReadTable(input, options, "<memory>", table, error);
}

bool ReadCsvTable(const fs::path& path, const CsvReadOptions& options, RawTable& table,
                  core::errors::Error& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "failed to open delimited text file: " + path.string());
  }
  return ReadTable(input, options, path.string(), table, error);
}

bool ReadCsvHeader(const fs::path& path, const CsvReadOptions& options,
                   std::vector<std::string>& columns, std::string& error) {
  columns.clear();
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open delimited text file: " + path.string();
    return false;
  }
  CsvRecordReader reader(input, options.delimiter);
  if (!reader.Next(columns, error)) {
    if (error.empty()) {
      error = "delimited text has no header row";
    }
    return false;
  }
  StripUtf8Bom(columns);
  return true;
}

bool IsMissingCell(std::string_view cell) {
  // Infinities carry no usable magnitude and are treated as absent.
  static constexpr std::array<std::string_view, 14> kMissingTokens = {
      "na",   "nan",  "n/a",  "null",      "none",      "#n/a",      "-nan",
      "<na>", "inf",  "-inf", "+inf",      "infinity",  "-infinity", "+infinity"};
  const std::string_view trimmed = Trim(cell);
  if (trimmed.empty()) {
    return true;
  }
  for (const std::string_view token : kMissingTokens) {
    if (EqualsIgnoreCase(trimmed, token)) {
      return true;
    }
  }
  return false;
}

bool ParseNumericCell(std::string_view cell, double& value) {
  std::string_view trimmed = Trim(cell);
  if (IsMissingCell(trimmed)) {
    return false;
  }
  if (trimmed.front() == '+') {
    trimmed.remove_prefix(1);
    if (trimmed.empty() || trimmed.front() == '-' || trimmed.front() == '+') {
      return false;
    }
  }

  double parsed = 0.0;
  const char* begin = trimmed.data();
  const char* end = trimmed.data() + trimmed.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end || !std::isfinite(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

} // namespace autopsy::overview
