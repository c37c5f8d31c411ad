#pragma once

#include "core/errors/error.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autopsy::overview {

// Row-major view of a delimited-text measurement file. Cells are kept as raw
// text; numeric interpretation happens per column in the overview builder.
struct RawTable {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;

  // Index of `name` in `columns`, or nullopt.
  std::optional<std::size_t> ColumnIndex(std::string_view name) const;
};

struct CsvReadOptions {
  char delimiter = ',';
};

// Streaming RFC-4180 style record reader.
//
// - quoted fields may contain delimiters, doubled quotes, and newlines
// - CRLF and LF line endings are both accepted
// - blank lines are skipped
class CsvRecordReader {
public:
  CsvRecordReader(std::istream& input, char delimiter) : input_(&input), delimiter_(delimiter) {}

  // Reads the next record. Returns false at end of input (error empty) or on a
  // malformed record (error populated).
  bool Next(std::vector<std::string>& fields, std::string& error);

  std::size_t LineNumber() const {
    return line_;
  }

private:
  std::istream* input_;
  char delimiter_;
  std::size_t line_ = 0;
};

// Parses in-memory delimited text. The first record is the header.
bool ParseCsvTable(std::string_view text, const CsvReadOptions& options, RawTable& table,
                   core::errors::Error& error);

// Reads a delimited-text file. Short rows are padded with empty cells; rows
// with more cells than the header are a kDataShape error.
bool ReadCsvTable(const std::filesystem::path& path, const CsvReadOptions& options,
                  RawTable& table, core::errors::Error& error);

// Reads only the header record (used by metadata extraction).
bool ReadCsvHeader(const std::filesystem::path& path, const CsvReadOptions& options,
                   std::vector<std::string>& columns, std::string& error);

// True for cells that denote an absent value: empty, NA, NaN, null, inf, ...
bool IsMissingCell(std::string_view cell);

// Parses a numeric cell (surrounding whitespace allowed, optional leading '+').
// Missing cells, non-numeric text and values outside the double range return
// false.
bool ParseNumericCell(std::string_view cell, double& value);

} // namespace autopsy::overview
