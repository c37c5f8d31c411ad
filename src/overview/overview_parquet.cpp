#include "overview/overview_parquet.hpp"

#include "core/fs_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace autopsy::overview {

using core::errors::ErrorKind;

namespace {

constexpr std::int64_t kRowGroupLength = 64 * 1024;
constexpr double kNanosPerSecond = 1'000'000'000.0;

bool CheckStatus(const arrow::Status& status, std::string_view context,
                 core::errors::Error& error) {
  if (status.ok()) {
    return true;
  }
  return core::errors::FailWith(error, ErrorKind::kIo, context, status.ToString());
}

void RemoveStagedFile(const std::filesystem::path& temp_path) {
  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
}

bool BuildTimeArray(const OverviewTable& table, std::shared_ptr<arrow::Array>& array,
                    std::shared_ptr<arrow::Field>& field, core::errors::Error& error) {
  if (table.absolute_time) {
    auto type = arrow::timestamp(arrow::TimeUnit::NANO, "UTC");
    arrow::TimestampBuilder builder(type, arrow::default_memory_pool());
    if (!CheckStatus(builder.Reserve(static_cast<std::int64_t>(table.times.size())),
                     "reserve time column", error)) {
      return false;
    }
    for (const double seconds : table.times) {
      builder.UnsafeAppend(static_cast<std::int64_t>(std::llround(seconds * kNanosPerSecond)));
    }
    field = arrow::field(table.time_col, type, false);
    return CheckStatus(builder.Finish(&array), "finish time column", error);
  }

  arrow::DoubleBuilder builder(arrow::default_memory_pool());
  if (!CheckStatus(builder.AppendValues(table.times), "append time column", error)) {
    return false;
  }
  field = arrow::field(table.time_col, arrow::float64(), false);
  return CheckStatus(builder.Finish(&array), "finish time column", error);
}

bool BuildAggregateArray(const OverviewColumn& column, std::shared_ptr<arrow::Array>& array,
                         core::errors::Error& error) {
  arrow::DoubleBuilder builder(arrow::default_memory_pool());
  if (!CheckStatus(builder.Reserve(static_cast<std::int64_t>(column.values.size())),
                   "reserve column " + column.name, error)) {
    return false;
  }
  for (const double value : column.values) {
    if (std::isnan(value)) {
      builder.UnsafeAppendNull();
    } else {
      builder.UnsafeAppend(value);
    }
  }
  return CheckStatus(builder.Finish(&array), "finish column " + column.name, error);
}

// Flattens a chunked float64/timestamp/int64 column into doubles. Nulls
// become NaN.
bool FlattenNumeric(const arrow::ChunkedArray& chunked, std::string_view name,
                    std::vector<double>& values, core::errors::Error& error) {
  values.clear();
  values.reserve(static_cast<std::size_t>(chunked.length()));
  const arrow::Type::type type_id = chunked.type()->id();
  for (const std::shared_ptr<arrow::Array>& chunk : chunked.chunks()) {
    for (std::int64_t i = 0; i < chunk->length(); ++i) {
      if (chunk->IsNull(i)) {
        values.push_back(std::numeric_limits<double>::quiet_NaN());
        continue;
      }
      switch (type_id) {
      case arrow::Type::DOUBLE:
        values.push_back(static_cast<const arrow::DoubleArray&>(*chunk).Value(i));
        break;
      case arrow::Type::INT64:
        values.push_back(static_cast<double>(static_cast<const arrow::Int64Array&>(*chunk).Value(i)));
        break;
      case arrow::Type::TIMESTAMP:
        values.push_back(
            static_cast<double>(static_cast<const arrow::TimestampArray&>(*chunk).Value(i)) /
            kNanosPerSecond);
        break;
      default:
        return core::errors::Fail(error, ErrorKind::kDataShape,
                                  "unsupported type for overview column '" + std::string(name) +
                                      "': " + chunked.type()->ToString());
      }
    }
  }
  return true;
}

bool FlattenBuckets(const arrow::ChunkedArray& chunked, std::vector<std::int64_t>& buckets,
                    core::errors::Error& error) {
  if (chunked.type()->id() != arrow::Type::INT64) {
    return core::errors::Fail(error, ErrorKind::kDataShape,
                              "overview column 'bucket' must be int64, got " +
                                  chunked.type()->ToString());
  }
  buckets.clear();
  buckets.reserve(static_cast<std::size_t>(chunked.length()));
  for (const std::shared_ptr<arrow::Array>& chunk : chunked.chunks()) {
    const auto& typed = static_cast<const arrow::Int64Array&>(*chunk);
    for (std::int64_t i = 0; i < typed.length(); ++i) {
      if (typed.IsNull(i)) {
        return core::errors::Fail(error, ErrorKind::kDataShape,
                                  "overview column 'bucket' contains nulls");
      }
      buckets.push_back(typed.Value(i));
    }
  }
  return true;
}

} // namespace

bool WriteOverviewParquet(const OverviewTable& table, const std::filesystem::path& output_path,
                          core::errors::Error& error) {
  error.Clear();
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;

  std::shared_ptr<arrow::Field> time_field;
  std::shared_ptr<arrow::Array> time_array;
  if (!BuildTimeArray(table, time_array, time_field, error)) {
    return false;
  }
  fields.push_back(time_field);
  arrays.push_back(time_array);

  arrow::Int64Builder bucket_builder(arrow::default_memory_pool());
  std::shared_ptr<arrow::Array> bucket_array;
  if (!CheckStatus(bucket_builder.AppendValues(table.buckets), "append bucket column", error) ||
      !CheckStatus(bucket_builder.Finish(&bucket_array), "finish bucket column", error)) {
    return false;
  }
  fields.push_back(arrow::field(std::string(kBucketColumn), arrow::int64(), false));
  arrays.push_back(bucket_array);

  for (const OverviewColumn& column : table.columns) {
    std::shared_ptr<arrow::Array> array;
    if (!BuildAggregateArray(column, array, error)) {
      return false;
    }
    fields.push_back(arrow::field(column.name, arrow::float64(), true));
    arrays.push_back(array);
  }

  const std::shared_ptr<arrow::Table> arrow_table =
      arrow::Table::Make(arrow::schema(fields), arrays, static_cast<std::int64_t>(table.RowCount()));

  std::string fs_error;
  if (!core::EnsureParentDirectory(output_path, fs_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, fs_error);
  }

  const std::filesystem::path temp_path = core::BuildAtomicTempPath(output_path);
  arrow::Result<std::shared_ptr<arrow::io::FileOutputStream>> sink_result =
      arrow::io::FileOutputStream::Open(temp_path.string());
  if (!sink_result.ok()) {
    return core::errors::FailWith(error, ErrorKind::kIo, "open " + temp_path.string(),
                                  sink_result.status().ToString());
  }
  std::shared_ptr<arrow::io::FileOutputStream> sink = sink_result.ValueUnsafe();

  const arrow::Status write_status = parquet::arrow::WriteTable(
      *arrow_table, arrow::default_memory_pool(), sink, kRowGroupLength);
  const arrow::Status close_status = sink->Close();
  if (!write_status.ok() || !close_status.ok()) {
    RemoveStagedFile(temp_path);
    const arrow::Status& failed = write_status.ok() ? close_status : write_status;
    return core::errors::FailWith(error, ErrorKind::kIo, "write " + output_path.string(),
                                  failed.ToString());
  }

  if (!core::PublishStagedFile(temp_path, output_path, fs_error)) {
    return core::errors::Fail(error, ErrorKind::kIo, fs_error);
  }
  return true;
}

bool ReadOverviewParquet(const std::filesystem::path& input_path, OverviewTable& table,
                         core::errors::Error& error) {
  error.Clear();
  table = OverviewTable{};

  std::error_code exists_ec;
  if (!std::filesystem::is_regular_file(input_path, exists_ec)) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "overview artifact not found: " + input_path.string());
  }

  parquet::arrow::FileReaderBuilder builder;
  if (!CheckStatus(builder.OpenFile(input_path.string()), "open " + input_path.string(), error)) {
    return false;
  }
  std::unique_ptr<parquet::arrow::FileReader> reader;
  if (!CheckStatus(builder.Build(&reader), "read " + input_path.string(), error)) {
    return false;
  }
  std::shared_ptr<arrow::Table> arrow_table;
  if (!CheckStatus(reader->ReadTable(&arrow_table), "read " + input_path.string(), error)) {
    return false;
  }

  const std::shared_ptr<arrow::Schema> schema = arrow_table->schema();
  if (schema->num_fields() < 2 || schema->field(1)->name() != kBucketColumn) {
    return core::errors::Fail(error, ErrorKind::kDataShape,
                              "overview artifact has no '" + std::string(kBucketColumn) +
                                  "' column: " + input_path.string());
  }

  table.time_col = schema->field(0)->name();
  table.absolute_time = schema->field(0)->type()->id() == arrow::Type::TIMESTAMP;
  if (!FlattenNumeric(*arrow_table->column(0), table.time_col, table.times, error) ||
      !FlattenBuckets(*arrow_table->column(1), table.buckets, error)) {
    return false;
  }

  for (int i = 2; i < schema->num_fields(); ++i) {
    OverviewColumn column;
    column.name = schema->field(i)->name();
    if (!FlattenNumeric(*arrow_table->column(i), column.name, column.values, error)) {
      return false;
    }
    table.columns.push_back(std::move(column));
  }
  return true;
}

} // namespace autopsy::overview
