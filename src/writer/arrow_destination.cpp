#ifdef TABLOAD_ENABLE_ARROW

#include "tabload/arrow_destination.h"

#include "tabload/logging.h"

#include <arrow/builder.h>
#include <arrow/util/key_value_metadata.h>
#include <type_traits>

#ifdef TABLOAD_ENABLE_PARQUET
#include <parquet/properties.h>
#endif

namespace tabload {

namespace {

void check(const arrow::Status& status, const std::string& what) {
  if (!status.ok())
    throw DestinationError(what + ": " + status.ToString());
}

template <typename Builder, typename T>
std::shared_ptr<arrow::Array> build_column(const RowBatch& batch, size_t col) {
  Builder builder;
  check(builder.Reserve(static_cast<int64_t>(batch.rows.size())), "Failed to reserve column");
  for (const auto& row : batch.rows) {
    if constexpr (std::is_same_v<T, Date>)
      check(builder.Append(std::get<Date>(row[col]).days), "Failed to append value");
    else
      check(builder.Append(std::get<T>(row[col])), "Failed to append value");
  }
  std::shared_ptr<arrow::Array> array;
  check(builder.Finish(&array), "Failed to finish column");
  return array;
}

} // namespace

const char* columnar_extension(ColumnarFormat format) {
  return format == ColumnarFormat::PARQUET ? "parquet" : "arrow";
}

std::shared_ptr<arrow::DataType> semantic_type_to_arrow(SemanticType type) {
  switch (type) {
  case SemanticType::INT64:
    return arrow::int64();
  case SemanticType::FLOAT64:
    return arrow::float64();
  case SemanticType::DATE:
    return arrow::date32();
  default:
    return arrow::utf8();
  }
}

std::shared_ptr<arrow::Schema> to_arrow_schema(const TableSchema& schema) {
  arrow::FieldVector fields;
  fields.reserve(schema.size());
  for (const auto& col : schema.columns())
    fields.push_back(arrow::field(col.name, semantic_type_to_arrow(col.type), false));
  auto metadata = arrow::key_value_metadata({"tabload.key"}, {schema.key_name()});
  return arrow::schema(std::move(fields), std::move(metadata));
}

ArrowTableDestination::ArrowTableDestination(std::string directory, ColumnarFormat format)
    : directory_(std::move(directory)), format_(format) {
#ifndef TABLOAD_ENABLE_PARQUET
  if (format_ == ColumnarFormat::PARQUET)
    throw ConfigurationError(
        "Parquet support not available. This build was compiled without Parquet support.");
#endif
}

ArrowTableDestination::~ArrowTableDestination() { close(false); }

std::string ArrowTableDestination::describe() const {
  return path_.empty() ? directory_ : path_;
}

void ArrowTableDestination::create_table(const std::string& name, const TableSchema& schema) {
  path_ = directory_ + "/" + name + "." + columnar_extension(format_);
  schema_ = to_arrow_schema(schema);

  auto file_result = arrow::io::FileOutputStream::Open(path_);
  if (!file_result.ok())
    throw TableCreationError("Failed to open output file " + path_ + ": " +
                             file_result.status().ToString());
  file_ = *file_result;

  if (format_ == ColumnarFormat::FEATHER) {
    auto writer_result = arrow::ipc::MakeFileWriter(file_, schema_);
    if (!writer_result.ok())
      throw TableCreationError("Failed to create IPC writer: " +
                               writer_result.status().ToString());
    ipc_writer_ = *writer_result;
  } else {
#ifdef TABLOAD_ENABLE_PARQUET
    auto properties =
        parquet::WriterProperties::Builder().compression(parquet::Compression::SNAPPY)->build();
    auto arrow_properties = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    auto writer_result = parquet::arrow::FileWriter::Open(
        *schema_, arrow::default_memory_pool(), file_, properties, arrow_properties);
    if (!writer_result.ok())
      throw TableCreationError("Failed to create Parquet writer: " +
                               writer_result.status().ToString());
    parquet_writer_ = std::move(*writer_result);
#endif
  }
  logger()->info("writing table {} to {}", name, path_);
}

std::shared_ptr<arrow::RecordBatch>
ArrowTableDestination::to_record_batch(const RowBatch& batch) const {
  arrow::ArrayVector columns;
  columns.reserve(schema_->num_fields());
  for (int i = 0; i < schema_->num_fields(); ++i) {
    const size_t col = static_cast<size_t>(i);
    switch (schema_->field(i)->type()->id()) {
    case arrow::Type::INT64:
      columns.push_back(build_column<arrow::Int64Builder, int64_t>(batch, col));
      break;
    case arrow::Type::DOUBLE:
      columns.push_back(build_column<arrow::DoubleBuilder, double>(batch, col));
      break;
    case arrow::Type::DATE32:
      columns.push_back(build_column<arrow::Date32Builder, Date>(batch, col));
      break;
    default:
      columns.push_back(build_column<arrow::StringBuilder, std::string>(batch, col));
      break;
    }
  }
  return arrow::RecordBatch::Make(schema_, static_cast<int64_t>(batch.rows.size()),
                                  std::move(columns));
}

AppendResult ArrowTableDestination::append(const RowBatch& batch, RejectionPolicy /*policy*/) {
  if (!file_)
    throw DestinationError("append called before create_table");

  AppendResult result;
  if (batch.rows.empty())
    return result;

  auto record_batch = to_record_batch(batch);
  if (ipc_writer_) {
    check(ipc_writer_->WriteRecordBatch(*record_batch), "Failed to write record batch");
  }
#ifdef TABLOAD_ENABLE_PARQUET
  else if (parquet_writer_) {
    auto table_result = arrow::Table::FromRecordBatches(schema_, {record_batch});
    check(table_result.status(), "Failed to build table");
    check(parquet_writer_->WriteTable(**table_result, record_batch->num_rows()),
          "Failed to write row group");
  }
#endif
  result.written = batch.rows.size();
  return result;
}

void ArrowTableDestination::finish() { close(true); }

void ArrowTableDestination::close(bool throw_on_error) {
  arrow::Status status;
  if (ipc_writer_) {
    status = ipc_writer_->Close();
    ipc_writer_.reset();
  }
#ifdef TABLOAD_ENABLE_PARQUET
  if (parquet_writer_) {
    status = parquet_writer_->Close();
    parquet_writer_.reset();
  }
#endif
  if (file_) {
    arrow::Status file_status = file_->Close();
    if (status.ok())
      status = file_status;
    file_.reset();
  }
  if (status.ok())
    return;
  if (throw_on_error)
    throw DestinationError("Failed to close " + path_ + ": " + status.ToString());
  logger()->warn("failed to close {}: {}", path_, status.ToString());
}

} // namespace tabload

#endif // TABLOAD_ENABLE_ARROW
