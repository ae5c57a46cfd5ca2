/**
 * @file arrow_destination.h
 * @brief Parquet and Feather file destinations built on Apache Arrow.
 *
 * Only available when built with TABLOAD_ENABLE_ARROW (Parquet additionally
 * needs TABLOAD_ENABLE_PARQUET).
 */

#pragma once

#ifdef TABLOAD_ENABLE_ARROW

#include "tabload/destination.h"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/writer.h>
#include <memory>
#include <string>

#ifdef TABLOAD_ENABLE_PARQUET
#include <parquet/arrow/writer.h>
#endif

namespace tabload {

enum class ColumnarFormat : uint8_t { PARQUET, FEATHER };

/// File extension written for a format ("parquet" or "arrow").
const char* columnar_extension(ColumnarFormat format);

/// Arrow type for a semantic type: utf8, int64, float64, date32.
std::shared_ptr<arrow::DataType> semantic_type_to_arrow(SemanticType type);

/// Arrow schema for a table schema. The key column name is stored under the
/// "tabload.key" metadata entry.
std::shared_ptr<arrow::Schema> to_arrow_schema(const TableSchema& schema);

/// Writes the table to `<directory>/<table>.<ext>`, one record batch (or
/// Parquet row group) per appended batch. Arrow rejects no individual rows,
/// so append only fails with DestinationError.
class ArrowTableDestination : public Destination {
public:
  ArrowTableDestination(std::string directory, ColumnarFormat format);
  ~ArrowTableDestination() override;

  void create_table(const std::string& name, const TableSchema& schema) override;
  AppendResult append(const RowBatch& batch, RejectionPolicy policy) override;
  void finish() override;
  std::string describe() const override;

  const std::string& path() const { return path_; }

private:
  std::shared_ptr<arrow::RecordBatch> to_record_batch(const RowBatch& batch) const;
  void close(bool throw_on_error);

  std::string directory_;
  ColumnarFormat format_;
  std::string path_;
  std::shared_ptr<arrow::Schema> schema_;
  std::shared_ptr<arrow::io::FileOutputStream> file_;
  std::shared_ptr<arrow::ipc::RecordBatchWriter> ipc_writer_;
#ifdef TABLOAD_ENABLE_PARQUET
  std::unique_ptr<parquet::arrow::FileWriter> parquet_writer_;
#endif
};

} // namespace tabload

#endif // TABLOAD_ENABLE_ARROW
