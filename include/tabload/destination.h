#pragma once

#include "tabload/batch_queue.h"
#include "tabload/error.h"
#include "tabload/schema.h"

#include <string>
#include <vector>

namespace tabload {

/// What a destination does after refusing a row inside a batch.
enum class RejectionPolicy : uint8_t {
  STOP_AT_FIRST, // write the rows before it, then stop the batch
  SKIP           // skip it and keep writing
};

struct AppendResult {
  size_t written = 0;
  std::vector<RowRejection> rejections; // row numbers are data row numbers
};

/// Columnar store that receives one new table per run.
///
/// Row-level refusals are reported in AppendResult; anything that makes the
/// store unusable (connection loss, authentication) throws DestinationError.
class Destination {
public:
  virtual ~Destination() = default;

  /// Create the table (replacing any previous one of that name).
  /// Throws TableCreationError.
  virtual void create_table(const std::string& name, const TableSchema& schema) = 0;

  /// Append a batch in row order. Requires a prior create_table().
  virtual AppendResult append(const RowBatch& batch, RejectionPolicy policy) = 0;

  /// Flush and close. Called once after the last successful append.
  virtual void finish() {}

  /// Short description for logs, e.g. "clickhouse://127.0.0.1:8123/db.table".
  virtual std::string describe() const = 0;
};

} // namespace tabload
