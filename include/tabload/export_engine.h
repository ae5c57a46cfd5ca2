#pragma once

#include "tabload/destination.h"
#include "tabload/error.h"
#include "tabload/row_reader.h"
#include "tabload/value_coercer.h"

#include <cstddef>

namespace tabload {

inline constexpr size_t DEFAULT_BATCH_SIZE = 1000;

struct ExportOptions {
  size_t batch_size = DEFAULT_BATCH_SIZE; // 0 = one batch holding every row
  bool tolerate_row_errors = false;
  bool pipelined = true;  // read and coerce on a producer thread
  size_t queue_depth = 2; // batches buffered ahead of the destination
  size_t max_kept_rejections = RejectionLog::DEFAULT_MAX_KEPT;
};

struct ExportResult {
  size_t rows_read = 0;
  size_t rows_written = 0;
  size_t rows_skipped = 0;
  size_t batches_written = 0;
  RejectionLog rejections;
};

/// Streams rows from a reader through a coercer into a destination in
/// batches, preserving read order.
///
/// Strict mode (tolerate_row_errors == false): the first rejected row
/// aborts with ExportError; rows before it are written and none after.
/// Tolerant mode: rejected rows are skipped and counted. A DestinationError
/// aborts in both modes.
class ExportEngine {
public:
  explicit ExportEngine(const ExportOptions& options = ExportOptions());

  /// Throws ExportError, DestinationError, SchemaMismatchError (row width
  /// differs from the schema) or any reader error.
  ExportResult run(RowReader& reader, const ValueCoercer& coercer, Destination& destination);

private:
  ExportResult run_sequential(RowReader& reader, const ValueCoercer& coercer,
                              Destination& destination);
  ExportResult run_pipelined(RowReader& reader, const ValueCoercer& coercer,
                             Destination& destination);

  /// Append one batch and fold its outcome into result. Throws ExportError
  /// in strict mode when the batch had a rejection.
  void deliver(const RowBatch& batch, Destination& destination, ExportResult& result);

  ExportOptions options_;
};

} // namespace tabload
