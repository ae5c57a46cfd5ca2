#include "tabload/export_engine.h"

#include "tabload/logging.h"

#include <thread>

namespace tabload {

namespace {

// Pulls rows from the reader and cuts them into coerced batches.
class BatchBuilder {
public:
  BatchBuilder(RowReader& reader, const ValueCoercer& coercer, size_t batch_size)
      : reader_(reader), coercer_(coercer), batch_size_(batch_size) {}

  std::optional<RowBatch> next() {
    RowBatch batch;
    batch.index = next_index_;
    batch.first_row = rows_read_ + 1;
    if (batch_size_ > 0)
      batch.rows.reserve(batch_size_);

    const size_t width = coercer_.schema().size();
    while (batch_size_ == 0 || batch.rows.size() < batch_size_) {
      auto row = reader_.next();
      if (!row)
        break;
      if (row->size() != width)
        throw SchemaMismatchError("source rows have " + std::to_string(row->size()) +
                                  " fields but the table has " + std::to_string(width) +
                                  " columns");
      batch.rows.push_back(coercer_.coerce(*row));
    }
    if (batch.rows.empty())
      return std::nullopt;

    ++next_index_;
    rows_read_ += batch.rows.size();
    return batch;
  }

  size_t rows_read() const { return rows_read_; }

private:
  RowReader& reader_;
  const ValueCoercer& coercer_;
  size_t batch_size_;
  size_t next_index_ = 0;
  size_t rows_read_ = 0;
};

} // namespace

ExportEngine::ExportEngine(const ExportOptions& options) : options_(options) {}

ExportResult ExportEngine::run(RowReader& reader, const ValueCoercer& coercer,
                               Destination& destination) {
  ExportResult result =
      options_.pipelined ? run_pipelined(reader, coercer, destination)
                         : run_sequential(reader, coercer, destination);
  destination.finish();
  logger()->info("exported {} rows in {} batches to {} ({} skipped)", result.rows_written,
                 result.batches_written, destination.describe(), result.rows_skipped);
  return result;
}

void ExportEngine::deliver(const RowBatch& batch, Destination& destination,
                           ExportResult& result) {
  const RejectionPolicy policy =
      options_.tolerate_row_errors ? RejectionPolicy::SKIP : RejectionPolicy::STOP_AT_FIRST;
  AppendResult appended = destination.append(batch, policy);
  result.rows_written += appended.written;
  ++result.batches_written;

  if (!appended.rejections.empty()) {
    if (!options_.tolerate_row_errors) {
      const RowRejection& first = appended.rejections.front();
      throw ExportError("row " + std::to_string(first.row_number) +
                            " rejected by destination: " + first.message + " (" +
                            std::to_string(result.rows_written) + " rows written)",
                        result.rows_written);
    }
    for (const auto& rejection : appended.rejections) {
      logger()->warn("skipping row {}: {}", rejection.row_number, rejection.message);
      result.rejections.add(rejection);
      ++result.rows_skipped;
    }
  }
  logger()->debug("batch {}: rows {}-{}, {} written, {} skipped", batch.index, batch.first_row,
                  batch.first_row + batch.rows.size() - 1, appended.written,
                  appended.rejections.size());
}

ExportResult ExportEngine::run_sequential(RowReader& reader, const ValueCoercer& coercer,
                                          Destination& destination) {
  ExportResult result;
  result.rejections = RejectionLog(options_.max_kept_rejections);
  BatchBuilder builder(reader, coercer, options_.batch_size);
  while (auto batch = builder.next()) {
    result.rows_read = builder.rows_read();
    deliver(*batch, destination, result);
  }
  result.rows_read = builder.rows_read();
  return result;
}

ExportResult ExportEngine::run_pipelined(RowReader& reader, const ValueCoercer& coercer,
                                         Destination& destination) {
  BatchQueue queue(options_.queue_depth);
  size_t rows_read = 0;

  std::thread producer([&] {
    try {
      BatchBuilder builder(reader, coercer, options_.batch_size);
      while (auto batch = builder.next()) {
        if (!queue.push(std::move(*batch)))
          return; // consumer gave up
      }
      rows_read = builder.rows_read();
      queue.finish();
    } catch (...) {
      queue.fail(std::current_exception());
    }
  });

  ExportResult result;
  result.rejections = RejectionLog(options_.max_kept_rejections);
  try {
    while (auto batch = queue.pop())
      deliver(*batch, destination, result);
  } catch (...) {
    queue.cancel();
    producer.join();
    throw;
  }
  producer.join();
  result.rows_read = rows_read;
  return result;
}

} // namespace tabload
