#pragma once

#include "tabload/types.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <vector>

namespace tabload {

/// Rows coerced together and handed to the destination in one append.
struct RowBatch {
  size_t index = 0;     // 0-based batch sequence number
  size_t first_row = 1; // 1-indexed data row number of rows[0]
  std::vector<CoercedRow> rows;
};

/// Bounded single-producer / single-consumer queue of batches in read order.
///
/// push() blocks while max_buffered batches are waiting. finish() marks the
/// end of input: the consumer drains what is queued, then pop() returns
/// nullopt. fail() records an exception for the consumer and wakes it.
/// cancel() is the consumer-side abort: it unblocks the producer and drops
/// anything still queued.
class BatchQueue {
public:
  explicit BatchQueue(size_t max_buffered = 2) : max_buffered_(max_buffered ? max_buffered : 1) {}

  /// Returns false if the queue was cancelled.
  bool push(RowBatch&& batch) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return ready_.size() < max_buffered_ || cancelled_; });
    if (cancelled_)
      return false;
    ready_.push_back(std::move(batch));
    not_empty_.notify_all();
    return true;
  }

  /// Next batch, or nullopt when finished/failed and drained, or cancelled.
  /// Rethrows the producer's exception once queued batches are consumed.
  std::optional<RowBatch> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !ready_.empty() || finished_ || cancelled_; });
    if (cancelled_)
      return std::nullopt;
    if (ready_.empty()) {
      if (error_) {
        auto err = error_;
        error_ = nullptr;
        std::rethrow_exception(err);
      }
      return std::nullopt;
    }
    RowBatch batch = std::move(ready_.front());
    ready_.pop_front();
    not_full_.notify_all();
    return batch;
  }

  /// Producer: no more batches.
  void finish() {
    std::unique_lock<std::mutex> lock(mutex_);
    finished_ = true;
    not_empty_.notify_all();
  }

  /// Producer: stop with an error, delivered after queued batches.
  void fail(std::exception_ptr error) {
    std::unique_lock<std::mutex> lock(mutex_);
    error_ = error;
    finished_ = true;
    not_empty_.notify_all();
  }

  /// Consumer: abandon the queue. Unblocks a waiting producer.
  void cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    cancelled_ = true;
    ready_.clear();
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool is_cancelled() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cancelled_;
  }

  size_t buffered() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return ready_.size();
  }

private:
  std::deque<RowBatch> ready_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  size_t max_buffered_;
  bool finished_ = false;
  bool cancelled_ = false;
  std::exception_ptr error_;
};

} // namespace tabload
