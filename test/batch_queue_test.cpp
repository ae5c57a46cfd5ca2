/**
 * @file batch_queue_test.cpp
 * @brief Tests for BatchQueue: ordering, backpressure, errors and cancel.
 */

#include "tabload/batch_queue.h"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace tabload;

namespace {

RowBatch make_batch(size_t index, size_t rows = 1) {
  RowBatch batch;
  batch.index = index;
  batch.first_row = index * rows + 1;
  for (size_t i = 0; i < rows; ++i)
    batch.rows.push_back(CoercedRow{Value{static_cast<int64_t>(batch.first_row + i)}});
  return batch;
}

} // namespace

TEST(BatchQueueTest, FifoThenEnd) {
  BatchQueue queue(4);
  ASSERT_TRUE(queue.push(make_batch(0)));
  ASSERT_TRUE(queue.push(make_batch(1)));
  queue.finish();

  auto b0 = queue.pop();
  ASSERT_TRUE(b0.has_value());
  EXPECT_EQ(b0->index, 0u);
  auto b1 = queue.pop();
  ASSERT_TRUE(b1.has_value());
  EXPECT_EQ(b1->index, 1u);
  EXPECT_FALSE(queue.pop().has_value());
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(BatchQueueTest, ZeroDepthActsAsOne) {
  BatchQueue queue(0);
  ASSERT_TRUE(queue.push(make_batch(0)));
  EXPECT_EQ(queue.buffered(), 1u);
}

TEST(BatchQueueTest, ErrorDeliveredAfterQueuedBatches) {
  BatchQueue queue(4);
  ASSERT_TRUE(queue.push(make_batch(0)));
  queue.fail(std::make_exception_ptr(std::runtime_error("reader broke")));

  auto b0 = queue.pop();
  ASSERT_TRUE(b0.has_value());
  EXPECT_THROW(queue.pop(), std::runtime_error);
  // Reported once
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(BatchQueueTest, ProducerBlocksWhenFull) {
  BatchQueue queue(2);
  std::atomic<size_t> pushed{0};

  std::thread producer([&] {
    for (size_t i = 0; i < 5; ++i) {
      if (!queue.push(make_batch(i)))
        return;
      ++pushed;
    }
    queue.finish();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_LE(pushed.load(), 2u);

  size_t expected = 0;
  while (auto batch = queue.pop()) {
    EXPECT_EQ(batch->index, expected);
    ++expected;
  }
  producer.join();
  EXPECT_EQ(expected, 5u);
  EXPECT_EQ(pushed.load(), 5u);
}

TEST(BatchQueueTest, CancelUnblocksProducer) {
  BatchQueue queue(1);
  std::atomic<bool> push_failed{false};

  std::thread producer([&] {
    for (size_t i = 0; i < 10; ++i) {
      if (!queue.push(make_batch(i))) {
        push_failed = true;
        return;
      }
    }
  });

  auto first = queue.pop();
  ASSERT_TRUE(first.has_value());
  queue.cancel();
  producer.join();

  EXPECT_TRUE(push_failed.load());
  EXPECT_TRUE(queue.is_cancelled());
  EXPECT_EQ(queue.buffered(), 0u);
  EXPECT_FALSE(queue.pop().has_value());
}
