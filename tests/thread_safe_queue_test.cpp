// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for savings::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order, try_pop() on empty and non-empty queues, size()
//   - Blocking pop() waits for a producer
//   - pop_for() times out on an empty queue and returns early on a push
//   - No lost or duplicated items under multi-producer / multi-consumer load
//
// Threaded tests join every thread before asserting.
// =============================================================================

#include "savings/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  savings::ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), static_cast<std::size_t>(kCount));

  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  std::optional<int> result = queue.try_pop();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 99);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// Blocking pop() must wait until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// pop_for(): bounded wait.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  auto start = std::chrono::steady_clock::now();
  std::optional<int> result = queue.pop_for(std::chrono::milliseconds(20));
  auto waited = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(15));
}

TEST_F(ThreadSafeQueueTest, PopForReturnsPushedItem) {
  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    queue.push(5);
  });

  std::optional<int> result = queue.pop_for(std::chrono::seconds(5));
  producer.join();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 5);
}

// -----------------------------------------------------------------------------
// Move-only payloads, as used for executor tasks.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveOnlyTest, CarriesMoveOnlyItems) {
  savings::ThreadSafeQueue<std::unique_ptr<int>> q;
  q.push(std::make_unique<int>(3));

  std::unique_ptr<int> item = q.pop();
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(*item, 3);
}

// -----------------------------------------------------------------------------
// 4 producers x 1000 items, 4 consumers: every item popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        std::optional<int> item = queue.pop_for(std::chrono::milliseconds(1));
        if (item) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
