// =============================================================================
// serial_executor_test.cpp
// =============================================================================
// Unit tests for savings::SerialExecutor.
//
// Validates:
//   - Tasks run one at a time, in submission order, on one worker thread
//   - Futures carry results and rethrow task exceptions
//   - submit() while stopped throws std::logic_error
//   - stop() finishes every task queued before it
//   - The executor can be restarted
// =============================================================================

#include "savings/concurrent/serial_executor.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class SerialExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override { executor.start(); }
  void TearDown() override { executor.stop(); }

  savings::SerialExecutor executor;
};

// -----------------------------------------------------------------------------
// 1. Results come back through the future.
// -----------------------------------------------------------------------------
TEST_F(SerialExecutorTest, FutureCarriesResult) {
  std::future<int> f = executor.submit([] { return 6 * 7; });
  EXPECT_EQ(f.get(), 42);

  std::future<std::string> s = executor.submit([] { return std::string("ok"); });
  EXPECT_EQ(s.get(), "ok");
}

TEST_F(SerialExecutorTest, VoidTasksComplete) {
  int counter = 0;
  executor.submit([&counter] { ++counter; }).get();
  EXPECT_EQ(counter, 1);
}

// -----------------------------------------------------------------------------
// 2. Exceptions stay in the future; the worker keeps going.
// -----------------------------------------------------------------------------
TEST_F(SerialExecutorTest, ExceptionPropagatesToCaller) {
  std::future<int> f =
      executor.submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(f.get(), std::runtime_error);

  EXPECT_EQ(executor.submit([] { return 1; }).get(), 1);
}

// -----------------------------------------------------------------------------
// 3. Order and single-threadedness, with several submitting threads.
// -----------------------------------------------------------------------------
TEST_F(SerialExecutorTest, RunsInSubmissionOrder) {
  std::vector<int> order;
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 100; ++i) {
    futures.push_back(executor.submit([&order, i] { order.push_back(i); }));
  }
  for (auto& f : futures) f.get();

  ASSERT_EQ(order.size(), 100u);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(order[i], i);
  }
}

TEST_F(SerialExecutorTest, AllTasksShareOneWorkerThread) {
  std::set<std::thread::id> workers;
  int unguarded_counter = 0;

  std::vector<std::thread> submitters;
  std::vector<std::future<void>> futures[4];
  for (int t = 0; t < 4; ++t) {
    submitters.emplace_back([&, t] {
      for (int i = 0; i < 250; ++i) {
        futures[t].push_back(executor.submit([&] {
          workers.insert(std::this_thread::get_id());
          ++unguarded_counter;
        }));
      }
    });
  }
  for (auto& s : submitters) s.join();
  for (auto& list : futures) {
    for (auto& f : list) f.get();
  }

  EXPECT_EQ(workers.size(), 1u);
  EXPECT_EQ(workers.count(std::this_thread::get_id()), 0u);
  EXPECT_EQ(unguarded_counter, 1000);
}

// -----------------------------------------------------------------------------
// 4. Lifecycle.
// -----------------------------------------------------------------------------
TEST_F(SerialExecutorTest, SubmitWhileStoppedThrows) {
  executor.stop();
  EXPECT_FALSE(executor.running());
  EXPECT_THROW(executor.submit([] { return 0; }), std::logic_error);
}

TEST_F(SerialExecutorTest, StopDrainsQueuedTasks) {
  std::promise<void> gate;
  std::shared_future<void> gate_future = gate.get_future().share();
  int completed = 0;

  // The first task holds the worker so the rest pile up in the queue.
  executor.submit([gate_future] { gate_future.wait(); });
  std::vector<std::future<void>> queued;
  for (int i = 0; i < 10; ++i) {
    queued.push_back(executor.submit([&completed] { ++completed; }));
  }

  std::thread releaser([&gate] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gate.set_value();
  });
  executor.stop();
  releaser.join();

  EXPECT_EQ(completed, 10);
  for (auto& f : queued) {
    EXPECT_NO_THROW(f.get());
  }
  EXPECT_EQ(executor.pending(), 0u);
}

TEST_F(SerialExecutorTest, RestartAfterStop) {
  executor.stop();
  executor.start();
  EXPECT_TRUE(executor.running());
  EXPECT_EQ(executor.submit([] { return 5; }).get(), 5);
}

TEST_F(SerialExecutorTest, StartAndStopAreIdempotent) {
  executor.start();
  EXPECT_TRUE(executor.running());
  executor.stop();
  EXPECT_NO_FATAL_FAILURE(executor.stop());
}
