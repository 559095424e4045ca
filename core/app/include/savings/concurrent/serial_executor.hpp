#pragma once

#include "savings/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace savings {

// -----------------------------------------------------------------------------
// SerialExecutor
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that runs submitted tasks one at a
// time, in submission order. The ledger service submits every pool operation
// here, so PoolCoordinator and its ledgers are only ever touched from this
// thread and need no locks of their own.
//
// Usage:
//   SerialExecutor executor;
//   executor.start();
//   std::future<Uint> f = executor.submit([&] { return pool.deposit(...); });
//   Uint shares = f.get();   // rethrows the task's exception, if any
//
// Lifecycle: construct, start(), submit()..., stop(). stop() lets the worker
// finish every task queued before it was called, then joins. The destructor
// calls stop().
//
// Thread model: start(), stop() and submit() may be called from any thread.
// Tasks run only on the worker thread.
// -----------------------------------------------------------------------------
class SerialExecutor {
 public:
  using Task = std::function<void()>;

  SerialExecutor() = default;
  ~SerialExecutor();

  SerialExecutor(const SerialExecutor&) = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;
  SerialExecutor(SerialExecutor&&) = delete;
  SerialExecutor& operator=(SerialExecutor&&) = delete;

  // Starts the worker. A second call while running is a no-op.
  void start();

  // Drains queued tasks, then joins the worker. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // submit(fn)
  // -------------------------------------------------------------------------
  // Queues fn for the worker and returns a future for its result. An
  // exception thrown by fn is captured in the future, not on the worker.
  //
  // @throws std::logic_error if the executor is not running.
  // -------------------------------------------------------------------------
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    // packaged_task is move-only; std::function needs a copyable target.
    auto task =
        std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> result = task->get_future();

    // stop() clears running_ under the same lock.
    std::lock_guard lock(submit_mutex_);
    if (!running_.load()) {
      throw std::logic_error("SerialExecutor: submit() while stopped");
    }
    tasks_.push([task] { (*task)(); });
    return result;
  }

  // Tasks queued but not yet started.
  std::size_t pending() const { return tasks_.size(); }

 private:
  void run();

  ThreadSafeQueue<Task> tasks_;
  std::mutex submit_mutex_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace savings
