#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace savings {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between threads. The service uses two:
// one carries command tasks to the SerialExecutor worker, the other carries
// pool events from the executor to the IPC telemetry publisher.
//
// Consumers choose how to wait:
//   pop()          blocks until an item arrives.
//   pop_for(t)     blocks at most t, so a worker loop can re-check a stop flag.
//   try_pop()      never blocks.
//
// Thread model: Multiple producers and multiple consumers. Every method is
// thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Holds a mutex and a condition_variable, neither of which copies or moves.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends value and wakes one waiting consumer. The notify happens after
  // the lock is released so the woken thread does not immediately block on
  // the mutex.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Blocking pop. Waits (spurious wakeups included) until non-empty.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // Waits up to timeout for an item. Returns std::nullopt if the queue is
  // still empty when the timeout expires.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;           // Guards queue_
  std::condition_variable condition_;  // Signalled on push
  std::deque<T> queue_;
};

}  // namespace savings
