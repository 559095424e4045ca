#include "savings/concurrent/serial_executor.hpp"

#include <chrono>

namespace savings {

namespace {

// How long an idle worker waits before re-checking running_. Bounds the
// latency of stop() on an empty queue.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

SerialExecutor::~SerialExecutor() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SerialExecutor::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
// Clearing running_ first makes later submit() calls fail, so the drain in
// run() sees a queue that can only shrink.
// -----------------------------------------------------------------------------
void SerialExecutor::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(submit_mutex_);
    running_.store(false);
  }
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void SerialExecutor::run() {
  while (running_.load()) {
    std::optional<Task> task = tasks_.pop_for(kIdleWaitTimeout);
    if (task) {
      (*task)();
    }
  }

  // Tasks accepted before stop() still get to run; their callers may be
  // blocked on the futures.
  while (std::optional<Task> task = tasks_.try_pop()) {
    (*task)();
  }
}

}  // namespace savings
