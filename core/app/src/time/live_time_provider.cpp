#include "savings/time/live_time_provider.hpp"

#include <chrono>

namespace savings {

// -----------------------------------------------------------------------------
// now_seconds(): system_clock truncated to epoch seconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_seconds() const {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
}

}  // namespace savings
