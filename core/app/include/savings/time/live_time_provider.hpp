#pragma once

#include "savings/time/i_time_provider.hpp"

namespace savings {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock time truncated to whole seconds.
//
// @details
// Used by the service binary when the configuration selects the "live"
// clock. Interest then accrues in real time between calls.
//
// Thread model: stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_seconds() const override;
};

}  // namespace savings
