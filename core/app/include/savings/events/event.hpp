#pragma once

#include "savings/events/event_types.hpp"

#include <variant>

namespace savings {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus and the IPC telemetry queue. A
// closed std::variant: adding an event kind means adding it here and to the
// std::visit / get_if sites (telemetry formatting), which the compiler then
// checks.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketInitializedEvent,
    DepositEvent,
    WithdrawEvent,
    InterestRateUpdatedEvent>;

}  // namespace savings
