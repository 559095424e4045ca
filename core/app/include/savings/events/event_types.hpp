#pragma once

#include "savings/domain/types.hpp"
#include "savings/math/fixed_point.hpp"

#include <cstdint>
#include <string>

namespace savings {

// -----------------------------------------------------------------------------
// Pool events
// -----------------------------------------------------------------------------
// Every event is an immutable value published by PoolCoordinator on the
// service EventBus after the operation it describes has fully committed. A
// refused operation publishes nothing.
//
// Common fields:
//   timestamp  : clock reading (epoch seconds) when the operation ran.
//   sequence_id: stamped by EventBus::publish(); strictly increasing per bus,
//                 so consumers can detect gaps in the telemetry stream.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// MarketInitializedEvent
// -----------------------------------------------------------------------------
// A ledger was created for asset_id.
// -----------------------------------------------------------------------------
struct MarketInitializedEvent {
  domain::AssetId asset_id;
  std::string share_name;
  std::string share_symbol;
  Uint annual_rate{0};
  std::int64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// DepositEvent
// -----------------------------------------------------------------------------
// user moved `amount` of asset into the pool and received `shares` principal
// shares priced at `index`.
// -----------------------------------------------------------------------------
struct DepositEvent {
  domain::AccountId user;
  domain::AssetId asset_id;
  Uint amount{0};
  Uint shares{0};
  Uint index{0};
  std::int64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// WithdrawEvent
// -----------------------------------------------------------------------------
// user burned `shares` principal shares and received `amount` of asset.
// `index` is the settled index the shares were priced at.
// -----------------------------------------------------------------------------
struct WithdrawEvent {
  domain::AccountId user;
  domain::AssetId asset_id;
  Uint amount{0};
  Uint shares{0};
  Uint index{0};
  std::int64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// InterestRateUpdatedEvent
// -----------------------------------------------------------------------------
// The annual rate of asset_id changed. `index` is the value settled under
// previous_rate right before the switch.
// -----------------------------------------------------------------------------
struct InterestRateUpdatedEvent {
  domain::AssetId asset_id;
  Uint previous_rate{0};
  Uint new_rate{0};
  Uint index{0};
  std::int64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

}  // namespace savings
