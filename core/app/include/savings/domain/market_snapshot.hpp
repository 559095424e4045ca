#pragma once

#include "savings/domain/types.hpp"
#include "savings/math/fixed_point.hpp"

#include <cstdint>
#include <string>

namespace savings {
namespace domain {

// -----------------------------------------------------------------------------
// MarketSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Read-only copy of one market's accounting state.
//
// @details
// settled_index is the index as last written by a state-changing call;
// preview_index is what the index would be if it were advanced right now.
// The two differ whenever time has passed since last_update with a non-zero
// rate. total_value is total_shares priced at preview_index.
//
// Value type; safe to hand across threads and to serialize.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  AssetId asset_id;
  std::string share_name;
  std::string share_symbol;
  Uint annual_rate{0};
  Uint settled_index{0};
  Uint preview_index{0};
  std::int64_t last_update{0};  // epoch seconds
  Uint total_shares{0};
  Uint total_value{0};
};

}  // namespace domain
}  // namespace savings
