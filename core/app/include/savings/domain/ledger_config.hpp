#pragma once

#include "savings/math/fixed_point.hpp"

#include <string>

namespace savings {
namespace domain {

// -----------------------------------------------------------------------------
// LedgerConfig
// -----------------------------------------------------------------------------
//
// @brief  Creation parameters for one market's InterestLedger.
//
// @details
// share_name / share_symbol describe the derivative accounting unit handed
// to depositors (e.g. "Savings Token" / "sMTK"). They are informational and
// immutable once the market exists.
//
// initial_rate is the annual rate scaled by 1e18: 100000000000000000 is 10%.
// -----------------------------------------------------------------------------
struct LedgerConfig {
  std::string share_name;
  std::string share_symbol;
  Uint initial_rate{0};
};

}  // namespace domain
}  // namespace savings
