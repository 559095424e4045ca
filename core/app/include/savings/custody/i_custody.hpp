#pragma once

#include "savings/domain/types.hpp"
#include "savings/math/fixed_point.hpp"

namespace savings {

// -----------------------------------------------------------------------------
// ICustody: base-asset transfer service used by the pool
// -----------------------------------------------------------------------------
//
// @brief  Moves base assets between user accounts and the pool's reserve.
//
// @details
// The pool never touches asset balances itself. It asks custody to pull a
// deposit in before minting shares, and to push a withdrawal out after
// burning shares. A false return means nothing moved; the pool then aborts
// the enclosing operation.
//
// Implementations may call back into the pool (a hostile or buggy asset
// contract would). The coordinator's reentrancy guard rejects such calls.
// -----------------------------------------------------------------------------
class ICustody {
 public:
  virtual ~ICustody() = default;

  // Pull amount of asset from `from` into the pool reserve.
  virtual bool transferIn(const domain::AssetId& asset,
                          const domain::AccountId& from,
                          const Uint& amount) = 0;

  // Push amount of asset from the pool reserve to `to`.
  virtual bool transferOut(const domain::AssetId& asset,
                           const domain::AccountId& to,
                           const Uint& amount) = 0;
};

}  // namespace savings
