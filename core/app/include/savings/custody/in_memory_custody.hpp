#pragma once

#include "savings/custody/i_custody.hpp"

#include <map>
#include <utility>

namespace savings {

// -----------------------------------------------------------------------------
// InMemoryCustody: fungible-asset vault held in process memory
// -----------------------------------------------------------------------------
//
// @brief  ICustody backed by per-(asset, account) balances and one reserve
//         per asset for the pool.
//
// @details
// Stands in for an external token ledger in the service binary and in tests.
// Accounts are funded with credit(); the pool reserve can be topped up with
// fundReserve() so interest owed to depositors is actually payable. Interest
// is an accounting claim on the reserve, so a reserve holding only deposits
// cannot pay out accrued interest in full.
//
// Transfers are all-or-nothing: an insufficient balance returns false and
// leaves both sides untouched.
//
// Thread model: single-threaded. The service touches it only from the
// executor thread.
// -----------------------------------------------------------------------------
class InMemoryCustody final : public ICustody {
 public:
  bool transferIn(const domain::AssetId& asset, const domain::AccountId& from,
                  const Uint& amount) override;

  bool transferOut(const domain::AssetId& asset, const domain::AccountId& to,
                   const Uint& amount) override;

  // Adds amount to an account's wallet balance (faucet / seeding).
  void credit(const domain::AssetId& asset, const domain::AccountId& account,
              const Uint& amount);

  // Adds amount directly to the pool reserve of asset.
  void fundReserve(const domain::AssetId& asset, const Uint& amount);

  Uint balanceOf(const domain::AssetId& asset,
                 const domain::AccountId& account) const;

  Uint reserveOf(const domain::AssetId& asset) const;

 private:
  using Key = std::pair<domain::AssetId, domain::AccountId>;

  std::map<Key, Uint> balances_;
  std::map<domain::AssetId, Uint> reserves_;
};

}  // namespace savings
