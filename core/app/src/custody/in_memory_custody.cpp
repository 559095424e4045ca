#include "savings/custody/in_memory_custody.hpp"

#include <iostream>

namespace savings {

// -----------------------------------------------------------------------------
// transferIn(): wallet → reserve
// -----------------------------------------------------------------------------
bool InMemoryCustody::transferIn(const domain::AssetId& asset,
                                 const domain::AccountId& from,
                                 const Uint& amount) {
  auto it = balances_.find(Key{asset, from});
  if (it == balances_.end() || it->second < amount) {
    std::cerr << "[InMemoryCustody] transferIn refused: " << from
              << " holds " << (it == balances_.end() ? Uint(0) : it->second)
              << " " << asset << ", needs " << amount << "\n";
    return false;
  }

  it->second -= amount;
  if (it->second == 0) {
    balances_.erase(it);
  }
  reserves_[asset] += amount;
  return true;
}

// -----------------------------------------------------------------------------
// transferOut(): reserve → wallet
// -----------------------------------------------------------------------------
bool InMemoryCustody::transferOut(const domain::AssetId& asset,
                                  const domain::AccountId& to,
                                  const Uint& amount) {
  auto it = reserves_.find(asset);
  if (it == reserves_.end() || it->second < amount) {
    std::cerr << "[InMemoryCustody] transferOut refused: reserve of " << asset
              << " is " << (it == reserves_.end() ? Uint(0) : it->second)
              << ", needs " << amount << "\n";
    return false;
  }

  it->second -= amount;
  balances_[Key{asset, to}] += amount;
  return true;
}

void InMemoryCustody::credit(const domain::AssetId& asset,
                             const domain::AccountId& account,
                             const Uint& amount) {
  balances_[Key{asset, account}] += amount;
}

void InMemoryCustody::fundReserve(const domain::AssetId& asset,
                                  const Uint& amount) {
  reserves_[asset] += amount;
}

Uint InMemoryCustody::balanceOf(const domain::AssetId& asset,
                                const domain::AccountId& account) const {
  auto it = balances_.find(Key{asset, account});
  return it == balances_.end() ? Uint(0) : it->second;
}

Uint InMemoryCustody::reserveOf(const domain::AssetId& asset) const {
  auto it = reserves_.find(asset);
  return it == reserves_.end() ? Uint(0) : it->second;
}

}  // namespace savings
