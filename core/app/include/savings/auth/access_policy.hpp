#pragma once

#include "savings/auth/i_authorizer.hpp"

#include <map>
#include <set>

namespace savings {

// -----------------------------------------------------------------------------
// AccessPolicy: single owner plus explicit grants
// -----------------------------------------------------------------------------
//
// @brief  IAuthorizer with one administrative owner and a grant table.
//
// @details
// Rules:
//   - The owner may InitializeMarket and SetInterestRate.
//   - Any operation may additionally be granted to specific accounts. The
//     service grants MintShares and BurnShares to the pool coordinator's
//     identity, which is how ledgers end up accepting mint/burn only from
//     their coordinator.
//   - The owner does NOT implicitly hold MintShares / BurnShares. Share
//     supply only moves alongside a custody transfer.
//
// Thread model:
//   Configured during service start-up, then read on the executor thread.
//   Not synchronized; grant()/revoke() must not race with isAuthorized().
// -----------------------------------------------------------------------------
class AccessPolicy final : public IAuthorizer {
 public:
  explicit AccessPolicy(domain::AccountId owner);

  bool isAuthorized(const domain::AccountId& caller,
                    Operation op) const override;

  void grant(const domain::AccountId& account, Operation op);
  void revoke(const domain::AccountId& account, Operation op);

  const domain::AccountId& owner() const { return owner_; }

 private:
  domain::AccountId owner_;
  std::map<domain::AccountId, std::set<Operation>> grants_;
};

}  // namespace savings
