#include "savings/auth/access_policy.hpp"

#include <iostream>
#include <utility>

namespace savings {

const char* operationToString(Operation op) {
  switch (op) {
    case Operation::InitializeMarket: return "InitializeMarket";
    case Operation::SetInterestRate:  return "SetInterestRate";
    case Operation::MintShares:       return "MintShares";
    case Operation::BurnShares:       return "BurnShares";
  }
  return "Unknown";
}

AccessPolicy::AccessPolicy(domain::AccountId owner) : owner_(std::move(owner)) {}

// -----------------------------------------------------------------------------
// isAuthorized(): owner rules first, then the grant table
// -----------------------------------------------------------------------------
bool AccessPolicy::isAuthorized(const domain::AccountId& caller,
                                Operation op) const {
  if (caller == owner_ && (op == Operation::InitializeMarket ||
                           op == Operation::SetInterestRate)) {
    return true;
  }

  auto it = grants_.find(caller);
  return it != grants_.end() && it->second.count(op) > 0;
}

void AccessPolicy::grant(const domain::AccountId& account, Operation op) {
  grants_[account].insert(op);
  std::cout << "[AccessPolicy] granted " << operationToString(op) << " to "
            << account << "\n";
}

void AccessPolicy::revoke(const domain::AccountId& account, Operation op) {
  auto it = grants_.find(account);
  if (it == grants_.end()) {
    return;
  }
  it->second.erase(op);
  if (it->second.empty()) {
    grants_.erase(it);
  }
}

}  // namespace savings
