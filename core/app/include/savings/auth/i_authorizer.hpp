#pragma once

#include "savings/domain/types.hpp"

namespace savings {

// -----------------------------------------------------------------------------
// Operation
// -----------------------------------------------------------------------------
//
// @brief  Privileged operations gated by an IAuthorizer.
//
// @details
//   InitializeMarket: create a ledger for a new asset (administrative).
//   SetInterestRate : change a market's annual rate (administrative).
//   MintShares      : credit principal shares on a ledger (pool only).
//   BurnShares      : debit principal shares on a ledger (pool only).
//
// Deposit, withdraw, balance queries and interest settlement are open to
// every caller and are not listed here.
// -----------------------------------------------------------------------------
enum class Operation {
  InitializeMarket,
  SetInterestRate,
  MintShares,
  BurnShares,
};

const char* operationToString(Operation op);

// -----------------------------------------------------------------------------
// IAuthorizer: capability check injected into the pool and its ledgers
// -----------------------------------------------------------------------------
//
// @brief  Answers "may this caller perform this operation?".
//
// @details
// Access control is a collaborator rather than a base class: the coordinator
// and each ledger hold a const reference and ask before every privileged
// call. AccessPolicy is the in-process implementation; a deployment could
// substitute one backed by an external permission service.
//
// Ownership: callers hold a const reference; the authorizer must outlive
// them.
// -----------------------------------------------------------------------------
class IAuthorizer {
 public:
  virtual ~IAuthorizer() = default;

  virtual bool isAuthorized(const domain::AccountId& caller,
                            Operation op) const = 0;
};

}  // namespace savings
