#pragma once

#include <stdexcept>
#include <string>

namespace savings {

// -----------------------------------------------------------------------------
// LedgerErrorCode
// -----------------------------------------------------------------------------
//
// @brief  Reasons a pool or ledger operation is refused.
//
// @details
// Every code aborts the whole operation; no state is left half-applied.
//
//   MarketAlreadyExists  : initializeMarket on an asset that has a ledger.
//   MarketNotFound       : operation names an asset with no ledger.
//   InvalidMarket        : asset id is empty.
//   InvalidAmount        : zero amount, or an amount too small to convert
//                           into at least one share.
//   InsufficientBalance  : withdraw exceeds the caller's value-with-interest.
//   InsufficientShares   : the share amount to burn exceeds the holder's
//                           principal shares.
//   Unauthorized         : caller lacks the privilege for the operation.
//   CustodyTransferFailed: the custody service refused to move the asset.
//   ReentrantCall        : a guarded entry point was re-entered while
//                           already in flight.
// -----------------------------------------------------------------------------
enum class LedgerErrorCode {
  MarketAlreadyExists,
  MarketNotFound,
  InvalidMarket,
  InvalidAmount,
  InsufficientBalance,
  InsufficientShares,
  Unauthorized,
  CustodyTransferFailed,
  ReentrantCall,
};

// Stable name of the code ("InsufficientShares"), used in logs and replies.
const char* errorCodeToString(LedgerErrorCode code);

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
//
// @brief  Exception raised by InterestLedger and PoolCoordinator.
//
// @details
// what() carries a human-readable message; code() carries the machine
// readable reason. The service layer translates both into a JSON error reply.
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  LedgerError(LedgerErrorCode code, const std::string& message);

  LedgerErrorCode code() const noexcept { return code_; }

 private:
  LedgerErrorCode code_;
};

}  // namespace savings
