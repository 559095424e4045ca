#include "savings/domain/ledger_error.hpp"

namespace savings {

LedgerError::LedgerError(LedgerErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

// -----------------------------------------------------------------------------
// errorCodeToString()
// -----------------------------------------------------------------------------
const char* errorCodeToString(LedgerErrorCode code) {
  using C = LedgerErrorCode;
  switch (code) {
    case C::MarketAlreadyExists:   return "MarketAlreadyExists";
    case C::MarketNotFound:        return "MarketNotFound";
    case C::InvalidMarket:         return "InvalidMarket";
    case C::InvalidAmount:         return "InvalidAmount";
    case C::InsufficientBalance:   return "InsufficientBalance";
    case C::InsufficientShares:    return "InsufficientShares";
    case C::Unauthorized:          return "Unauthorized";
    case C::CustodyTransferFailed: return "CustodyTransferFailed";
    case C::ReentrantCall:         return "ReentrantCall";
  }
  return "Unknown";
}

}  // namespace savings
