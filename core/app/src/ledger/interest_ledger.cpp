#include "savings/ledger/interest_ledger.hpp"
#include "savings/domain/ledger_error.hpp"

#include <iostream>
#include <utility>

namespace savings {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
InterestLedger::InterestLedger(domain::AssetId asset_id,
                               domain::AccountId coordinator,
                               const domain::LedgerConfig& config,
                               const ITimeProvider& clock,
                               const IAuthorizer& authorizer)
    : asset_id_(std::move(asset_id)),
      coordinator_(std::move(coordinator)),
      share_name_(config.share_name),
      share_symbol_(config.share_symbol),
      clock_(clock),
      authorizer_(authorizer),
      annual_rate_(config.initial_rate),
      index_(kInitialIndex),
      last_update_(clock.now_seconds()) {}

// -----------------------------------------------------------------------------
// indexAt(): the accrual formula, shared by advance and preview
// -----------------------------------------------------------------------------
Uint InterestLedger::indexAt(std::int64_t now) const {
  if (now <= last_update_ || annual_rate_ == 0) {
    return index_;
  }

  Uint elapsed(now - last_update_);
  Uint accumulated = mulDiv(annual_rate_, elapsed, Uint(kSecondsPerYear));
  return mulDiv(index_, kPrecision + accumulated, kPrecision);
}

// -----------------------------------------------------------------------------
// advanceIndex()
// -----------------------------------------------------------------------------
void InterestLedger::advanceIndex() { settleAt(clock_.now_seconds()); }

void InterestLedger::settleAt(std::int64_t now) {
  if (now <= last_update_) {
    return;
  }

  index_ = indexAt(now);
  last_update_ = now;
}

Uint InterestLedger::previewIndex() const {
  return indexAt(clock_.now_seconds());
}

Uint InterestLedger::valueOf(const domain::AccountId& holder) const {
  auto it = principal_shares_.find(holder);
  if (it == principal_shares_.end()) {
    return 0;
  }
  return mulDiv(it->second, previewIndex(), kInitialIndex);
}

// -----------------------------------------------------------------------------
// quoteMint(): every mint check, priced at the preview index
// -----------------------------------------------------------------------------
Uint InterestLedger::quoteMint(const domain::AccountId& caller,
                               const Uint& value) const {
  requireMintable(caller, value);
  return sharesFor(value, previewIndex());
}

// -----------------------------------------------------------------------------
// mintShares(): price value in shares at the index as of now, then settle
// -----------------------------------------------------------------------------
Uint InterestLedger::mintShares(const domain::AccountId& caller,
                                const domain::AccountId& holder,
                                const Uint& value) {
  requireMintable(caller, value);

  // One clock read prices the shares and settles the index, so both use the
  // same instant.
  std::int64_t now = clock_.now_seconds();
  Uint shares = sharesFor(value, indexAt(now));

  settleAt(now);
  principal_shares_[holder] += shares;
  total_shares_ += shares;
  return shares;
}

Uint InterestLedger::sharesFor(const Uint& value, const Uint& index) {
  return mulDivUp(value, kInitialIndex, index);
}

// -----------------------------------------------------------------------------
// burnShares(): validate, advance, debit
// -----------------------------------------------------------------------------
void InterestLedger::burnShares(const domain::AccountId& caller,
                                const domain::AccountId& holder,
                                const Uint& shares) {
  requireCoordinator(caller, Operation::BurnShares);
  if (shares == 0) {
    throw LedgerError(LedgerErrorCode::InvalidAmount,
                      "burn amount must be greater than 0");
  }

  auto it = principal_shares_.find(holder);
  Uint owned = it == principal_shares_.end() ? Uint(0) : it->second;
  if (shares > owned) {
    throw LedgerError(LedgerErrorCode::InsufficientShares,
                      holder + " holds " + toString(owned) + " shares of " +
                          asset_id_ + ", cannot burn " + toString(shares));
  }

  advanceIndex();
  it->second -= shares;
  if (it->second == 0) {
    principal_shares_.erase(it);
  }
  total_shares_ -= shares;
}

// -----------------------------------------------------------------------------
// setInterestRate(): settle under the old rate first
// -----------------------------------------------------------------------------
void InterestLedger::setInterestRate(const domain::AccountId& caller,
                                     const Uint& new_rate) {
  if (!authorizer_.isAuthorized(caller, Operation::SetInterestRate)) {
    throw LedgerError(LedgerErrorCode::Unauthorized,
                      caller + " may not set the rate of " + asset_id_);
  }

  advanceIndex();
  std::cout << "[InterestLedger] " << asset_id_ << " rate " << annual_rate_
            << " -> " << new_rate << " at index " << index_ << "\n";
  annual_rate_ = new_rate;
}

Uint InterestLedger::principalOf(const domain::AccountId& holder) const {
  auto it = principal_shares_.find(holder);
  return it == principal_shares_.end() ? Uint(0) : it->second;
}

Uint InterestLedger::totalValue() const {
  return mulDiv(total_shares_, previewIndex(), kInitialIndex);
}

domain::MarketSnapshot InterestLedger::snapshot() const {
  domain::MarketSnapshot snap;
  snap.asset_id = asset_id_;
  snap.share_name = share_name_;
  snap.share_symbol = share_symbol_;
  snap.annual_rate = annual_rate_;
  snap.settled_index = index_;
  snap.preview_index = previewIndex();
  snap.last_update = last_update_;
  snap.total_shares = total_shares_;
  snap.total_value = mulDiv(total_shares_, snap.preview_index, kInitialIndex);
  return snap;
}

InterestLedger::Checkpoint InterestLedger::checkpoint(
    const domain::AccountId& holder) const {
  Checkpoint cp;
  cp.holder = holder;
  cp.holder_shares = principalOf(holder);
  cp.total_shares = total_shares_;
  cp.index = index_;
  cp.last_update = last_update_;
  return cp;
}

// -----------------------------------------------------------------------------
// restore(): roll back to a checkpoint taken earlier in the same operation
// -----------------------------------------------------------------------------
void InterestLedger::restore(const Checkpoint& checkpoint) {
  if (checkpoint.holder_shares == 0) {
    principal_shares_.erase(checkpoint.holder);
  } else {
    principal_shares_[checkpoint.holder] = checkpoint.holder_shares;
  }
  total_shares_ = checkpoint.total_shares;
  index_ = checkpoint.index;
  last_update_ = checkpoint.last_update;
}

void InterestLedger::requireMintable(const domain::AccountId& caller,
                                     const Uint& value) const {
  requireCoordinator(caller, Operation::MintShares);
  if (value == 0) {
    throw LedgerError(LedgerErrorCode::InvalidAmount,
                      "mint value must be greater than 0");
  }
}

void InterestLedger::requireCoordinator(const domain::AccountId& caller,
                                        Operation op) const {
  if (caller != coordinator_ || !authorizer_.isAuthorized(caller, op)) {
    std::cerr << "[InterestLedger] " << asset_id_ << ": "
              << operationToString(op) << " refused for " << caller << "\n";
    throw LedgerError(LedgerErrorCode::Unauthorized,
                      caller + " may not " + operationToString(op) + " on " +
                          asset_id_);
  }
}

}  // namespace savings
