#pragma once

#include "savings/auth/i_authorizer.hpp"
#include "savings/domain/ledger_config.hpp"
#include "savings/domain/market_snapshot.hpp"
#include "savings/domain/types.hpp"
#include "savings/math/fixed_point.hpp"
#include "savings/time/i_time_provider.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace savings {

// -----------------------------------------------------------------------------
// InterestLedger: per-market interest index and principal-share table
// -----------------------------------------------------------------------------
//
// @brief  Owns one market's accrual index, annual rate, last-update time and
//         the principal shares of every holder. Converts shares to
//         value-with-interest through the index.
//
// @details
// A holder's balance is never stored. Only principal shares are; the
// economic value is derived on read:
//
//   value = shares * index / kInitialIndex
//
// The index starts at kInitialIndex (1e18) and grows lazily. Every
// state-changing call first advances it to "now":
//
//   dt          = now - last_update            (no-op when dt <= 0)
//   accumulated = annual_rate * dt / kSecondsPerYear
//   index       = index * (kPrecision + accumulated) / kPrecision
//
// Each advancement is linear in dt. Growth compounds only across separate
// advancements, so a market touched often earns slightly more than one
// touched once a year at the same rate.
//
// Read paths use previewIndex(), the same formula evaluated without writing,
// so balances reflect interest up to the moment of the query.
//
// Invariants:
//   - index never decreases (the rate is unsigned).
//   - last_update never exceeds the clock reading of the advancing call and
//     never moves backwards.
//   - total_shares equals the sum of all holders' principal shares.
//
// Authorization:
//   mintShares()/burnShares() accept only the coordinator identity bound at
//   construction, and only if the authorizer grants it the operation.
//   setInterestRate() accepts any caller the authorizer allows.
//
// Thread model:
//   Not synchronized. The owning PoolCoordinator is driven from a single
//   thread (the service executor).
//
// Ownership:
//   Owned by PoolCoordinator via std::unique_ptr. Holds non-owning
//   references to the clock and authorizer, which must outlive it.
// -----------------------------------------------------------------------------
class InterestLedger {
 public:
  // -------------------------------------------------------------------------
  // Checkpoint
  // -------------------------------------------------------------------------
  // @brief  Saved ledger state around one holder, for undoing a burn whose
  //         custody transfer failed.
  // -------------------------------------------------------------------------
  struct Checkpoint {
    domain::AccountId holder;
    Uint holder_shares{0};
    Uint total_shares{0};
    Uint index{0};
    std::int64_t last_update{0};
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Creates a market at index 1e18 with config.initial_rate.
  //
  // @param  asset_id     Base asset this ledger accrues interest for.
  // @param  coordinator  Identity allowed to mint and burn shares.
  // @param  config       Share metadata and initial annual rate.
  // @param  clock        Time source; last_update starts at its reading.
  // @param  authorizer   Capability check for privileged calls.
  // -------------------------------------------------------------------------
  InterestLedger(domain::AssetId asset_id, domain::AccountId coordinator,
                 const domain::LedgerConfig& config,
                 const ITimeProvider& clock, const IAuthorizer& authorizer);

  InterestLedger(const InterestLedger&) = delete;
  InterestLedger& operator=(const InterestLedger&) = delete;
  InterestLedger(InterestLedger&&) = delete;
  InterestLedger& operator=(InterestLedger&&) = delete;

  // -------------------------------------------------------------------------
  // advanceIndex()
  // -------------------------------------------------------------------------
  // @brief  Applies interest accrued since last_update to the stored index.
  //
  // @details
  // Idempotent within one second: after the first call, dt is zero and
  // later calls change nothing. A clock reading behind last_update is
  // treated as zero elapsed time.
  // -------------------------------------------------------------------------
  void advanceIndex();

  // -------------------------------------------------------------------------
  // previewIndex()
  // -------------------------------------------------------------------------
  // @brief  The index advanceIndex() would produce right now, without
  //         mutating anything.
  // -------------------------------------------------------------------------
  Uint previewIndex() const;

  // -------------------------------------------------------------------------
  // valueOf(holder)
  // -------------------------------------------------------------------------
  // @brief  Balance including interest: shares * previewIndex() / 1e18,
  //         rounded down.
  //
  // @details
  // Non-decreasing between two calls for the same holder as long as no
  // shares are minted or burned for that holder.
  // -------------------------------------------------------------------------
  Uint valueOf(const domain::AccountId& holder) const;

  // -------------------------------------------------------------------------
  // sharesFor(value, index)
  // -------------------------------------------------------------------------
  // @brief  Principal shares worth `value` at `index`:
  //         value * kInitialIndex / index, rounded up.
  //
  // @details
  // The single conversion used in both directions. Deposits mint
  // sharesFor(amount, index) and withdrawals burn sharesFor(amount, index)
  // at the same freshly settled index, so depositing A and withdrawing A at
  // one instant burns exactly the shares that were minted. Rounding up means
  // a mint is worth at least `value` and never yields zero shares for a
  // non-zero value.
  // -------------------------------------------------------------------------
  static Uint sharesFor(const Uint& value, const Uint& index);

  // -------------------------------------------------------------------------
  // quoteMint(caller, value)
  // -------------------------------------------------------------------------
  // @brief  Runs every check mintShares() would and returns the shares it
  //         would mint right now. Mutates nothing.
  //
  // @throws as mintShares().
  // -------------------------------------------------------------------------
  Uint quoteMint(const domain::AccountId& caller, const Uint& value) const;

  // -------------------------------------------------------------------------
  // mintShares(caller, holder, value)
  // -------------------------------------------------------------------------
  // @brief  Credits holder with sharesFor(value) at the freshly advanced
  //         index.
  //
  // @return Shares minted.
  //
  // @throws LedgerError(Unauthorized)  caller is not the bound coordinator
  //                                    or lacks MintShares.
  // @throws LedgerError(InvalidAmount) value is zero.
  //
  // Side-effects: advances the index.
  // -------------------------------------------------------------------------
  Uint mintShares(const domain::AccountId& caller,
                  const domain::AccountId& holder, const Uint& value);

  // -------------------------------------------------------------------------
  // burnShares(caller, holder, shares)
  // -------------------------------------------------------------------------
  // @brief  Debits `shares` principal shares from holder.
  //
  // @throws LedgerError(Unauthorized)       as for mintShares (BurnShares).
  // @throws LedgerError(InvalidAmount)      shares is zero.
  // @throws LedgerError(InsufficientShares) holder owns fewer shares.
  //
  // All checks run before the index is advanced, so a refused burn leaves
  // the ledger untouched.
  // -------------------------------------------------------------------------
  void burnShares(const domain::AccountId& caller,
                  const domain::AccountId& holder, const Uint& shares);

  // -------------------------------------------------------------------------
  // setInterestRate(caller, new_rate)
  // -------------------------------------------------------------------------
  // @brief  Settles accrual under the old rate up to now, then switches to
  //         new_rate. Zero pauses accrual.
  //
  // @throws LedgerError(Unauthorized) caller lacks SetInterestRate.
  // -------------------------------------------------------------------------
  void setInterestRate(const domain::AccountId& caller, const Uint& new_rate);

  Uint principalOf(const domain::AccountId& holder) const;
  Uint totalShares() const { return total_shares_; }
  Uint totalValue() const;

  // Index as last written by advanceIndex() (no pending accrual applied).
  const Uint& currentIndex() const { return index_; }
  const Uint& annualRate() const { return annual_rate_; }
  std::int64_t lastUpdate() const { return last_update_; }

  const domain::AssetId& assetId() const { return asset_id_; }
  const std::string& shareName() const { return share_name_; }
  const std::string& shareSymbol() const { return share_symbol_; }

  domain::MarketSnapshot snapshot() const;

  Checkpoint checkpoint(const domain::AccountId& holder) const;
  void restore(const Checkpoint& checkpoint);

 private:
  // Index after accruing from last_update_ to now at annual_rate_.
  Uint indexAt(std::int64_t now) const;

  // Writes indexAt(now) and moves last_update_ to now (never backwards).
  void settleAt(std::int64_t now);

  void requireMintable(const domain::AccountId& caller,
                       const Uint& value) const;
  void requireCoordinator(const domain::AccountId& caller, Operation op) const;

  const domain::AssetId asset_id_;
  const domain::AccountId coordinator_;
  const std::string share_name_;
  const std::string share_symbol_;
  const ITimeProvider& clock_;
  const IAuthorizer& authorizer_;

  Uint annual_rate_;
  Uint index_;
  std::int64_t last_update_;
  Uint total_shares_{0};
  std::unordered_map<domain::AccountId, Uint> principal_shares_;
};

}  // namespace savings
