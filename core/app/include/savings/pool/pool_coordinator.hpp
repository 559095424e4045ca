#pragma once

#include "savings/auth/i_authorizer.hpp"
#include "savings/custody/i_custody.hpp"
#include "savings/domain/ledger_config.hpp"
#include "savings/domain/market_snapshot.hpp"
#include "savings/domain/types.hpp"
#include "savings/eventbus/event_bus.hpp"
#include "savings/ledger/interest_ledger.hpp"
#include "savings/math/fixed_point.hpp"
#include "savings/pool/reentrancy_guard.hpp"
#include "savings/time/i_time_provider.hpp"

#include <map>
#include <memory>
#include <vector>

namespace savings {

// -----------------------------------------------------------------------------
// PoolCoordinator: market registry and deposit/withdraw orchestration
// -----------------------------------------------------------------------------
//
// @brief  Maps each asset to its InterestLedger, moves base assets through
//         custody, mints/burns principal shares, and publishes pool events.
//
// @details
// Deposit:
//   1. guard, validate amount and market
//   2. ledger.quoteMint(identity, amount)          (authorization and amount
//      checks before any asset moves)
//   3. custody.transferIn(asset, caller, amount)   (refused → nothing minted)
//   4. ledger.mintShares(identity, caller, amount)  (shares =
//      ceil(amount * 1e18 / index as of now); refunded if the mint fails)
//   5. publish DepositEvent
//
// Withdraw:
//   1. guard, validate amount and market
//   2. valueOf(caller) >= amount                    else InsufficientBalance
//   3. settle the index to now
//   4. shares = ceil(amount * 1e18 / settled index), the same conversion a
//      deposit uses at this instant
//   5. shares <= principal shares                   else InsufficientShares
//   6. ledger.burnShares(identity, caller, shares)
//   7. custody.transferOut(asset, caller, amount)   (refused → ledger is
//      restored to its pre-settlement checkpoint)
//   8. publish WithdrawEvent
//
// Both directions price through InterestLedger::sharesFor() at the fresh
// index, so a deposit of A followed by a withdrawal of A at one instant
// burns exactly the shares minted. Step 5 is a safety net: with step 2
// passed at the same index it cannot fail.
//
// Every refusal raises LedgerError and leaves ledger, custody and event
// stream as they were.
//
// Thread model:
//   Single-threaded. The service runs every call on its executor thread.
//   Same-thread re-entry through custody is rejected by the guard.
//
// Ownership:
//   Owns every InterestLedger (unique_ptr, never removed). Holds non-owning
//   references to custody, authorizer, clock and bus.
// -----------------------------------------------------------------------------
class PoolCoordinator {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  identity    Account the pool acts as when minting and burning.
  //                     The authorizer must grant it MintShares/BurnShares.
  // @param  custody     Base-asset transfer service.
  // @param  authorizer  Capability check for administrative calls; also
  //                     handed to every ledger.
  // @param  clock       Time source for ledgers and event timestamps.
  // @param  bus         Destination of pool events.
  // -------------------------------------------------------------------------
  PoolCoordinator(domain::AccountId identity, ICustody& custody,
                  const IAuthorizer& authorizer, const ITimeProvider& clock,
                  EventBus& bus);

  PoolCoordinator(const PoolCoordinator&) = delete;
  PoolCoordinator& operator=(const PoolCoordinator&) = delete;
  PoolCoordinator(PoolCoordinator&&) = delete;
  PoolCoordinator& operator=(PoolCoordinator&&) = delete;

  // -------------------------------------------------------------------------
  // initializeMarket(caller, asset, config)
  // -------------------------------------------------------------------------
  // @brief  Creates the ledger for asset at index 1e18.
  //
  // @throws LedgerError(Unauthorized)        caller lacks InitializeMarket.
  // @throws LedgerError(InvalidMarket)       asset is empty.
  // @throws LedgerError(MarketAlreadyExists) asset already has a ledger.
  // -------------------------------------------------------------------------
  void initializeMarket(const domain::AccountId& caller,
                        const domain::AssetId& asset,
                        const domain::LedgerConfig& config);

  // -------------------------------------------------------------------------
  // deposit(caller, asset, amount)
  // -------------------------------------------------------------------------
  // @return Principal shares minted to caller.
  //
  // @throws LedgerError: ReentrantCall, InvalidAmount, MarketNotFound,
  //         CustodyTransferFailed, plus anything mintShares() raises.
  // -------------------------------------------------------------------------
  Uint deposit(const domain::AccountId& caller, const domain::AssetId& asset,
               const Uint& amount);

  // -------------------------------------------------------------------------
  // withdraw(caller, asset, amount)
  // -------------------------------------------------------------------------
  // @return Principal shares burned from caller.
  //
  // @throws LedgerError: ReentrantCall, InvalidAmount, MarketNotFound,
  //         InsufficientBalance, InsufficientShares, CustodyTransferFailed.
  // -------------------------------------------------------------------------
  Uint withdraw(const domain::AccountId& caller, const domain::AssetId& asset,
                const Uint& amount);

  // Value-with-interest of user in asset, as of now. Read only.
  Uint getUserBalance(const domain::AssetId& asset,
                      const domain::AccountId& user) const;

  // -------------------------------------------------------------------------
  // setInterestRate(caller, asset, new_rate)
  // -------------------------------------------------------------------------
  // Settles the index under the old rate, switches to new_rate and publishes
  // InterestRateUpdatedEvent.
  //
  // @throws LedgerError(MarketNotFound), LedgerError(Unauthorized)
  // -------------------------------------------------------------------------
  void setInterestRate(const domain::AccountId& caller,
                       const domain::AssetId& asset, const Uint& new_rate);

  // -------------------------------------------------------------------------
  // accrueInterest(asset)
  // -------------------------------------------------------------------------
  // Advances the asset's index to now. Open to any caller; a no-op when
  // called twice in the same second. Returns the settled index.
  // -------------------------------------------------------------------------
  Uint accrueInterest(const domain::AssetId& asset);

  bool hasMarket(const domain::AssetId& asset) const;

  // Read access to a ledger. @throws LedgerError(MarketNotFound)
  const InterestLedger& ledger(const domain::AssetId& asset) const;

  domain::MarketSnapshot marketSnapshot(const domain::AssetId& asset) const;

  // Snapshots of every market, ordered by asset id.
  std::vector<domain::MarketSnapshot> markets() const;

  const domain::AccountId& identity() const { return identity_; }

 private:
  InterestLedger& requireMarket(const domain::AssetId& asset);
  const InterestLedger& requireMarket(const domain::AssetId& asset) const;

  const domain::AccountId identity_;
  ICustody& custody_;
  const IAuthorizer& authorizer_;
  const ITimeProvider& clock_;
  EventBus& bus_;

  std::map<domain::AssetId, std::unique_ptr<InterestLedger>> markets_;
  ReentrancyGuard guard_;
};

}  // namespace savings
