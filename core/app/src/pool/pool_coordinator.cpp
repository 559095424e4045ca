#include "savings/pool/pool_coordinator.hpp"
#include "savings/domain/ledger_error.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace savings {

PoolCoordinator::PoolCoordinator(domain::AccountId identity, ICustody& custody,
                                 const IAuthorizer& authorizer,
                                 const ITimeProvider& clock, EventBus& bus)
    : identity_(std::move(identity)),
      custody_(custody),
      authorizer_(authorizer),
      clock_(clock),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// initializeMarket()
// -----------------------------------------------------------------------------
void PoolCoordinator::initializeMarket(const domain::AccountId& caller,
                                       const domain::AssetId& asset,
                                       const domain::LedgerConfig& config) {
  if (!authorizer_.isAuthorized(caller, Operation::InitializeMarket)) {
    throw LedgerError(LedgerErrorCode::Unauthorized,
                      caller + " may not initialize markets");
  }
  if (asset.empty()) {
    throw LedgerError(LedgerErrorCode::InvalidMarket,
                      "asset id must not be empty");
  }
  if (markets_.count(asset) != 0) {
    throw LedgerError(LedgerErrorCode::MarketAlreadyExists,
                      "market " + asset + " already exists");
  }

  auto ledger = std::make_unique<InterestLedger>(asset, identity_, config,
                                                 clock_, authorizer_);
  markets_.emplace(asset, std::move(ledger));

  std::cout << "[PoolCoordinator] market " << asset << " initialized ("
            << config.share_symbol << ", rate " << config.initial_rate
            << ")\n";

  MarketInitializedEvent event;
  event.asset_id = asset;
  event.share_name = config.share_name;
  event.share_symbol = config.share_symbol;
  event.annual_rate = config.initial_rate;
  event.timestamp = clock_.now_seconds();
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// deposit(): pull the asset in, then mint
// -----------------------------------------------------------------------------
Uint PoolCoordinator::deposit(const domain::AccountId& caller,
                              const domain::AssetId& asset,
                              const Uint& amount) {
  ReentrancyGuard::Scope scope(guard_, "deposit");

  if (amount == 0) {
    throw LedgerError(LedgerErrorCode::InvalidAmount,
                      "deposit amount must be greater than 0");
  }
  InterestLedger& ledger = requireMarket(asset);

  // Every mint check runs before any asset moves.
  ledger.quoteMint(identity_, amount);

  if (!custody_.transferIn(asset, caller, amount)) {
    std::cerr << "[PoolCoordinator] deposit of " << amount << " " << asset
              << " from " << caller << " refused by custody\n";
    throw LedgerError(LedgerErrorCode::CustodyTransferFailed,
                      "custody refused to transfer " + toString(amount) + " " +
                          asset + " from " + caller);
  }

  Uint shares;
  try {
    shares = ledger.mintShares(identity_, caller, amount);
  } catch (const std::exception&) {
    if (!custody_.transferOut(asset, caller, amount)) {
      std::cerr << "[PoolCoordinator] refund of " << amount << " " << asset
                << " to " << caller << " failed\n";
    }
    throw;
  }

  DepositEvent event;
  event.user = caller;
  event.asset_id = asset;
  event.amount = amount;
  event.shares = shares;
  event.index = ledger.currentIndex();
  event.timestamp = ledger.lastUpdate();
  bus_.publish(event);
  return shares;
}

// -----------------------------------------------------------------------------
// withdraw(): settle, price, burn, then push the asset out
// -----------------------------------------------------------------------------
Uint PoolCoordinator::withdraw(const domain::AccountId& caller,
                               const domain::AssetId& asset,
                               const Uint& amount) {
  ReentrancyGuard::Scope scope(guard_, "withdraw");

  if (amount == 0) {
    throw LedgerError(LedgerErrorCode::InvalidAmount,
                      "withdraw amount must be greater than 0");
  }
  InterestLedger& ledger = requireMarket(asset);

  Uint available = ledger.valueOf(caller);
  if (available < amount) {
    throw LedgerError(LedgerErrorCode::InsufficientBalance,
                      caller + " has " + toString(available) + " " + asset +
                          ", cannot withdraw " + toString(amount));
  }

  // The checkpoint predates the settlement, so a refusal below restores the
  // ledger exactly.
  InterestLedger::Checkpoint before = ledger.checkpoint(caller);
  ledger.advanceIndex();
  Uint index = ledger.currentIndex();
  Uint shares = InterestLedger::sharesFor(amount, index);
  Uint owned = ledger.principalOf(caller);
  if (shares > owned) {
    ledger.restore(before);
    throw LedgerError(LedgerErrorCode::InsufficientShares,
                      "withdrawing " + toString(amount) + " " + asset +
                          " needs " + toString(shares) + " shares, " + caller +
                          " holds " + toString(owned));
  }

  ledger.burnShares(identity_, caller, shares);

  if (!custody_.transferOut(asset, caller, amount)) {
    ledger.restore(before);
    std::cerr << "[PoolCoordinator] withdrawal of " << amount << " " << asset
              << " to " << caller << " refused by custody, burn undone\n";
    throw LedgerError(LedgerErrorCode::CustodyTransferFailed,
                      "custody refused to transfer " + toString(amount) + " " +
                          asset + " to " + caller);
  }

  WithdrawEvent event;
  event.user = caller;
  event.asset_id = asset;
  event.amount = amount;
  event.shares = shares;
  event.index = index;
  event.timestamp = ledger.lastUpdate();
  bus_.publish(event);
  return shares;
}

Uint PoolCoordinator::getUserBalance(const domain::AssetId& asset,
                                     const domain::AccountId& user) const {
  return requireMarket(asset).valueOf(user);
}

// -----------------------------------------------------------------------------
// setInterestRate()
// -----------------------------------------------------------------------------
void PoolCoordinator::setInterestRate(const domain::AccountId& caller,
                                      const domain::AssetId& asset,
                                      const Uint& new_rate) {
  InterestLedger& ledger = requireMarket(asset);
  Uint previous = ledger.annualRate();
  ledger.setInterestRate(caller, new_rate);

  InterestRateUpdatedEvent event;
  event.asset_id = asset;
  event.previous_rate = previous;
  event.new_rate = new_rate;
  event.index = ledger.currentIndex();
  event.timestamp = clock_.now_seconds();
  bus_.publish(event);
}

Uint PoolCoordinator::accrueInterest(const domain::AssetId& asset) {
  InterestLedger& ledger = requireMarket(asset);
  ledger.advanceIndex();
  return ledger.currentIndex();
}

bool PoolCoordinator::hasMarket(const domain::AssetId& asset) const {
  return markets_.count(asset) != 0;
}

const InterestLedger& PoolCoordinator::ledger(
    const domain::AssetId& asset) const {
  return requireMarket(asset);
}

domain::MarketSnapshot PoolCoordinator::marketSnapshot(
    const domain::AssetId& asset) const {
  return requireMarket(asset).snapshot();
}

std::vector<domain::MarketSnapshot> PoolCoordinator::markets() const {
  std::vector<domain::MarketSnapshot> out;
  out.reserve(markets_.size());
  for (const auto& [asset, ledger] : markets_) {
    out.push_back(ledger->snapshot());
  }
  return out;
}

InterestLedger& PoolCoordinator::requireMarket(const domain::AssetId& asset) {
  auto it = markets_.find(asset);
  if (it == markets_.end()) {
    throw LedgerError(LedgerErrorCode::MarketNotFound,
                      "no market for asset " + asset);
  }
  return *it->second;
}

const InterestLedger& PoolCoordinator::requireMarket(
    const domain::AssetId& asset) const {
  auto it = markets_.find(asset);
  if (it == markets_.end()) {
    throw LedgerError(LedgerErrorCode::MarketNotFound,
                      "no market for asset " + asset);
  }
  return *it->second;
}

}  // namespace savings
