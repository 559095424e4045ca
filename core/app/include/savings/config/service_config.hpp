#pragma once

#include "savings/domain/ledger_config.hpp"
#include "savings/domain/types.hpp"
#include "savings/math/fixed_point.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace savings {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Raised when a configuration document cannot be read or does not match the
// expected shape. what() names the offending field.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class ClockMode { Live, Simulation };

struct MarketSeed {
  domain::AssetId asset;
  domain::LedgerConfig ledger;
};

struct BalanceSeed {
  domain::AccountId account;
  domain::AssetId asset;
  Uint amount{0};
};

struct ReserveSeed {
  domain::AssetId asset;
  Uint amount{0};
};

// -----------------------------------------------------------------------------
// ServiceConfig
// -----------------------------------------------------------------------------
// Start-up settings of the savings pool service. Every field has a default,
// so an empty JSON object is a valid configuration.
//
//   owner              account allowed to create markets and set rates
//   coordinator_id     identity the pool mints and burns shares as
//   clock              live (system clock) or simulation (advance_time op)
//   command_endpoint   ZMQ REP endpoint; empty disables IPC
//   telemetry_endpoint ZMQ PUB endpoint; empty disables IPC
//   markets            created at start by the owner
//   balances           credited to custody wallets at start
//   reserves           added to the pool reserve at start
//   simulation_start   initial clock reading in simulation mode
// -----------------------------------------------------------------------------
struct ServiceConfig {
  domain::AccountId owner{"owner"};
  domain::AccountId coordinator_id{"savings-pool"};
  ClockMode clock{ClockMode::Live};
  std::int64_t simulation_start{0};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
  std::vector<MarketSeed> markets;
  std::vector<BalanceSeed> balances;
  std::vector<ReserveSeed> reserves;
};

// -------------------------------------------------------------------------
// parseServiceConfig(text)
// -------------------------------------------------------------------------
// @brief  Builds a ServiceConfig from a JSON document. Missing fields keep
//         their defaults.
//
// @throws ConfigError on malformed JSON, a field of the wrong type, an
//         unknown clock mode, or an amount that is not a decimal string.
// -------------------------------------------------------------------------
ServiceConfig parseServiceConfig(const std::string& text);

// Reads path and parses it. @throws ConfigError if the file cannot be opened.
ServiceConfig loadServiceConfig(const std::string& path);

const char* clockModeToString(ClockMode mode);

}  // namespace savings
