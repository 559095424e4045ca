#include "savings/config/service_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace savings {

namespace {

using nlohmann::json;

std::string requireString(const json& node, const char* key,
                          const std::string& where) {
  auto it = node.find(key);
  if (it == node.end() || !it->is_string()) {
    throw ConfigError(where + "." + key + " must be a string");
  }
  return it->get<std::string>();
}

std::string stringOr(const json& node, const char* key,
                     const std::string& fallback) {
  auto it = node.find(key);
  if (it == node.end()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ConfigError(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

// Amounts are decimal strings. A plain JSON integer is accepted too as long
// as it is non-negative; anything wider has to be quoted.
Uint requireAmount(const json& node, const char* key,
                   const std::string& where) {
  auto it = node.find(key);
  if (it == node.end()) {
    throw ConfigError(where + "." + key + " is required");
  }
  if (it->is_number_unsigned()) {
    return Uint(it->get<std::uint64_t>());
  }
  if (!it->is_string()) {
    throw ConfigError(where + "." + key + " must be a decimal string");
  }
  try {
    return parseUint(it->get<std::string>());
  } catch (const std::exception& e) {
    throw ConfigError(where + "." + key + ": " + e.what());
  }
}

const json& requireArray(const json& root, const char* key) {
  const json& node = root.at(key);
  if (!node.is_array()) {
    throw ConfigError(std::string(key) + " must be an array");
  }
  return node;
}

ClockMode parseClockMode(const std::string& text) {
  if (text == "live") return ClockMode::Live;
  if (text == "simulation") return ClockMode::Simulation;
  throw ConfigError("clock must be \"live\" or \"simulation\", got \"" + text +
                    "\"");
}

}  // namespace

// -----------------------------------------------------------------------------
// parseServiceConfig()
// -----------------------------------------------------------------------------
ServiceConfig parseServiceConfig(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("config is not valid JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  ServiceConfig config;
  config.owner = stringOr(root, "owner", config.owner);
  config.coordinator_id =
      stringOr(root, "coordinator_id", config.coordinator_id);
  config.clock = parseClockMode(stringOr(root, "clock", "live"));

  if (auto it = root.find("simulation_start"); it != root.end()) {
    if (!it->is_number_integer()) {
      throw ConfigError("simulation_start must be an integer");
    }
    config.simulation_start = it->get<std::int64_t>();
  }

  if (auto it = root.find("ipc"); it != root.end()) {
    if (!it->is_object()) {
      throw ConfigError("ipc must be an object");
    }
    config.command_endpoint =
        stringOr(*it, "command_endpoint", config.command_endpoint);
    config.telemetry_endpoint =
        stringOr(*it, "telemetry_endpoint", config.telemetry_endpoint);
  }

  if (root.contains("markets")) {
    std::size_t i = 0;
    for (const json& m : requireArray(root, "markets")) {
      std::string where = "markets[" + std::to_string(i++) + "]";
      MarketSeed seed;
      seed.asset = requireString(m, "asset", where);
      seed.ledger.share_name = stringOr(m, "share_name", "");
      seed.ledger.share_symbol = stringOr(m, "share_symbol", "");
      seed.ledger.initial_rate = m.contains("initial_rate")
                                     ? requireAmount(m, "initial_rate", where)
                                     : Uint(0);
      config.markets.push_back(std::move(seed));
    }
  }

  if (root.contains("balances")) {
    std::size_t i = 0;
    for (const json& b : requireArray(root, "balances")) {
      std::string where = "balances[" + std::to_string(i++) + "]";
      BalanceSeed seed;
      seed.account = requireString(b, "account", where);
      seed.asset = requireString(b, "asset", where);
      seed.amount = requireAmount(b, "amount", where);
      config.balances.push_back(std::move(seed));
    }
  }

  if (root.contains("reserves")) {
    std::size_t i = 0;
    for (const json& r : requireArray(root, "reserves")) {
      std::string where = "reserves[" + std::to_string(i++) + "]";
      ReserveSeed seed;
      seed.asset = requireString(r, "asset", where);
      seed.amount = requireAmount(r, "amount", where);
      config.reserves.push_back(std::move(seed));
    }
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadServiceConfig()
// -----------------------------------------------------------------------------
ServiceConfig loadServiceConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  ServiceConfig config = parseServiceConfig(buffer.str());
  std::cout << "[Config] loaded " << path << " (" << config.markets.size()
            << " markets, clock " << clockModeToString(config.clock) << ")\n";
  return config;
}

const char* clockModeToString(ClockMode mode) {
  switch (mode) {
    case ClockMode::Live:       return "live";
    case ClockMode::Simulation: return "simulation";
  }
  return "unknown";
}

}  // namespace savings
