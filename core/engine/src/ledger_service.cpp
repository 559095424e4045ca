#include "savings/engine/ledger_service.hpp"
#include "savings/domain/ledger_error.hpp"
#include "savings/math/fixed_point.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace savings {

namespace {

using nlohmann::json;

// A request that is well-formed JSON but names an unknown op or lacks an
// argument. Reported with code "BadRequest".
class RequestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

std::string stringArg(const json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || !it->is_string()) {
    throw RequestError(std::string("missing string argument '") + key + "'");
  }
  return it->get<std::string>();
}

Uint amountArg(const json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end()) {
    throw RequestError(std::string("missing amount argument '") + key + "'");
  }
  if (it->is_number_unsigned()) {
    return Uint(it->get<std::uint64_t>());
  }
  if (!it->is_string()) {
    throw RequestError(std::string("argument '") + key +
                       "' must be a decimal string");
  }
  try {
    return parseUint(it->get<std::string>());
  } catch (const std::invalid_argument& e) {
    throw RequestError(std::string("argument '") + key + "': " + e.what());
  } catch (const std::out_of_range& e) {
    throw RequestError(std::string("argument '") + key + "': " + e.what());
  }
}

json snapshotToJson(const domain::MarketSnapshot& s) {
  json j;
  j["asset"] = s.asset_id;
  j["share_name"] = s.share_name;
  j["share_symbol"] = s.share_symbol;
  j["annual_rate"] = toString(s.annual_rate);
  j["settled_index"] = toString(s.settled_index);
  j["index"] = toString(s.preview_index);
  j["last_update"] = s.last_update;
  j["total_shares"] = toString(s.total_shares);
  j["total_value"] = toString(s.total_value);
  return j;
}

std::string errorReply(const char* code, const std::string& message) {
  json reply;
  reply["status"] = "error";
  reply["code"] = code;
  reply["message"] = message;
  return reply.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
LedgerService::LedgerService(ServiceConfig config, const ITimeProvider& clock,
                             SimulationTimeProvider* sim_clock)
    : config_(std::move(config)),
      clock_(clock),
      sim_clock_(sim_clock),
      policy_(config_.owner) {
  pool_ = std::make_unique<PoolCoordinator>(config_.coordinator_id, custody_,
                                            policy_, clock_, bus_);
}

LedgerService::~LedgerService() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void LedgerService::start() {
  if (running_) {
    return;
  }

  // ---  1-3) Authorization and seed state, before any thread can reach it --
  seed();

  // ---  4) Executor ---------------------------------------------------------
  executor_.start();

  // ---  5) IPC front end (optional) -----------------------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);

    IpcServer* server = ipc_server_.get();
    telemetry_subscription_ = bus_.subscribe(
        [server](const Event& event) { server->pushTelemetry(event); });

    try {
      ipc_server_->start();
    } catch (...) {
      bus_.unsubscribe(telemetry_subscription_);
      ipc_server_.reset();
      executor_.stop();
      throw;
    }
  }

  running_ = true;
  std::cout << "[LedgerService] started. owner=" << config_.owner
            << " coordinator=" << config_.coordinator_id
            << " markets=" << config_.markets.size() << "\n";
}

// -----------------------------------------------------------------------------
// stop(): IPC first so no new commands arrive, then the executor
// -----------------------------------------------------------------------------
void LedgerService::stop() {
  if (!running_) {
    return;
  }

  if (ipc_server_) {
    ipc_server_->stop();
    bus_.unsubscribe(telemetry_subscription_);
    ipc_server_.reset();
  }
  executor_.stop();

  running_ = false;
  std::cout << "[LedgerService] stopped.\n";
}

// -----------------------------------------------------------------------------
// seed(): grants, balances, reserves, markets
// -----------------------------------------------------------------------------
// Runs on the starting thread, once per service. A restart after stop() keeps
// the state built so far.
// -----------------------------------------------------------------------------
void LedgerService::seed() {
  policy_.grant(config_.coordinator_id, Operation::MintShares);
  policy_.grant(config_.coordinator_id, Operation::BurnShares);

  if (seeded_) {
    return;
  }
  seeded_ = true;

  for (const BalanceSeed& b : config_.balances) {
    custody_.credit(b.asset, b.account, b.amount);
  }
  for (const ReserveSeed& r : config_.reserves) {
    custody_.fundReserve(r.asset, r.amount);
  }
  for (const MarketSeed& m : config_.markets) {
    pool_->initializeMarket(config_.owner, m.asset, m.ledger);
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, hop to the executor, translate errors
// -----------------------------------------------------------------------------
std::string LedgerService::executeCommand(const std::string& request) {
  json parsed;
  try {
    parsed = json::parse(request);
  } catch (const json::parse_error& e) {
    return errorReply("BadRequest", std::string("invalid JSON: ") + e.what());
  }
  if (!parsed.is_object()) {
    return errorReply("BadRequest", "request must be a JSON object");
  }

  if (!executor_.running()) {
    return errorReply("ServiceStopped", "service is not running");
  }

  try {
    json reply = executor_.submit([this, &parsed] { return dispatch(parsed); })
                     .get();
    reply["status"] = "ok";
    return reply.dump();
  } catch (const LedgerError& e) {
    std::cerr << "[LedgerService] " << errorCodeToString(e.code()) << ": "
              << e.what() << "\n";
    return errorReply(errorCodeToString(e.code()), e.what());
  } catch (const RequestError& e) {
    return errorReply("BadRequest", e.what());
  } catch (const json::exception& e) {
    return errorReply("BadRequest", e.what());
  } catch (const std::exception& e) {
    std::cerr << "[LedgerService] command failed: " << e.what() << "\n";
    return errorReply("InternalError", e.what());
  }
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per op, executor thread only
// -----------------------------------------------------------------------------
json LedgerService::dispatch(const json& request) {
  const std::string op = stringArg(request, "op");
  json reply = json::object();

  if (op == "ping") {
    reply["response"] = "pong";
  } else if (op == "status") {
    reply["clock"] = sim_clock_ != nullptr ? "simulation" : "live";
    reply["now"] = clock_.now_seconds();
    reply["owner"] = config_.owner;
    reply["coordinator"] = pool_->identity();
    json markets = json::array();
    for (const auto& snapshot : pool_->markets()) {
      markets.push_back(snapshotToJson(snapshot));
    }
    reply["markets"] = std::move(markets);
  } else if (op == "init_market") {
    domain::LedgerConfig ledger_config;
    ledger_config.share_name = request.value("share_name", "");
    ledger_config.share_symbol = request.value("share_symbol", "");
    ledger_config.initial_rate = request.contains("initial_rate")
                                     ? amountArg(request, "initial_rate")
                                     : Uint(0);
    std::string asset = stringArg(request, "asset");
    pool_->initializeMarket(stringArg(request, "caller"), asset,
                            ledger_config);
    reply["market"] = snapshotToJson(pool_->marketSnapshot(asset));
  } else if (op == "deposit") {
    std::string caller = stringArg(request, "caller");
    std::string asset = stringArg(request, "asset");
    Uint shares = pool_->deposit(caller, asset, amountArg(request, "amount"));
    reply["shares"] = toString(shares);
    reply["balance"] = toString(pool_->getUserBalance(asset, caller));
  } else if (op == "withdraw") {
    std::string caller = stringArg(request, "caller");
    std::string asset = stringArg(request, "asset");
    Uint shares = pool_->withdraw(caller, asset, amountArg(request, "amount"));
    reply["shares"] = toString(shares);
    reply["balance"] = toString(pool_->getUserBalance(asset, caller));
  } else if (op == "balance") {
    std::string user = stringArg(request, "user");
    std::string asset = stringArg(request, "asset");
    reply["balance"] = toString(pool_->getUserBalance(asset, user));
    reply["shares"] = toString(pool_->ledger(asset).principalOf(user));
  } else if (op == "accrue") {
    reply["index"] = toString(pool_->accrueInterest(stringArg(request, "asset")));
  } else if (op == "set_rate") {
    std::string asset = stringArg(request, "asset");
    pool_->setInterestRate(stringArg(request, "caller"), asset,
                           amountArg(request, "rate"));
    reply["market"] = snapshotToJson(pool_->marketSnapshot(asset));
  } else if (op == "custody_balance") {
    std::string asset = stringArg(request, "asset");
    reply["balance"] =
        toString(custody_.balanceOf(asset, stringArg(request, "account")));
    reply["reserve"] = toString(custody_.reserveOf(asset));
  } else if (op == "advance_time") {
    if (sim_clock_ == nullptr) {
      throw RequestError("advance_time requires the simulation clock");
    }
    auto it = request.find("seconds");
    if (it == request.end() || !it->is_number_integer() ||
        it->get<std::int64_t>() < 0) {
      throw RequestError("advance_time needs a non-negative 'seconds'");
    }
    sim_clock_->advance_by(it->get<std::int64_t>());
    reply["now"] = sim_clock_->now_seconds();
  } else {
    throw RequestError("unknown op: " + op);
  }

  return reply;
}

}  // namespace savings
