#pragma once

#include "savings/auth/access_policy.hpp"
#include "savings/concurrent/serial_executor.hpp"
#include "savings/config/service_config.hpp"
#include "savings/custody/in_memory_custody.hpp"
#include "savings/eventbus/event_bus.hpp"
#include "savings/network/ipc_server.hpp"
#include "savings/pool/pool_coordinator.hpp"
#include "savings/time/i_time_provider.hpp"
#include "savings/time/simulation_time_provider.hpp"

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <string>
#include <type_traits>

namespace savings {

// -----------------------------------------------------------------------------
// LedgerService
// -----------------------------------------------------------------------------
//
// @brief  Owns the savings pool and everything around it: authorization,
//         custody, event bus, the executor thread that serializes pool calls,
//         and the optional ZeroMQ front end.
//
// @details
// main() and tests use the service through a start/stop lifecycle:
//
//   SimulationTimeProvider clock(1'700'000'000);
//   LedgerService service(config, clock, &clock);
//   service.start();
//   std::string reply = service.executeCommand(R"({"op":"ping"})");
//   service.stop();
//
// Every pool operation, whether it comes from IPC, executeCommand() or
// call(), runs as a task on the SerialExecutor thread. The coordinator and
// its ledgers therefore never see two calls at once.
//
// Thread layout:
//
//   executor thread   → PoolCoordinator, InterestLedger, InMemoryCustody,
//                       EventBus callbacks
//   ipc thread        → IpcServer (REP recv, PUB send); hops to the
//                       executor for every command
//   caller thread     → start(), stop(), executeCommand(), call()
//
// Start-up (start()):
//   1. Grant the coordinator identity MintShares and BurnShares.
//   2. Seed custody wallets and reserves from config.balances/reserves.
//   3. Create config.markets as the owner.
//   4. Start the executor.
//   5. Start the IpcServer if both endpoints are non-empty; every pool event
//      is forwarded to its telemetry queue.
//
// Ownership:
//   LedgerService
//    ├── policy_       (AccessPolicy)
//    ├── custody_      (InMemoryCustody)
//    ├── bus_          (EventBus)
//    ├── pool_         (unique_ptr<PoolCoordinator>)
//    ├── executor_     (SerialExecutor)
//    └── ipc_server_   (unique_ptr<IpcServer>, may be null)
//   The clock is borrowed and must outlive the service.
// -----------------------------------------------------------------------------
class LedgerService {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config     Start-up settings; markets and seeds apply in start().
  // @param  clock      Time source for every ledger.
  // @param  sim_clock  The same clock when it is a SimulationTimeProvider,
  //                    which enables the advance_time command. nullptr
  //                    otherwise.
  // -------------------------------------------------------------------------
  LedgerService(ServiceConfig config, const ITimeProvider& clock,
                SimulationTimeProvider* sim_clock = nullptr);

  ~LedgerService();

  LedgerService(const LedgerService&) = delete;
  LedgerService& operator=(const LedgerService&) = delete;
  LedgerService(LedgerService&&) = delete;
  LedgerService& operator=(LedgerService&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @throws LedgerError  if a configured market cannot be created (e.g. the
  //                      same asset listed twice).
  // @throws zmq::error_t if an IPC endpoint cannot be bound.
  //
  // Calling start() on a running service does nothing.
  // -------------------------------------------------------------------------
  void start();

  // Stops IPC first, then drains and joins the executor. Idempotent.
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // @brief  Runs one JSON command and returns the JSON reply.
  //
  // @details
  // Request: {"op": "<name>", ...arguments}. Reply on success:
  // {"status":"ok", ...results}; on failure:
  // {"status":"error","code":"<LedgerErrorCode|BadRequest|...>",
  //  "message":"..."}.
  //
  // Ops: ping, status, init_market, deposit, withdraw, balance, accrue,
  // set_rate, custody_balance, advance_time. Amounts, rates and indices are
  // decimal strings in both directions.
  //
  // Never throws; every failure becomes an error reply.
  // Thread-safety: Safe from any thread while the service is running.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // -------------------------------------------------------------------------
  // call(fn)
  // -------------------------------------------------------------------------
  // Runs fn(pool, custody) on the executor thread and returns its result.
  // Exceptions thrown by fn propagate to the caller.
  // -------------------------------------------------------------------------
  template <typename F>
  auto call(F&& fn)
      -> std::invoke_result_t<F&, PoolCoordinator&, InMemoryCustody&> {
    return executor_
        .submit([this, &fn] { return fn(*pool_, custody_); })
        .get();
  }

  // Subscribe here to observe pool events (callbacks run on the executor).
  EventBus& eventBus() { return bus_; }

  const ServiceConfig& config() const { return config_; }

 private:
  void seed();
  // Runs on the executor thread. Returns the reply body without "status".
  nlohmann::json dispatch(const nlohmann::json& request);

  ServiceConfig config_;
  const ITimeProvider& clock_;
  SimulationTimeProvider* sim_clock_;

  AccessPolicy policy_;
  InMemoryCustody custody_;
  EventBus bus_;
  std::unique_ptr<PoolCoordinator> pool_;
  SerialExecutor executor_;
  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_subscription_{0};

  bool seeded_{false};
  bool running_{false};
};

}  // namespace savings
