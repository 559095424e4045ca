// -----------------------------------------------------------------------------
// savings_pool: single executable entry point.
//
//   savings_pool [config.json]
//
//   1) Load the ServiceConfig (defaults when no path is given).
//   2) Pick the clock: system time, or a SimulationTimeProvider that only
//      moves on the advance_time command.
//   3) Start the LedgerService: seeds custody, creates the configured
//      markets, starts the executor and the ZeroMQ command/telemetry
//      endpoints.
//   4) Log every pool event on stdout.
//   5) Idle on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread       → waits for SIGINT
//   executor thread   → all pool operations
//   ipc thread        → REP/PUB sockets
// -----------------------------------------------------------------------------

#include "savings/config/service_config.hpp"
#include "savings/engine/ledger_service.hpp"
#include "savings/events/event_types.hpp"
#include "savings/time/live_time_provider.hpp"
#include "savings/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

// Set by the SIGINT handler, polled by main(). A lock-free atomic store is
// async-signal-safe.
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  savings::ServiceConfig config;
  try {
    if (argc > 1) {
      config = savings::loadServiceConfig(argv[1]);
    } else {
      std::cout << "[main] no config file given, using defaults\n";
    }
  } catch (const savings::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock
  // -------------------------------------------------------------------------
  savings::LiveTimeProvider live_clock;
  std::unique_ptr<savings::SimulationTimeProvider> sim_clock;
  const savings::ITimeProvider* clock = &live_clock;

  if (config.clock == savings::ClockMode::Simulation) {
    std::int64_t start = config.simulation_start != 0
                             ? config.simulation_start
                             : live_clock.now_seconds();
    sim_clock = std::make_unique<savings::SimulationTimeProvider>(start);
    clock = sim_clock.get();
  }

  // -------------------------------------------------------------------------
  // 3) Service
  // -------------------------------------------------------------------------
  savings::LedgerService service(config, *clock, sim_clock.get());

  // Subscribe before start() so the markets created from config are logged.
  service.eventBus().subscribe<savings::MarketInitializedEvent>(
      [](const savings::MarketInitializedEvent& e) {
        std::cout << "[Event] #" << e.sequence_id << " market " << e.asset_id
                  << " (" << e.share_symbol << ") rate=" << e.annual_rate
                  << "\n";
      });
  service.eventBus().subscribe<savings::DepositEvent>(
      [](const savings::DepositEvent& e) {
        std::cout << "[Event] #" << e.sequence_id << " deposit " << e.user
                  << " " << e.amount << " " << e.asset_id
                  << " shares=" << e.shares << "\n";
      });
  service.eventBus().subscribe<savings::WithdrawEvent>(
      [](const savings::WithdrawEvent& e) {
        std::cout << "[Event] #" << e.sequence_id << " withdraw " << e.user
                  << " " << e.amount << " " << e.asset_id
                  << " shares=" << e.shares << "\n";
      });
  service.eventBus().subscribe<savings::InterestRateUpdatedEvent>(
      [](const savings::InterestRateUpdatedEvent& e) {
        std::cout << "[Event] #" << e.sequence_id << " rate " << e.asset_id
                  << " " << e.previous_rate << " -> " << e.new_rate << "\n";
      });

  try {
    service.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for Ctrl-C
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] clock=" << savings::clockModeToString(config.clock)
            << " now=" << clock->now_seconds() << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 5) Shutdown
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  service.stop();
  return 0;
}
