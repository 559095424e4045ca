#pragma once

#include "savings/concurrent/thread_safe_queue.hpp"
#include "savings/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace savings {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoint of the savings pool
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands on a REP socket
//         and broadcasts pool events as JSON on a PUB socket.
//
// @details
// Two ZeroMQ sockets share one thread:
//
//   1. REP socket (command endpoint, default tcp://127.0.0.1:5556):
//      Each request string is handed to command_handler_ (bound to
//      LedgerService::executeCommand()) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps the recv from blocking so the loop can also
//      drain telemetry and notice stop().
//
//   2. PUB socket (telemetry endpoint, default tcp://127.0.0.1:5557):
//      Publishes every pool event (market initialized, deposit, withdraw,
//      rate update) as a JSON object with a "type" field. Events reach the
//      IPC thread through a ThreadSafeQueue filled from the executor thread
//      by pushTelemetry().
//
// Amounts, shares, rates and indices are rendered as decimal strings; they
// do not fit a JSON number.
//
// Thread model:
//   start() spawns the worker thread; stop() clears an atomic flag and joins.
//   pushTelemetry() may be called from any thread. command_handler_ runs on
//   the IPC thread and must do its own synchronization (LedgerService hops to
//   its executor).
//
// Ownership:
//   Owned by LedgerService via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler  Called for each request on the REP socket.
  // @param  cmd_endpoint     ZMQ endpoint to bind the REP socket to.
  // @param  pub_endpoint     ZMQ endpoint to bind the PUB socket to.
  //
  // No sockets are opened until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker. No-op if
  // already running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Joins the worker after a final telemetry drain, then closes the sockets.
  // Idempotent.
  void stop();

  // Queues event for publication on the PUB socket.
  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // JSON rendering of a pool event, e.g.
  //   {"type":"deposit","user":"alice","asset":"MTK","amount":"100",
  //    "shares":"100","index":"1000000000000000000","timestamp":1700000000,
  //    "sequence_id":2}
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatEvent(const MarketInitializedEvent& e);
  static std::string formatEvent(const DepositEvent& e);
  static std::string formatEvent(const WithdrawEvent& e);
  static std::string formatEvent(const InterestRateUpdatedEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace savings
