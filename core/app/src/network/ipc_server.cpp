#include "savings/network/ipc_server.hpp"
#include "savings/math/fixed_point.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace savings {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish whatever the executor queued before shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    std::string json_str = formatTelemetry(*maybe_event);
    zmq::message_t msg(json_str.data(), json_str.size());
    // A slow subscriber drops telemetry rather than stalling commands.
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry dropped: " << json_str << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch on the event alternative
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit([](const auto& e) { return formatEvent(e); }, event);
}

std::string IpcServer::formatEvent(const MarketInitializedEvent& e) {
  nlohmann::json j;
  j["type"] = "market_initialized";
  j["asset"] = e.asset_id;
  j["share_name"] = e.share_name;
  j["share_symbol"] = e.share_symbol;
  j["annual_rate"] = toString(e.annual_rate);
  j["timestamp"] = e.timestamp;
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

std::string IpcServer::formatEvent(const DepositEvent& e) {
  nlohmann::json j;
  j["type"] = "deposit";
  j["user"] = e.user;
  j["asset"] = e.asset_id;
  j["amount"] = toString(e.amount);
  j["shares"] = toString(e.shares);
  j["index"] = toString(e.index);
  j["timestamp"] = e.timestamp;
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

std::string IpcServer::formatEvent(const WithdrawEvent& e) {
  nlohmann::json j;
  j["type"] = "withdraw";
  j["user"] = e.user;
  j["asset"] = e.asset_id;
  j["amount"] = toString(e.amount);
  j["shares"] = toString(e.shares);
  j["index"] = toString(e.index);
  j["timestamp"] = e.timestamp;
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

std::string IpcServer::formatEvent(const InterestRateUpdatedEvent& e) {
  nlohmann::json j;
  j["type"] = "interest_rate_updated";
  j["asset"] = e.asset_id;
  j["previous_rate"] = toString(e.previous_rate);
  j["new_rate"] = toString(e.new_rate);
  j["index"] = toString(e.index);
  j["timestamp"] = e.timestamp;
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

}  // namespace savings
