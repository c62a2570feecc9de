#include "courier/network/ipc_server.hpp"

#include "courier/network/telemetry_format.hpp"

#include <cerrno>
#include <chrono>
#include <iostream>
#include <utility>

namespace courier {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string command_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }
  if (command_endpoint_.empty() && telemetry_endpoint_.empty()) {
    std::cout << "[IpcServer] disabled (no endpoints configured)\n";
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);

  if (!command_endpoint_.empty()) {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->set(zmq::sockopt::linger, 0);
    cmd_socket_->bind(command_endpoint_);
  }
  if (!telemetry_endpoint_.empty()) {
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
    pub_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->bind(telemetry_endpoint_);
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD="
            << (command_endpoint_.empty() ? "-" : command_endpoint_)
            << " PUB="
            << (telemetry_endpoint_.empty() ? "-" : telemetry_endpoint_)
            << "\n";
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
  if (!running_.load() || telemetry_endpoint_.empty()) {
    return;
  }
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    if (cmd_socket_) {
      processCommands();
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollTimeoutMs));
    }
  }

  // Final drain: publish any remaining telemetry before shutdown.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on the PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    if (!pub_socket_) {
      continue;
    }
    const std::string payload = wire::formatTelemetry(*maybe_event);
    zmq::message_t msg(payload.data(), payload.size());
    // A full high-water mark drops the message; telemetry is best effort.
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry dropped: " << payload << "\n";
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

}  // namespace courier
