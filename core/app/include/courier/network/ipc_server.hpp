#pragma once

#include "courier/concurrent/thread_safe_queue.hpp"
#include "courier/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace courier {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread serving JSON commands on a REP socket and
//         broadcasting dispatch telemetry on a PUB socket.
//
// @details
// Two sockets share one thread:
//
//   1. REP socket (command_endpoint):
//      One JSON command per request ({"cmd": "ACCEPT", ...}). The request
//      string is handed to command_handler_ (DispatchEngine::executeCommand)
//      and its JSON reply is sent back. ZMQ_RCVTIMEO keeps the thread from
//      blocking forever so it can alternate with telemetry draining.
//
//   2. PUB socket (telemetry_endpoint):
//      Every event pushed through pushTelemetry() is rendered with
//      wire::formatTelemetry() and published. The push gateway subscribes
//      here for dispatch_offer messages; dashboards take the rest.
//
// An empty endpoint disables that socket. With both empty start() is a
// no-op.
//
// Thread model:
//   start()/stop() from the owning thread (DispatchEngine). pushTelemetry()
//   from the telemetry loop thread. command_handler_ runs on the IPC thread.
//
// Ownership:
//   Owned by DispatchEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the outbound queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string command_endpoint,
            std::string telemetry_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds the enabled sockets and spawns the worker.
  // Idempotent. Throws zmq::error_t if a bind fails (e.g. port in use).
  // -------------------------------------------------------------------------
  void start();

  // Stops the worker after a final telemetry drain and closes the sockets.
  void stop();

  // Queues one event for the PUB socket. Dropped when telemetry is disabled
  // or the server is not running.
  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace courier
