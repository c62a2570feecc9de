#pragma once

#include "courier/concurrent/event_loop_thread.hpp"
#include "courier/concurrent/timer_scheduler.hpp"
#include "courier/config/config_loader.hpp"
#include "courier/dispatch/dispatch_loop.hpp"
#include "courier/dispatch/driver_response_handler.hpp"
#include "courier/dispatch/event_notification_sender.hpp"
#include "courier/dispatch/offer_expiry_worker.hpp"
#include "courier/domain/dispatch_error.hpp"
#include "courier/drivers/driver_registry.hpp"
#include "courier/matching/candidate_selector.hpp"
#include "courier/network/ipc_server.hpp"
#include "courier/network/location_feed_thread.hpp"
#include "courier/store/dispatch_store.hpp"
#include "courier/time/i_time_provider.hpp"

#include <memory>
#include <optional>
#include <string>

namespace courier {

// -----------------------------------------------------------------------------
// DispatchEngine: top-level orchestrator of courier_dispatchd
// -----------------------------------------------------------------------------
//
// @brief  Owns the store, the driver registry, every dispatch component and
//         every thread, wires them together and exposes the JSON command
//         surface.
//
// @details
// Construction builds the passive parts: DispatchStore, DriverRegistry,
// CandidateSelector, OfferExpiryWorker, DispatchLoop, DriverResponseHandler.
// They are usable immediately (tests drive them without starting threads).
//
// start() brings the threads up in dependency order:
//   1. telemetry EventLoopThread (events published by the components)
//   2. IpcServer, bridged to the telemetry bus (skipped if both endpoints
//      are empty)
//   3. LocationFeedThread (skipped if location_endpoint is empty)
//   4. TimerScheduler with the Dispatch Loop armed every loop_interval_ms
//
// stop() reverses it: no new ticks or expiry firings, no new locations, the
// telemetry loop drains into the IPC server, then IPC shuts down.
//
// Threads when running:
//   - TimerScheduler timer thread + worker_threads workers (loop ticks,
//     expiry firings)
//   - telemetry loop thread
//   - IPC thread (executeCommand runs here)
//   - location feed thread
//
// Ownership:
//   Holds a const reference to the clock, which must outlive the engine.
//   Everything else is owned by value or std::unique_ptr.
// -----------------------------------------------------------------------------
class DispatchEngine {
 public:
  DispatchEngine(const ITimeProvider& clock, EngineConfig config);

  ~DispatchEngine();

  DispatchEngine(const DispatchEngine&) = delete;
  DispatchEngine& operator=(const DispatchEngine&) = delete;
  DispatchEngine(DispatchEngine&&) = delete;
  DispatchEngine& operator=(DispatchEngine&&) = delete;

  void start();
  void stop();
  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // registerOrder(order)
  // -------------------------------------------------------------------------
  // Checkout entry point. A Pending order is stored as SearchingForDriver; a
  // missing created_at is set to now. Conflict if the id is already known.
  // -------------------------------------------------------------------------
  domain::DispatchResult registerOrder(domain::Order order);

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one IPC request and returns the JSON reply.
  //
  // @details
  // request is a JSON object {"cmd": "<NAME>", ...}; a bare command name
  // such as "PING" is accepted too. Replies are {"status": "ok", ...} or
  // {"status": "error", "error": "<Kind>", "detail": "..."} where Kind is a
  // DispatchError name or BadRequest (malformed request, unknown command,
  // unknown enum value).
  //
  // Never throws.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  DispatchStore& store() { return store_; }
  DriverRegistry& drivers() { return registry_; }
  DispatchLoop& dispatchLoop() { return loop_; }
  OfferExpiryWorker& expiryWorker() { return expiry_worker_; }
  DriverResponseHandler& responses() { return responses_; }
  EventBus& telemetryBus() { return telemetry_loop_.eventBus(); }
  const EngineConfig& config() const { return config_; }

 private:
  void onLocationUpdate(const LocationUpdate& update);

  const ITimeProvider& clock_;
  const EngineConfig config_;

  EventLoopThread telemetry_loop_;
  TimerScheduler scheduler_;

  DispatchStore store_;
  DriverRegistry registry_;
  matching::CandidateSelector selector_;
  OfferExpiryWorker expiry_worker_;
  EventNotificationSender notifier_;
  DispatchLoop loop_;
  DriverResponseHandler responses_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<LocationFeedThread> location_feed_;
  std::optional<EventBus::SubscriptionId> ipc_bridge_;

  bool running_{false};
};

}  // namespace courier
