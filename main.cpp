// -----------------------------------------------------------------------------
// courier_dispatchd: dispatch and driver-matching daemon
//
//   courier_dispatchd [config.json]
//
//   1) Load EngineConfig from the optional JSON file (defaults otherwise).
//   2) Create the wall clock and the DispatchEngine.
//   3) Subscribe console logging to the telemetry bus.
//   4) Start the engine: telemetry loop, IPC server, location feed,
//      scheduler running the Dispatch Loop.
//   5) Idle on the main thread until SIGINT/SIGTERM, then shut down.
//
// Thread layout:
//   main thread          → waits for a signal
//   scheduler threads    → Dispatch Loop ticks and offer expiry firings
//   telemetry thread     → EventBus subscribers (console log, IPC bridge)
//   IPC thread           → REP commands, PUB telemetry
//   location feed thread → ZMQ SUB driver locations
// -----------------------------------------------------------------------------

#include "courier/config/config_loader.hpp"
#include "courier/engine/dispatch_engine.hpp"
#include "courier/events/dispatch_events.hpp"
#include "courier/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// Set by the signal handler, polled by main(). The only global.
static volatile std::sig_atomic_t g_stop_requested = 0;

static void stop_handler(int /*signum*/) { g_stop_requested = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  courier::EngineConfig config;
  if (argc > 1) {
    try {
      config = courier::loadEngineConfig(argv[1]);
    } catch (const courier::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Clock and engine
  // -------------------------------------------------------------------------
  courier::LiveTimeProvider clock;
  courier::DispatchEngine engine(clock, config);

  // -------------------------------------------------------------------------
  // 3) Console logging of telemetry (runs on the telemetry thread)
  // -------------------------------------------------------------------------
  engine.telemetryBus().subscribe<courier::OrderStatusEvent>(
      [](const courier::OrderStatusEvent& e) {
        std::cout << "[OrderStatus] order=" << e.order_id << " "
                  << courier::domain::toString(e.previous) << " -> "
                  << courier::domain::toString(e.current);
        if (e.driver_id) {
          std::cout << " driver=" << *e.driver_id;
        }
        std::cout << "\n";
      },
      "console");

  engine.telemetryBus().subscribe<courier::DispatchExhaustedEvent>(
      [](const courier::DispatchExhaustedEvent& e) {
        std::cout << "[DispatchExhausted] order=" << e.order_id
                  << " cycles=" << e.cycle << " needs operator attention\n";
      },
      "console");

  // -------------------------------------------------------------------------
  // 4) Start
  // -------------------------------------------------------------------------
  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start: " << e.what() << "\n";
    engine.stop();
    return 1;
  }

  std::signal(SIGINT, stop_handler);
  std::signal(SIGTERM, stop_handler);

  std::cout << "[main] courier_dispatchd running. Commands on "
            << config.command_endpoint << ". Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait, then clean shutdown (joins every thread)
  // -------------------------------------------------------------------------
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] signal received. Stopping engine...\n";
  engine.stop();
  return 0;
}
