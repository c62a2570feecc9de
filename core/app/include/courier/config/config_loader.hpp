#pragma once

#include "courier/domain/dispatch_config.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace courier {

// -----------------------------------------------------------------------------
// EngineConfig: everything courier_dispatchd reads at startup
// -----------------------------------------------------------------------------
//
// @details
// JSON layout (every key optional; missing keys keep the defaults below):
//
//   {
//     "dispatch": {
//       "suggestion_limit": 5,
//       "acceptance_window_seconds": 60,
//       "max_cycles": 3,
//       "retry_delay_seconds": 10,
//       "location_staleness_seconds": 60
//     },
//     "loop_interval_ms": 1000,
//     "worker_threads": 2,
//     "command_endpoint": "tcp://127.0.0.1:5556",
//     "telemetry_endpoint": "tcp://127.0.0.1:5557",
//     "location_endpoint": "tcp://127.0.0.1:5555"
//   }
//
// An empty endpoint disables that socket.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::DispatchConfig dispatch;
  std::int64_t loop_interval_ms{1000};
  std::size_t worker_threads{2};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
  std::string location_endpoint{"tcp://127.0.0.1:5555"};
};

// Thrown for unreadable files, malformed JSON, wrong value types and values
// out of range.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Parses a JSON document into an EngineConfig. Throws ConfigError.
EngineConfig configFromJsonText(const std::string& text);

// Reads and parses a config file. Throws ConfigError.
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace courier
