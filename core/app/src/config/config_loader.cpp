#include "courier/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace courier {

using json = nlohmann::json;

namespace {

void requireAtLeast(const char* key, std::int64_t value, std::int64_t minimum) {
  if (value < minimum) {
    throw ConfigError(std::string(key) + " must be >= " +
                      std::to_string(minimum) + ", got " +
                      std::to_string(value));
  }
}

void requireAtMost(const char* key, std::int64_t value, std::int64_t maximum) {
  if (value > maximum) {
    throw ConfigError(std::string(key) + " must be <= " +
                      std::to_string(maximum) + ", got " +
                      std::to_string(value));
  }
}

// Upper bounds keep every *Ms() product and deadline far from int64 overflow
// and every narrowing cast lossless.
constexpr std::int64_t kMaxSeconds = 7 * 24 * 3600;
constexpr std::int64_t kMaxCycles = 1000;
constexpr std::int64_t kMaxSuggestionLimit = 1000;
constexpr std::int64_t kMaxLoopIntervalMs = 3600 * 1000;
constexpr std::int64_t kMaxWorkerThreads = 256;

domain::DispatchConfig parseDispatch(const json& j) {
  domain::DispatchConfig config;
  if (!j.is_object()) {
    throw ConfigError("\"dispatch\" must be an object");
  }

  const auto limit = j.value("suggestion_limit",
                             static_cast<std::int64_t>(config.suggestion_limit));
  const auto window =
      j.value("acceptance_window_seconds", config.acceptance_window_seconds);
  const auto cycles =
      j.value("max_cycles", static_cast<std::int64_t>(config.max_cycles));
  const auto retry = j.value("retry_delay_seconds", config.retry_delay_seconds);
  const auto staleness =
      j.value("location_staleness_seconds", config.location_staleness_seconds);

  requireAtLeast("suggestion_limit", limit, 1);
  requireAtLeast("acceptance_window_seconds", window, 1);
  requireAtLeast("max_cycles", cycles, 1);
  requireAtLeast("retry_delay_seconds", retry, 0);
  requireAtLeast("location_staleness_seconds", staleness, 0);
  requireAtMost("suggestion_limit", limit, kMaxSuggestionLimit);
  requireAtMost("acceptance_window_seconds", window, kMaxSeconds);
  requireAtMost("max_cycles", cycles, kMaxCycles);
  requireAtMost("retry_delay_seconds", retry, kMaxSeconds);
  requireAtMost("location_staleness_seconds", staleness, kMaxSeconds);

  config.suggestion_limit = static_cast<std::size_t>(limit);
  config.acceptance_window_seconds = window;
  config.max_cycles = static_cast<std::uint32_t>(cycles);
  config.retry_delay_seconds = retry;
  config.location_staleness_seconds = staleness;
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// configFromJsonText()
// -----------------------------------------------------------------------------
EngineConfig configFromJsonText(const std::string& text) {
  EngineConfig config;
  try {
    const json root = json::parse(text);
    if (!root.is_object()) {
      throw ConfigError("config root must be a JSON object");
    }

    if (root.contains("dispatch")) {
      config.dispatch = parseDispatch(root.at("dispatch"));
    }

    config.loop_interval_ms =
        root.value("loop_interval_ms", config.loop_interval_ms);
    const auto workers = root.value(
        "worker_threads", static_cast<std::int64_t>(config.worker_threads));
    requireAtLeast("loop_interval_ms", config.loop_interval_ms, 1);
    requireAtLeast("worker_threads", workers, 1);
    requireAtMost("loop_interval_ms", config.loop_interval_ms,
                  kMaxLoopIntervalMs);
    requireAtMost("worker_threads", workers, kMaxWorkerThreads);
    config.worker_threads = static_cast<std::size_t>(workers);

    config.command_endpoint =
        root.value("command_endpoint", config.command_endpoint);
    config.telemetry_endpoint =
        root.value("telemetry_endpoint", config.telemetry_endpoint);
    config.location_endpoint =
        root.value("location_endpoint", config.location_endpoint);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return configFromJsonText(buffer.str());
}

}  // namespace courier
