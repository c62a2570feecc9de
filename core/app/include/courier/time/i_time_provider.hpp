#pragma once

#include <cstdint>

namespace courier {

// -----------------------------------------------------------------------------
// ITimeProvider: source of "now" for every dispatch decision
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the clock so offer expiry, retry delays and location
//         staleness can be tested without sleeping.
//
// @details
// All domain instants (notified_at, expires_at, next_retry_at, location
// timestamps, status history) are int64 milliseconds since the Unix epoch
// taken from this interface. Components hold a const reference and never
// call std::chrono clocks directly for domain time.
//
//   - LiveTimeProvider       → std::chrono::system_clock (the daemon).
//   - SimulationTimeProvider → a value the test sets and advances.
//
// Note the split: the TimerScheduler decides *when* a task runs using
// steady_clock; the task then reads *what time it is* from this provider.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently from any thread.
//
// Ownership:
//   Non-owning const references everywhere; the provider outlives the
//   DispatchEngine.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace courier
