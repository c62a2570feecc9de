#pragma once

#include "courier/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace courier {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is whatever the owner last set.
//
// @details
// Dispatch tests drive the matching protocol through time explicitly: run a
// loop tick, advance past the acceptance window, fire the expiry worker,
// advance past the retry delay, tick again. Nothing sleeps, so scenarios are
// deterministic.
//
// Storage is a single std::atomic<int64_t>: readers on scheduler workers and
// handler threads see the latest value without a mutex.
//
// Thread model:
//   now_ms(), set_time() and advance_by() are all safe from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Jumps to an absolute time. Monotonicity is the caller's responsibility.
  void set_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace courier
