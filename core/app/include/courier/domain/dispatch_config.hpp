#pragma once

#include <cstddef>
#include <cstdint>

namespace courier {
namespace domain {

// -----------------------------------------------------------------------------
// DispatchConfig: tuning of the matching protocol
// -----------------------------------------------------------------------------
//
// @brief  Copied into DispatchLoop and CandidateSelector at construction.
//         Constant for the lifetime of the engine.
//
// @details
//   suggestion_limit            Drivers offered per broadcast cycle.
//   acceptance_window_seconds   How long a Sent offer stays valid.
//   max_cycles                  Broadcasts without acceptance before the
//                               order's dispatch state is deactivated.
//   retry_delay_seconds         Minimum gap between loop attempts on one
//                               order (after a broadcast or an empty
//                               candidate search).
//   location_staleness_seconds  Drivers whose last location is older than
//                               this are not candidates.
//
// Loaded from the "dispatch" object of the engine's JSON config file by
// loadEngineConfig(); the defaults below apply to missing keys.
// -----------------------------------------------------------------------------
struct DispatchConfig {
  std::size_t suggestion_limit{5};
  std::int64_t acceptance_window_seconds{60};
  std::uint32_t max_cycles{3};
  std::int64_t retry_delay_seconds{10};
  std::int64_t location_staleness_seconds{60};

  std::int64_t acceptanceWindowMs() const {
    return acceptance_window_seconds * 1000;
  }
  std::int64_t retryDelayMs() const { return retry_delay_seconds * 1000; }
  std::int64_t locationStalenessMs() const {
    return location_staleness_seconds * 1000;
  }
};

}  // namespace domain
}  // namespace courier
