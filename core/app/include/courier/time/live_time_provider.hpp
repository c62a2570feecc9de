#pragma once

#include "courier/time/i_time_provider.hpp"

namespace courier {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall clock
// -----------------------------------------------------------------------------
// Used by the courier_dispatchd daemon. Reads std::chrono::system_clock, which
// is safe to call from any thread; no state of its own.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace courier
