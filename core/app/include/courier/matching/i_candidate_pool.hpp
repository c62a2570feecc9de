#pragma once

#include "courier/domain/driver.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace courier {
namespace matching {

// -----------------------------------------------------------------------------
// ICandidatePool: read access to driver presence and capabilities
// -----------------------------------------------------------------------------
//
// @brief  The boundary between the dispatch core and whatever tracks drivers.
//
// @details
// availableDrivers() returns snapshots of drivers that are Approved, online
// and whose last location is not older than stale_cutoff_ms. Drivers with no
// location at all are never returned.
//
// profile() returns any known driver regardless of state; the Accept handler
// uses it to check approval and eligibility of the acting driver.
//
// Implementations must allow concurrent calls from scheduler workers and
// handler threads.
// -----------------------------------------------------------------------------
class ICandidatePool {
 public:
  virtual ~ICandidatePool() = default;

  virtual std::vector<domain::DriverProfile> availableDrivers(
      std::int64_t stale_cutoff_ms) const = 0;

  virtual std::optional<domain::DriverProfile> profile(
      domain::DriverId driver_id) const = 0;
};

}  // namespace matching
}  // namespace courier
