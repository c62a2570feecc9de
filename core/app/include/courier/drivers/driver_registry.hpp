#pragma once

#include "courier/domain/driver.hpp"
#include "courier/matching/i_candidate_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace courier {

// -----------------------------------------------------------------------------
// DriverRegistry: in-process candidate pool
// -----------------------------------------------------------------------------
//
// @brief  Holds every known driver's profile, presence flag and last
//         location, and answers the Candidate Selector's pool queries.
//
// @details
// Writers:
//   - upsertProfile(): account/verification collaborator (UPSERT_DRIVER).
//   - setOnline(): the driver app going on/off shift (DRIVER_ONLINE).
//   - updateLocation(): the location feed thread and DRIVER_LOCATION.
// Readers:
//   - availableDrivers()/profile(): Candidate Selector on scheduler workers,
//     Accept handler and listSuggestedOrders() on IPC/handler threads.
//
// Location reports may arrive out of order from the feed. A report older
// than the stored one is ignored. A device clock running ahead cannot date a
// report later than the moment it was received: the stored time is
// min(reported, received), so a silent driver still goes stale.
//
// Thread model:
//   std::shared_mutex: readers take shared_lock and run in parallel; writers
//   take unique_lock. No lock is held while calling out.
//
// Ownership:
//   Owned by DispatchEngine. Referenced (as ICandidatePool) by the selector
//   and the response handlers.
// -----------------------------------------------------------------------------
class DriverRegistry final : public matching::ICandidatePool {
 public:
  DriverRegistry() = default;

  DriverRegistry(const DriverRegistry&) = delete;
  DriverRegistry& operator=(const DriverRegistry&) = delete;

  // -------------------------------------------------------------------------
  // upsertProfile(profile)
  // -------------------------------------------------------------------------
  // Inserts or replaces a driver's profile. When the incoming profile has no
  // location, an already known location is kept.
  // -------------------------------------------------------------------------
  void upsertProfile(const domain::DriverProfile& profile);

  // @return false if the driver is unknown.
  bool setOnline(domain::DriverId driver_id, bool online);

  // -------------------------------------------------------------------------
  // updateLocation(driver_id, point, reported_at_ms, received_at_ms)
  // -------------------------------------------------------------------------
  // Stores the fix stamped min(reported_at_ms, received_at_ms).
  //
  // @return false if the driver is unknown or the report is older than the
  //         stored location.
  // -------------------------------------------------------------------------
  bool updateLocation(domain::DriverId driver_id, const domain::GeoPoint& point,
                      std::int64_t reported_at_ms, std::int64_t received_at_ms);

  std::vector<domain::DriverProfile> availableDrivers(
      std::int64_t stale_cutoff_ms) const override;

  std::optional<domain::DriverProfile> profile(
      domain::DriverId driver_id) const override;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::DriverId, domain::DriverProfile> drivers_;
};

}  // namespace courier
