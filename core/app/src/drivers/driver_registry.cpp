#include "courier/drivers/driver_registry.hpp"

#include <algorithm>
#include <mutex>

namespace courier {

// -----------------------------------------------------------------------------
// upsertProfile()
// -----------------------------------------------------------------------------
void DriverRegistry::upsertProfile(const domain::DriverProfile& profile) {
  std::unique_lock lock(mutex_);
  auto it = drivers_.find(profile.id);
  if (it == drivers_.end()) {
    drivers_.emplace(profile.id, profile);
    return;
  }

  std::optional<domain::DriverLocation> known = it->second.location;
  it->second = profile;
  if (!it->second.location) {
    it->second.location = known;
  }
}

// -----------------------------------------------------------------------------
// setOnline()
// -----------------------------------------------------------------------------
bool DriverRegistry::setOnline(domain::DriverId driver_id, bool online) {
  std::unique_lock lock(mutex_);
  auto it = drivers_.find(driver_id);
  if (it == drivers_.end()) {
    return false;
  }
  it->second.is_online = online;
  return true;
}

// -----------------------------------------------------------------------------
// updateLocation()
// -----------------------------------------------------------------------------
bool DriverRegistry::updateLocation(domain::DriverId driver_id,
                                    const domain::GeoPoint& point,
                                    std::int64_t reported_at_ms,
                                    std::int64_t received_at_ms) {
  const std::int64_t timestamp_ms = std::min(reported_at_ms, received_at_ms);

  std::unique_lock lock(mutex_);
  auto it = drivers_.find(driver_id);
  if (it == drivers_.end()) {
    return false;
  }

  auto& location = it->second.location;
  if (location && location->updated_at_ms > timestamp_ms) {
    return false;
  }
  location = domain::DriverLocation{point, timestamp_ms};
  return true;
}

// -----------------------------------------------------------------------------
// availableDrivers(): approved, online, location at or after the cutoff
// -----------------------------------------------------------------------------
std::vector<domain::DriverProfile> DriverRegistry::availableDrivers(
    std::int64_t stale_cutoff_ms) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::DriverProfile> result;
  for (const auto& [id, driver] : drivers_) {
    if (driver.approval != domain::ApprovalStatus::Approved ||
        !driver.is_online) {
      continue;
    }
    if (!driver.location || driver.location->updated_at_ms < stale_cutoff_ms) {
      continue;
    }
    result.push_back(driver);
  }
  return result;
}

std::optional<domain::DriverProfile> DriverRegistry::profile(
    domain::DriverId driver_id) const {
  std::shared_lock lock(mutex_);
  auto it = drivers_.find(driver_id);
  if (it == drivers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t DriverRegistry::size() const {
  std::shared_lock lock(mutex_);
  return drivers_.size();
}

}  // namespace courier
