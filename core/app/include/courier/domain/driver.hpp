#pragma once

#include "courier/domain/geo_point.hpp"
#include "courier/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace courier {
namespace domain {

// Verification outcome of a driver's documents. Only Approved drivers are
// offered orders or allowed to accept them.
enum class ApprovalStatus {
  Pending,
  Approved,
  Rejected,
};

// Last position reported by a driver's device, with the time it was taken.
struct DriverLocation {
  GeoPoint point;
  std::int64_t updated_at_ms{0};
};

// -----------------------------------------------------------------------------
// DriverProfile
// -----------------------------------------------------------------------------
//
// @brief  Everything the candidate pool exposes about a driver: approval,
//         presence, capabilities and last location.
//
// @details
// The accepts_* flags are set by the driver per vertical. vehicle_type is
// matched exactly against an order's requested_vehicle_type for Parcel and
// Ride orders. location is empty until the first report arrives; such a
// driver is never a candidate.
// -----------------------------------------------------------------------------
struct DriverProfile {
  DriverId id{};
  ApprovalStatus approval{ApprovalStatus::Pending};
  VehicleType vehicle_type{VehicleType::Car};
  bool accepts_food{false};
  bool accepts_parcel{false};
  bool accepts_ride{false};
  bool is_online{false};
  std::optional<DriverLocation> location;
};

const char* toString(ApprovalStatus status);
std::optional<ApprovalStatus> approvalStatusFromString(const std::string& text);

}  // namespace domain
}  // namespace courier
