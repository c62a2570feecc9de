#pragma once

#include "courier/domain/driver.hpp"
#include "courier/domain/order.hpp"

namespace courier {
namespace matching {

// -----------------------------------------------------------------------------
// isEligible(driver, order)
// -----------------------------------------------------------------------------
//
// @brief  Can this driver legally serve this order?
//
// @details
//   Food    accepts_food.
//   Parcel  accepts_parcel, and the vehicle type matches the requested one
//           when the order requests one.
//   Ride    accepts_ride, same vehicle rule as Parcel.
//   Other   never eligible.
//
// Capability only: approval, presence and self-service are checked by the
// callers. Pure; called once per candidate per cycle and again on accept.
// -----------------------------------------------------------------------------
bool isEligible(const domain::DriverProfile& driver, const domain::Order& order);

}  // namespace matching
}  // namespace courier
