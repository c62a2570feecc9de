#include "courier/matching/eligibility.hpp"

namespace courier {
namespace matching {

namespace {

bool vehicleMatches(const domain::DriverProfile& driver,
                    const domain::Order& order) {
  return !order.requested_vehicle_type.has_value() ||
         *order.requested_vehicle_type == driver.vehicle_type;
}

}  // namespace

bool isEligible(const domain::DriverProfile& driver,
                const domain::Order& order) {
  using domain::ServiceType;
  switch (order.service_type) {
    case ServiceType::Food:
      return driver.accepts_food;
    case ServiceType::Parcel:
      return driver.accepts_parcel && vehicleMatches(driver, order);
    case ServiceType::Ride:
      return driver.accepts_ride && vehicleMatches(driver, order);
    case ServiceType::Unknown:
      return false;
  }
  return false;
}

}  // namespace matching
}  // namespace courier
