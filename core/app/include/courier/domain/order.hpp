#pragma once

#include "courier/domain/geo_point.hpp"
#include "courier/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace courier {
namespace domain {

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// Customers and drivers are both users of the marketplace, so they share one
// id space. That is what makes the "driver is the order's own customer"
// checks meaningful.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;
using UserId = std::uint64_t;
using DriverId = UserId;

// -----------------------------------------------------------------------------
// ServiceType
// -----------------------------------------------------------------------------
// The marketplace vertical an order belongs to. Unknown stands for any value
// this build does not recognize; the Eligibility Filter fails closed on it.
// -----------------------------------------------------------------------------
enum class ServiceType {
  Food,
  Parcel,
  Ride,
  Unknown,
};

enum class VehicleType {
  Bike,
  Motorcycle,
  Car,
  Van,
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  The dispatch-relevant projection of a marketplace order.
//
// @details
// Orders are created by checkout (registerOrder) and owned by the
// order-management collaborator; the dispatcher mutates only status and
// driver_id. Prices, distances and fares arrive precomputed and are not
// carried here.
//
// requested_vehicle_type constrains Parcel and Ride orders only; it is
// ignored for Food.
//
// The authoritative copy lives inside DispatchStore and is only mutated
// through an OrderTransaction. Copies handed out by the store are snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  ServiceType service_type{ServiceType::Food};
  OrderStatus status{OrderStatus::SearchingForDriver};
  UserId customer_id{};
  std::optional<DriverId> driver_id;  // Set exactly once, by acceptOrder()
  GeoPoint pickup;
  GeoPoint dropoff;
  std::optional<VehicleType> requested_vehicle_type;
  std::int64_t created_at_ms{0};
};

const char* toString(ServiceType type);
std::optional<ServiceType> serviceTypeFromString(const std::string& text);

const char* toString(VehicleType type);
std::optional<VehicleType> vehicleTypeFromString(const std::string& text);

}  // namespace domain
}  // namespace courier
