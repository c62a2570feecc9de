#pragma once

#include <optional>
#include <string>

namespace courier {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle as seen by the dispatcher
// -----------------------------------------------------------------------------
//
// @brief  Every status an order can take. The dispatch core only drives the
//         pre-acceptance part of the graph; trip progress after acceptance
//         is advanced by the assigned driver.
//
// @details
//
//   Pending ──> SearchingForDriver <──> DriverNotificationSent
//                      │                        │
//                      └──────────┬─────────────┘
//                                 ▼
//                             Accepted ──> OnTheWay ──> Delivered ──> Completed
//
//   Cancelled / Rejected are reachable from the pre-acceptance states; their
//   triggers live with the order-management collaborator.
//
// An order stays in SearchingForDriver after dispatch gives up; what stops
// the loop is DispatchState::is_active, not the order status.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,
  SearchingForDriver,
  DriverNotificationSent,
  Accepted,
  OnTheWay,
  Delivered,
  Completed,
  Rejected,
  Cancelled,
};

// SearchingForDriver or DriverNotificationSent: the states the Dispatch Loop
// scans and the driver response handlers act on.
bool isDispatchable(OrderStatus status);

// The single legal successor for driver trip progress (Accepted → OnTheWay →
// Delivered → Completed); std::nullopt for any other status.
std::optional<OrderStatus> nextTripStatus(OrderStatus status);

const char* toString(OrderStatus status);
std::optional<OrderStatus> orderStatusFromString(const std::string& text);

}  // namespace domain
}  // namespace courier
