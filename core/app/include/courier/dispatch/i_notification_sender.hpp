#pragma once

#include "courier/domain/order.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace courier {

// One broadcast as handed to the notification collaborator.
struct DispatchOffer {
  domain::OrderId order_id{};
  std::uint32_t cycle{0};
  std::vector<domain::DriverId> driver_ids;  // nearest first
  std::int64_t expires_at_ms{0};
};

// -----------------------------------------------------------------------------
// INotificationSender: push delivery of offers to drivers
// -----------------------------------------------------------------------------
//
// @brief  Fire-and-forget boundary called by the Dispatch Loop after a
//         broadcast has been committed.
//
// @details
// notifyDrivers() returns how many drivers were notified, or throws a
// std::exception subclass on failure. The loop logs failures and keeps the
// broadcast: offers stay Sent and expire normally if nobody hears about them.
//
// Called outside any order lock, possibly from several scheduler workers at
// once; implementations must be thread-safe.
// -----------------------------------------------------------------------------
class INotificationSender {
 public:
  virtual ~INotificationSender() = default;

  virtual std::size_t notifyDrivers(const DispatchOffer& offer) = 0;
};

}  // namespace courier
