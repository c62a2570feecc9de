#pragma once

#include "courier/domain/order.hpp"
#include "courier/domain/order_status.hpp"
#include "courier/domain/suggestion.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace courier {

// -----------------------------------------------------------------------------
// DispatchOfferEvent
// -----------------------------------------------------------------------------
//
// @brief  Published once per broadcast cycle, after the Dispatch Loop has
//         committed the new Sent suggestions.
//
// @details
// This is the delivery path of the notification collaborator: the IPC server
// forwards it on the PUB socket, where the push gateway picks it up and
// notifies each driver. driver_ids are in ranking order (nearest first).
//
// Thread model:
//   Created on a scheduler worker, pushed into the telemetry loop's queue.
//   Plain data; safe to copy across threads.
// -----------------------------------------------------------------------------
struct DispatchOfferEvent {
  domain::OrderId order_id{};
  std::uint32_t cycle{0};
  std::vector<domain::DriverId> driver_ids;
  std::int64_t expires_at_ms{0};
};

// -----------------------------------------------------------------------------
// OrderStatusEvent
// -----------------------------------------------------------------------------
// Emitted for every status value an order takes after registration, by the
// loop (Searching → Notified), the expiry worker and the reject handler
// (Notified → Searching), and the driver handlers (Accepted and trip steps).
// Mirrors the StatusHistory row written in the same transaction.
// -----------------------------------------------------------------------------
struct OrderStatusEvent {
  domain::OrderId order_id{};
  domain::OrderStatus previous{domain::OrderStatus::Pending};
  domain::OrderStatus current{domain::OrderStatus::Pending};
  std::optional<domain::DriverId> driver_id;
  std::int64_t timestamp_ms{0};
};

// A Sent suggestion left Sent: accepted, rejected, or expired.
struct SuggestionResolvedEvent {
  domain::OrderId order_id{};
  domain::DriverId driver_id{};
  std::uint32_t cycle{0};
  domain::SuggestionStatus status{domain::SuggestionStatus::Expired};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// DispatchExhaustedEvent
// -----------------------------------------------------------------------------
// The order reached max_cycles without acceptance and its dispatch state was
// deactivated. Automatic matching has stopped; an operator has to step in.
// -----------------------------------------------------------------------------
struct DispatchExhaustedEvent {
  domain::OrderId order_id{};
  std::uint32_t cycle{0};
  std::int64_t timestamp_ms{0};
};

}  // namespace courier
