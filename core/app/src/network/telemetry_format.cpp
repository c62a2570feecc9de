#include "courier/network/telemetry_format.hpp"

#include <optional>
#include <type_traits>

namespace courier {
namespace wire {

using json = nlohmann::json;

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

json pointToJson(const domain::GeoPoint& point) {
  return json{{"lat", point.lat}, {"lng", point.lng}};
}

}  // namespace

// -----------------------------------------------------------------------------
// eventToJson(): one branch per Event alternative
// -----------------------------------------------------------------------------
json eventToJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, DispatchOfferEvent>) {
          return json{{"type", "dispatch_offer"},
                      {"order_id", e.order_id},
                      {"cycle", e.cycle},
                      {"driver_ids", e.driver_ids},
                      {"expires_at_ms", e.expires_at_ms}};
        } else if constexpr (std::is_same_v<T, OrderStatusEvent>) {
          return json{{"type", "order_status"},
                      {"order_id", e.order_id},
                      {"previous_status", domain::toString(e.previous)},
                      {"status", domain::toString(e.current)},
                      {"driver_id", optionalToJson(e.driver_id)},
                      {"timestamp_ms", e.timestamp_ms}};
        } else if constexpr (std::is_same_v<T, SuggestionResolvedEvent>) {
          return json{{"type", "suggestion_resolved"},
                      {"order_id", e.order_id},
                      {"driver_id", e.driver_id},
                      {"cycle", e.cycle},
                      {"status", domain::toString(e.status)},
                      {"timestamp_ms", e.timestamp_ms}};
        } else {
          static_assert(std::is_same_v<T, DispatchExhaustedEvent>);
          return json{{"type", "dispatch_exhausted"},
                      {"order_id", e.order_id},
                      {"cycle", e.cycle},
                      {"timestamp_ms", e.timestamp_ms}};
        }
      },
      event);
}

std::string formatTelemetry(const Event& event) {
  return eventToJson(event).dump();
}

json orderToJson(const domain::Order& order) {
  json j;
  j["id"] = order.id;
  j["service_type"] = domain::toString(order.service_type);
  j["status"] = domain::toString(order.status);
  j["customer_id"] = order.customer_id;
  j["driver_id"] = optionalToJson(order.driver_id);
  j["pickup"] = pointToJson(order.pickup);
  j["dropoff"] = pointToJson(order.dropoff);
  j["requested_vehicle_type"] =
      order.requested_vehicle_type
          ? json(domain::toString(*order.requested_vehicle_type))
          : json(nullptr);
  j["created_at_ms"] = order.created_at_ms;
  return j;
}

json suggestionToJson(const domain::Suggestion& s) {
  return json{{"id", s.id},
              {"order_id", s.order_id},
              {"driver_id", s.driver_id},
              {"cycle", s.cycle},
              {"distance_km", s.distance_km},
              {"status", domain::toString(s.status)},
              {"notified_at_ms", s.notified_at_ms},
              {"expires_at_ms", s.expires_at_ms},
              {"responded_at_ms", optionalToJson(s.responded_at_ms)}};
}

json dispatchStateToJson(const domain::DispatchState& state) {
  return json{{"order_id", state.order_id},
              {"cycle", state.cycle},
              {"is_active", state.is_active},
              {"last_dispatched_at_ms",
               optionalToJson(state.last_dispatched_at_ms)},
              {"next_retry_at_ms", optionalToJson(state.next_retry_at_ms)}};
}

json historyEntryToJson(const domain::StatusHistoryEntry& entry) {
  return json{{"status", domain::toString(entry.status)},
              {"timestamp_ms", entry.timestamp_ms}};
}

json driverToJson(const domain::DriverProfile& driver) {
  json j;
  j["id"] = driver.id;
  j["approval"] = domain::toString(driver.approval);
  j["vehicle_type"] = domain::toString(driver.vehicle_type);
  j["accepts_food"] = driver.accepts_food;
  j["accepts_parcel"] = driver.accepts_parcel;
  j["accepts_ride"] = driver.accepts_ride;
  j["is_online"] = driver.is_online;
  if (driver.location) {
    j["location"] = pointToJson(driver.location->point);
    j["location_updated_at_ms"] = driver.location->updated_at_ms;
  } else {
    j["location"] = nullptr;
  }
  return j;
}

}  // namespace wire
}  // namespace courier
