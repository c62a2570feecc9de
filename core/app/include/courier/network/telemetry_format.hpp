#pragma once

#include "courier/domain/dispatch_state.hpp"
#include "courier/domain/driver.hpp"
#include "courier/domain/order.hpp"
#include "courier/domain/suggestion.hpp"
#include "courier/events/event.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace courier {
namespace wire {

// -----------------------------------------------------------------------------
// JSON rendering shared by the PUB telemetry stream and REP command replies
// -----------------------------------------------------------------------------
// Enums are rendered with their toString() names, instants as integer
// milliseconds, absent optionals as null.
// -----------------------------------------------------------------------------

// One telemetry event as a JSON object with a "type" discriminator:
// dispatch_offer, order_status, suggestion_resolved, dispatch_exhausted.
nlohmann::json eventToJson(const Event& event);

// eventToJson(event).dump(), the payload sent on the PUB socket.
std::string formatTelemetry(const Event& event);

nlohmann::json orderToJson(const domain::Order& order);
nlohmann::json suggestionToJson(const domain::Suggestion& suggestion);
nlohmann::json dispatchStateToJson(const domain::DispatchState& state);
nlohmann::json historyEntryToJson(const domain::StatusHistoryEntry& entry);
nlohmann::json driverToJson(const domain::DriverProfile& driver);

}  // namespace wire
}  // namespace courier
