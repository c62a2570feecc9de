#pragma once

#include "courier/domain/order.hpp"

#include <cstdint>
#include <optional>

namespace courier {
namespace domain {

using SuggestionId = std::uint64_t;

// -----------------------------------------------------------------------------
// SuggestionStatus
// -----------------------------------------------------------------------------
// Sent is the only non-terminal value. A suggestion leaves Sent exactly once:
//   Sent → Accepted   (acceptOrder by this driver)
//   Sent → Rejected   (rejectOrder by this driver)
//   Sent → Expired    (offer expiry, or another driver accepted the order)
// -----------------------------------------------------------------------------
enum class SuggestionStatus {
  Sent,
  Accepted,
  Rejected,
  Expired,
};

// -----------------------------------------------------------------------------
// Suggestion: one ledger entry: an offer of one order to one driver
// -----------------------------------------------------------------------------
//
// @details
// cycle identifies the broadcast that produced the offer. distance_km is the
// driver-to-pickup distance at offer time, rounded to 3 decimals, and is never
// updated afterwards.
//
// For a given (order, driver) pair at most one suggestion is in Sent at any
// time. The Dispatch Loop guarantees it by excluding every previously offered
// driver from candidate selection.
// -----------------------------------------------------------------------------
struct Suggestion {
  SuggestionId id{};
  OrderId order_id{};
  DriverId driver_id{};
  std::uint32_t cycle{0};
  double distance_km{0.0};
  SuggestionStatus status{SuggestionStatus::Sent};
  std::int64_t notified_at_ms{0};
  std::int64_t expires_at_ms{0};
  std::optional<std::int64_t> responded_at_ms;

  // Sent and still inside its acceptance window at now_ms.
  bool isLive(std::int64_t now_ms) const {
    return status == SuggestionStatus::Sent && expires_at_ms > now_ms;
  }
};

inline const char* toString(SuggestionStatus status) {
  switch (status) {
    case SuggestionStatus::Sent:     return "Sent";
    case SuggestionStatus::Accepted: return "Accepted";
    case SuggestionStatus::Rejected: return "Rejected";
    case SuggestionStatus::Expired:  return "Expired";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace courier
