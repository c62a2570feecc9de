#pragma once

#include "courier/domain/order.hpp"
#include "courier/domain/order_status.hpp"

#include <cstdint>
#include <optional>

namespace courier {
namespace domain {

// -----------------------------------------------------------------------------
// DispatchState: per-order bookkeeping of the matching protocol
// -----------------------------------------------------------------------------
//
// @brief  One record per order, created lazily by the first Dispatch Loop
//         pass and never deleted while the order exists.
//
// @details
// Fields:
//   cycle              Number of broadcasts made so far. Only grows; always
//                      equal to the highest cycle among the order's
//                      suggestions.
//   is_active          false once matching is over: either a driver accepted
//                      or max_cycles broadcasts went unanswered. The loop
//                      never revives an inactive state.
//   last_dispatched_at Time of the most recent broadcast.
//   next_retry_at      The loop skips the order until this instant. Set to
//                      "now" by expiry and by the last pending rejection so
//                      the next tick retries immediately.
//
// Writers: Dispatch Loop, Offer Expiry Worker, and the Accept/Reject
// handlers, always under the order's lock.
// -----------------------------------------------------------------------------
struct DispatchState {
  OrderId order_id{};
  std::uint32_t cycle{0};
  bool is_active{true};
  std::optional<std::int64_t> last_dispatched_at_ms;
  std::optional<std::int64_t> next_retry_at_ms;
};

// One row of the append-only audit trail of order status values.
struct StatusHistoryEntry {
  OrderId order_id{};
  OrderStatus status{OrderStatus::Pending};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace courier
