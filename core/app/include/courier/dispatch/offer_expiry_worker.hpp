#pragma once

#include "courier/domain/order.hpp"
#include "courier/events/event.hpp"
#include "courier/store/dispatch_store.hpp"
#include "courier/time/i_time_provider.hpp"

#include <cstdint>

namespace courier {

// What a single expiry firing did. Only Expired changes state.
enum class ExpiryOutcome {
  Expired,          // Sent offers of the cycle expired, order re-armed
  OrderMissing,     // Unknown order id
  AlreadyAssigned,  // A driver accepted in the meantime
  NotDispatched,    // Order has no dispatch state
  StaleCycle,       // A newer cycle started since this timer was armed
  NothingPending,   // Every offer of the cycle was already resolved
};

const char* toString(ExpiryOutcome outcome);

// -----------------------------------------------------------------------------
// OfferExpiryWorker
// -----------------------------------------------------------------------------
//
// @brief  Closes the acceptance window of one broadcast cycle.
//
// @details
// The Dispatch Loop schedules expire(order_id, cycle) to run once the
// acceptance window has passed. Under the order's lock it:
//   1. Does nothing if the order is assigned, has no dispatch state, or its
//      dispatch state has moved on to another cycle. The cycle check is what
//      makes late, early-superseded and duplicate firings harmless.
//   2. Marks every still-Sent suggestion of that cycle Expired.
//   3. Reverts DriverNotificationSent to SearchingForDriver (with history).
//   4. Sets next_retry_at = now so the next loop tick re-broadcasts without
//      waiting out the retry delay.
//
// Events are emitted after the lock is released.
//
// Thread model:
//   Any scheduler worker; concurrent calls for different orders run in
//   parallel, calls for the same order serialize on its lock.
// -----------------------------------------------------------------------------
class OfferExpiryWorker {
 public:
  OfferExpiryWorker(DispatchStore& store, const ITimeProvider& clock,
                    EventSink sink = {});

  OfferExpiryWorker(const OfferExpiryWorker&) = delete;
  OfferExpiryWorker& operator=(const OfferExpiryWorker&) = delete;

  ExpiryOutcome expire(domain::OrderId order_id, std::uint32_t cycle);

 private:
  DispatchStore& store_;
  const ITimeProvider& clock_;
  EventSink sink_;
};

}  // namespace courier
