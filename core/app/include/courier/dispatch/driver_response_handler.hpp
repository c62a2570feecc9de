#pragma once

#include "courier/domain/dispatch_error.hpp"
#include "courier/domain/order.hpp"
#include "courier/domain/order_status.hpp"
#include "courier/domain/suggestion.hpp"
#include "courier/events/event.hpp"
#include "courier/matching/i_candidate_pool.hpp"
#include "courier/store/dispatch_store.hpp"
#include "courier/time/i_time_provider.hpp"

#include <vector>

namespace courier {

// One entry of a driver's offer inbox.
struct SuggestedOrder {
  domain::Order order;
  domain::Suggestion suggestion;
};

// -----------------------------------------------------------------------------
// DriverResponseHandler
// -----------------------------------------------------------------------------
//
// @brief  The synchronous, driver-facing operations on an order: accept or
//         reject an offer, advance a matched trip, list open offers.
//
// @details
// Every mutating call holds the order's lock (LockMode::Wait) for its whole
// check-then-write sequence, so it races safely with loop ticks, expiry
// firings and other drivers. Expected failures come back as DispatchResult;
// nothing here throws for a business outcome.
//
// acceptOrder(order, driver), checks in this order:
//   NotFound      order does not exist
//   Conflict      order already assigned to a different driver
//   NotFound      order not SearchingForDriver/DriverNotificationSent
//   Forbidden     driver is the order's customer, is not an approved driver,
//                 or fails the eligibility filter
//   Forbidden     driver holds no live Sent offer for the order
//   On success the order is assigned and Accepted, the driver's offer is
//   Accepted, every other Sent offer of the order is Expired and the
//   dispatch state is deactivated.
//
// rejectOrder(order, driver):
//   NotFound      driver holds no Sent offer for the order (expired or not)
//   InvalidState  order is no longer searching for a driver
//   On success the offer is Rejected. If it was the last live offer of a
//   DriverNotificationSent order, the order goes back to SearchingForDriver
//   and next_retry_at = now.
//
// updateOrderStatus(order, driver, status):
//   NotFound      order missing or not assigned to this driver
//   InvalidState  status is not the single next trip step
//
// Thread model:
//   Any thread. Calls for different orders run in parallel.
// -----------------------------------------------------------------------------
class DriverResponseHandler {
 public:
  DriverResponseHandler(DispatchStore& store,
                        const matching::ICandidatePool& pool,
                        const ITimeProvider& clock, EventSink sink = {});

  DriverResponseHandler(const DriverResponseHandler&) = delete;
  DriverResponseHandler& operator=(const DriverResponseHandler&) = delete;

  domain::DispatchResult acceptOrder(domain::OrderId order_id,
                                     domain::DriverId driver_id);

  domain::DispatchResult rejectOrder(domain::OrderId order_id,
                                     domain::DriverId driver_id);

  domain::DispatchResult updateOrderStatus(domain::OrderId order_id,
                                           domain::DriverId driver_id,
                                           domain::OrderStatus new_status);

  // -------------------------------------------------------------------------
  // listSuggestedOrders(driver_id)
  // -------------------------------------------------------------------------
  // Orders the driver currently holds a live offer for, newest order first.
  // Empty for unknown or unapproved drivers. Only unassigned orders still
  // searching, and only service types the driver accepts, are listed.
  // -------------------------------------------------------------------------
  std::vector<SuggestedOrder> listSuggestedOrders(
      domain::DriverId driver_id) const;

 private:
  void emit(std::vector<Event>& events);

  DispatchStore& store_;
  const matching::ICandidatePool& pool_;
  const ITimeProvider& clock_;
  EventSink sink_;
};

}  // namespace courier
