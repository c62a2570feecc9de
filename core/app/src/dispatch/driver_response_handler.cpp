#include "courier/dispatch/driver_response_handler.hpp"

#include "courier/matching/eligibility.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace courier {

using domain::DispatchError;
using domain::DispatchResult;
using domain::OrderStatus;
using domain::SuggestionStatus;

namespace {

bool acceptsServiceType(const domain::DriverProfile& driver,
                        domain::ServiceType type) {
  switch (type) {
    case domain::ServiceType::Food:    return driver.accepts_food;
    case domain::ServiceType::Parcel:  return driver.accepts_parcel;
    case domain::ServiceType::Ride:    return driver.accepts_ride;
    case domain::ServiceType::Unknown: return false;
  }
  return false;
}

}  // namespace

DriverResponseHandler::DriverResponseHandler(
    DispatchStore& store, const matching::ICandidatePool& pool,
    const ITimeProvider& clock, EventSink sink)
    : store_(store), pool_(pool), clock_(clock), sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// acceptOrder()
// -----------------------------------------------------------------------------
DispatchResult DriverResponseHandler::acceptOrder(domain::OrderId order_id,
                                                  domain::DriverId driver_id) {
  std::vector<Event> pending;

  {
    auto txn = store_.begin(order_id);
    if (!txn) {
      return DispatchResult::failure(DispatchError::NotFound,
                                     "order not found");
    }

    domain::Order& order = txn->order();
    if (order.driver_id && *order.driver_id != driver_id) {
      return DispatchResult::failure(DispatchError::Conflict,
                                     "order already taken by another driver");
    }
    if (!domain::isDispatchable(order.status)) {
      return DispatchResult::failure(DispatchError::NotFound,
                                     "order is not open for dispatch");
    }
    if (order.customer_id == driver_id) {
      return DispatchResult::failure(DispatchError::Forbidden,
                                     "cannot accept your own order");
    }

    auto profile = pool_.profile(driver_id);
    if (!profile || profile->approval != domain::ApprovalStatus::Approved) {
      return DispatchResult::failure(DispatchError::Forbidden,
                                     "driver is not approved");
    }
    if (!matching::isEligible(*profile, order)) {
      return DispatchResult::failure(DispatchError::Forbidden,
                                     "driver is not eligible for this order");
    }

    const std::int64_t now = clock_.now_ms();
    auto& suggestions = txn->suggestions();
    auto matched = std::find_if(
        suggestions.begin(), suggestions.end(),
        [driver_id, now](const domain::Suggestion& s) {
          return s.driver_id == driver_id && s.isLive(now);
        });
    if (matched == suggestions.end()) {
      return DispatchResult::failure(DispatchError::Forbidden,
                                     "no live offer for this driver");
    }

    const OrderStatus previous = order.status;
    order.driver_id = driver_id;
    txn->recordStatus(OrderStatus::Accepted, now);
    pending.emplace_back(OrderStatusEvent{order_id, previous,
                                          OrderStatus::Accepted, driver_id,
                                          now});

    const domain::SuggestionId matched_id = matched->id;
    for (auto& s : suggestions) {
      if (s.status != SuggestionStatus::Sent) {
        continue;
      }
      s.status = s.id == matched_id ? SuggestionStatus::Accepted
                                    : SuggestionStatus::Expired;
      s.responded_at_ms = now;
      pending.emplace_back(SuggestionResolvedEvent{order_id, s.driver_id,
                                                   s.cycle, s.status, now});
    }

    if (domain::DispatchState* state = txn->existingDispatchState()) {
      state->is_active = false;
    }
  }

  std::cout << "[DriverResponseHandler] order " << order_id
            << " accepted by driver " << driver_id << "\n";
  emit(pending);
  return DispatchResult::success("order accepted");
}

// -----------------------------------------------------------------------------
// rejectOrder()
// -----------------------------------------------------------------------------
DispatchResult DriverResponseHandler::rejectOrder(domain::OrderId order_id,
                                                  domain::DriverId driver_id) {
  std::vector<Event> pending;

  {
    auto txn = store_.begin(order_id);
    if (!txn) {
      return DispatchResult::failure(DispatchError::NotFound,
                                     "no pending offer for this driver");
    }

    auto& suggestions = txn->suggestions();
    auto offer = std::find_if(
        suggestions.begin(), suggestions.end(),
        [driver_id](const domain::Suggestion& s) {
          return s.driver_id == driver_id &&
                 s.status == SuggestionStatus::Sent;
        });
    if (offer == suggestions.end()) {
      return DispatchResult::failure(DispatchError::NotFound,
                                     "no pending offer for this driver");
    }

    domain::Order& order = txn->order();
    if (!domain::isDispatchable(order.status)) {
      return DispatchResult::failure(
          DispatchError::InvalidState,
          std::string("order cannot be rejected in status ") +
              domain::toString(order.status));
    }

    const std::int64_t now = clock_.now_ms();
    offer->status = SuggestionStatus::Rejected;
    offer->responded_at_ms = now;
    pending.emplace_back(SuggestionResolvedEvent{
        order_id, driver_id, offer->cycle, offer->status, now});

    if (!txn->hasLiveSuggestion(now) &&
        order.status == OrderStatus::DriverNotificationSent) {
      txn->recordStatus(OrderStatus::SearchingForDriver, now);
      txn->dispatchState().next_retry_at_ms = now;
      pending.emplace_back(OrderStatusEvent{
          order_id, OrderStatus::DriverNotificationSent,
          OrderStatus::SearchingForDriver, std::nullopt, now});
    }
  }

  emit(pending);
  return DispatchResult::success("offer rejected");
}

// -----------------------------------------------------------------------------
// updateOrderStatus(): one trip step by the assigned driver
// -----------------------------------------------------------------------------
DispatchResult DriverResponseHandler::updateOrderStatus(
    domain::OrderId order_id, domain::DriverId driver_id,
    OrderStatus new_status) {
  std::vector<Event> pending;

  {
    auto txn = store_.begin(order_id);
    if (!txn || txn->order().driver_id != driver_id) {
      return DispatchResult::failure(DispatchError::NotFound,
                                     "order not assigned to this driver");
    }

    const OrderStatus previous = txn->order().status;
    auto next = domain::nextTripStatus(previous);
    if (!next || *next != new_status) {
      return DispatchResult::failure(
          DispatchError::InvalidState,
          std::string("cannot move from ") + domain::toString(previous) +
              " to " + domain::toString(new_status));
    }

    const std::int64_t now = clock_.now_ms();
    txn->recordStatus(new_status, now);
    pending.emplace_back(
        OrderStatusEvent{order_id, previous, new_status, driver_id, now});
  }

  emit(pending);
  return DispatchResult::success(std::string("order is now ") +
                                 domain::toString(new_status));
}

// -----------------------------------------------------------------------------
// listSuggestedOrders()
// -----------------------------------------------------------------------------
std::vector<SuggestedOrder> DriverResponseHandler::listSuggestedOrders(
    domain::DriverId driver_id) const {
  std::vector<SuggestedOrder> result;

  auto profile = pool_.profile(driver_id);
  if (!profile || profile->approval != domain::ApprovalStatus::Approved) {
    return result;
  }

  for (auto& [order, suggestion] :
       store_.liveOffersForDriver(driver_id, clock_.now_ms())) {
    if (!domain::isDispatchable(order.status) || order.driver_id) {
      continue;
    }
    if (!acceptsServiceType(*profile, order.service_type)) {
      continue;
    }
    result.push_back(SuggestedOrder{order, suggestion});
  }

  std::sort(result.begin(), result.end(),
            [](const SuggestedOrder& a, const SuggestedOrder& b) {
              if (a.order.created_at_ms != b.order.created_at_ms) {
                return a.order.created_at_ms > b.order.created_at_ms;
              }
              return a.order.id > b.order.id;
            });
  return result;
}

void DriverResponseHandler::emit(std::vector<Event>& events) {
  if (!sink_) {
    return;
  }
  for (auto& event : events) {
    sink_(std::move(event));
  }
}

}  // namespace courier
