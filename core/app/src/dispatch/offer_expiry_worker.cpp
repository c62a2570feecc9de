#include "courier/dispatch/offer_expiry_worker.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace courier {

const char* toString(ExpiryOutcome outcome) {
  switch (outcome) {
    case ExpiryOutcome::Expired:         return "Expired";
    case ExpiryOutcome::OrderMissing:    return "OrderMissing";
    case ExpiryOutcome::AlreadyAssigned: return "AlreadyAssigned";
    case ExpiryOutcome::NotDispatched:   return "NotDispatched";
    case ExpiryOutcome::StaleCycle:      return "StaleCycle";
    case ExpiryOutcome::NothingPending:  return "NothingPending";
  }
  return "Unknown";
}

OfferExpiryWorker::OfferExpiryWorker(DispatchStore& store,
                                     const ITimeProvider& clock,
                                     EventSink sink)
    : store_(store), clock_(clock), sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// expire(order_id, cycle)
// -----------------------------------------------------------------------------
ExpiryOutcome OfferExpiryWorker::expire(domain::OrderId order_id,
                                        std::uint32_t cycle) {
  std::vector<Event> pending;
  std::size_t expired = 0;

  {
    auto txn = store_.begin(order_id, DispatchStore::LockMode::Wait);
    if (!txn) {
      return ExpiryOutcome::OrderMissing;
    }
    if (txn->order().driver_id) {
      return ExpiryOutcome::AlreadyAssigned;
    }

    domain::DispatchState* state = txn->existingDispatchState();
    if (state == nullptr) {
      return ExpiryOutcome::NotDispatched;
    }
    if (state->cycle != cycle) {
      return ExpiryOutcome::StaleCycle;
    }

    const std::int64_t now = clock_.now_ms();
    for (auto& s : txn->suggestions()) {
      if (s.cycle != cycle || s.status != domain::SuggestionStatus::Sent) {
        continue;
      }
      s.status = domain::SuggestionStatus::Expired;
      s.responded_at_ms = now;
      ++expired;
      pending.emplace_back(SuggestionResolvedEvent{
          order_id, s.driver_id, cycle, s.status, now});
    }
    if (expired == 0) {
      return ExpiryOutcome::NothingPending;
    }

    const domain::OrderStatus previous = txn->order().status;
    if (previous == domain::OrderStatus::DriverNotificationSent) {
      txn->recordStatus(domain::OrderStatus::SearchingForDriver, now);
      pending.emplace_back(OrderStatusEvent{
          order_id, previous, domain::OrderStatus::SearchingForDriver,
          std::nullopt, now});
    }
    state->next_retry_at_ms = now;
  }

  std::cout << "[OfferExpiryWorker] order " << order_id << " cycle " << cycle
            << ": expired " << expired << " offer(s)\n";
  if (sink_) {
    for (auto& event : pending) {
      sink_(std::move(event));
    }
  }
  return ExpiryOutcome::Expired;
}

}  // namespace courier
