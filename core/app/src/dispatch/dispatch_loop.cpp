#include "courier/dispatch/dispatch_loop.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace courier {

const char* toString(PassOutcome outcome) {
  switch (outcome) {
    case PassOutcome::Missing:         return "Missing";
    case PassOutcome::LockBusy:        return "LockBusy";
    case PassOutcome::NotDispatchable: return "NotDispatchable";
    case PassOutcome::Inactive:        return "Inactive";
    case PassOutcome::RetryPending:    return "RetryPending";
    case PassOutcome::CycleInFlight:   return "CycleInFlight";
    case PassOutcome::Exhausted:       return "Exhausted";
    case PassOutcome::NoCandidates:    return "NoCandidates";
    case PassOutcome::Broadcast:       return "Broadcast";
  }
  return "Unknown";
}

DispatchLoop::DispatchLoop(DispatchStore& store,
                           const matching::CandidateSelector& selector,
                           OfferExpiryWorker& expiry_worker,
                           IScheduler& scheduler, INotificationSender& notifier,
                           const ITimeProvider& clock,
                           const domain::DispatchConfig& config,
                           EventSink sink)
    : store_(store),
      selector_(selector),
      expiry_worker_(expiry_worker),
      scheduler_(scheduler),
      notifier_(notifier),
      clock_(clock),
      config_(config),
      sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// runOnce(): one scheduler tick
// -----------------------------------------------------------------------------
LoopTickSummary DispatchLoop::runOnce() {
  LoopTickSummary summary;
  for (domain::OrderId id : store_.dispatchableOrderIds()) {
    ++summary.scanned;
    switch (processOrder(id)) {
      case PassOutcome::Broadcast:
        ++summary.broadcasts;
        break;
      case PassOutcome::NoCandidates:
        ++summary.no_candidates;
        break;
      case PassOutcome::Exhausted:
        ++summary.exhausted;
        break;
      case PassOutcome::LockBusy:
        ++summary.busy;
        break;
      default:
        break;
    }
  }
  return summary;
}

// -----------------------------------------------------------------------------
// processOrder(): one pass over one order
// -----------------------------------------------------------------------------
PassOutcome DispatchLoop::processOrder(domain::OrderId order_id) {
  std::vector<Event> pending;
  std::optional<DispatchOffer> offer;
  PassOutcome outcome;

  {
    auto txn = store_.begin(order_id, DispatchStore::LockMode::TryOnly);
    if (!txn) {
      return store_.contains(order_id) ? PassOutcome::LockBusy
                                       : PassOutcome::Missing;
    }
    outcome = advance(*txn, pending, offer);
  }

  // Committed. Everything below runs without the order's lock.
  if (sink_) {
    for (auto& event : pending) {
      sink_(std::move(event));
    }
  }

  if (outcome == PassOutcome::Exhausted) {
    std::cerr << "[DispatchLoop] order " << order_id
              << " exhausted its dispatch cycles; matching deactivated\n";
  }
  if (outcome != PassOutcome::Broadcast) {
    return outcome;
  }

  const std::uint32_t cycle = offer->cycle;
  scheduler_.scheduleAfter(
      std::chrono::milliseconds(config_.acceptanceWindowMs()),
      [worker = &expiry_worker_, order_id, cycle] {
        worker->expire(order_id, cycle);
      });

  std::cout << "[DispatchLoop] order " << order_id << " cycle " << cycle
            << ": offered to " << offer->driver_ids.size() << " driver(s)\n";

  notify(*offer);
  return PassOutcome::Broadcast;
}

// -----------------------------------------------------------------------------
// advance(): the locked part of a pass (steps 1-7)
// -----------------------------------------------------------------------------
PassOutcome DispatchLoop::advance(OrderTransaction& txn,
                                  std::vector<Event>& pending,
                                  std::optional<DispatchOffer>& offer) {
  domain::Order& order = txn.order();
  if (!domain::isDispatchable(order.status) || order.driver_id) {
    return PassOutcome::NotDispatchable;
  }

  const std::int64_t now = clock_.now_ms();
  domain::DispatchState& state = txn.dispatchState();

  if (!state.is_active) {
    return PassOutcome::Inactive;
  }
  if (state.next_retry_at_ms && *state.next_retry_at_ms > now) {
    return PassOutcome::RetryPending;
  }
  if (txn.hasLiveSuggestion(now)) {
    return PassOutcome::CycleInFlight;
  }

  if (state.cycle >= config_.max_cycles) {
    state.is_active = false;
    pending.emplace_back(DispatchExhaustedEvent{order.id, state.cycle, now});
    return PassOutcome::Exhausted;
  }

  auto candidates = selector_.selectCandidates(order, txn.offeredDrivers());
  if (candidates.empty()) {
    // Supply gap: no cycle is consumed, so an order with no nearby drivers
    // retries every retry_delay for as long as it stays open.
    state.next_retry_at_ms = now + config_.retryDelayMs();
    return PassOutcome::NoCandidates;
  }
  if (candidates.size() > config_.suggestion_limit) {
    candidates.resize(config_.suggestion_limit);
  }

  state.cycle += 1;
  const std::int64_t expires_at = now + config_.acceptanceWindowMs();

  offer = DispatchOffer{order.id, state.cycle, {}, expires_at};
  for (const auto& candidate : candidates) {
    domain::Suggestion suggestion;
    suggestion.driver_id = candidate.driver_id;
    suggestion.cycle = state.cycle;
    suggestion.distance_km = candidate.distance_km;
    suggestion.notified_at_ms = now;
    suggestion.expires_at_ms = expires_at;
    txn.addSuggestion(suggestion);
    offer->driver_ids.push_back(candidate.driver_id);
  }

  state.last_dispatched_at_ms = now;
  state.next_retry_at_ms = now + config_.retryDelayMs();

  const domain::OrderStatus previous = order.status;
  if (previous != domain::OrderStatus::DriverNotificationSent) {
    txn.recordStatus(domain::OrderStatus::DriverNotificationSent, now);
    pending.emplace_back(OrderStatusEvent{
        order.id, previous, domain::OrderStatus::DriverNotificationSent,
        std::nullopt, now});
  }
  return PassOutcome::Broadcast;
}

void DispatchLoop::notify(const DispatchOffer& offer) {
  try {
    notifier_.notifyDrivers(offer);
  } catch (const std::exception& e) {
    std::cerr << "[DispatchLoop] notification for order " << offer.order_id
              << " failed: " << e.what() << "\n";
  }
}

}  // namespace courier
