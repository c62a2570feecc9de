#pragma once

#include "courier/concurrent/scheduler.hpp"
#include "courier/dispatch/i_notification_sender.hpp"
#include "courier/dispatch/offer_expiry_worker.hpp"
#include "courier/domain/dispatch_config.hpp"
#include "courier/events/event.hpp"
#include "courier/matching/candidate_selector.hpp"
#include "courier/store/dispatch_store.hpp"
#include "courier/time/i_time_provider.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace courier {

// Result of one loop pass over one order.
enum class PassOutcome {
  Missing,          // Unknown order id
  LockBusy,         // Held by another actor; retried on the next tick
  NotDispatchable,  // Assigned, or no longer searching
  Inactive,         // Dispatch state deactivated earlier
  RetryPending,     // next_retry_at is in the future
  CycleInFlight,    // A Sent offer is still live
  Exhausted,        // max_cycles reached; deactivated on this pass
  NoCandidates,     // Nobody eligible nearby; retry later, cycle kept
  Broadcast,        // New cycle offered to candidates
};

const char* toString(PassOutcome outcome);

// Counters of one runOnce() call.
struct LoopTickSummary {
  std::size_t scanned{0};
  std::size_t broadcasts{0};
  std::size_t no_candidates{0};
  std::size_t exhausted{0};
  std::size_t busy{0};
};

// -----------------------------------------------------------------------------
// DispatchLoop
// -----------------------------------------------------------------------------
//
// @brief  Advances every open order through the matching protocol, one pass
//         per tick.
//
// @details
// runOnce() is triggered by the scheduler on a fixed interval. It takes the
// ids of unassigned SearchingForDriver/DriverNotificationSent orders and runs
// processOrder() on each. A pass, under the order's lock:
//
//   1. inactive dispatch state            → skip
//   2. next_retry_at in the future        → skip
//   3. a Sent offer still live            → skip (no double broadcast)
//   4. cycle >= max_cycles                → deactivate, skip
//   5. select candidates, excluding every driver offered in any cycle
//   6. none                               → next_retry_at = now + retry delay
//   7. otherwise                          → cycle + 1, top suggestion_limit
//      candidates get a Sent offer expiring after the acceptance window,
//      timestamps updated, status → DriverNotificationSent.
//
// After the lock is released a broadcast schedules the Offer Expiry Worker
// for (order, cycle) and hands the offer to the notification sender. A
// notification failure is logged; the broadcast stands.
//
// The loop is stateless between ticks; everything lives in DispatchStore.
// The pass never waits for an order's lock: a busy order is simply picked up
// on the next tick.
//
// Thread model:
//   runOnce()/processOrder() may run concurrently on several scheduler
//   workers; correctness rests on the per-order lock.
//
// Ownership:
//   Non-owning references to every collaborator; the engine owns them all
//   and stops the scheduler before destroying any of them.
// -----------------------------------------------------------------------------
class DispatchLoop {
 public:
  DispatchLoop(DispatchStore& store,
               const matching::CandidateSelector& selector,
               OfferExpiryWorker& expiry_worker, IScheduler& scheduler,
               INotificationSender& notifier, const ITimeProvider& clock,
               const domain::DispatchConfig& config, EventSink sink = {});

  DispatchLoop(const DispatchLoop&) = delete;
  DispatchLoop& operator=(const DispatchLoop&) = delete;

  LoopTickSummary runOnce();

  PassOutcome processOrder(domain::OrderId order_id);

 private:
  PassOutcome advance(OrderTransaction& txn, std::vector<Event>& pending,
                      std::optional<DispatchOffer>& offer);
  void notify(const DispatchOffer& offer);

  DispatchStore& store_;
  const matching::CandidateSelector& selector_;
  OfferExpiryWorker& expiry_worker_;
  IScheduler& scheduler_;
  INotificationSender& notifier_;
  const ITimeProvider& clock_;
  const domain::DispatchConfig config_;
  EventSink sink_;
};

}  // namespace courier
