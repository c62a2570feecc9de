// =============================================================================
// dispatch_loop_test.cpp
// =============================================================================
// Unit tests for courier::DispatchLoop.
//
// Validates:
//   - A pass broadcasts to the nearest suggestion_limit candidates
//   - Repeated ticks inside a live cycle change nothing
//   - No candidates: no cycle consumed, retry deferred
//   - Exhaustion after max_cycles, even with candidates available
//   - Offer expiry is scheduled with the acceptance window as delay
//   - Notification failure does not undo the committed broadcast
//   - Busy and inactive orders are skipped
//
// Every test runs on DispatchFixture: simulated time, manual scheduler.
// =============================================================================

#include "support/dispatch_fixture.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using namespace courier;
using namespace courier::domain;

class DispatchLoopTest : public test::DispatchFixture {};

// -----------------------------------------------------------------------------
// 1. Three eligible drivers, limit 2: the two nearest get a Sent offer, the
//    order moves to DriverNotificationSent and the cycle becomes 1.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, BroadcastToNearestWithinLimit) {
  DispatchConfig cfg;
  cfg.suggestion_limit = 2;
  build(cfg);

  addDriver(1, 0.03);
  addDriver(2, 0.01);
  addDriver(3, 0.02);
  addOrder(100);

  LoopTickSummary summary = loop->runOnce();
  EXPECT_EQ(summary.scanned, 1u);
  EXPECT_EQ(summary.broadcasts, 1u);

  OrderSnapshot s = snap(100);
  EXPECT_EQ(s.order.status, OrderStatus::DriverNotificationSent);
  ASSERT_TRUE(s.dispatch_state.has_value());
  EXPECT_EQ(s.dispatch_state->cycle, 1u);
  EXPECT_EQ(s.dispatch_state->last_dispatched_at_ms, test::kStartMs);
  EXPECT_EQ(s.dispatch_state->next_retry_at_ms,
            test::kStartMs + config.retryDelayMs());

  ASSERT_EQ(s.suggestions.size(), 2u);
  EXPECT_EQ(s.suggestions[0].driver_id, 2u);
  EXPECT_EQ(s.suggestions[1].driver_id, 3u);
  for (const auto& sug : s.suggestions) {
    EXPECT_EQ(sug.status, SuggestionStatus::Sent);
    EXPECT_EQ(sug.cycle, 1u);
    EXPECT_EQ(sug.expires_at_ms, test::kStartMs + config.acceptanceWindowMs());
  }

  auto offers = notifier.offers();
  ASSERT_EQ(offers.size(), 1u);
  EXPECT_EQ(offers[0].driver_ids, (std::vector<DriverId>{2, 3}));

  auto status_events = eventsOf<OrderStatusEvent>();
  ASSERT_EQ(status_events.size(), 1u);
  EXPECT_EQ(status_events[0].previous, OrderStatus::SearchingForDriver);
  EXPECT_EQ(status_events[0].current, OrderStatus::DriverNotificationSent);
}

// -----------------------------------------------------------------------------
// 2. The expiry callback is scheduled for exactly the acceptance window.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, SchedulesExpiryAfterWindow) {
  addDriver(1, 0.01);
  addOrder(100);

  loop->runOnce();

  ASSERT_EQ(scheduler.pendingOneShots(), 1u);
  EXPECT_EQ(scheduler.pendingDelays()[0],
            std::chrono::milliseconds(config.acceptanceWindowMs()));
}

// -----------------------------------------------------------------------------
// 3. While offers are live, more ticks are no-ops.
// Why: the loop runs every second; an order must not be re-broadcast while
//      drivers are still deciding.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, IdempotentWhileCycleLive) {
  addDriver(1, 0.01);
  addDriver(2, 0.02);
  addOrder(100);

  loop->runOnce();
  clock.advance_by(config.retryDelayMs());
  EXPECT_EQ(loop->processOrder(100), PassOutcome::CycleInFlight);
  loop->runOnce();

  OrderSnapshot s = snap(100);
  EXPECT_EQ(s.dispatch_state->cycle, 1u);
  EXPECT_EQ(s.suggestions.size(), 2u);
  EXPECT_EQ(notifier.offers().size(), 1u);
  EXPECT_EQ(scheduler.pendingOneShots(), 1u);
}

// -----------------------------------------------------------------------------
// 4. No candidates: no cycle is used, the retry is pushed out by retry_delay
//    and the order keeps searching.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, NoCandidatesDefersWithoutConsumingCycle) {
  addOrder(100);

  EXPECT_EQ(loop->processOrder(100), PassOutcome::NoCandidates);

  OrderSnapshot s = snap(100);
  EXPECT_EQ(s.order.status, OrderStatus::SearchingForDriver);
  EXPECT_EQ(s.dispatch_state->cycle, 0u);
  EXPECT_EQ(s.dispatch_state->next_retry_at_ms,
            test::kStartMs + config.retryDelayMs());
  EXPECT_TRUE(s.suggestions.empty());

  EXPECT_EQ(loop->processOrder(100), PassOutcome::RetryPending);

  clock.advance_by(config.retryDelayMs());
  addDriver(1, 0.01);
  EXPECT_EQ(loop->processOrder(100), PassOutcome::Broadcast);
  EXPECT_EQ(snap(100).dispatch_state->cycle, 1u);
}

// -----------------------------------------------------------------------------
// 5. max_cycles = 3: three broadcasts expire unanswered, the fourth pass
//    deactivates the order although driver 4 is still available.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, ExhaustsAfterMaxCycles) {
  DispatchConfig cfg;
  cfg.suggestion_limit = 1;
  cfg.max_cycles = 3;
  build(cfg);

  for (DriverId id = 1; id <= 4; ++id) {
    addDriver(id, 0.01 * static_cast<double>(id));
  }
  addOrder(100);

  for (std::uint32_t cycle = 1; cycle <= 3; ++cycle) {
    ASSERT_EQ(loop->processOrder(100), PassOutcome::Broadcast);
    EXPECT_EQ(snap(100).dispatch_state->cycle, cycle);
    ASSERT_EQ(expireCurrentOffers(), 1u);
    // The window is as long as the staleness threshold: refresh every fix.
    for (DriverId id = 1; id <= 4; ++id) {
      registry.updateLocation(id,
                              GeoPoint{test::kPickupLat + 0.01 * id,
                                       test::kPickupLng},
                              clock.now_ms(), clock.now_ms());
    }
  }

  LoopTickSummary summary = loop->runOnce();
  EXPECT_EQ(summary.exhausted, 1u);
  EXPECT_EQ(summary.broadcasts, 0u);

  OrderSnapshot s = snap(100);
  EXPECT_FALSE(s.dispatch_state->is_active);
  EXPECT_EQ(s.dispatch_state->cycle, 3u);
  EXPECT_EQ(s.suggestions.size(), 3u);
  EXPECT_EQ(notifier.offers().size(), 3u);
  EXPECT_EQ(s.order.status, OrderStatus::SearchingForDriver);

  auto exhausted = eventsOf<DispatchExhaustedEvent>();
  ASSERT_EQ(exhausted.size(), 1u);
  EXPECT_EQ(exhausted[0].cycle, 3u);

  // Later ticks neither broadcast nor re-announce exhaustion.
  clock.advance_by(config.retryDelayMs());
  EXPECT_EQ(loop->processOrder(100), PassOutcome::Inactive);
  EXPECT_EQ(eventsOf<DispatchExhaustedEvent>().size(), 1u);
}

// -----------------------------------------------------------------------------
// 6. A second cycle skips drivers already offered in the first.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, NextCycleExcludesPreviouslyOffered) {
  DispatchConfig cfg;
  cfg.suggestion_limit = 2;
  build(cfg);

  addDriver(1, 0.01);
  addDriver(2, 0.02);
  addDriver(3, 0.03);
  addOrder(100);

  loop->runOnce();
  expireCurrentOffers();
  registry.updateLocation(3, GeoPoint{test::kPickupLat + 0.03,
                                      test::kPickupLng},
                          clock.now_ms(), clock.now_ms());
  registry.updateLocation(1, GeoPoint{test::kPickupLat + 0.01,
                                      test::kPickupLng},
                          clock.now_ms(), clock.now_ms());
  ASSERT_EQ(loop->processOrder(100), PassOutcome::Broadcast);

  auto offers = notifier.offers();
  ASSERT_EQ(offers.size(), 2u);
  EXPECT_EQ(offers[1].cycle, 2u);
  EXPECT_EQ(offers[1].driver_ids, (std::vector<DriverId>{3}));
}

// -----------------------------------------------------------------------------
// 7. A failing push gateway is logged; the broadcast stays committed and the
//    expiry is still scheduled.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, NotificationFailureKeepsBroadcast) {
  notifier.setFailing(true);
  addDriver(1, 0.01);
  addOrder(100);

  EXPECT_EQ(loop->processOrder(100), PassOutcome::Broadcast);

  OrderSnapshot s = snap(100);
  EXPECT_EQ(s.order.status, OrderStatus::DriverNotificationSent);
  EXPECT_EQ(s.suggestions.size(), 1u);
  EXPECT_EQ(scheduler.pendingOneShots(), 1u);
}

// -----------------------------------------------------------------------------
// 8. A tick skips an order another actor holds and picks it up next tick.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, SkipsLockedOrder) {
  addDriver(1, 0.01);
  addOrder(100);

  {
    auto held = store.begin(100);
    LoopTickSummary summary = loop->runOnce();
    EXPECT_EQ(summary.busy, 1u);
    EXPECT_EQ(summary.broadcasts, 0u);
  }

  EXPECT_EQ(loop->runOnce().broadcasts, 1u);
  EXPECT_EQ(loop->processOrder(999), PassOutcome::Missing);
}

// -----------------------------------------------------------------------------
// 9. Assigned or closed orders are not dispatched.
// -----------------------------------------------------------------------------
TEST_F(DispatchLoopTest, IgnoresNonDispatchableOrders) {
  addDriver(1, 0.01);
  addOrder(100);
  {
    auto txn = store.begin(100);
    txn->recordStatus(OrderStatus::Cancelled, clock.now_ms());
  }

  EXPECT_EQ(loop->runOnce().scanned, 0u);
  EXPECT_EQ(loop->processOrder(100), PassOutcome::NotDispatchable);
  EXPECT_TRUE(notifier.offers().empty());
}
