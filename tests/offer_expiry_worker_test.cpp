// =============================================================================
// offer_expiry_worker_test.cpp
// =============================================================================
// Unit tests for courier::OfferExpiryWorker.
//
// Validates:
//   - Unanswered offers expire and the order reverts to SearchingForDriver
//   - Rejected offers are left alone
//   - Firings for a superseded cycle are no-ops
//   - Firings after assignment are no-ops
//   - Duplicate firings are harmless
// =============================================================================

#include "support/dispatch_fixture.hpp"

#include <gtest/gtest.h>

using namespace courier;
using namespace courier::domain;

class OfferExpiryWorkerTest : public test::DispatchFixture {
 protected:
  // Broadcasts order 100 to drivers 1 and 2.
  void broadcastToTwo() {
    addDriver(1, 0.01);
    addDriver(2, 0.02);
    addOrder(100);
    ASSERT_EQ(loop->processOrder(100), PassOutcome::Broadcast);
  }
};

// -----------------------------------------------------------------------------
// 1. Both offers lapse: both Expired, order back to SearchingForDriver,
//    next retry allowed immediately.
// -----------------------------------------------------------------------------
TEST_F(OfferExpiryWorkerTest, ExpiresUnansweredCycle) {
  broadcastToTwo();

  ASSERT_EQ(expireCurrentOffers(), 1u);
  const std::int64_t fired_at = clock.now_ms();

  OrderSnapshot s = snap(100);
  EXPECT_EQ(s.order.status, OrderStatus::SearchingForDriver);
  EXPECT_EQ(s.dispatch_state->next_retry_at_ms, fired_at);
  EXPECT_TRUE(s.dispatch_state->is_active);
  for (const auto& sug : s.suggestions) {
    EXPECT_EQ(sug.status, SuggestionStatus::Expired);
    EXPECT_EQ(sug.responded_at_ms, fired_at);
  }
  EXPECT_EQ(s.history.back().status, OrderStatus::SearchingForDriver);

  EXPECT_EQ(eventsOf<SuggestionResolvedEvent>().size(), 2u);
  auto status_events = eventsOf<OrderStatusEvent>();
  ASSERT_FALSE(status_events.empty());
  EXPECT_EQ(status_events.back().current, OrderStatus::SearchingForDriver);
}

// -----------------------------------------------------------------------------
// 2. A rejected offer keeps its Rejected status; only Sent ones expire.
// -----------------------------------------------------------------------------
TEST_F(OfferExpiryWorkerTest, LeavesRespondedOffersAlone) {
  broadcastToTwo();
  ASSERT_TRUE(handler->rejectOrder(100, 2).ok());

  expireCurrentOffers();

  EXPECT_EQ(suggestionsWith(100, SuggestionStatus::Rejected).size(), 1u);
  EXPECT_EQ(suggestionsWith(100, SuggestionStatus::Expired).size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. A timer carrying an old cycle number does nothing.
// Why: a late or duplicated firing must not expire the next cycle's offers.
// -----------------------------------------------------------------------------
TEST_F(OfferExpiryWorkerTest, StaleCycleIsNoOp) {
  broadcastToTwo();
  {
    auto txn = store.begin(100);
    txn->dispatchState().cycle = 2;
  }

  EXPECT_EQ(expiry->expire(100, 1), ExpiryOutcome::StaleCycle);
  EXPECT_EQ(suggestionsWith(100, SuggestionStatus::Sent).size(), 2u);
  EXPECT_EQ(snap(100).order.status, OrderStatus::DriverNotificationSent);
}

// -----------------------------------------------------------------------------
// 4. Once a driver has accepted, the expiry firing is a no-op.
// -----------------------------------------------------------------------------
TEST_F(OfferExpiryWorkerTest, AssignedOrderIsNoOp) {
  broadcastToTwo();
  ASSERT_TRUE(handler->acceptOrder(100, 1).ok());

  clock.advance_by(config.acceptanceWindowMs());
  EXPECT_EQ(expiry->expire(100, 1), ExpiryOutcome::AlreadyAssigned);

  OrderSnapshot s = snap(100);
  EXPECT_EQ(s.order.status, OrderStatus::Accepted);
  EXPECT_EQ(suggestionsWith(100, SuggestionStatus::Accepted).size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. The same timer delivered twice changes the order once.
// -----------------------------------------------------------------------------
TEST_F(OfferExpiryWorkerTest, DuplicateFiringIsHarmless) {
  broadcastToTwo();
  clock.advance_by(config.acceptanceWindowMs());

  scheduler.replayAll();
  const std::size_t history_after_first = snap(100).history.size();
  scheduler.replayAll();

  EXPECT_EQ(snap(100).history.size(), history_after_first);
  EXPECT_EQ(expiry->expire(100, 1), ExpiryOutcome::NothingPending);
  EXPECT_EQ(eventsOf<SuggestionResolvedEvent>().size(), 2u);
}

// -----------------------------------------------------------------------------
// 6. Unknown and never-dispatched orders are reported, not touched.
// -----------------------------------------------------------------------------
TEST_F(OfferExpiryWorkerTest, MissingOrUndispatchedOrder) {
  addOrder(100);

  EXPECT_EQ(expiry->expire(999, 1), ExpiryOutcome::OrderMissing);
  EXPECT_EQ(expiry->expire(100, 1), ExpiryOutcome::NotDispatched);
  EXPECT_FALSE(snap(100).dispatch_state.has_value());
}
