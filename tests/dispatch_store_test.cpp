// =============================================================================
// dispatch_store_test.cpp
// =============================================================================
// Unit tests for courier::DispatchStore and courier::OrderTransaction.
//
// Validates:
//   - insertOrder() records the first history row and refuses duplicates
//   - begin() in Wait and TryOnly modes
//   - Transactions create the dispatch state lazily and id suggestions
//   - dispatchableOrderIds() filters by status and keeps busy orders
//   - liveOffersForDriver() and countByStatus()
// =============================================================================

#include "courier/store/dispatch_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace courier;
using namespace courier::domain;
using LockMode = DispatchStore::LockMode;

class DispatchStoreTest : public ::testing::Test {
 protected:
  DispatchStore store;

  Order makeOrder(OrderId id,
                  OrderStatus status = OrderStatus::SearchingForDriver) {
    Order o;
    o.id = id;
    o.status = status;
    o.customer_id = 9000;
    o.created_at_ms = 1000;
    return o;
  }

  Suggestion sentTo(DriverId driver, std::int64_t expires_at_ms) {
    Suggestion s;
    s.driver_id = driver;
    s.cycle = 1;
    s.notified_at_ms = 1000;
    s.expires_at_ms = expires_at_ms;
    return s;
  }
};

// -----------------------------------------------------------------------------
// 1. Insert stores the order with one history row; a duplicate id is refused.
// -----------------------------------------------------------------------------
TEST_F(DispatchStoreTest, InsertAndDuplicate) {
  EXPECT_TRUE(store.insertOrder(makeOrder(1), 1000));
  EXPECT_FALSE(store.insertOrder(makeOrder(1, OrderStatus::Cancelled), 2000));

  auto snapshot = store.snapshot(1);
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->order.status, OrderStatus::SearchingForDriver);
  ASSERT_EQ(snapshot->history.size(), 1u);
  EXPECT_EQ(snapshot->history[0].timestamp_ms, 1000);
  EXPECT_FALSE(snapshot->dispatch_state.has_value());

  EXPECT_TRUE(store.contains(1));
  EXPECT_FALSE(store.contains(2));
  EXPECT_FALSE(store.begin(2).has_value());
  EXPECT_EQ(store.size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Writes through a transaction are visible after it ends.
// -----------------------------------------------------------------------------
TEST_F(DispatchStoreTest, TransactionWritesAggregate) {
  store.insertOrder(makeOrder(1), 1000);
  {
    auto txn = store.begin(1);
    ASSERT_TRUE(txn.has_value());
    EXPECT_EQ(txn->existingDispatchState(), nullptr);

    txn->dispatchState().cycle = 1;
    const auto& first = txn->addSuggestion(sentTo(10, 5000));
    const SuggestionId first_id = first.id;
    const auto& second = txn->addSuggestion(sentTo(11, 5000));
    EXPECT_NE(second.id, first_id);
    EXPECT_EQ(second.order_id, 1u);

    txn->recordStatus(OrderStatus::DriverNotificationSent, 1500);
    EXPECT_TRUE(txn->hasLiveSuggestion(4999));
    EXPECT_FALSE(txn->hasLiveSuggestion(5000));
    EXPECT_EQ(txn->offeredDrivers().size(), 2u);
  }

  auto snapshot = store.snapshot(1);
  ASSERT_TRUE(snapshot->dispatch_state.has_value());
  EXPECT_EQ(snapshot->dispatch_state->order_id, 1u);
  EXPECT_EQ(snapshot->dispatch_state->cycle, 1u);
  EXPECT_TRUE(snapshot->dispatch_state->is_active);
  EXPECT_EQ(snapshot->suggestions.size(), 2u);
  EXPECT_EQ(snapshot->order.status, OrderStatus::DriverNotificationSent);
  ASSERT_EQ(snapshot->history.size(), 2u);
  EXPECT_EQ(snapshot->history[1].status, OrderStatus::DriverNotificationSent);
  EXPECT_EQ(snapshot->history[1].timestamp_ms, 1500);
}

// -----------------------------------------------------------------------------
// 3. TryOnly gives up on a held order; Wait blocks until it is released.
// Why: the loop skips busy orders, driver handlers must not.
// -----------------------------------------------------------------------------
TEST_F(DispatchStoreTest, LockModes) {
  store.insertOrder(makeOrder(1), 1000);
  store.insertOrder(makeOrder(2), 1000);

  auto held = store.begin(1);
  ASSERT_TRUE(held.has_value());

  EXPECT_FALSE(store.begin(1, LockMode::TryOnly).has_value());
  EXPECT_TRUE(store.begin(2, LockMode::TryOnly).has_value());

  std::atomic<bool> acquired{false};
  auto waiter = std::async(std::launch::async, [this, &acquired] {
    auto txn = store.begin(1, LockMode::Wait);
    acquired.store(txn.has_value());
  });

  EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(50)),
            std::future_status::timeout);
  held.reset();
  ASSERT_EQ(waiter.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_TRUE(acquired.load());
}

// -----------------------------------------------------------------------------
// 4. Only unassigned SearchingForDriver / DriverNotificationSent orders are
//    dispatchable; a locked order is listed without inspection.
// -----------------------------------------------------------------------------
TEST_F(DispatchStoreTest, DispatchableOrderIds) {
  store.insertOrder(makeOrder(5), 1000);
  store.insertOrder(makeOrder(3, OrderStatus::DriverNotificationSent), 1000);
  store.insertOrder(makeOrder(4, OrderStatus::Accepted), 1000);
  store.insertOrder(makeOrder(1, OrderStatus::Cancelled), 1000);
  Order assigned = makeOrder(2);
  assigned.driver_id = 77;
  store.insertOrder(assigned, 1000);

  EXPECT_EQ(store.dispatchableOrderIds(), (std::vector<OrderId>{3, 5}));

  auto held = store.begin(4);
  EXPECT_EQ(store.dispatchableOrderIds(), (std::vector<OrderId>{3, 4, 5}));
}

// -----------------------------------------------------------------------------
// 5. liveOffersForDriver() returns only live Sent offers of that driver.
// -----------------------------------------------------------------------------
TEST_F(DispatchStoreTest, LiveOffersForDriver) {
  store.insertOrder(makeOrder(1), 1000);
  store.insertOrder(makeOrder(2), 1000);
  {
    auto txn = store.begin(1);
    txn->addSuggestion(sentTo(10, 5000));
    txn->addSuggestion(sentTo(11, 5000));
  }
  {
    auto txn = store.begin(2);
    Suggestion rejected = sentTo(10, 5000);
    rejected.status = SuggestionStatus::Rejected;
    txn->addSuggestion(rejected);
    txn->addSuggestion(sentTo(10, 2000));
  }

  auto offers = store.liveOffersForDriver(10, 3000);
  ASSERT_EQ(offers.size(), 1u);
  EXPECT_EQ(offers[0].first.id, 1u);
  EXPECT_EQ(offers[0].second.driver_id, 10u);

  EXPECT_EQ(store.liveOffersForDriver(10, 1500).size(), 2u);
  EXPECT_TRUE(store.liveOffersForDriver(12, 1500).empty());
}

// -----------------------------------------------------------------------------
// 6. countByStatus() groups every stored order.
// -----------------------------------------------------------------------------
TEST_F(DispatchStoreTest, CountByStatus) {
  store.insertOrder(makeOrder(1), 1000);
  store.insertOrder(makeOrder(2), 1000);
  store.insertOrder(makeOrder(3, OrderStatus::Completed), 1000);

  auto counts = store.countByStatus();
  EXPECT_EQ(counts[OrderStatus::SearchingForDriver], 2u);
  EXPECT_EQ(counts[OrderStatus::Completed], 1u);
  EXPECT_EQ(counts.count(OrderStatus::Accepted), 0u);
}
