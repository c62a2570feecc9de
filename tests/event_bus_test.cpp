// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for courier::EventBus and courier::EventLoopThread.
//
// Validates:
//   - Generic and typed subscriptions
//   - Unsubscribe stops delivery
//   - A throwing subscriber is counted and the others still receive the event
//   - Re-entrant publish from inside a callback does not deadlock
//   - EventLoopThread delivers on its own thread and drains on stop()
//   - A throwing subscriber does not kill the loop
// =============================================================================

#include "courier/concurrent/event_loop_thread.hpp"
#include "courier/eventbus/event_bus.hpp"
#include "courier/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using courier::domain::OrderStatus;

class EventBusTest : public ::testing::Test {
 protected:
  courier::EventBus bus;

  static courier::OrderStatusEvent makeStatus(std::uint64_t order_id) {
    courier::OrderStatusEvent e;
    e.order_id = order_id;
    e.previous = OrderStatus::SearchingForDriver;
    e.current = OrderStatus::DriverNotificationSent;
    e.timestamp_ms = 1000;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const courier::Event&) { ++call_count; });

  bus.publish(makeStatus(1));
  bus.publish(courier::DispatchOfferEvent{1, 1, {10, 11}, 5000});
  bus.publish(courier::DispatchExhaustedEvent{1, 3, 9000});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its type and sees the payload intact.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByType) {
  std::vector<courier::DispatchOfferEvent> offers;
  bus.subscribe<courier::DispatchOfferEvent>(
      [&offers](const courier::DispatchOfferEvent& e) { offers.push_back(e); });

  bus.publish(makeStatus(1));
  bus.publish(courier::DispatchOfferEvent{7, 2, {10, 11, 12}, 5000});

  ASSERT_EQ(offers.size(), 1u);
  EXPECT_EQ(offers[0].order_id, 7u);
  EXPECT_EQ(offers[0].cycle, 2u);
  EXPECT_EQ(offers[0].driver_ids, (std::vector<std::uint64_t>{10, 11, 12}));
}

// -----------------------------------------------------------------------------
// 3. Unsubscribe stops delivery; unknown ids are ignored.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int count = 0;
  auto id = bus.subscribe([&count](const courier::Event&) { ++count; });

  bus.publish(makeStatus(1));
  EXPECT_TRUE(bus.unsubscribe(id));
  EXPECT_FALSE(bus.unsubscribe(12345));
  bus.publish(makeStatus(2));

  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. A callback may publish on the same bus without deadlocking.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ReentrantPublishDoesNotDeadlock) {
  int exhausted = 0;
  bus.subscribe<courier::DispatchExhaustedEvent>(
      [&exhausted](const courier::DispatchExhaustedEvent&) { ++exhausted; });
  bus.subscribe<courier::OrderStatusEvent>(
      [this](const courier::OrderStatusEvent& e) {
        bus.publish(courier::DispatchExhaustedEvent{e.order_id, 3, 0});
      });

  bus.publish(makeStatus(5));
  EXPECT_EQ(exhausted, 1);
}

// -----------------------------------------------------------------------------
// 5. A throwing subscriber does not stop delivery to the ones after it.
// Why: the IPC bridge can throw on a socket error; the console log must
//      still see the event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, FailingSubscriberIsIsolated) {
  std::vector<std::uint64_t> logged;
  bus.subscribe(
      [](const courier::Event&) { throw std::runtime_error("EAGAIN"); },
      "ipc");
  bus.subscribe<courier::OrderStatusEvent>(
      [&logged](const courier::OrderStatusEvent& e) {
        logged.push_back(e.order_id);
      },
      "console");

  EXPECT_EQ(bus.publish(makeStatus(1)), 1u);
  EXPECT_EQ(bus.publish(makeStatus(2)), 1u);

  EXPECT_EQ(logged, (std::vector<std::uint64_t>{1, 2}));
  EXPECT_EQ(bus.failureCount(), 2u);
}

// -----------------------------------------------------------------------------
// 6. EventLoopThread publishes on its worker thread.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DeliversOnLoopThread) {
  courier::EventLoopThread loop("Test");
  std::promise<std::thread::id> delivered_on;
  auto future = delivered_on.get_future();

  loop.eventBus().subscribe<courier::DispatchExhaustedEvent>(
      [&delivered_on](const courier::DispatchExhaustedEvent&) {
        delivered_on.set_value(std::this_thread::get_id());
      });

  loop.start();
  loop.push(courier::DispatchExhaustedEvent{1, 3, 0});

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
}

// -----------------------------------------------------------------------------
// 7. Events pushed before stop() are all published, even if the loop never
//    got to them while running.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StopDrainsQueuedEvents) {
  courier::EventLoopThread loop("Test");
  std::atomic<int> seen{0};
  loop.eventBus().subscribe([&seen](const courier::Event&) { ++seen; });

  auto sink = loop.sink();
  for (int i = 0; i < 50; ++i) {
    sink(courier::DispatchExhaustedEvent{static_cast<std::uint64_t>(i), 3, 0});
  }
  loop.start();
  loop.stop();

  EXPECT_EQ(seen.load(), 50);
}

// -----------------------------------------------------------------------------
// 8. A subscriber that throws is logged and counted; the loop keeps going
//    and the other subscriber sees both events.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, ThrowingSubscriberDoesNotStopLoop) {
  courier::EventLoopThread loop("Test");
  std::atomic<int> seen{0};
  loop.eventBus().subscribe<courier::DispatchExhaustedEvent>(
      [](const courier::DispatchExhaustedEvent& e) {
        if (e.order_id == 1) {
          throw std::runtime_error("subscriber bug");
        }
      });
  loop.eventBus().subscribe([&seen](const courier::Event&) { ++seen; });

  loop.start();
  loop.push(courier::DispatchExhaustedEvent{1, 3, 0});
  loop.push(courier::DispatchExhaustedEvent{2, 3, 0});
  loop.stop();

  EXPECT_EQ(seen.load(), 2);
  EXPECT_EQ(loop.eventBus().failureCount(), 1u);
}
