// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for courier::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO semantics and non-blocking try_pop()
//   - Blocking pop() waits for a producer
//   - close() releases blocked consumers and drains remaining items
//   - Thread-safety under concurrent multi-producer / multi-consumer load
//
// All threads are joined before assertions.
// =============================================================================

#include "courier/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  courier::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in submission order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  EXPECT_TRUE(queue.empty());

  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_EQ(queue.size(), static_cast<std::size_t>(kCount));

  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(queue.pop(), std::optional<int>(i)) << "FIFO violated at " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyAndNonEmpty) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  auto result = queue.try_pop();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 99);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. Blocking pop() waits until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] {
    auto value = queue.pop();
    received.store(value.value_or(-2));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 4. close() wakes a blocked consumer with std::nullopt.
// This is how the TimerScheduler's worker pool shuts down.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseReleasesBlockedConsumer) {
  std::atomic<bool> got_nullopt{false};

  std::thread consumer([this, &got_nullopt] {
    got_nullopt.store(!queue.pop().has_value());
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();

  EXPECT_TRUE(got_nullopt.load());
  EXPECT_TRUE(queue.closed());
}

// -----------------------------------------------------------------------------
// 5. After close(), queued items are still delivered, new pushes are refused,
//    and reopen() restores normal operation.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseDrainsThenRefuses) {
  queue.push(1);
  queue.push(2);
  queue.close();

  EXPECT_FALSE(queue.push(3));
  EXPECT_EQ(queue.pop(), std::optional<int>(1));
  EXPECT_EQ(queue.pop(), std::optional<int>(2));
  EXPECT_EQ(queue.pop(), std::nullopt);

  queue.reopen();
  EXPECT_TRUE(queue.push(4));
  EXPECT_EQ(queue.pop(), std::optional<int>(4));
}

// -----------------------------------------------------------------------------
// 6. Concurrent producers and consumers: every item is popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  // Consumers block in pop(); close() after the producers finish lets them
  // drain the rest and exit.
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &per_consumer] {
      while (auto item = queue.pop()) {
        per_consumer[c].push_back(*item);
      }
    });
  }

  for (auto& t : producers) t.join();
  queue.close();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
