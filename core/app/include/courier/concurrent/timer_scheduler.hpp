#pragma once

#include "courier/concurrent/scheduler.hpp"
#include "courier/concurrent/thread_safe_queue.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace courier {

// -----------------------------------------------------------------------------
// TimerScheduler
// -----------------------------------------------------------------------------
//
// @brief  In-process IScheduler: one timer thread orders deadlines, a pool of
//         worker threads runs whatever is due.
//
// @details
// The timer thread sleeps on a condition variable until the earliest
// deadline (or until a new, earlier timer is added), moves every due task
// into the ready queue and re-arms periodic timers. Workers block on the
// ready queue, so a long Dispatch Loop tick never delays an expiry firing as
// long as another worker is idle.
//
// Periodic timers run at a fixed rate. If a tick overruns its interval the
// next deadline is computed from "now" so ticks do not pile up.
//
// Thread model:
//   start()/stop() from the owning thread. scheduleAfter()/scheduleEvery()
//   from any thread, before or after start(); timers registered before
//   start() fire once the scheduler runs.
//
// Shutdown:
//   stop() discards timers that have not come due, lets workers finish the
//   tasks already in the ready queue and joins every thread. An exception
//   escaping a task is logged to stderr; the worker survives.
// -----------------------------------------------------------------------------
class TimerScheduler final : public IScheduler {
 public:
  explicit TimerScheduler(std::size_t worker_count = 2);
  ~TimerScheduler() override;

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  // Spawns the timer thread and the worker pool. No-op if already running.
  void start();

  // Joins every thread. Idempotent.
  void stop();

  void scheduleAfter(std::chrono::milliseconds delay, Task task) override;
  void scheduleEvery(std::chrono::milliseconds interval, Task task) override;

  // Number of timers that have not come due yet (periodic timers count once).
  std::size_t pendingTimers() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct TimerEntry {
    Clock::time_point due;
    std::uint64_t sequence{0};
    Task task;
    std::chrono::milliseconds interval{0};  // zero for one-shot timers
  };

  // Min-heap on (due, sequence): equal deadlines fire in submission order.
  struct LaterFirst {
    bool operator()(const TimerEntry& a, const TimerEntry& b) const {
      if (a.due != b.due) {
        return a.due > b.due;
      }
      return a.sequence > b.sequence;
    }
  };

  void addTimer(Clock::time_point due, std::chrono::milliseconds interval,
                Task task);
  void timerLoop();
  void workerLoop();

  const std::size_t worker_count_;

  mutable std::mutex mutex_;  // Protects timers_, next_sequence_, running_
  std::condition_variable timer_cv_;
  std::priority_queue<TimerEntry, std::vector<TimerEntry>, LaterFirst> timers_;
  std::uint64_t next_sequence_{0};
  bool running_{false};

  ThreadSafeQueue<Task> ready_;
  std::thread timer_thread_;
  std::vector<std::thread> workers_;
};

}  // namespace courier
