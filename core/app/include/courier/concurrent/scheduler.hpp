#pragma once

#include <chrono>
#include <functional>

namespace courier {

// -----------------------------------------------------------------------------
// IScheduler: deferred and periodic task execution
// -----------------------------------------------------------------------------
//
// @brief  The scheduling contract the dispatch core depends on: run the
//         Dispatch Loop on a fixed interval and fire a one-shot offer expiry
//         after the acceptance window.
//
// @details
// A task may run no earlier than its delay, on any thread, and possibly in
// parallel with other tasks. Callers must therefore not rely on ordering
// between tasks; the offer expiry path tolerates late and duplicate firings
// through its cycle check.
//
// Implementations:
//   - TimerScheduler   → timer thread plus worker pool (production).
//   - ManualScheduler  → records tasks for tests to fire explicitly.
// -----------------------------------------------------------------------------
class IScheduler {
 public:
  using Task = std::function<void()>;

  virtual ~IScheduler() = default;

  // Runs task once, no earlier than delay from now.
  virtual void scheduleAfter(std::chrono::milliseconds delay, Task task) = 0;

  // Runs task repeatedly every interval until the scheduler stops.
  virtual void scheduleEvery(std::chrono::milliseconds interval,
                             Task task) = 0;
};

}  // namespace courier
