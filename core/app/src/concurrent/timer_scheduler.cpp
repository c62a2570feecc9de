#include "courier/concurrent/timer_scheduler.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace courier {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
TimerScheduler::TimerScheduler(std::size_t worker_count)
    : worker_count_(worker_count == 0 ? 1 : worker_count) {}

TimerScheduler::~TimerScheduler() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the timer thread and the worker pool
// -----------------------------------------------------------------------------
void TimerScheduler::start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
  }

  ready_.reopen();

  workers_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this] { workerLoop(); });
  }
  timer_thread_ = std::thread([this] { timerLoop(); });
}

// -----------------------------------------------------------------------------
// stop(): drop undue timers, drain ready tasks, join everything
// -----------------------------------------------------------------------------
void TimerScheduler::stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    timers_ = {};
  }
  timer_cv_.notify_all();

  if (timer_thread_.joinable()) {
    timer_thread_.join();
  }

  // Workers finish what is already queued, then pop() returns nullopt.
  ready_.close();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

// -----------------------------------------------------------------------------
// scheduleAfter() / scheduleEvery()
// -----------------------------------------------------------------------------
void TimerScheduler::scheduleAfter(std::chrono::milliseconds delay,
                                   Task task) {
  addTimer(Clock::now() + delay, std::chrono::milliseconds{0},
           std::move(task));
}

void TimerScheduler::scheduleEvery(std::chrono::milliseconds interval,
                                   Task task) {
  if (interval.count() <= 0) {
    interval = std::chrono::milliseconds{1};
  }
  addTimer(Clock::now() + interval, interval, std::move(task));
}

std::size_t TimerScheduler::pendingTimers() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

void TimerScheduler::addTimer(Clock::time_point due,
                              std::chrono::milliseconds interval, Task task) {
  {
    std::lock_guard lock(mutex_);
    timers_.push(TimerEntry{due, next_sequence_++, std::move(task), interval});
  }
  // The new timer may be earlier than the one the timer thread sleeps on.
  timer_cv_.notify_one();
}

// -----------------------------------------------------------------------------
// timerLoop(): move due tasks to the ready queue
// -----------------------------------------------------------------------------
void TimerScheduler::timerLoop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (timers_.empty()) {
      timer_cv_.wait(lock, [this] { return !running_ || !timers_.empty(); });
      continue;
    }

    const auto next_due = timers_.top().due;
    if (Clock::now() < next_due) {
      timer_cv_.wait_until(lock, next_due);
      continue;
    }

    TimerEntry entry = timers_.top();
    timers_.pop();

    if (entry.interval.count() > 0) {
      TimerEntry again = entry;
      again.due += entry.interval;
      const auto now = Clock::now();
      if (again.due <= now) {
        again.due = now + entry.interval;
      }
      again.sequence = next_sequence_++;
      timers_.push(std::move(again));
    }

    ready_.push(std::move(entry.task));
  }
}

// -----------------------------------------------------------------------------
// workerLoop(): run ready tasks until the queue is closed and drained
// -----------------------------------------------------------------------------
void TimerScheduler::workerLoop() {
  while (auto task = ready_.pop()) {
    if (!*task) {
      continue;
    }
    try {
      (*task)();
    } catch (const std::exception& e) {
      std::cerr << "[TimerScheduler] task failed: " << e.what() << "\n";
    }
  }
}

}  // namespace courier
