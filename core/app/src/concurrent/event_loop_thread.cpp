#include "courier/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace courier {

namespace {

// Idle wait before re-checking running_. Keeps stop() responsive without
// busy-waiting on an empty queue.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

// -----------------------------------------------------------------------------
// Destructor: the worker must not outlive the queue and bus it reads.
// -----------------------------------------------------------------------------
EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  // Final drain: events pushed before stop() was requested.
  while (auto event = queue_.try_pop()) {
    bus_.publish(*event);
  }

  if (bus_.failureCount() > 0) {
    std::cerr << "[" << name_ << "] stopped after " << bus_.failureCount()
              << " subscriber failure(s)\n";
  }
}

}  // namespace courier
