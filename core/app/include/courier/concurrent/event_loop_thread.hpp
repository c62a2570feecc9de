#pragma once

#include "courier/concurrent/thread_safe_queue.hpp"
#include "courier/eventbus/event_bus.hpp"
#include "courier/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace courier {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains a ThreadSafeQueue<Event> and publishes
//         each event on an owned EventBus.
//
// @details
// In the dispatch engine this is the telemetry loop: the Dispatch Loop, the
// Offer Expiry Worker and the driver handlers push events from whatever
// thread they run on, and every subscriber (IPC PUB bridge, console log)
// runs serialized on this thread, never inside an order's critical section.
//
// Shutdown drains: events pushed before stop() are still published before
// the worker exits, so the last state change of a run is never lost.
//
// Thread model:
//   start()/stop() from the owning thread. push() from any thread.
//   Subscriber callbacks run on the loop thread only. The bus isolates and
//   logs subscriber exceptions, so one failing subscriber neither stops the
//   loop nor starves the others.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker thread. No-op if already running.
  void start();

  // Publishes what is still queued, then joins the worker. Idempotent.
  void stop();

  // Enqueues one event for publication on the loop thread.
  void push(Event event) { queue_.push(std::move(event)); }

  // Returns a sink bound to push(), for components that emit events.
  EventSink sink() {
    return [this](Event event) { push(std::move(event)); };
  }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

 private:
  void run();

  const std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace courier
