#pragma once

#include "courier/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace courier {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Publish-subscribe channel for dispatch telemetry.
//
// @details
// Subscribers in the engine: the IPC PUB bridge ("ipc"), the daemon's
// console log, and test probes. The telemetry EventLoopThread is the only
// publisher.
//
// Every subscriber is isolated from the others. A callback that throws a
// std::exception is logged with its subscription name and the event kind,
// counted in failureCount(), and the remaining subscribers still receive the
// event.
//
// Thread model:
//   subscribe, unsubscribe and publish are safe from any thread. Callbacks
//   run synchronously on the thread that calls publish(), which in the
//   engine is always the telemetry loop thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event; use std::visit or std::get_if to pick types.
  using GenericCallback = std::function<void(const Event&)>;

  // Returned by subscribe(); pass to unsubscribe() to detach.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every published event. name appears in the
  // failure log.
  SubscriptionId subscribe(GenericCallback callback,
                           std::string name = "subscriber");

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback, name)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the published variant holds
  // EventType, e.g. subscribe<DispatchOfferEvent>(...).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback,
                           std::string name = "subscriber");

  // Removes a subscription. A publish() already in progress on another
  // thread may still deliver its current event to the removed callback.
  // @return false if id was not subscribed.
  bool unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to every subscriber before returning. The subscriber
  // list is copied under the lock and callbacks run unlocked, so a callback
  // may itself subscribe, unsubscribe or publish.
  //
  // @return Number of subscribers that threw for this event.
  // -------------------------------------------------------------------------
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

  // Total subscriber failures since construction.
  std::uint64_t failureCount() const { return failures_.load(); }

 private:
  struct Subscriber {
    SubscriptionId id;
    std::string name;
    GenericCallback callback;
  };

  mutable std::mutex mutex_;   // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<Subscriber> subscribers_;
  std::atomic<std::uint64_t> failures_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback, std::string name) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped), std::move(name));
}

}  // namespace courier
