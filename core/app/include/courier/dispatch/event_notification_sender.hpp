#pragma once

#include "courier/dispatch/i_notification_sender.hpp"
#include "courier/events/event.hpp"

namespace courier {

// -----------------------------------------------------------------------------
// EventNotificationSender
// -----------------------------------------------------------------------------
// Delivers offers as DispatchOfferEvent on the telemetry loop. The IPC server
// publishes them on the PUB socket ("dispatch_offer"), where the push
// gateway subscribes. Throws std::runtime_error when no sink is attached.
// -----------------------------------------------------------------------------
class EventNotificationSender final : public INotificationSender {
 public:
  explicit EventNotificationSender(EventSink sink);

  std::size_t notifyDrivers(const DispatchOffer& offer) override;

 private:
  EventSink sink_;
};

}  // namespace courier
