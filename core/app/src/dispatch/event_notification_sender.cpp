#include "courier/dispatch/event_notification_sender.hpp"

#include <stdexcept>
#include <utility>

namespace courier {

EventNotificationSender::EventNotificationSender(EventSink sink)
    : sink_(std::move(sink)) {}

std::size_t EventNotificationSender::notifyDrivers(const DispatchOffer& offer) {
  if (!sink_) {
    throw std::runtime_error("no telemetry sink attached");
  }
  sink_(DispatchOfferEvent{offer.order_id, offer.cycle, offer.driver_ids,
                           offer.expires_at_ms});
  return offer.driver_ids.size();
}

}  // namespace courier
