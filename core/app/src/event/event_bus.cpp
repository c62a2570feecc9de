#include "courier/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <type_traits>

namespace courier {

namespace {

const char* eventKind(const Event& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, DispatchOfferEvent>) {
          return "DispatchOffer";
        } else if constexpr (std::is_same_v<T, OrderStatusEvent>) {
          return "OrderStatus";
        } else if constexpr (std::is_same_v<T, SuggestionResolvedEvent>) {
          return "SuggestionResolved";
        } else {
          static_assert(std::is_same_v<T, DispatchExhaustedEvent>,
                        "unhandled event type");
          return "DispatchExhausted";
        }
      },
      event);
}

}  // namespace

// -----------------------------------------------------------------------------
// subscribe(GenericCallback, name)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback,
                                             std::string name) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.push_back(Subscriber{id, std::move(name), std::move(callback)});
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
bool EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it == subscribers_.end()) {
    return false;
  }
  subscribers_.erase(it);
  return true;
}

// -----------------------------------------------------------------------------
// publish(event): every subscriber runs, whatever the others do
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Event& event) {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  std::size_t failed = 0;
  for (const auto& subscriber : snapshot) {
    try {
      subscriber.callback(event);
    } catch (const std::exception& e) {
      ++failed;
      std::cerr << "[EventBus] subscriber '" << subscriber.name << "' (#"
                << subscriber.id << ") failed on " << eventKind(event) << ": "
                << e.what() << "\n";
    }
  }

  if (failed > 0) {
    failures_.fetch_add(failed);
  }
  return failed;
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace courier
