#pragma once

#include "courier/events/dispatch_events.hpp"

#include <functional>
#include <variant>

namespace courier {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by the telemetry EventBus. A closed
// std::variant keeps events as plain values: no heap-allocated hierarchy, and
// every std::visit over it is checked for completeness by the compiler.
// -----------------------------------------------------------------------------
using Event = std::variant<
    DispatchOfferEvent,
    OrderStatusEvent,
    SuggestionResolvedEvent,
    DispatchExhaustedEvent>;

// -----------------------------------------------------------------------------
// EventSink
// -----------------------------------------------------------------------------
// How dispatch components emit events without knowing who consumes them.
// The engine binds it to EventLoopThread::push(); tests bind it to a vector.
// An empty sink drops events.
// -----------------------------------------------------------------------------
using EventSink = std::function<void(Event)>;

}  // namespace courier
