#pragma once

#include "levtrade/events/event.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <variant>

namespace levtrade {

namespace detail {

template <typename T, typename... Ts>
constexpr std::size_t indexOfAlternative() {
  constexpr bool matches[] = {std::is_same_v<T, Ts>...};
  for (std::size_t i = 0; i < sizeof...(Ts); ++i) {
    if (matches[i]) {
      return i;
    }
  }
  return sizeof...(Ts);
}

// Position of T among the alternatives of the variant V.
template <typename T, typename V>
struct AlternativeIndex;

template <typename T, typename... Ts>
struct AlternativeIndex<T, std::variant<Ts...>> {
  static constexpr std::size_t value = indexOfAlternative<T, Ts...>();
  static_assert(value < sizeof...(Ts), "type is not an Event alternative");
};

}  // namespace detail

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for Event values.
//
// In this engine the risk loop's bus carries two kinds of traffic:
//   - work items (PriceSnapshotEvent, MonitorTickEvent) that TradingEngine
//     subscribes to and forwards into TradeExecutor / RiskEngine;
//   - notifications (TradeExecutedEvent, PositionClosedEvent,
//     RiskAlertEvent) that main() and tests observe.
//
// Typed subscriptions record the alternative they want, so publish() only
// calls the subscribers interested in the event. Subscribers are called in
// subscription order.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread, outside the lock.
// A callback that throws std::exception is logged to stderr and does not
// prevent delivery to the remaining subscribers.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Every event. Returns an id for unsubscribe().
  SubscriptionId subscribe(GenericCallback callback);

  // Only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  struct Subscriber {
    std::optional<std::size_t> alternative;  // nullopt: every event
    std::shared_ptr<const GenericCallback> callback;
  };

  SubscriptionId add(std::optional<std::size_t> alternative,
                     GenericCallback callback);

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::map<SubscriptionId, Subscriber> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return add(detail::AlternativeIndex<EventType, Event>::value,
             [cb = std::move(callback)](const Event& event) {
               cb(std::get<EventType>(event));
             });
}

}  // namespace levtrade
