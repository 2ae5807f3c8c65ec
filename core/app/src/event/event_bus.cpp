#include "levtrade/eventbus/event_bus.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace levtrade {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  return add(std::nullopt, std::move(callback));
}

EventBus::SubscriptionId EventBus::add(std::optional<std::size_t> alternative,
                                       GenericCallback callback) {
  auto shared = std::make_shared<const GenericCallback>(std::move(callback));
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace(id, Subscriber{alternative, std::move(shared)});
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(id);
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
// The matching callbacks are collected under the lock and invoked after it
// is released: a handler may publish or unsubscribe on this same bus
// (closing a position from a MonitorTickEvent handler publishes a
// PositionClosedEvent).
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  const std::size_t alternative = event.index();
  std::vector<std::pair<SubscriptionId, std::shared_ptr<const GenericCallback>>>
      targets;
  {
    std::lock_guard lock(mutex_);
    targets.reserve(subscribers_.size());
    for (const auto& [id, sub] : subscribers_) {
      if (!sub.alternative || *sub.alternative == alternative) {
        targets.emplace_back(id, sub.callback);
      }
    }
  }

  for (const auto& [id, callback] : targets) {
    try {
      (*callback)(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] Subscriber " << id << " failed on event #"
                << alternative << ": " << e.what() << "\n";
    }
  }
}

}  // namespace levtrade
