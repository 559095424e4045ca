#include "savings/eventbus/event_bus.hpp"

#include <algorithm>

namespace savings {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event): stamp under the lock, deliver outside it
// -----------------------------------------------------------------------------
std::uint64_t EventBus::publish(Event event) {
  std::vector<SubscriberEntry> copy;
  std::uint64_t sequence_id = 0;

  {
    std::lock_guard lock(mutex_);
    sequence_id = next_sequence_id_++;
    copy = subscribers_;
  }

  std::visit([sequence_id](auto& e) { e.sequence_id = sequence_id; }, event);

  for (const auto& [id, callback] : copy) {
    callback(event);
  }
  return sequence_id;
}

std::uint64_t EventBus::nextSequenceId() const {
  std::lock_guard lock(mutex_);
  return next_sequence_id_;
}

}  // namespace savings
