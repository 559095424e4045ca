#pragma once

#include "savings/events/event.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace savings {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for pool events. The coordinator
// publishes; the service forwards to IPC telemetry; tests subscribe to
// observe what happened.
//
// Sequencing: publish() stamps each event with the next sequence id before
// delivery, so every subscriber sees the same, gap-free numbering starting
// at 1.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, and
// publish. Callbacks run synchronously on the publishing thread (the service
// executor), after publish() has released its lock.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event.
  // Returns an id for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only for events holding EventType.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Stamps event.sequence_id, then delivers it to every subscriber
  // registered at the time of the call. Returns the stamped sequence id.
  //
  // A callback may publish or unsubscribe re-entrantly; the subscriber list
  // is copied under the lock and the lock is not held during delivery.
  // -------------------------------------------------------------------------
  std::uint64_t publish(Event event);

  // Sequence id the next publish() will assign.
  std::uint64_t nextSequenceId() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;           // Protects everything below
  SubscriptionId next_id_{0};
  std::uint64_t next_sequence_id_{1};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace savings
