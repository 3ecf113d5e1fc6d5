#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <cstdint>
#include <utility>

namespace decaf {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe keyed by Event::type_tag.
//
// publish() walks a snapshot of the subscription list without the mutex
// held; subscribe()/unsubscribe() replace the list, so a handler may
// unsubscribe itself mid-publish. Publishers may run on the message
// thread and the flush thread at once; handlers must tolerate concurrent
// calls.
class EventBus {
public:
    EventBus();

    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Call every handler for event.type_tag in registration order.
    // Returns the number of handlers called.
    size_t publish(const Event& event) const;

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };
    using SubscriptionList = std::vector<Subscription>;

    std::shared_ptr<const SubscriptionList> snapshot() const;

    mutable std::mutex mutex_;
    std::shared_ptr<const SubscriptionList> subscriptions_;
    uint64_t next_id_ = 1;
};

// Typed subscribe: the handler sees the concrete event struct.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace decaf
