#include "event_bus.hpp"
#include <algorithm>

namespace decaf {

EventBus::EventBus()
    : subscriptions_(std::make_shared<SubscriptionList>())
{}

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<SubscriptionList>(*subscriptions_);
    uint64_t id = next_id_++;
    next->push_back(Subscription{id, tag, std::move(handler)});
    subscriptions_ = std::move(next);
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscriptions_->begin(), subscriptions_->end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_->end()) return false;

    auto next = std::make_shared<SubscriptionList>();
    next->reserve(subscriptions_->size() - 1);
    for (const auto& sub : *subscriptions_) {
        if (sub.id != id) next->push_back(sub);
    }
    subscriptions_ = std::move(next);
    return true;
}

std::shared_ptr<const EventBus::SubscriptionList> EventBus::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

size_t EventBus::publish(const Event& event) const {
    auto subs = snapshot();
    size_t called = 0;
    for (const auto& sub : *subs) {
        if (sub.tag != event.type_tag) continue;
        sub.handler(event);
        called++;
    }
    return called;
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    auto subs = snapshot();
    return static_cast<size_t>(std::count_if(subs->begin(), subs->end(),
        [&tag](const Subscription& s) { return s.tag == tag; }));
}

} // namespace decaf
