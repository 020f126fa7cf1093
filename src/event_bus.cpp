#include "event_bus.hpp"

namespace toolhost {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    by_tag_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

uint64_t EventBus::subscribe_all(EventHandler handler) {
    return subscribe(kAnyTag, std::move(handler));
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto tag_it = by_tag_.begin(); tag_it != by_tag_.end(); ++tag_it) {
        auto& subs = tag_it->second;
        for (auto it = subs.begin(); it != subs.end(); ++it) {
            if (it->id != id) continue;
            subs.erase(it);
            if (subs.empty()) by_tag_.erase(tag_it);
            return true;
        }
    }
    return false;
}

size_t EventBus::publish(const Event& event) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const char* tag : {event.type_tag, kAnyTag}) {
            auto it = by_tag_.find(tag);
            if (it == by_tag_.end()) continue;
            for (const auto& sub : it->second) handlers.push_back(sub.handler);
        }
    }
    for (const auto& handler : handlers) handler(event);
    return handlers.size();
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_tag_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? 0 : it->second.size();
}

} // namespace toolhost
