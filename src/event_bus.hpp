#pragma once
#include "event.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolhost {

using EventHandler = std::function<void(const Event&)>;

// Synchronous in-process bus. Handlers run on the publishing thread, in
// subscription order, with the bus lock released.
class EventBus {
public:
    // Tag used by subscribe_all(); receives every event.
    static constexpr const char* kAnyTag = "*";

    uint64_t subscribe(const std::string& tag, EventHandler handler);
    uint64_t subscribe_all(EventHandler handler);

    bool unsubscribe(uint64_t id);

    // Returns the number of handlers that ran.
    size_t publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> by_tag_;
    uint64_t next_id_ = 1;
};

// Typed subscription: the handler sees the concrete event struct.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish through an optional bus.
inline void publish_to(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace toolhost
