#include <catch2/catch_test_macros.hpp>
#include "event_bus.hpp"

#include <vector>

using namespace toolhost;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) {
        count++;
    });

    ActionStartedEvent ev;
    ev.alias = "git";
    REQUIRE(bus.publish(ev) == 1);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(ActionCompletedEvent::TAG, [&](const Event&) {
        order.push_back(1);
    });
    bus.subscribe(ActionCompletedEvent::TAG, [&](const Event&) {
        order.push_back(2);
    });

    ActionCompletedEvent ev;
    bus.publish(ev);

    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    ProcessSpawnedEvent ev;
    REQUIRE(bus.publish(ev) == 0);
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int started = 0;
    int retired = 0;

    bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) { started++; });
    bus.subscribe(ProcessRetiredEvent::TAG, [&](const Event&) { retired++; });

    ActionStartedEvent s;
    bus.publish(s);
    bus.publish(s);
    ProcessRetiredEvent r;
    bus.publish(r);

    REQUIRE(started == 2);
    REQUIRE(retired == 1);
}

// ── Wildcard ─────────────────────────────────────────────────────

TEST_CASE("EventBus: subscribe_all sees every tag after tagged handlers", "[event_bus]") {
    EventBus bus;
    std::vector<std::string> seen;

    bus.subscribe_all([&](const Event& e) { seen.push_back(std::string("*:") + e.type_tag); });
    bus.subscribe(ApprovalRequiredEvent::TAG, [&](const Event& e) {
        seen.push_back(e.type_tag);
    });

    ApprovalRequiredEvent a;
    ProcessSpawnedEvent p;
    REQUIRE(bus.publish(a) == 2);
    REQUIRE(bus.publish(p) == 1);

    REQUIRE(seen == std::vector<std::string>{"ApprovalRequired", "*:ApprovalRequired",
                                             "*:ProcessSpawned"});
    REQUIRE(bus.subscriber_count(EventBus::kAnyTag) == 1);
}

// ── Unsubscribe / clear ──────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;

    auto id = bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) { count++; });
    ActionStartedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);

    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);
    REQUIRE(count == 1);
    REQUIRE(bus.subscriber_count(ActionStartedEvent::TAG) == 0);
}

TEST_CASE("EventBus: unsubscribe returns false for unknown id", "[event_bus]") {
    EventBus bus;
    REQUIRE_FALSE(bus.unsubscribe(999));
}

TEST_CASE("EventBus: unsubscribe keeps other handlers on the tag", "[event_bus]") {
    EventBus bus;
    int first = 0;
    int second = 0;
    auto id = bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) { first++; });
    bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) { second++; });

    REQUIRE(bus.unsubscribe(id));
    ActionStartedEvent ev;
    bus.publish(ev);
    REQUIRE(first == 0);
    REQUIRE(second == 1);
}

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    int count = 0;
    bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) { count++; });
    bus.subscribe_all([&](const Event&) { count++; });

    bus.clear();
    ActionStartedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: handler may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int late = 0;
    bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) {
        bus.subscribe(ActionStartedEvent::TAG, [&](const Event&) { late++; });
    });

    ActionStartedEvent ev;
    REQUIRE(bus.publish(ev) == 1);
    REQUIRE(late == 0);
    REQUIRE(bus.subscriber_count(ActionStartedEvent::TAG) == 2);
}

// ── Typed subscription ───────────────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe template", "[event_bus]") {
    EventBus bus;
    std::string reason;
    pid_t pid = 0;

    subscribe<ProcessRetiredEvent>(bus, [&](const ProcessRetiredEvent& e) {
        reason = e.reason;
        pid = e.pid;
    });

    ProcessRetiredEvent ev;
    ev.alias = "kb";
    ev.pid = 4242;
    ev.reason = "crashed";
    bus.publish(ev);

    REQUIRE(reason == "crashed");
    REQUIRE(pid == 4242);
}

TEST_CASE("EventBus: event data passes through correctly", "[event_bus]") {
    EventBus bus;
    ActionCompletedEvent received;

    subscribe<ActionCompletedEvent>(bus, [&](const ActionCompletedEvent& e) {
        received.alias = e.alias;
        received.action = e.action;
        received.success = e.success;
        received.exit_code = e.exit_code;
        received.error = e.error;
    });

    ActionCompletedEvent ev;
    ev.alias = "git";
    ev.action = "status";
    ev.success = false;
    ev.exit_code = 128;
    ev.error = "boom";
    bus.publish(ev);

    REQUIRE(received.alias == "git");
    REQUIRE(received.action == "status");
    REQUIRE_FALSE(received.success);
    REQUIRE(received.exit_code == 128);
    REQUIRE(received.error == "boom");
}

TEST_CASE("EventBus: publish_to tolerates a null bus", "[event_bus]") {
    ActionStartedEvent ev;
    publish_to(nullptr, ev);

    EventBus bus;
    int count = 0;
    bus.subscribe_all([&](const Event&) { count++; });
    publish_to(&bus, ev);
    REQUIRE(count == 1);
}
