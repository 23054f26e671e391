/// @file test_event_bus.cpp
/// @brief Tests for EventBus

#include <catch2/catch_test_macros.hpp>
#include <keystone/event/event_bus.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace keystone_event;

// Test event types
struct TestEvent {
    int value;
};

struct OtherEvent {
    std::string message;
};

class CountingListener : public EventListener {
public:
    void register_handlers(ListenerRegistrar& registrar) override {
        registrar.on<TestEvent>([this](const TestEvent& e) { total += e.value; });
        registrar.on<OtherEvent>([this](const OtherEvent&) { ++messages; });
    }

    int total = 0;
    int messages = 0;
};

TEST_CASE("EventBus: creation", "[event][bus]") {
    EventBus bus;
    REQUIRE(bus.pending_count() == 0);
    REQUIRE_FALSE(bus.has_pending());
    REQUIRE(bus.handler_count() == 0);
}

TEST_CASE("EventBus: publish and process", "[event][bus]") {
    EventBus bus;
    int received = 0;

    bus.subscribe<TestEvent>([&received](const TestEvent& e) { received = e.value; });

    bus.publish(TestEvent{42});
    REQUIRE(bus.has_pending());
    REQUIRE(received == 0);

    bus.process();
    REQUIRE(received == 42);
    REQUIRE_FALSE(bus.has_pending());
}

TEST_CASE("EventBus: emit dispatches immediately", "[event][bus]") {
    EventBus bus;
    int received = 0;

    bus.subscribe<TestEvent>([&received](const TestEvent& e) { received += e.value; });

    bus.emit(TestEvent{3});
    REQUIRE(received == 3);
    REQUIRE_FALSE(bus.has_pending());
}

TEST_CASE("EventBus: different event types", "[event][bus]") {
    EventBus bus;
    int int_count = 0;
    int str_count = 0;

    bus.subscribe<TestEvent>([&int_count](const TestEvent&) { ++int_count; });
    bus.subscribe<OtherEvent>([&str_count](const OtherEvent&) { ++str_count; });

    bus.publish(TestEvent{1});
    bus.publish(OtherEvent{"hello"});
    bus.process();

    REQUIRE(int_count == 1);
    REQUIRE(str_count == 1);
    REQUIRE(bus.handler_count<TestEvent>() == 1);
}

TEST_CASE("EventBus: handler priority", "[event][bus]") {
    EventBus bus;
    std::vector<std::string> order;

    bus.subscribe_with_priority<TestEvent>([&order](const TestEvent&) { order.push_back("low"); }, Priority::Low);
    bus.subscribe_with_priority<TestEvent>([&order](const TestEvent&) { order.push_back("critical"); },
                                           Priority::Critical);
    bus.subscribe<TestEvent>([&order](const TestEvent&) { order.push_back("normal-1"); });
    bus.subscribe<TestEvent>([&order](const TestEvent&) { order.push_back("normal-2"); });

    bus.emit(TestEvent{0});

    REQUIRE(order == std::vector<std::string>{"critical", "normal-1", "normal-2", "low"});
}

TEST_CASE("EventBus: queued events by priority then publish order", "[event][bus]") {
    EventBus bus;
    std::vector<int> values;

    bus.subscribe<TestEvent>([&values](const TestEvent& e) { values.push_back(e.value); });

    bus.publish(TestEvent{1});
    bus.publish_with_priority(TestEvent{2}, Priority::High);
    bus.publish(TestEvent{3});

    bus.process();
    REQUIRE(values == std::vector<int>{2, 1, 3});
}

TEST_CASE("EventBus: process_batch", "[event][bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe<TestEvent>([&count](const TestEvent&) { ++count; });

    for (int i = 0; i < 5; ++i) {
        bus.publish(TestEvent{i});
    }

    bus.process_batch(2);
    REQUIRE(count == 2);
    REQUIRE(bus.pending_count() == 3);

    bus.clear();
    REQUIRE_FALSE(bus.has_pending());
}

TEST_CASE("EventBus: unsubscribe", "[event][bus]") {
    EventBus bus;
    int count = 0;

    auto id = bus.subscribe<TestEvent>([&count](const TestEvent&) { ++count; });
    REQUIRE(id.is_valid());

    bus.emit(TestEvent{1});
    REQUIRE(bus.unsubscribe(id));
    REQUIRE_FALSE(bus.unsubscribe(id));
    bus.emit(TestEvent{1});

    REQUIRE(count == 1);
    REQUIRE(bus.handler_count() == 0);
}

TEST_CASE("EventBus: listener subscription", "[event][bus][listener]") {
    EventBus bus;
    CountingListener listener;
    CountingListener other;
    int anonymous = 0;

    bus.subscribe<TestEvent>([&anonymous](const TestEvent&) { ++anonymous; });

    REQUIRE(bus.subscribe(listener) == 2);
    REQUIRE(bus.subscribe(other) == 2);
    REQUIRE(bus.is_subscribed(listener));
    REQUIRE(bus.handler_count() == 5);

    bus.emit(TestEvent{5});
    bus.emit(OtherEvent{"hi"});
    REQUIRE(listener.total == 5);
    REQUIRE(listener.messages == 1);

    SECTION("unsubscribe_all removes only that listener's handlers") {
        REQUIRE(bus.unsubscribe_all(listener) == 2);
        REQUIRE_FALSE(bus.is_subscribed(listener));
        REQUIRE(bus.is_subscribed(other));

        bus.emit(TestEvent{5});
        REQUIRE(listener.total == 5);
        REQUIRE(other.total == 10);
        REQUIRE(anonymous == 2);
    }

    SECTION("unsubscribe_all is idempotent") {
        bus.unsubscribe_all(listener);
        REQUIRE(bus.unsubscribe_all(listener) == 0);
    }
}

TEST_CASE("EventBus: failed listener registration leaves no handlers", "[event][bus][listener]") {
    class FailingListener : public EventListener {
    public:
        void register_handlers(ListenerRegistrar& registrar) override {
            registrar.on<TestEvent>([](const TestEvent&) {});
            throw std::runtime_error("no handlers today");
        }
    };

    EventBus bus;
    FailingListener listener;

    REQUIRE_THROWS_AS(bus.subscribe(listener), std::runtime_error);
    REQUIRE_FALSE(bus.is_subscribed(listener));
    REQUIRE(bus.handler_count() == 0);
}

TEST_CASE("EventBus: handlers may unsubscribe during dispatch", "[event][bus]") {
    EventBus bus;
    int count = 0;
    SubscriberId id;

    id = bus.subscribe<TestEvent>([&](const TestEvent&) {
        ++count;
        bus.unsubscribe(id);
    });

    bus.emit(TestEvent{1});
    bus.emit(TestEvent{1});
    REQUIRE(count == 1);
}
