#include "catch2_custom.hpp"

#include <grader/exceptions.hpp>
#include <grader/runner/event_bus.hpp>
#include <grader/runner/events.hpp>
#include <grader/runner/stats.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace grader;

TEST_CASE("Events are delivered in subscription order") {
    EventBus bus;
    std::vector<std::string> calls;

    bus.subscribe_all([&](const Event& event) { calls.push_back(fmt::format("all {}", event.kind)); });
    bus.subscribe(EventKind::RunEnd, [&](const Event&) { calls.push_back("run end"); });

    Stats stats;
    bus.emit({.kind = EventKind::RunBegin, .stats = &stats});
    bus.emit({.kind = EventKind::RunEnd, .stats = &stats});

    REQUIRE(calls == std::vector<std::string>{"all runBegin", "all runEnd", "run end"});
}

TEST_CASE("Unsubscribed handlers are not called") {
    EventBus bus;
    int count = 0;

    auto id = bus.subscribe_all([&](const Event&) { ++count; });
    REQUIRE(bus.num_subscribers() == 1);

    bus.emit({.kind = EventKind::RunBegin});
    bus.unsubscribe(id);
    bus.emit({.kind = EventKind::RunBegin});

    REQUIRE(count == 1);
    REQUIRE(bus.num_subscribers() == 0);
}

TEST_CASE("A throwing handler doesn't stop delivery") {
    EventBus bus;
    bool reached = false;

    bus.subscribe_all([](const Event&) { throw std::runtime_error("broken reporter"); });
    bus.subscribe_all([&](const Event&) { reached = true; });

    REQUIRE_NOTHROW(bus.emit({.kind = EventKind::SuiteBegin}));
    REQUIRE(reached);
}

TEST_CASE("Handlers throwing non-exceptions don't stop delivery either") {
    EventBus bus;
    int reached = 0;

    bus.subscribe_all([](const Event&) { throw 42; });
    bus.subscribe_all([](const Event&) { throw PendingSignal{}; });
    bus.subscribe_all([&](const Event&) { ++reached; });

    REQUIRE_NOTHROW(bus.emit({.kind = EventKind::TestBegin}));
    REQUIRE_NOTHROW(bus.emit({.kind = EventKind::TestEnd}));
    REQUIRE(reached == 2);
}

TEST_CASE("Handlers may change subscriptions while an event is dispatched") {
    EventBus bus;
    std::vector<std::string> calls;

    EventBus::SubscriptionId second{};
    EventBus::SubscriptionId first = bus.subscribe_all([&](const Event&) {
        calls.emplace_back("first");
        bus.unsubscribe(first);
        bus.unsubscribe(second);
        bus.subscribe_all([&](const Event&) { calls.emplace_back("late"); });
    });
    second = bus.subscribe_all([&](const Event&) { calls.emplace_back("second"); });

    bus.emit({.kind = EventKind::SuiteBegin});

    REQUIRE(calls == std::vector<std::string>{"first"});
    REQUIRE(bus.num_subscribers() == 1);

    bus.emit({.kind = EventKind::SuiteEnd});

    REQUIRE(calls == std::vector<std::string>{"first", "late"});
}

TEST_CASE("Event kinds format in camel case") {
    REQUIRE(fmt::format("{}", EventKind::TestRetry) == "testRetry");
    REQUIRE(fmt::format("{}", EventKind::RunnableError) == "runnableError");
}
