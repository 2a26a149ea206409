#include <raylink/runtime/events.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace raylink::runtime;

TEST_CASE("Events reach listeners of their kind only", "[runtime][events]") {
    EventBus bus;
    std::vector<std::string> seen;
    bus.on(EventKind::Connected, [&](const Event& event) {
        const auto& connected = std::get<ConnectedEvent>(event);
        seen.push_back("connected " + std::to_string(connected.server_version.value_or(0)));
    });
    bus.on(EventKind::Error, [&](const Event& event) {
        seen.push_back("error " + std::get<ErrorEvent>(event).message);
    });

    bus.emit(ConnectedEvent{.server_version = 3});
    bus.emit(DisconnectedEvent{});
    bus.emit(ErrorEvent{.message = "refused"});

    REQUIRE(seen == std::vector<std::string>{"connected 3", "error refused"});
}

TEST_CASE("Listeners run in subscription order", "[runtime][events]") {
    EventBus bus;
    std::string order;
    bus.on(EventKind::Disconnected, [&](const Event&) { order += "a"; });
    bus.on(EventKind::Disconnected, [&](const Event&) { order += "b"; });
    bus.emit(DisconnectedEvent{});
    REQUIRE(order == "ab");
}

TEST_CASE("off removes a listener", "[runtime][events]") {
    EventBus bus;
    int calls = 0;
    auto id = bus.on(EventKind::Result, [&](const Event&) { ++calls; });
    REQUIRE(bus.listener_count(EventKind::Result) == 1);

    bus.emit(ResultEvent{.result = Result::null()});
    bus.off(id);
    bus.emit(ResultEvent{.result = Result::null()});

    REQUIRE(calls == 1);
    REQUIRE(bus.listener_count(EventKind::Result) == 0);
}

TEST_CASE("Listeners may unsubscribe while being notified", "[runtime][events]") {
    EventBus bus;
    int calls = 0;
    EventBus::ListenerId id = 0;
    id = bus.on(EventKind::Disconnected, [&](const Event&) {
        ++calls;
        bus.off(id);
    });
    bus.emit(DisconnectedEvent{});
    bus.emit(DisconnectedEvent{});
    REQUIRE(calls == 1);
}

TEST_CASE("kind_of follows the variant order", "[runtime][events]") {
    REQUIRE(kind_of(Event{ConnectedEvent{}}) == EventKind::Connected);
    REQUIRE(kind_of(Event{DisconnectedEvent{}}) == EventKind::Disconnected);
    REQUIRE(kind_of(Event{ErrorEvent{}}) == EventKind::Error);
    REQUIRE(kind_of(Event{ResultEvent{.result = Result::null()}}) == EventKind::Result);
}
