#include <raylink/runtime/client.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "fake_channel.hpp"
#include "fake_evaluator.hpp"

using namespace raylink;
using namespace std::chrono_literals;
using runtime::Origin;
using runtime::ResultKind;
using Outcome = std::expected<runtime::Result, std::string>;

namespace {

struct Harness {
    explicit Harness(bool with_engine = true, runtime::ClientConfig config = {}) {
        if (with_engine) {
            engine = std::make_shared<testing::FakeEvaluator>();
            engine->script("nums", testing::i64_vector({1, 2, 3}));
        }
        client = std::make_unique<runtime::Client>(io, engine, std::move(config),
                                                   network.factory());
    }

    void connect() {
        client->connect("ws://127.0.0.1:5100", [](auto outcome) {
            REQUIRE(outcome.has_value());
        });
        network.last().accept();
        REQUIRE(client->is_connected());
    }

    auto execute(std::string_view text) -> std::optional<Outcome> {
        std::optional<Outcome> settled;
        client->execute(text, [&](Outcome outcome) { settled = std::move(outcome); });
        return settled;
    }

    /// Request frames sent to the server, handshake excluded.
    [[nodiscard]] auto requests() const -> std::size_t {
        if (network.links.empty()) {
            return 0;
        }
        std::size_t count = 0;
        for (const auto& bytes : network.last().sent) {
            count += bytes.size() > ipc::kHandshake.size() ? 1 : 0;
        }
        return count;
    }

    boost::asio::io_context io;
    testing::FakeNetwork network;
    std::shared_ptr<testing::FakeEvaluator> engine;
    std::unique_ptr<runtime::Client> client;
};

}  // namespace

TEST_CASE("Disconnected clients evaluate locally", "[runtime][client]") {
    Harness h;
    auto outcome = h.execute("nums");
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->has_value());

    const auto& result = outcome->value();
    REQUIRE(result.kind() == ResultKind::Vector);
    REQUIRE(result.value() == testing::i64_vector({1, 2, 3}));
    REQUIRE(result.execution().has_value());
    REQUIRE(result.execution()->origin == Origin::Local);
    REQUIRE(result.execution()->elapsed_ms >= 0.0);
}

TEST_CASE("Local evaluation without an engine is an error result", "[runtime][client]") {
    Harness h(false);
    REQUIRE_FALSE(h.client->has_evaluator());

    auto outcome = h.execute("1+1");
    const auto& result = outcome->value();
    REQUIRE(result.is_error());
    REQUIRE(result.error_message() == "Embedded engine not loaded");
    REQUIRE(result.execution()->origin == Origin::Local);
}

TEST_CASE("Engine errors come back as error results", "[runtime][client]") {
    Harness h;
    auto result = h.client->evaluate_local("undefined_name");
    REQUIRE(result.is_error());
    REQUIRE(result.error_message() == "undefined: undefined_name");
    REQUIRE(h.engine->live_objects() == 1);
}

TEST_CASE("@remote without a connection fails immediately", "[runtime][client]") {
    Harness h;
    auto outcome = h.execute("@remote\nnums");
    const auto& result = outcome->value();
    REQUIRE(result.is_error());
    REQUIRE(result.error_message() == "@remote specified but not connected to server");
    REQUIRE(result.execution()->origin == Origin::Remote);
    REQUIRE(result.execution()->elapsed_ms == 0.0);
    REQUIRE(h.engine->evaluations() == 0);
}

TEST_CASE("Connected clients route to the server", "[runtime][client]") {
    Harness h;
    h.connect();

    std::optional<Outcome> settled;
    h.client->execute("select from t", [&](Outcome outcome) { settled = std::move(outcome); });
    REQUIRE_FALSE(settled.has_value());
    REQUIRE(testing::sent_code(h.network.last().sent.back()) == "select from t");

    h.network.last().respond(testing::trades_table());
    REQUIRE(settled.has_value());
    const auto& result = settled->value();
    REQUIRE(result.kind() == ResultKind::Table);
    REQUIRE(result.execution()->origin == Origin::Remote);
    REQUIRE(h.engine->evaluations() == 0);
}

TEST_CASE("@local overrides the connection", "[runtime][client]") {
    Harness h;
    h.connect();

    SECTION("@local alone") {
        auto outcome = h.execute("@local\nnums");
        REQUIRE(outcome->value().execution()->origin == Origin::Local);
    }

    SECTION("@local wins over @remote") {
        auto outcome = h.execute("@remote\n@local\nnums");
        REQUIRE(outcome->value().execution()->origin == Origin::Local);
    }

    REQUIRE(h.requests() == 0);
    REQUIRE(h.engine->evaluations() == 1);
}

TEST_CASE("The configured timeout applies to remote queries", "[runtime][client]") {
    Harness h(true, runtime::ClientConfig{.engine_path = {}, .server = {}, .default_timeout = 5ms});
    h.connect();

    std::optional<Outcome> settled;
    h.client->execute("slow", [&](Outcome outcome) { settled = std::move(outcome); });
    h.io.run_one();

    REQUIRE(settled.has_value());
    REQUIRE_FALSE(settled->has_value());
    REQUIRE(settled->error() == "Query timeout after 5ms");
}

TEST_CASE("A @timeout directive overrides the configured timeout", "[runtime][client]") {
    Harness h(true, runtime::ClientConfig{.engine_path = {}, .server = {}, .default_timeout = 10s});
    h.connect();

    std::optional<Outcome> settled;
    h.client->execute("@timeout:5\nslow", [&](Outcome outcome) { settled = std::move(outcome); });
    h.io.run_one();
    REQUIRE(settled->error() == "Query timeout after 5ms");
}

TEST_CASE("Client connect validates the address", "[runtime][client]") {
    Harness h;
    std::optional<std::expected<void, std::string>> connected;
    h.client->connect("nope", [&](auto outcome) { connected = outcome; });
    REQUIRE(connected.has_value());
    REQUIRE(connected->error() == "address needs host:port: 'nope'");
    REQUIRE(h.network.links.empty());
}

TEST_CASE("Client events report the connection lifecycle", "[runtime][client]") {
    Harness h;
    int connected = 0;
    int disconnected = 0;
    h.client->events().on(runtime::EventKind::Connected, [&](const auto&) { ++connected; });
    h.client->events().on(runtime::EventKind::Disconnected, [&](const auto&) { ++disconnected; });

    h.connect();
    h.client->disconnect();

    REQUIRE(connected == 1);
    REQUIRE(disconnected == 1);
    REQUIRE_FALSE(h.client->is_connected());
}

TEST_CASE("load_evaluator", "[runtime][client]") {
    SECTION("no path gives no engine") {
        auto evaluator = runtime::load_evaluator(runtime::ClientConfig{});
        REQUIRE(evaluator.has_value());
        REQUIRE(*evaluator == nullptr);
    }

    SECTION("a missing library is an error") {
        auto evaluator = runtime::load_evaluator(runtime::ClientConfig{
            .engine_path = "/nonexistent/librayforce.so", .server = {}, .default_timeout = 1s});
        REQUIRE_FALSE(evaluator.has_value());
        REQUIRE(evaluator.error().starts_with("failed to load '/nonexistent/librayforce.so'"));
    }
}
