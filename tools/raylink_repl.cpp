#include <raylink/raylink.hpp>
#include <raylink/repl/repl.hpp>

#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"raylink - console for local and remote engine queries"};

    bool verbose = false;
    std::string server;
    std::string engine_path;
    std::int64_t timeout_ms = raylink::runtime::kDefaultQueryTimeout.count();
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("--connect", server,
                   "Server to connect to at startup (ws://host:port/path, tcp://host:port or "
                   "host:port). Defaults to the RAYLINK_SERVER environment variable.");
    app.add_option("--engine", engine_path,
                   "Shared library of the embedded engine. Defaults to the "
                   "RAYLINK_ENGINE_PATH environment variable.");
    app.add_option("--timeout", timeout_ms, "Remote query timeout in milliseconds")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    // Flags take precedence over the environment.
    if (engine_path.empty()) {
        const char* env = std::getenv("RAYLINK_ENGINE_PATH");
        if (env != nullptr) {
            engine_path = env;
        }
    }
    if (server.empty()) {
        const char* env = std::getenv("RAYLINK_SERVER");
        if (env != nullptr) {
            server = env;
        }
    }

    raylink::runtime::ClientConfig config;
    if (!engine_path.empty()) {
        config.engine_path = engine_path;
    }
    if (!server.empty()) {
        config.server = server;
    }
    config.default_timeout = std::chrono::milliseconds{timeout_ms};

    auto evaluator = raylink::runtime::load_evaluator(config);
    if (!evaluator) {
        fmt::print(stderr, "error: {}\n", evaluator.error());
        return 1;
    }

    boost::asio::io_context io;
    raylink::runtime::Client client(io, *evaluator, config);

    std::unique_ptr<raylink::bridge::Bridge> bridge;
    if (config.engine_path) {
        bridge = std::make_unique<raylink::bridge::Bridge>(
            io, [config]() { return raylink::runtime::load_evaluator(config); });
    }

    raylink::repl::Session session{.io = io, .client = client, .bridge = bridge.get()};
    raylink::repl::ReplConfig repl_config;
    repl_config.verbose = verbose;

    if (config.server) {
        if (!raylink::repl::execute_script(":connect " + *config.server, session, repl_config)) {
            spdlog::warn("continuing without a remote connection");
        }
    }

    raylink::repl::run(repl_config, session);

    if (bridge) {
        bridge->terminate();
    }
    client.disconnect();
    return 0;
}
