#include <raylink/codec/format.hpp>
#include <raylink/repl/repl.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#ifdef RAYLINK_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace raylink::repl {

namespace {

#ifdef RAYLINK_HAS_READLINE
constexpr std::array<std::string_view, 10> kColonCommands = {
    ":q",      ":quit",   ":exit",  ":connect", ":disconnect",
    ":status", ":timing", ":bridge", ":load",   ":help",
};

auto colon_command_generator(const char* text, int state) -> char* {
    static std::size_t index = 0;
    static std::string prefix;
    if (state == 0) {
        index = 0;
        prefix = text != nullptr ? text : "";
    }
    while (index < kColonCommands.size()) {
        const auto command = kColonCommands[index++];
        if (command.starts_with(prefix)) {
            return ::strdup(std::string(command).c_str());
        }
    }
    return nullptr;
}

auto repl_completion(const char* text, int start, int /*end*/) -> char** {
    if (start != 0 || text == nullptr || text[0] != ':') {
        return nullptr;
    }
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, colon_command_generator);
}

void configure_line_editing() {
    rl_attempted_completion_function = repl_completion;
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!out.empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
void configure_line_editing() {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    std::fflush(stdout);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

enum class Outcome : std::uint8_t { Ok, Failed, Quit };

struct ReplState {
    Session& session;
    bool timing = false;
    std::size_t max_rows = 10;
};

auto ltrim(std::string_view text) -> std::string_view {
    auto pos = text.find_first_not_of(" \t\r\n");
    if (pos == std::string_view::npos) {
        return {};
    }
    return text.substr(pos);
}

auto rtrim(std::string_view text) -> std::string_view {
    auto pos = text.find_last_not_of(" \t\r\n");
    if (pos == std::string_view::npos) {
        return {};
    }
    return text.substr(0, pos + 1);
}

auto trim(std::string_view text) -> std::string_view {
    return rtrim(ltrim(text));
}

auto starts_with_command(std::string_view text, std::string_view command) -> bool {
    if (!text.starts_with(command)) {
        return false;
    }
    if (text.size() == command.size()) {
        return true;
    }
    auto next = static_cast<unsigned char>(text[command.size()]);
    return std::isspace(next) != 0;
}

auto command_argument(std::string_view text, std::string_view command) -> std::string_view {
    return trim(text.substr(command.size()));
}

struct LoadArguments {
    std::string path;
    std::string_view format;
};

/// `<file> [format]`, where the file may be quoted.
auto parse_load_arguments(std::string_view text) -> LoadArguments {
    std::string_view view = trim(text);
    if (view.empty()) {
        return {};
    }
    if (view.front() == '"' || view.front() == '\'') {
        char quote = view.front();
        auto end = view.find(quote, 1);
        if (end != std::string_view::npos) {
            return {.path = std::string(view.substr(1, end - 1)),
                    .format = trim(view.substr(end + 1))};
        }
    }
    auto space = view.find_first_of(" \t");
    if (space == std::string_view::npos) {
        return {.path = std::string(view), .format = {}};
    }
    return {.path = std::string(view.substr(0, space)), .format = trim(view.substr(space))};
}

/// Run handlers on `io` until `done()` holds.
template <typename Done>
void drive(boost::asio::io_context& io, const Done& done) {
    auto guard = boost::asio::make_work_guard(io);
    while (!done()) {
        io.restart();
        if (io.run_one() == 0) {
            break;
        }
    }
}

/// Dispatch whatever completed while the prompt was waiting.
void poll(boost::asio::io_context& io) {
    io.restart();
    io.poll();
}

void print_elapsed(const runtime::ExecutionInfo& info) {
    const double millis = info.elapsed_ms;
    const auto origin = runtime::to_string(info.origin);
    if (millis < 1.0) {
        fmt::print("time: {:.0f} us ({})\n", millis * 1000.0, origin);
        return;
    }
    if (millis < 1000.0) {
        fmt::print("time: {:.3f} ms ({})\n", millis, origin);
        return;
    }
    fmt::print("time: {:.3f} s ({})\n", millis / 1000.0, origin);
}

void print_help() {
    fmt::print(
        "  <expr>               evaluate (remote when connected, else local)\n"
        "  @local / @remote     force where the following lines run\n"
        "  @timeout:<ms>        remote timeout for this query\n"
        "  :connect <address>   ws://host:port/path, tcp://host:port or host:port\n"
        "  :disconnect          close the remote connection\n"
        "  :status              connection and engine state\n"
        "  :timing [on|off]     print elapsed time after each query\n"
        "  :bridge <expr>       evaluate on the isolated worker\n"
        "  :load <file> [fmt]   load a CSV or encoded table through the worker\n"
        "  :quit                leave\n");
}

auto ensure_bridge(ReplState& state) -> bool {
    auto* bridge = state.session.bridge;
    if (bridge == nullptr) {
        fmt::print("error: no isolated worker available (start with --engine)\n");
        return false;
    }
    if (bridge->is_initialized()) {
        return true;
    }
    std::optional<std::expected<std::string, std::string>> ready;
    bridge->init([&ready](std::expected<std::string, std::string> outcome) {
        ready = std::move(outcome);
    });
    drive(state.session.io, [&ready] { return ready.has_value(); });
    if (!ready->has_value()) {
        fmt::print("error: {}\n", ready->error());
        return false;
    }
    spdlog::debug("[bridge] worker ready, engine version {}", **ready);
    return true;
}

auto command_connect(ReplState& state, std::string_view address) -> Outcome {
    if (address.empty()) {
        fmt::print("usage: :connect <address>\n");
        return Outcome::Failed;
    }
    std::optional<std::expected<void, std::string>> connected;
    state.session.client.connect(address, [&connected](std::expected<void, std::string> outcome) {
        connected = std::move(outcome);
    });
    drive(state.session.io, [&connected] { return connected.has_value(); });
    if (!connected->has_value()) {
        fmt::print("error: {}\n", connected->error());
        return Outcome::Failed;
    }
    const auto& transport = state.session.client.transport();
    if (auto version = transport.server_version()) {
        fmt::print("connected to {} (server version {})\n", address, *version);
    } else {
        fmt::print("connected to {}\n", address);
    }
    return Outcome::Ok;
}

void command_status(const ReplState& state) {
    const auto& client = state.session.client;
    const auto& transport = client.transport();
    fmt::print("remote: {}", ipc::to_string(transport.state()));
    if (transport.address() && transport.state() != ipc::ConnectionState::Disconnected) {
        fmt::print(" ({})", transport.address()->to_string());
    }
    if (auto version = transport.server_version()) {
        fmt::print(", server version {}", *version);
    }
    fmt::print("\n");
    if (transport.pending_count() > 0 || transport.stale_responses() > 0) {
        fmt::print("queries: {} pending, {} late responses discarded\n",
                   transport.pending_count(), transport.stale_responses());
    }
    fmt::print("engine: {}\n", client.has_evaluator() ? "loaded" : "none");
    if (const auto* bridge = state.session.bridge) {
        fmt::print("worker: {}\n", bridge->is_initialized() ? "ready" : "not started");
    }
    fmt::print("timing: {}\n", state.timing ? "on" : "off");
}

auto command_bridge(ReplState& state, std::string_view expression) -> Outcome {
    if (expression.empty()) {
        fmt::print("usage: :bridge <expr>\n");
        return Outcome::Failed;
    }
    if (!ensure_bridge(state)) {
        return Outcome::Failed;
    }
    std::optional<std::expected<std::string, std::string>> reply;
    state.session.bridge->evaluate(std::string(expression),
                                   [&reply](std::expected<std::string, std::string> outcome) {
                                       reply = std::move(outcome);
                                   });
    drive(state.session.io, [&reply] { return reply.has_value(); });
    if (!reply->has_value()) {
        fmt::print("error: {}\n", reply->error());
        return Outcome::Failed;
    }
    fmt::print("{}\n", **reply);
    return Outcome::Ok;
}

auto command_load(ReplState& state, std::string_view argument) -> Outcome {
    const auto arguments = parse_load_arguments(argument);
    const std::string& path = arguments.path;
    if (path.empty()) {
        fmt::print("usage: :load <file> [csv|rayforce]\n");
        return Outcome::Failed;
    }
    std::optional<bridge::DataFormat> format;
    if (arguments.format.empty()) {
        format = std::filesystem::path(path).extension() == ".csv" ? bridge::DataFormat::Csv
                                                                    : bridge::DataFormat::Rayforce;
    } else {
        format = bridge::parse_format(arguments.format);
    }
    if (!format) {
        fmt::print("error: unknown format '{}' (expected csv or rayforce)\n", arguments.format);
        return Outcome::Failed;
    }
    std::ifstream input{path, std::ios::binary};
    if (!input) {
        fmt::print("error: failed to open '{}'\n", path);
        return Outcome::Failed;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)),
                                    std::istreambuf_iterator<char>());
    if (!ensure_bridge(state)) {
        return Outcome::Failed;
    }
    std::optional<std::expected<bridge::LoadSummary, std::string>> loaded;
    state.session.bridge->load_data(
        std::move(bytes), *format,
        [&loaded](std::expected<bridge::LoadSummary, std::string> outcome) {
            loaded = std::move(outcome);
        });
    drive(state.session.io, [&loaded] { return loaded.has_value(); });
    if (!loaded->has_value()) {
        fmt::print("error: {}\n", loaded->error());
        return Outcome::Failed;
    }
    const auto& summary = **loaded;
    std::string columns;
    for (std::size_t i = 0; i < summary.columns.size(); ++i) {
        if (i > 0) {
            columns += ", ";
        }
        columns += summary.columns[i];
    }
    fmt::print("loaded '{}': {} rows, columns: {}\n", path, summary.row_count,
               columns.empty() ? "<none>" : columns);
    return Outcome::Ok;
}

auto evaluate(ReplState& state, std::string_view input) -> Outcome {
    std::optional<std::expected<runtime::Result, std::string>> reply;
    state.session.client.execute(input,
                                 [&reply](std::expected<runtime::Result, std::string> outcome) {
                                     reply = std::move(outcome);
                                 });
    drive(state.session.io, [&reply] { return reply.has_value(); });
    if (!reply->has_value()) {
        fmt::print("error: {}\n", reply->error());
        return Outcome::Failed;
    }
    const auto& result = **reply;
    fmt::print("{}\n", format_result(result, state.max_rows));
    if (state.timing && result.execution()) {
        print_elapsed(*result.execution());
    }
    return result.is_error() ? Outcome::Failed : Outcome::Ok;
}

auto execute_input(ReplState& state, std::string_view input) -> Outcome {
    const auto line = trim(input);
    if (line.empty()) {
        return Outcome::Ok;
    }
    if (line == ":q" || line == ":quit" || line == ":exit") {
        return Outcome::Quit;
    }
    if (line == ":help") {
        print_help();
        return Outcome::Ok;
    }
    if (starts_with_command(line, ":timing")) {
        auto arg = command_argument(line, ":timing");
        if (arg.empty()) {
            state.timing = !state.timing;
        } else if (arg == "on") {
            state.timing = true;
        } else if (arg == "off") {
            state.timing = false;
        } else {
            fmt::print("usage: :timing [on|off]\n");
            return Outcome::Failed;
        }
        fmt::print("timing: {}\n", state.timing ? "on" : "off");
        return Outcome::Ok;
    }
    if (starts_with_command(line, ":connect")) {
        return command_connect(state, command_argument(line, ":connect"));
    }
    if (line == ":disconnect") {
        state.session.client.disconnect();
        fmt::print("disconnected\n");
        return Outcome::Ok;
    }
    if (line == ":status") {
        command_status(state);
        return Outcome::Ok;
    }
    if (starts_with_command(line, ":bridge")) {
        return command_bridge(state, command_argument(line, ":bridge"));
    }
    if (starts_with_command(line, ":load")) {
        return command_load(state, command_argument(line, ":load"));
    }
    if (line.front() == ':') {
        fmt::print("error: unknown command '{}' (try :help)\n", line);
        return Outcome::Failed;
    }
    return evaluate(state, input);
}

auto render_cell(const codec::Value& column, std::size_t row) -> std::string {
    const auto cell = codec::element_at(column, row);
    if (const auto* nested = cell.get_if<codec::Vector>()) {
        return fmt::format("[{}]", nested->length());
    }
    return codec::format_value(cell);
}

}  // namespace

auto format_table(const codec::Table& table, std::size_t max_rows) -> std::string {
    if (table.columns.empty()) {
        return "<empty>";
    }
    std::string out = fmt::format("rows: {}\n", table.row_count());

    const std::size_t col_count = table.column_count();
    const std::size_t shown_rows = std::min(table.row_count(), max_rows);

    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = table.names[c].size();
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = render_cell(table.columns[c], r);
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    auto append_sep = [&]() {
        out += "+";
        for (std::size_t c = 0; c < col_count; ++c) {
            out += fmt::format("{:-<{}}+", "", widths[c] + 2);
        }
        out += "\n";
    };

    append_sep();
    out += "|";
    for (std::size_t c = 0; c < col_count; ++c) {
        out += fmt::format(" {:<{}} |", table.names[c], widths[c]);
    }
    out += "\n";
    append_sep();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        out += "|";
        for (std::size_t c = 0; c < col_count; ++c) {
            out += fmt::format(" {:<{}} |", cells[c][r], widths[c]);
        }
        out += "\n";
    }
    append_sep();

    if (table.row_count() > shown_rows) {
        out += fmt::format("... ({} more rows)\n", table.row_count() - shown_rows);
    }
    out.pop_back();
    return out;
}

auto format_result(const runtime::Result& result, std::size_t max_rows) -> std::string {
    switch (result.kind()) {
        case runtime::ResultKind::Error:
            return fmt::format("error: {}", result.error_message());
        case runtime::ResultKind::Null:
            return "null";
        case runtime::ResultKind::Table:
            if (const auto* table = result.value().get_if<codec::Table>()) {
                return format_table(*table, max_rows);
            }
            break;
        case runtime::ResultKind::Scalar:
        case runtime::ResultKind::Vector:
            break;
    }
    return codec::format_value(result.value());
}

auto strip_continuation(std::string& line) -> bool {
    auto view = rtrim(line);
    if (!view.ends_with('\\')) {
        return false;
    }
    line.resize(view.size() - 1);
    return true;
}

auto execute_script(std::string_view source, Session& session, const ReplConfig& config) -> bool {
    ReplState state{.session = session, .timing = config.timing, .max_rows = config.max_rows};
    bool ok = true;
    std::string pending;
    std::size_t start = 0;
    while (start <= source.size()) {
        auto end = source.find('\n', start);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        std::string line(source.substr(start, end - start));
        start = end + 1;

        const bool continues = strip_continuation(line);
        pending += line;
        if (continues) {
            pending += '\n';
            continue;
        }
        const auto outcome = execute_input(state, pending);
        pending.clear();
        if (outcome == Outcome::Quit) {
            break;
        }
        ok = ok && outcome == Outcome::Ok;
    }
    if (!trim(pending).empty()) {
        ok = execute_input(state, pending) != Outcome::Failed && ok;
    }
    return ok;
}

void run(const ReplConfig& config, Session& session) {
    if (config.verbose) {
        spdlog::info("raylink console started (verbose={})", config.verbose);
    }
    ReplState state{.session = session, .timing = config.timing, .max_rows = config.max_rows};
    configure_line_editing();

    std::string line;
    std::string pending;
    while (true) {
        poll(session.io);
        const auto& prompt = pending.empty() ? config.prompt : config.continuation_prompt;
        if (!read_repl_line(prompt, line)) {
            fmt::print("\n");
            break;
        }
        if (strip_continuation(line)) {
            pending += line;
            pending += '\n';
            continue;
        }
        pending += line;
        const auto outcome = execute_input(state, pending);
        pending.clear();
        if (outcome == Outcome::Quit) {
            break;
        }
    }

    spdlog::info("raylink console exiting");
}

}  // namespace raylink::repl
