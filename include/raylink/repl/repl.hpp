#pragma once

#include <raylink/bridge/bridge.hpp>
#include <raylink/codec/value.hpp>
#include <raylink/runtime/client.hpp>
#include <raylink/runtime/result.hpp>

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace raylink::repl {

/// Configuration for the console session.
struct ReplConfig {
    bool verbose = false;
    std::string prompt = "raylink> ";
    std::string continuation_prompt = "    ...> ";
    /// Rows printed for a table result.
    std::size_t max_rows = 10;
    bool timing = false;
};

/// What a console session drives. `bridge` may be null.
struct Session {
    boost::asio::io_context& io;
    runtime::Client& client;
    bridge::Bridge* bridge = nullptr;
};

/// Run the interactive loop until end of input or `:quit`.
void run(const ReplConfig& config, Session& session);

/// Execute console input line by line, as typed (useful for tests). Returns
/// false when any input failed.
[[nodiscard]] auto execute_script(std::string_view source, Session& session,
                                  const ReplConfig& config = {}) -> bool;

/// Boxed text rendering of a table, at most `max_rows` rows.
[[nodiscard]] auto format_table(const codec::Table& table, std::size_t max_rows = 10)
    -> std::string;

/// Console rendering of any result.
[[nodiscard]] auto format_result(const runtime::Result& result, std::size_t max_rows = 10)
    -> std::string;

/// Remove a trailing `\` (and the whitespace before it) from `line`.
/// Returns true when the input continues on the next line.
[[nodiscard]] auto strip_continuation(std::string& line) -> bool;

}  // namespace raylink::repl
