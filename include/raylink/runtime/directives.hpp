#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace raylink::runtime {

/// Timeout applied when a query carries no `@timeout:` directive.
inline constexpr std::chrono::milliseconds kDefaultQueryTimeout{30000};

/// Routing flags and cleaned source extracted from query text.
struct Directives {
    bool force_local = false;
    bool force_remote = false;
    std::chrono::milliseconds timeout = kDefaultQueryTimeout;
    /// Query text with every directive line removed, trimmed.
    std::string code;
};

/// Strip `@local`, `@remote` and `@timeout:<ms>` lines from `text`.
///
/// Matching is by prefix on each trimmed line. Other lines starting with `@`
/// are dropped. An unparsable or negative timeout keeps `default_timeout`.
[[nodiscard]] auto parse_directives(std::string_view text,
                                    std::chrono::milliseconds default_timeout =
                                        kDefaultQueryTimeout) -> Directives;

}  // namespace raylink::runtime
