#include <raylink/runtime/directives.hpp>

#include <charconv>
#include <cstdint>
#include <optional>
#include <vector>

namespace raylink::runtime {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Leading integer of `text`, as parseInt would read it.
auto parse_timeout(std::string_view text) -> std::optional<std::int64_t> {
    text = trim(text);
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto parse_directives(std::string_view text, std::chrono::milliseconds default_timeout)
    -> Directives {
    Directives directives;
    directives.timeout = default_timeout;
    std::vector<std::string_view> code_lines;
    const auto source = trim(text);
    std::size_t start = 0;
    while (start <= source.size()) {
        auto end = source.find('\n', start);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        const auto raw_line = source.substr(start, end - start);
        const auto line = trim(raw_line);
        start = end + 1;

        if (line.starts_with("@local")) {
            directives.force_local = true;
        } else if (line.starts_with("@remote")) {
            directives.force_remote = true;
        } else if (line.starts_with("@timeout:")) {
            auto value = parse_timeout(line.substr(std::string_view("@timeout:").size()));
            if (value.has_value() && *value >= 0) {
                directives.timeout = std::chrono::milliseconds{*value};
            }
        } else if (!line.starts_with('@')) {
            code_lines.push_back(raw_line);
        }
    }

    std::string code;
    for (std::size_t i = 0; i < code_lines.size(); ++i) {
        if (i > 0) {
            code.push_back('\n');
        }
        code.append(code_lines[i]);
    }
    directives.code = std::string(trim(code));
    return directives;
}

}  // namespace raylink::runtime
