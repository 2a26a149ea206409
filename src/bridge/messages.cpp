#include <raylink/bridge/messages.hpp>

namespace raylink::bridge {

auto to_string(DataFormat format) -> std::string_view {
    switch (format) {
        case DataFormat::Csv:
            return "csv";
        case DataFormat::Rayforce:
            return "rayforce";
    }
    return "unknown";
}

auto parse_format(std::string_view text) -> std::optional<DataFormat> {
    if (text == "csv") {
        return DataFormat::Csv;
    }
    if (text == "rayforce") {
        return DataFormat::Rayforce;
    }
    return std::nullopt;
}

}  // namespace raylink::bridge
