#include <raylink/codec/types.hpp>

#include <fmt/core.h>

namespace raylink::codec {

auto format_guid(const Guid& guid) -> std::string {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < guid.bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.append(fmt::format("{:02x}", guid.bytes[i]));
    }
    return out;
}

auto is_element_type(std::int8_t code) noexcept -> bool {
    return code >= static_cast<std::int8_t>(TypeCode::B8) &&
           code <= static_cast<std::int8_t>(TypeCode::C8);
}

auto element_width(TypeCode type) noexcept -> std::optional<std::size_t> {
    switch (type) {
        case TypeCode::B8:
        case TypeCode::U8:
        case TypeCode::C8:
            return 1;
        case TypeCode::I16:
            return 2;
        case TypeCode::I32:
        case TypeCode::Date:
        case TypeCode::Time:
            return 4;
        case TypeCode::I64:
        case TypeCode::Timestamp:
        case TypeCode::F64:
            return 8;
        case TypeCode::Guid:
            return 16;
        default:
            return std::nullopt;
    }
}

auto type_name(TypeCode type) -> std::string_view {
    switch (type) {
        case TypeCode::List:
            return "list";
        case TypeCode::B8:
            return "b8";
        case TypeCode::U8:
            return "u8";
        case TypeCode::I16:
            return "i16";
        case TypeCode::I32:
            return "i32";
        case TypeCode::I64:
            return "i64";
        case TypeCode::Symbol:
            return "sym";
        case TypeCode::Date:
            return "date";
        case TypeCode::Time:
            return "time";
        case TypeCode::Timestamp:
            return "ts";
        case TypeCode::F64:
            return "f64";
        case TypeCode::Guid:
            return "guid";
        case TypeCode::C8:
            return "c8";
        case TypeCode::Table:
            return "table";
        case TypeCode::Dict:
            return "dict";
        case TypeCode::Lambda:
            return "lambda";
        case TypeCode::Null:
            return "null";
        case TypeCode::Error:
            return "error";
    }
    return "unknown";
}

}  // namespace raylink::codec
