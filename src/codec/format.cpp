#include <raylink/codec/format.hpp>
#include <raylink/core/temporal.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <cmath>
#include <type_traits>

namespace raylink::codec {

namespace {

auto normalize_float_text(std::string text) -> std::string {
    auto trim_mantissa = [](std::string& mantissa) {
        auto dot = mantissa.find('.');
        if (dot != std::string::npos) {
            while (!mantissa.empty() && mantissa.back() == '0') {
                mantissa.pop_back();
            }
            if (!mantissa.empty() && mantissa.back() == '.') {
                mantissa.pop_back();
            }
        }
        if (mantissa == "-0") {
            mantissa = "0";
        }
    };

    auto exp_pos = text.find_first_of("eE");
    if (exp_pos == std::string::npos) {
        trim_mantissa(text);
        return text;
    }

    std::string mantissa = text.substr(0, exp_pos);
    trim_mantissa(mantissa);

    std::string exponent = text.substr(exp_pos + 1);
    char sign = '\0';
    std::size_t idx = 0;
    if (!exponent.empty() && (exponent[0] == '+' || exponent[0] == '-')) {
        sign = exponent[0];
        idx = 1;
    }
    while (idx < exponent.size() && exponent[idx] == '0') {
        ++idx;
    }
    std::string digits = idx < exponent.size() ? exponent.substr(idx) : "0";

    std::string out = std::move(mantissa);
    out.push_back('e');
    if (sign == '-') {
        out.push_back('-');
    }
    out.append(digits);
    return out;
}

auto is_textual(TypeCode type) -> bool {
    return type == TypeCode::C8 || type == TypeCode::Symbol;
}

/// Elements nested inside a container quote their strings.
auto format_element(const Value& value) -> std::string {
    if (const auto* atom = value.get_if<Atom>()) {
        if (atom->type == TypeCode::C8) {
            if (const auto* text = std::get_if<std::string>(&atom->value)) {
                return quote_and_escape(*text);
            }
        }
    }
    return format_value(value);
}

auto format_vector(const Vector& vector) -> std::string {
    if (vector.length() == 0) {
        return fmt::format("[]:{}", type_name(vector.type));
    }
    if (vector.type == TypeCode::C8) {
        const auto& chars = std::get<Column<std::uint8_t>>(vector.data);
        return quote_and_escape(std::string(chars.begin(), chars.end()));
    }
    std::string out;
    for (std::size_t i = 0; i < vector.length(); ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        out.append(format_scalar(vector.type, scalar_at(vector, i)));
    }
    return out;
}

}  // namespace

auto format_float(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::array<char, 128> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                   std::chars_format::general, 7);
    if (ec == std::errc{}) {
        return normalize_float_text(std::string(buffer.data(), ptr));
    }
    return normalize_float_text(fmt::format("{:.7g}", value));
}

auto quote_and_escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text) {
        switch (ch) {
            case '\\':
                out.append("\\\\");
                break;
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\t':
                out.append("\\t");
                break;
            case '\r':
                out.append("\\r");
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    out.push_back('"');
    return out;
}

auto format_scalar(TypeCode type, const Scalar& scalar) -> std::string {
    return std::visit(
        [type](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::uint8_t>) {
                return fmt::format("0x{:02x}", v);
            } else if constexpr (std::is_same_v<T, std::int32_t>) {
                if (type == TypeCode::Date) {
                    return format_date(Date{v});
                }
                if (type == TypeCode::Time) {
                    return format_time(Time{v});
                }
                return v == kNullI32 ? std::string("null") : fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                if (type == TypeCode::Timestamp) {
                    return format_timestamp(Timestamp{v});
                }
                return v == kNullI64 ? std::string("null") : fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_float(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return is_textual(type) ? v : quote_and_escape(v);
            } else if constexpr (std::is_same_v<T, Guid>) {
                return format_guid(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        scalar);
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "null";
            } else if constexpr (std::is_same_v<T, Atom>) {
                return format_scalar(node.type, node.value);
            } else if constexpr (std::is_same_v<T, Vector>) {
                return format_vector(node);
            } else if constexpr (std::is_same_v<T, List>) {
                std::string out = "(";
                for (std::size_t i = 0; i < node.items.size(); ++i) {
                    if (i > 0) {
                        out.push_back(' ');
                    }
                    out.append(format_element(node.items[i]));
                }
                out.push_back(')');
                return out;
            } else if constexpr (std::is_same_v<T, Dict>) {
                if (auto entries = dict_entries(node)) {
                    std::string out = "{";
                    bool first = true;
                    for (const auto& [key, item] : *entries) {
                        if (!first) {
                            out.append(", ");
                        }
                        first = false;
                        out.append(fmt::format("{}: {}", key, format_element(item)));
                    }
                    out.push_back('}');
                    return out;
                }
                return fmt::format("{{{}: {}}}", node.keys ? format_value(*node.keys) : "null",
                                   node.values ? format_value(*node.values) : "null");
            } else if constexpr (std::is_same_v<T, Table>) {
                std::string columns;
                for (std::size_t i = 0; i < node.names.size(); ++i) {
                    if (i > 0) {
                        columns.push_back(' ');
                    }
                    columns.append(node.names[i]);
                }
                return fmt::format("table[{}; {} rows]", columns, node.row_count());
            } else if constexpr (std::is_same_v<T, Error>) {
                return "error: " + node.message;
            }
        },
        value.node);
}

}  // namespace raylink::codec
