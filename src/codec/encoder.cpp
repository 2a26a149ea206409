#include <raylink/codec/encoder.hpp>

#include <algorithm>
#include <bit>
#include <type_traits>

namespace raylink::codec {

namespace {

void put_tag(Writer& writer, TypeCode type) {
    writer.put_i8(static_cast<std::int8_t>(type));
}

template <typename T>
void put_element(Writer& writer, const T& element) {
    if constexpr (std::is_same_v<T, std::uint8_t>) {
        writer.put_u8(element);
    } else if constexpr (std::is_same_v<T, std::int16_t>) {
        writer.put_i16(element);
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        writer.put_i32(element);
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        writer.put_i64(element);
    } else if constexpr (std::is_same_v<T, double>) {
        writer.put_f64(element);
    } else if constexpr (std::is_same_v<T, std::string>) {
        writer.put_cstr(element);
    } else if constexpr (std::is_same_v<T, Guid>) {
        writer.put_guid(element);
    }
}

void put_char_vector(Writer& writer, std::string_view text) {
    put_tag(writer, TypeCode::C8);
    writer.put_u8(0);  // attrs
    writer.put_i64(static_cast<std::int64_t>(text.size()));
    for (char ch : text) {
        writer.put_u8(static_cast<std::uint8_t>(ch));
    }
}

void put_atom(Writer& writer, const Atom& atom) {
    if (atom.type == TypeCode::C8) {
        const auto* text = std::get_if<std::string>(&atom.value);
        put_char_vector(writer, text != nullptr ? std::string_view(*text) : std::string_view{});
        return;
    }
    writer.put_i8(static_cast<std::int8_t>(-static_cast<int>(atom.type)));
    std::visit(
        [&](const auto& scalar) {
            using T = std::decay_t<decltype(scalar)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                // A typeless atom carries no payload; write the type's zero.
                if (auto storage = make_column_data(atom.type)) {
                    std::visit(
                        [&](const auto& column) {
                            using E = typename std::decay_t<decltype(column)>::value_type;
                            put_element(writer, E{});
                        },
                        *storage);
                }
            } else if constexpr (std::is_same_v<T, bool>) {
                writer.put_u8(scalar ? 1 : 0);
            } else {
                put_element(writer, scalar);
            }
        },
        atom.value);
}

void put_vector(Writer& writer, const Vector& vector) {
    put_tag(writer, vector.type);
    writer.put_u8(0);  // attrs
    writer.put_i64(static_cast<std::int64_t>(vector.length()));
    std::visit(
        [&](const auto& column) {
            for (const auto& element : column) {
                put_element(writer, element);
            }
        },
        vector.data);
}

void put_plain_table(Writer& writer, const Table& table, std::size_t first, std::size_t count) {
    put_tag(writer, TypeCode::Table);
    writer.put_u8(0);  // attrs
    put_tag(writer, TypeCode::Symbol);
    writer.put_u8(0);
    writer.put_i64(static_cast<std::int64_t>(count));
    for (std::size_t c = first; c < first + count; ++c) {
        writer.put_cstr(table.names[c]);
    }
    put_tag(writer, TypeCode::List);
    writer.put_u8(0);
    writer.put_i64(static_cast<std::int64_t>(count));
    for (std::size_t c = first; c < first + count; ++c) {
        encode_value(writer, table.columns[c]);
    }
}

}  // namespace

void Writer::put_uint(std::uint64_t value, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        const std::size_t shift = endian_ == Endian::Little ? (8 * i) : (8 * (width - 1 - i));
        bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void Writer::put_f64(double value) {
    put_uint(std::bit_cast<std::uint64_t>(value), 8);
}

void Writer::put_cstr(std::string_view text) {
    bytes_.insert(bytes_.end(), text.begin(), text.end());
    bytes_.push_back(0);
}

void Writer::put_guid(const Guid& guid) {
    bytes_.insert(bytes_.end(), guid.bytes.begin(), guid.bytes.end());
}

void encode_value(Writer& writer, const Value& value) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Null>) {
                put_tag(writer, TypeCode::Null);
            } else if constexpr (std::is_same_v<T, Atom>) {
                put_atom(writer, node);
            } else if constexpr (std::is_same_v<T, Vector>) {
                put_vector(writer, node);
            } else if constexpr (std::is_same_v<T, List>) {
                put_tag(writer, TypeCode::List);
                writer.put_u8(0);  // attrs
                writer.put_i64(static_cast<std::int64_t>(node.items.size()));
                for (const auto& item : node.items) {
                    encode_value(writer, item);
                }
            } else if constexpr (std::is_same_v<T, Dict>) {
                put_tag(writer, TypeCode::Dict);
                encode_value(writer, node.keys ? *node.keys : Value{});
                encode_value(writer, node.values ? *node.values : Value{});
            } else if constexpr (std::is_same_v<T, Table>) {
                const std::size_t key_count = std::min(node.key_columns, node.column_count());
                if (key_count == 0) {
                    put_plain_table(writer, node, 0, node.column_count());
                    return;
                }
                put_tag(writer, TypeCode::Dict);
                put_plain_table(writer, node, 0, key_count);
                put_plain_table(writer, node, key_count, node.column_count() - key_count);
            } else if constexpr (std::is_same_v<T, Error>) {
                put_tag(writer, TypeCode::Error);
                writer.put_u8(node.code);
                for (int i = 0; i < 8; ++i) {
                    writer.put_u8(0);  // context
                }
                if (node.code == kErrorCodeWithMessage) {
                    writer.put_cstr(node.message);
                }
            }
        },
        value.node);
}

auto encode_value(const Value& value, Endian endian) -> std::vector<std::uint8_t> {
    Writer writer(endian);
    encode_value(writer, value);
    return writer.take();
}

auto make_string_request(std::string_view code) -> Value {
    return Value{Atom{.type = TypeCode::C8, .value = Scalar{std::string(code)}}};
}

}  // namespace raylink::codec
