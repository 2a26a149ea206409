#include <raylink/codec/decoder.hpp>

#include <fmt/core.h>

#include <bit>
#include <string_view>
#include <type_traits>
#include <utility>

namespace raylink::codec {

namespace {

using std::unexpected;

/// Bounded, endian-aware cursor over a payload.
class Reader {
   public:
    Reader(std::span<const std::uint8_t> bytes, Endian endian) : bytes_(bytes), endian_(endian) {}

    [[nodiscard]] auto offset() const noexcept -> std::size_t { return pos_; }
    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return bytes_.size() - pos_; }

    [[nodiscard]] auto fail(std::string message) const -> unexpected<DecodeError> {
        return unexpected(DecodeError{.message = std::move(message), .offset = pos_});
    }

    auto read_u8() -> std::expected<std::uint8_t, DecodeError> {
        if (remaining() < 1) {
            return fail("unexpected end of payload");
        }
        return bytes_[pos_++];
    }

    auto peek_i8() const -> std::expected<std::int8_t, DecodeError> {
        if (remaining() < 1) {
            return fail("unexpected end of payload");
        }
        return static_cast<std::int8_t>(bytes_[pos_]);
    }

    auto skip(std::size_t count) -> std::expected<void, DecodeError> {
        if (remaining() < count) {
            return fail(fmt::format("unexpected end of payload: need {} bytes, have {}", count,
                                    remaining()));
        }
        pos_ += count;
        return {};
    }

    template <typename T>
        requires std::is_integral_v<T>
    auto read_int() -> std::expected<T, DecodeError> {
        constexpr std::size_t width = sizeof(T);
        if (remaining() < width) {
            return fail(fmt::format("unexpected end of payload: need {} bytes, have {}", width,
                                    remaining()));
        }
        std::make_unsigned_t<T> raw = 0;
        for (std::size_t i = 0; i < width; ++i) {
            const std::size_t shift =
                endian_ == Endian::Little ? (8 * i) : (8 * (width - 1 - i));
            raw |= static_cast<std::make_unsigned_t<T>>(
                static_cast<std::make_unsigned_t<T>>(bytes_[pos_ + i]) << shift);
        }
        pos_ += width;
        return static_cast<T>(raw);
    }

    auto read_f64() -> std::expected<double, DecodeError> {
        auto raw = read_int<std::uint64_t>();
        if (!raw) {
            return unexpected(raw.error());
        }
        return std::bit_cast<double>(*raw);
    }

    auto read_cstr() -> std::expected<std::string, DecodeError> {
        const auto rest = bytes_.subspan(pos_);
        for (std::size_t i = 0; i < rest.size(); ++i) {
            if (rest[i] == 0) {
                std::string out(reinterpret_cast<const char*>(rest.data()), i);
                pos_ += i + 1;
                return out;
            }
        }
        return fail("unterminated string");
    }

    auto read_guid() -> std::expected<Guid, DecodeError> {
        if (remaining() < 16) {
            return fail("unexpected end of payload: truncated guid");
        }
        Guid guid;
        for (std::size_t i = 0; i < guid.bytes.size(); ++i) {
            guid.bytes[i] = bytes_[pos_ + i];
        }
        pos_ += 16;
        return guid;
    }

    template <typename T>
    auto read_element() -> std::expected<T, DecodeError> {
        if constexpr (std::is_same_v<T, std::uint8_t>) {
            return read_u8();
        } else if constexpr (std::is_same_v<T, double>) {
            return read_f64();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return read_cstr();
        } else if constexpr (std::is_same_v<T, Guid>) {
            return read_guid();
        } else {
            return read_int<T>();
        }
    }

   private:
    std::span<const std::uint8_t> bytes_;
    Endian endian_;
    std::size_t pos_ = 0;
};

class Decoder {
   public:
    explicit Decoder(Reader& reader) : reader_(reader) {}

    auto decode(std::size_t depth) -> std::expected<Value, DecodeError> {
        if (depth > kMaxDecodeDepth) {
            return reader_.fail("value nesting too deep");
        }
        auto tag_byte = reader_.read_u8();
        if (!tag_byte) {
            return unexpected(tag_byte.error());
        }
        const auto tag = static_cast<std::int8_t>(*tag_byte);
        if (tag < 0) {
            return decode_atom(tag);
        }
        if (tag == static_cast<std::int8_t>(TypeCode::List)) {
            return decode_list(depth);
        }
        if (tag <= kMaxVectorTag) {
            return decode_vector(tag);
        }
        switch (static_cast<TypeCode>(tag)) {
            case TypeCode::Table:
                return decode_table(depth);
            case TypeCode::Dict:
                return decode_dict(depth);
            case TypeCode::Null:
                return Value{Null{}};
            case TypeCode::Error:
                return decode_error();
            default:
                break;
        }
        return reader_.fail(fmt::format("unsupported type tag {}", static_cast<int>(tag)));
    }

   private:
    auto decode_atom(std::int8_t tag) -> std::expected<Value, DecodeError> {
        const int code = -static_cast<int>(tag);
        if (code > kMaxVectorTag || !is_element_type(static_cast<std::int8_t>(code))) {
            return reader_.fail(fmt::format("unsupported atom type {}", code));
        }
        const auto type = static_cast<TypeCode>(code);
        auto scalar = read_scalar(type);
        if (!scalar) {
            return unexpected(scalar.error());
        }
        return Value{Atom{.type = type, .value = std::move(*scalar)}};
    }

    auto read_scalar(TypeCode type) -> std::expected<Scalar, DecodeError> {
        auto storage = make_column_data(type);
        return std::visit(
            [&](const auto& column) -> std::expected<Scalar, DecodeError> {
                using T = typename std::decay_t<decltype(column)>::value_type;
                auto element = reader_.read_element<T>();
                if (!element) {
                    return unexpected(element.error());
                }
                if constexpr (std::is_same_v<T, std::uint8_t>) {
                    if (type == TypeCode::B8) {
                        return Scalar{*element != 0};
                    }
                    if (type == TypeCode::C8) {
                        return Scalar{std::string(1, static_cast<char>(*element))};
                    }
                }
                return Scalar{std::move(*element)};
            },
            *storage);
    }

    auto read_length(std::optional<std::size_t> min_element_bytes)
        -> std::expected<std::size_t, DecodeError> {
        const std::size_t at = reader_.offset();
        auto length = reader_.read_int<std::int64_t>();
        if (!length) {
            return unexpected(length.error());
        }
        if (*length < 0) {
            return unexpected(DecodeError{
                .message = fmt::format("negative length {}", *length),
                .offset = at,
            });
        }
        const auto count = static_cast<std::uint64_t>(*length);
        const std::size_t per_element = min_element_bytes.value_or(1);
        if (count > reader_.remaining() / per_element) {
            return unexpected(DecodeError{
                .message = fmt::format("length {} exceeds remaining {} bytes", count,
                                       reader_.remaining()),
                .offset = at,
            });
        }
        return static_cast<std::size_t>(count);
    }

    auto decode_vector(std::int8_t tag) -> std::expected<Value, DecodeError> {
        if (!is_element_type(tag)) {
            return reader_.fail(fmt::format("unsupported vector element type {}",
                                            static_cast<int>(tag)));
        }
        const auto type = static_cast<TypeCode>(tag);
        if (auto attrs = reader_.skip(1); !attrs) {
            return unexpected(attrs.error());
        }
        auto length = read_length(element_width(type));
        if (!length) {
            return unexpected(length.error());
        }
        auto data = read_elements(type, *length);
        if (!data) {
            return unexpected(data.error());
        }
        if (type == TypeCode::C8) {
            const auto& chars = std::get<Column<std::uint8_t>>(*data);
            std::string text(chars.begin(), chars.end());
            return Value{Atom{.type = TypeCode::C8, .value = Scalar{std::move(text)}}};
        }
        return Value{Vector{.type = type, .data = std::move(*data)}};
    }

    auto read_elements(TypeCode type, std::size_t length)
        -> std::expected<ColumnData, DecodeError> {
        auto storage = make_column_data(type);
        std::expected<void, DecodeError> status;
        std::visit(
            [&](auto& column) {
                using T = typename std::decay_t<decltype(column)>::value_type;
                column.reserve(length);
                for (std::size_t i = 0; i < length; ++i) {
                    auto element = reader_.read_element<T>();
                    if (!element) {
                        status = unexpected(element.error());
                        return;
                    }
                    column.push_back(std::move(*element));
                }
            },
            *storage);
        if (!status) {
            return unexpected(status.error());
        }
        return std::move(*storage);
    }

    auto decode_list(std::size_t depth) -> std::expected<Value, DecodeError> {
        if (auto attrs = reader_.skip(1); !attrs) {
            return unexpected(attrs.error());
        }
        auto length = read_length(std::nullopt);
        if (!length) {
            return unexpected(length.error());
        }
        List list;
        list.items.reserve(*length);
        for (std::size_t i = 0; i < *length; ++i) {
            auto item = decode(depth + 1);
            if (!item) {
                return unexpected(item.error());
            }
            list.items.push_back(std::move(*item));
        }
        return Value{std::move(list)};
    }

    /// Collapsed char columns come back as Atom(C8); restore them to vectors
    /// so every column stays addressable by row.
    static auto as_column(Value value) -> std::optional<Value> {
        if (value.is<Vector>() || value.is<List>()) {
            return value;
        }
        if (const auto* atom = value.get_if<Atom>(); atom != nullptr && atom->type == TypeCode::C8) {
            const auto& text = std::get<std::string>(atom->value);
            Column<std::uint8_t> chars;
            chars.reserve(text.size());
            for (char ch : text) {
                chars.push_back(static_cast<std::uint8_t>(ch));
            }
            return Value{Vector{.type = TypeCode::C8, .data = std::move(chars)}};
        }
        return std::nullopt;
    }

    auto decode_table(std::size_t depth) -> std::expected<Value, DecodeError> {
        if (auto attrs = reader_.skip(1); !attrs) {
            return unexpected(attrs.error());
        }
        auto names_value = decode(depth + 1);
        if (!names_value) {
            return unexpected(names_value.error());
        }
        const auto* names = names_value->get_if<Vector>();
        if (names == nullptr || names->type != TypeCode::Symbol) {
            return reader_.fail("table column names are not a symbol vector");
        }
        const std::size_t columns_at = reader_.offset();
        auto columns_value = decode(depth + 1);
        if (!columns_value) {
            return unexpected(columns_value.error());
        }
        auto* columns = std::get_if<List>(&columns_value->node);
        if (columns == nullptr) {
            return unexpected(DecodeError{
                .message = "table columns are not a list",
                .offset = columns_at,
            });
        }

        const auto& name_column = std::get<Column<std::string>>(names->data);
        if (name_column.size() != columns->items.size()) {
            return reader_.fail(fmt::format("table has {} column names but {} columns",
                                            name_column.size(), columns->items.size()));
        }

        Table table;
        table.names.assign(name_column.begin(), name_column.end());
        table.columns.reserve(columns->items.size());
        std::optional<std::size_t> rows;
        for (std::size_t c = 0; c < columns->items.size(); ++c) {
            auto column = as_column(std::move(columns->items[c]));
            if (!column.has_value()) {
                return reader_.fail(
                    fmt::format("table column '{}' is not a vector or list", table.names[c]));
            }
            const std::size_t length = column_length(*column).value_or(0);
            if (rows.has_value() && *rows != length) {
                return reader_.fail(fmt::format("table column '{}' has {} rows, expected {}",
                                                table.names[c], length, *rows));
            }
            rows = length;
            table.columns.push_back(std::move(*column));
        }
        return Value{std::move(table)};
    }

    auto decode_dict(std::size_t depth) -> std::expected<Value, DecodeError> {
        auto next = reader_.peek_i8();
        if (!next) {
            return unexpected(next.error());
        }
        auto keys = decode(depth + 1);
        if (!keys) {
            return unexpected(keys.error());
        }
        auto values = decode(depth + 1);
        if (!values) {
            return unexpected(values.error());
        }
        if (*next != static_cast<std::int8_t>(TypeCode::Table)) {
            return make_dict(std::move(*keys), std::move(*values));
        }

        auto* key_table = std::get_if<Table>(&keys->node);
        auto* value_table = std::get_if<Table>(&values->node);
        if (key_table == nullptr || value_table == nullptr) {
            return reader_.fail("keyed table value side is not a table");
        }
        if (key_table->row_count() != value_table->row_count()) {
            return reader_.fail(fmt::format("keyed table has {} key rows but {} value rows",
                                            key_table->row_count(), value_table->row_count()));
        }
        Table merged;
        merged.key_columns = key_table->column_count();
        merged.names = std::move(key_table->names);
        merged.columns = std::move(key_table->columns);
        for (std::size_t c = 0; c < value_table->names.size(); ++c) {
            merged.names.push_back(std::move(value_table->names[c]));
            merged.columns.push_back(std::move(value_table->columns[c]));
        }
        return Value{std::move(merged)};
    }

    auto decode_error() -> std::expected<Value, DecodeError> {
        auto code = reader_.read_u8();
        if (!code) {
            return unexpected(code.error());
        }
        if (auto context = reader_.skip(8); !context) {
            return unexpected(context.error());
        }
        Error error{.code = *code, .message = {}};
        if (*code == kErrorCodeWithMessage) {
            auto message = reader_.read_cstr();
            if (!message) {
                return unexpected(message.error());
            }
            error.message = std::move(*message);
        }
        if (error.message.empty()) {
            error.message = fmt::format("Error code: {}", static_cast<int>(*code));
        }
        return Value{std::move(error)};
    }

    Reader& reader_;
};

}  // namespace

auto DecodeError::format() const -> std::string {
    return fmt::format("{} (at byte {})", message, offset);
}

auto decode_value(std::span<const std::uint8_t> bytes, Endian endian)
    -> std::expected<Value, DecodeError> {
    Reader reader(bytes, endian);
    Decoder decoder(reader);
    return decoder.decode(0);
}

}  // namespace raylink::codec
