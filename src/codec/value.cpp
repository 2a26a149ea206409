#include <raylink/codec/value.hpp>

#include <fmt/core.h>

#include <stdexcept>

namespace raylink::codec {

auto Vector::length() const noexcept -> std::size_t {
    return std::visit([](const auto& column) { return column.size(); }, data);
}

bool List::operator==(const List& other) const {
    return items == other.items;
}

bool Dict::operator==(const Dict& other) const {
    auto same = [](const std::shared_ptr<const Value>& lhs,
                   const std::shared_ptr<const Value>& rhs) {
        if (!lhs || !rhs) {
            return lhs == rhs;
        }
        return *lhs == *rhs;
    };
    return same(keys, other.keys) && same(values, other.values);
}

bool Table::operator==(const Table& other) const {
    return key_columns == other.key_columns && names == other.names && columns == other.columns;
}

auto Table::row_count() const -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_length(columns.front()).value_or(0);
}

auto Table::find(std::string_view name) const -> const Value* {
    for (std::size_t i = 0; i < names.size() && i < columns.size(); ++i) {
        if (names[i] == name) {
            return &columns[i];
        }
    }
    return nullptr;
}

auto Table::row(std::size_t index) const -> Record {
    if (index >= row_count()) {
        throw std::out_of_range(fmt::format("row {} out of range ({} rows)", index, row_count()));
    }
    Record record;
    for (std::size_t c = 0; c < names.size() && c < columns.size(); ++c) {
        record.insert_or_assign(names[c], element_at(columns[c], index));
    }
    return record;
}

auto Table::records() const -> std::vector<Record> {
    std::vector<Record> out;
    const std::size_t rows = row_count();
    out.reserve(rows);
    for (std::size_t r = 0; r < rows; ++r) {
        out.push_back(row(r));
    }
    return out;
}

auto make_dict(Value keys, Value values) -> Value {
    return Value{Dict{
        .keys = std::make_shared<const Value>(std::move(keys)),
        .values = std::make_shared<const Value>(std::move(values)),
    }};
}

auto make_column_data(TypeCode type) -> std::optional<ColumnData> {
    switch (type) {
        case TypeCode::B8:
        case TypeCode::U8:
        case TypeCode::C8:
            return ColumnData{Column<std::uint8_t>{}};
        case TypeCode::I16:
            return ColumnData{Column<std::int16_t>{}};
        case TypeCode::I32:
        case TypeCode::Date:
        case TypeCode::Time:
            return ColumnData{Column<std::int32_t>{}};
        case TypeCode::I64:
        case TypeCode::Timestamp:
            return ColumnData{Column<std::int64_t>{}};
        case TypeCode::F64:
            return ColumnData{Column<double>{}};
        case TypeCode::Symbol:
            return ColumnData{Column<std::string>{}};
        case TypeCode::Guid:
            return ColumnData{Column<Guid>{}};
        default:
            return std::nullopt;
    }
}

auto scalar_at(const Vector& vector, std::size_t index) -> Scalar {
    return std::visit(
        [&](const auto& column) -> Scalar {
            using T = typename std::decay_t<decltype(column)>::value_type;
            const T& element = column.at(index);
            if constexpr (std::is_same_v<T, std::uint8_t>) {
                if (vector.type == TypeCode::B8) {
                    return Scalar{element != 0};
                }
                if (vector.type == TypeCode::C8) {
                    return Scalar{std::string(1, static_cast<char>(element))};
                }
                return Scalar{element};
            } else {
                return Scalar{element};
            }
        },
        vector.data);
}

auto element_at(const Value& column, std::size_t index) -> Value {
    if (const auto* vector = column.get_if<Vector>()) {
        return Value{Atom{.type = vector->type, .value = scalar_at(*vector, index)}};
    }
    if (const auto* list = column.get_if<List>()) {
        return list->items.at(index);
    }
    throw std::out_of_range("value is not a vector or list column");
}

auto column_length(const Value& column) -> std::optional<std::size_t> {
    if (const auto* vector = column.get_if<Vector>()) {
        return vector->length();
    }
    if (const auto* list = column.get_if<List>()) {
        return list->items.size();
    }
    return std::nullopt;
}

auto dict_entries(const Dict& dict) -> std::optional<Record> {
    if (!dict.keys || !dict.values) {
        return std::nullopt;
    }
    const auto* keys = dict.keys->get_if<Vector>();
    if (keys == nullptr || keys->type != TypeCode::Symbol) {
        return std::nullopt;
    }
    auto count = column_length(*dict.values);
    if (!count.has_value() || *count != keys->length()) {
        return std::nullopt;
    }
    const auto& names = std::get<Column<std::string>>(keys->data);
    Record out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        out.insert_or_assign(names[i], element_at(*dict.values, i));
    }
    return out;
}

}  // namespace raylink::codec
