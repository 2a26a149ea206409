#pragma once

#include <raylink/codec/types.hpp>
#include <raylink/core/column.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace raylink::codec {

struct Value;

/// Row-major projection of one table row, keyed by column name.
using Record = std::map<std::string, Value>;

/// Atom payload. Dates and times travel as std::int32_t, timestamps as
/// std::int64_t, symbols and chars as std::string.
using Scalar = std::variant<std::monostate, bool, std::uint8_t, std::int16_t, std::int32_t,
                            std::int64_t, double, std::string, Guid>;

/// Vector payload, one alternative per storage class.
using ColumnData =
    std::variant<Column<std::uint8_t>, Column<std::int16_t>, Column<std::int32_t>,
                 Column<std::int64_t>, Column<double>, Column<std::string>, Column<Guid>>;

struct Null {
    bool operator==(const Null&) const = default;
};

struct Atom {
    TypeCode type = TypeCode::I64;
    Scalar value;
    bool operator==(const Atom&) const = default;
};

struct Vector {
    TypeCode type = TypeCode::I64;
    ColumnData data;

    [[nodiscard]] auto length() const noexcept -> std::size_t;
    bool operator==(const Vector&) const = default;
};

struct List {
    std::vector<Value> items;
    bool operator==(const List& other) const;
};

/// Plain dictionary. A dictionary keyed by a table never survives decoding;
/// it is merged into a keyed Table instead.
struct Dict {
    std::shared_ptr<const Value> keys;
    std::shared_ptr<const Value> values;
    bool operator==(const Dict& other) const;
};

/// Column-oriented table. The first `key_columns` columns came from the key
/// side of a keyed table.
struct Table {
    std::vector<std::string> names;
    std::vector<Value> columns;
    std::size_t key_columns = 0;

    [[nodiscard]] auto column_count() const noexcept -> std::size_t { return names.size(); }
    [[nodiscard]] auto row_count() const -> std::size_t;
    [[nodiscard]] auto find(std::string_view name) const -> const Value*;

    /// Project a single row. Throws std::out_of_range past the last row.
    [[nodiscard]] auto row(std::size_t index) const -> Record;
    [[nodiscard]] auto records() const -> std::vector<Record>;

    bool operator==(const Table& other) const;
};

struct Error {
    std::uint8_t code = 0;
    std::string message;
    bool operator==(const Error&) const = default;
};

/// A decoded engine value.
struct Value {
    std::variant<Null, Atom, Vector, List, Dict, Table, Error> node;

    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool {
        return std::holds_alternative<T>(node);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&node);
    }

    bool operator==(const Value&) const = default;
};

/// Build a dictionary value from its two halves.
[[nodiscard]] auto make_dict(Value keys, Value values) -> Value;

/// Empty vector storage for an element type.
[[nodiscard]] auto make_column_data(TypeCode type) -> std::optional<ColumnData>;

/// Element `index` of a vector as a Scalar of its atom representation.
[[nodiscard]] auto scalar_at(const Vector& vector, std::size_t index) -> Scalar;

/// Element `index` of a vector or list column. Throws std::out_of_range.
[[nodiscard]] auto element_at(const Value& column, std::size_t index) -> Value;

/// Number of elements a value holds as a table column (vector or list).
[[nodiscard]] auto column_length(const Value& column) -> std::optional<std::size_t>;

/// String-keyed view of a dictionary whose keys are a symbol vector and whose
/// values are a vector or list of the same length.
[[nodiscard]] auto dict_entries(const Dict& dict) -> std::optional<Record>;

}  // namespace raylink::codec
