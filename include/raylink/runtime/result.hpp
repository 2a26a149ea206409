#pragma once

#include <raylink/codec/types.hpp>
#include <raylink/codec/value.hpp>
#include <raylink/engine/evaluator.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace raylink::runtime {

enum class ResultKind : std::uint8_t { Table, Scalar, Vector, Error, Null };

/// Where a result was evaluated.
enum class Origin : std::uint8_t { Local, Remote };

[[nodiscard]] auto to_string(ResultKind kind) -> std::string_view;
[[nodiscard]] auto to_string(Origin origin) -> std::string_view;

/// Execution metadata stamped by the router.
struct ExecutionInfo {
    double elapsed_ms = 0.0;
    Origin origin = Origin::Local;
};

/// Zero-copy view over a fixed-width column.
///
/// `bytes` points into memory owned by the Result it came from and stays
/// valid for as long as any copy of that Result lives.
struct ColumnView {
    codec::TypeCode type = codec::TypeCode::I64;
    std::span<const std::byte> bytes;
    std::size_t length = 0;

    /// Reinterpret as elements of `T`. Empty when the width does not match.
    template <typename T>
    [[nodiscard]] auto as() const -> std::span<const T> {
        if (bytes.size() != length * sizeof(T)) {
            return {};
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return {reinterpret_cast<const T*>(bytes.data()), length};
    }
};

/// Row-major projection of a result. Tables produce records, scalars and
/// vectors their value, errors and nulls nothing.
using Materialized = std::variant<std::monostate, codec::Value, std::vector<codec::Record>>;

class ResultSource;

/// Uniform, immutable view of an evaluated value.
///
/// Copies share one source; the native handle behind a local result is
/// released when the last copy goes away.
class Result {
   public:
    [[nodiscard]] static auto from_value(codec::Value value) -> Result;
    [[nodiscard]] static auto from_error(std::string message) -> Result;
    [[nodiscard]] static auto null() -> Result;
    [[nodiscard]] static auto from_native(engine::OwnedHandle handle) -> Result;

    [[nodiscard]] auto kind() const -> ResultKind;
    [[nodiscard]] auto is_error() const -> bool { return kind() == ResultKind::Error; }

    /// Column names of a table result; empty otherwise.
    [[nodiscard]] auto columns() const -> const std::vector<std::string>&;

    /// Engine type names (`i64`, `sym`, ...) aligned with `columns()`.
    [[nodiscard]] auto column_types() const -> std::vector<std::string>;

    [[nodiscard]] auto row_count() const -> std::size_t;

    /// Zero-copy view of a fixed-width table column. Symbol and list columns
    /// have no view.
    [[nodiscard]] auto column(std::string_view name) const -> std::optional<ColumnView>;

    /// Zero-copy view of a fixed-width vector result.
    [[nodiscard]] auto vector_view() const -> std::optional<ColumnView>;

    /// Message of an error result; empty otherwise.
    [[nodiscard]] auto error_message() const -> std::string;

    /// The full decoded value. Native results serialize and decode once.
    [[nodiscard]] auto value() const -> const codec::Value&;

    /// Computed on first call; later calls return the same object.
    [[nodiscard]] auto materialize() const -> const Materialized&;

    [[nodiscard]] auto execution() const noexcept -> const std::optional<ExecutionInfo>& {
        return execution_;
    }

    /// Copy of this result carrying execution metadata.
    [[nodiscard]] auto with_execution(double elapsed_ms, Origin origin) const -> Result;

   private:
    explicit Result(std::shared_ptr<const ResultSource> source) : source_(std::move(source)) {}

    std::shared_ptr<const ResultSource> source_;
    std::optional<ExecutionInfo> execution_;
};

}  // namespace raylink::runtime
