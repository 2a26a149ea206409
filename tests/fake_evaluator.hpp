#pragma once

#include <raylink/codec/encoder.hpp>
#include <raylink/codec/value.hpp>
#include <raylink/engine/evaluator.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace raylink::testing {

/// In-memory engine: each expression evaluates to a scripted Value.
///
/// Handles are indices into an object table so tests can check that every
/// handle is released exactly once.
class FakeEvaluator final : public engine::Evaluator {
   public:
    /// Expression that makes `evaluate` throw.
    static constexpr std::string_view kThrowExpression = "boom";

    void script(std::string code, codec::Value value) {
        std::lock_guard lock(mutex_);
        scripted_[std::move(code)] = std::move(value);
    }

    [[nodiscard]] auto version() const -> std::string override { return "fake-1"; }

    [[nodiscard]] auto evaluate(std::string_view code)
        -> std::expected<engine::Handle, std::string> override {
        if (code == kThrowExpression) {
            throw std::runtime_error("engine crashed");
        }
        std::lock_guard lock(mutex_);
        ++evaluations_;
        auto it = scripted_.find(std::string(code));
        if (it == scripted_.end()) {
            return allocate(codec::Value{codec::Error{
                .code = codec::kErrorCodeWithMessage,
                .message = "undefined: " + std::string(code),
            }});
        }
        return allocate(it->second);
    }

    [[nodiscard]] auto is_null(engine::Handle handle) const -> bool override {
        return object(handle).is<codec::Null>();
    }

    [[nodiscard]] auto is_error(engine::Handle handle) const -> bool override {
        return object(handle).is<codec::Error>();
    }

    [[nodiscard]] auto type_code(engine::Handle handle) const -> std::int8_t override {
        const auto& value = object(handle);
        if (const auto* atom = value.get_if<codec::Atom>()) {
            return static_cast<std::int8_t>(-static_cast<int>(atom->type));
        }
        if (const auto* vector = value.get_if<codec::Vector>()) {
            return static_cast<std::int8_t>(vector->type);
        }
        if (value.is<codec::List>()) {
            return static_cast<std::int8_t>(codec::TypeCode::List);
        }
        if (const auto* table = value.get_if<codec::Table>()) {
            return static_cast<std::int8_t>(table->key_columns > 0 ? codec::TypeCode::Dict
                                                                   : codec::TypeCode::Table);
        }
        if (value.is<codec::Dict>()) {
            return static_cast<std::int8_t>(codec::TypeCode::Dict);
        }
        if (value.is<codec::Error>()) {
            return static_cast<std::int8_t>(codec::TypeCode::Error);
        }
        return static_cast<std::int8_t>(codec::TypeCode::Null);
    }

    [[nodiscard]] auto is_vector(engine::Handle handle) const -> bool override {
        return object(handle).is<codec::Vector>();
    }

    [[nodiscard]] auto length(engine::Handle handle) const -> std::int64_t override {
        const auto& value = object(handle);
        if (const auto* table = value.get_if<codec::Table>()) {
            return static_cast<std::int64_t>(table->row_count());
        }
        return static_cast<std::int64_t>(codec::column_length(value).value_or(1));
    }

    [[nodiscard]] auto error_message(engine::Handle handle) const -> std::string override {
        if (const auto* error = object(handle).get_if<codec::Error>()) {
            return error->message;
        }
        return {};
    }

    [[nodiscard]] auto column_names(engine::Handle handle) const
        -> std::vector<std::string> override {
        if (const auto* table = object(handle).get_if<codec::Table>()) {
            return table->names;
        }
        return {};
    }

    [[nodiscard]] auto column(engine::Handle table, std::string_view name)
        -> engine::Handle override {
        const auto* found = object(table).get_if<codec::Table>();
        if (found == nullptr) {
            return nullptr;
        }
        const auto* column = found->find(name);
        if (column == nullptr) {
            return nullptr;
        }
        std::lock_guard lock(mutex_);
        return allocate(*column);
    }

    [[nodiscard]] auto raw_data(engine::Handle handle) const
        -> std::span<const std::byte> override {
        const auto* vector = object(handle).get_if<codec::Vector>();
        if (vector == nullptr) {
            return {};
        }
        return std::visit(
            [](const auto& column) -> std::span<const std::byte> {
                using T = typename std::decay_t<decltype(column)>::value_type;
                if constexpr (std::is_same_v<T, std::string>) {
                    return {};
                } else {
                    return column.bytes();
                }
            },
            vector->data);
    }

    [[nodiscard]] auto serialize(engine::Handle handle) const
        -> std::expected<std::vector<std::uint8_t>, std::string> override {
        return codec::encode_value(object(handle));
    }

    void release(engine::Handle handle) noexcept override {
        std::lock_guard lock(mutex_);
        if (objects_.erase(key(handle)) == 0) {
            ++double_releases_;
        }
    }

    [[nodiscard]] auto live_objects() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return objects_.size();
    }

    [[nodiscard]] auto double_releases() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return double_releases_;
    }

    [[nodiscard]] auto evaluations() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return evaluations_;
    }

   private:
    static auto key(engine::Handle handle) -> std::uintptr_t {
        return reinterpret_cast<std::uintptr_t>(handle);
    }

    /// Caller holds `mutex_`.
    auto allocate(codec::Value value) -> engine::Handle {
        const std::uintptr_t id = next_id_++;
        objects_.emplace(id, std::move(value));
        return reinterpret_cast<engine::Handle>(id);
    }

    [[nodiscard]] auto object(engine::Handle handle) const -> const codec::Value& {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key(handle));
        if (it == objects_.end()) {
            throw std::logic_error("use of a released handle");
        }
        return it->second;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, codec::Value> scripted_;
    std::map<std::uintptr_t, codec::Value> objects_;
    std::uintptr_t next_id_ = 1;
    std::size_t double_releases_ = 0;
    std::size_t evaluations_ = 0;
};

/// I64 vector value.
inline auto i64_vector(std::initializer_list<std::int64_t> items) -> codec::Value {
    return codec::Value{codec::Vector{.type = codec::TypeCode::I64,
                                      .data = Column<std::int64_t>(items)}};
}

/// F64 vector value.
inline auto f64_vector(std::initializer_list<double> items) -> codec::Value {
    return codec::Value{codec::Vector{.type = codec::TypeCode::F64,
                                      .data = Column<double>(items)}};
}

/// Symbol vector value.
inline auto symbol_vector(std::initializer_list<std::string> items) -> codec::Value {
    return codec::Value{codec::Vector{.type = codec::TypeCode::Symbol,
                                      .data = Column<std::string>(items)}};
}

/// Two-column table: `sym` (symbols) and `price` (f64).
inline auto trades_table() -> codec::Value {
    return codec::Value{codec::Table{
        .names = {"sym", "price"},
        .columns = {symbol_vector({"AAPL", "MSFT", "AAPL"}), f64_vector({1.5, 2.25, 3.0})},
        .key_columns = 0,
    }};
}

}  // namespace raylink::testing
