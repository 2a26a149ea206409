#include <raylink/codec/decoder.hpp>
#include <raylink/runtime/result.hpp>

#include <fmt/core.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace raylink::runtime {

/// Shared, immutable backing store of a Result.
class ResultSource {
   public:
    virtual ~ResultSource() = default;

    [[nodiscard]] virtual auto kind() const -> ResultKind = 0;
    [[nodiscard]] virtual auto columns() const -> const std::vector<std::string>& = 0;
    [[nodiscard]] virtual auto column_types() const -> std::vector<std::string> = 0;
    [[nodiscard]] virtual auto row_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto column(std::string_view name) const -> std::optional<ColumnView> = 0;
    [[nodiscard]] virtual auto vector_view() const -> std::optional<ColumnView> = 0;
    [[nodiscard]] virtual auto error_message() const -> std::string = 0;
    [[nodiscard]] virtual auto value() const -> const codec::Value& = 0;

    [[nodiscard]] auto materialize() const -> const Materialized& {
        std::call_once(materialized_once_, [this] { materialized_ = build_materialized(); });
        return materialized_;
    }

   private:
    [[nodiscard]] auto build_materialized() const -> Materialized {
        switch (kind()) {
            case ResultKind::Table:
                if (const auto* table = value().get_if<codec::Table>()) {
                    return table->records();
                }
                return std::vector<codec::Record>{};
            case ResultKind::Scalar:
            case ResultKind::Vector:
                return value();
            case ResultKind::Error:
            case ResultKind::Null:
                break;
        }
        return std::monostate{};
    }

    mutable std::once_flag materialized_once_;
    mutable Materialized materialized_;
};

namespace {

const std::vector<std::string> kNoColumns;

auto kind_of(const codec::Value& value) -> ResultKind {
    return std::visit(
        [](const auto& node) -> ResultKind {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, codec::Table>) {
                return ResultKind::Table;
            } else if constexpr (std::is_same_v<T, codec::Atom> ||
                                 std::is_same_v<T, codec::Dict>) {
                return ResultKind::Scalar;
            } else if constexpr (std::is_same_v<T, codec::Error>) {
                return ResultKind::Error;
            } else if constexpr (std::is_same_v<T, codec::Null>) {
                return ResultKind::Null;
            } else {
                return ResultKind::Vector;
            }
        },
        value.node);
}

auto view_of(const codec::Vector& vector) -> std::optional<ColumnView> {
    return std::visit(
        [&](const auto& column) -> std::optional<ColumnView> {
            using T = typename std::decay_t<decltype(column)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                return std::nullopt;
            } else {
                return ColumnView{
                    .type = vector.type,
                    .bytes = column.bytes(),
                    .length = column.size(),
                };
            }
        },
        vector.data);
}

/// Result backed by a value decoded from the wire (or built in memory).
class DecodedSource final : public ResultSource {
   public:
    explicit DecodedSource(codec::Value value) : value_(std::move(value)) {
        if (const auto* table = value_.get_if<codec::Table>()) {
            index_.reserve(table->names.size());
            for (std::size_t i = 0; i < table->names.size(); ++i) {
                index_.emplace(table->names[i], i);
            }
        }
    }

    [[nodiscard]] auto kind() const -> ResultKind override { return kind_of(value_); }

    [[nodiscard]] auto columns() const -> const std::vector<std::string>& override {
        if (const auto* table = value_.get_if<codec::Table>()) {
            return table->names;
        }
        return kNoColumns;
    }

    [[nodiscard]] auto column_types() const -> std::vector<std::string> override {
        std::vector<std::string> types;
        if (const auto* table = value_.get_if<codec::Table>()) {
            types.reserve(table->columns.size());
            for (const auto& column : table->columns) {
                if (const auto* vector = column.get_if<codec::Vector>()) {
                    types.emplace_back(codec::type_name(vector->type));
                } else {
                    types.emplace_back(codec::type_name(codec::TypeCode::List));
                }
            }
        }
        return types;
    }

    [[nodiscard]] auto row_count() const -> std::size_t override {
        if (const auto* table = value_.get_if<codec::Table>()) {
            return table->row_count();
        }
        return codec::column_length(value_).value_or(0);
    }

    [[nodiscard]] auto column(std::string_view name) const -> std::optional<ColumnView> override {
        const auto* table = value_.get_if<codec::Table>();
        if (table == nullptr) {
            return std::nullopt;
        }
        auto it = index_.find(std::string(name));
        if (it == index_.end()) {
            return std::nullopt;
        }
        const auto* vector = table->columns[it->second].get_if<codec::Vector>();
        if (vector == nullptr) {
            return std::nullopt;
        }
        return view_of(*vector);
    }

    [[nodiscard]] auto vector_view() const -> std::optional<ColumnView> override {
        if (const auto* vector = value_.get_if<codec::Vector>()) {
            return view_of(*vector);
        }
        return std::nullopt;
    }

    [[nodiscard]] auto error_message() const -> std::string override {
        if (const auto* error = value_.get_if<codec::Error>()) {
            return error->message;
        }
        return {};
    }

    [[nodiscard]] auto value() const -> const codec::Value& override { return value_; }

   private:
    codec::Value value_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
};

/// Result backed by an object living in the embedded engine. Metadata is read
/// eagerly; the full value is serialized and decoded on first request.
class NativeSource final : public ResultSource {
   public:
    explicit NativeSource(engine::OwnedHandle handle) : handle_(std::move(handle)) {
        auto* evaluator = handle_.evaluator();
        const auto raw = handle_.get();
        if (evaluator == nullptr || evaluator->is_null(raw)) {
            kind_ = ResultKind::Null;
            return;
        }
        if (evaluator->is_error(raw)) {
            kind_ = ResultKind::Error;
            error_ = evaluator->error_message(raw);
            return;
        }
        const auto type = evaluator->type_code(raw);
        if (type < 0) {
            kind_ = ResultKind::Scalar;
        } else if (type <= codec::kMaxVectorTag) {
            kind_ = ResultKind::Vector;
        } else if (type == static_cast<std::int8_t>(codec::TypeCode::Table)) {
            kind_ = ResultKind::Table;
            load_table_metadata(*evaluator, raw);
        } else {
            // Dictionaries and keyed tables are described by their decoded form.
            kind_ = kind_of(value());
            if (const auto* table = value().get_if<codec::Table>()) {
                names_ = table->names;
            }
        }
    }

    [[nodiscard]] auto kind() const -> ResultKind override { return kind_; }

    [[nodiscard]] auto columns() const -> const std::vector<std::string>& override {
        return names_;
    }

    [[nodiscard]] auto column_types() const -> std::vector<std::string> override {
        std::vector<std::string> types;
        if (!column_handles_.empty()) {
            types.reserve(column_handles_.size());
            for (const auto& column : column_handles_) {
                const auto type = handle_.evaluator()->type_code(column.get());
                types.emplace_back(codec::type_name(static_cast<codec::TypeCode>(type)));
            }
            return types;
        }
        if (kind_ == ResultKind::Table) {
            if (const auto* table = value().get_if<codec::Table>()) {
                for (const auto& column : table->columns) {
                    const auto* vector = column.get_if<codec::Vector>();
                    types.emplace_back(
                        codec::type_name(vector != nullptr ? vector->type : codec::TypeCode::List));
                }
            }
        }
        return types;
    }

    [[nodiscard]] auto row_count() const -> std::size_t override {
        auto* evaluator = handle_.evaluator();
        if (kind_ == ResultKind::Table) {
            if (!column_handles_.empty()) {
                return static_cast<std::size_t>(evaluator->length(column_handles_.front().get()));
            }
            if (const auto* table = value().get_if<codec::Table>()) {
                return table->row_count();
            }
            return 0;
        }
        if (kind_ == ResultKind::Vector) {
            return static_cast<std::size_t>(evaluator->length(handle_.get()));
        }
        return 0;
    }

    [[nodiscard]] auto column(std::string_view name) const -> std::optional<ColumnView> override {
        auto it = index_.find(std::string(name));
        if (it == index_.end()) {
            return std::nullopt;
        }
        return view_of_handle(column_handles_[it->second].get());
    }

    [[nodiscard]] auto vector_view() const -> std::optional<ColumnView> override {
        if (kind_ != ResultKind::Vector) {
            return std::nullopt;
        }
        return view_of_handle(handle_.get());
    }

    [[nodiscard]] auto error_message() const -> std::string override { return error_; }

    [[nodiscard]] auto value() const -> const codec::Value& override {
        std::call_once(decoded_once_, [this] { decoded_ = decode(); });
        return decoded_;
    }

   private:
    void load_table_metadata(engine::Evaluator& evaluator, engine::Handle raw) {
        names_ = evaluator.column_names(raw);
        column_handles_.reserve(names_.size());
        for (std::size_t i = 0; i < names_.size(); ++i) {
            column_handles_.emplace_back(handle_.shared_evaluator(),
                                         evaluator.column(raw, names_[i]));
            index_.emplace(names_[i], i);
        }
    }

    [[nodiscard]] auto view_of_handle(engine::Handle raw) const -> std::optional<ColumnView> {
        auto* evaluator = handle_.evaluator();
        if (raw == nullptr) {
            return std::nullopt;
        }
        const auto type = evaluator->type_code(raw);
        if (!codec::is_element_type(type) ||
            type == static_cast<std::int8_t>(codec::TypeCode::Symbol)) {
            return std::nullopt;
        }
        const auto length = static_cast<std::size_t>(evaluator->length(raw));
        auto bytes = evaluator->raw_data(raw);
        const auto width = codec::element_width(static_cast<codec::TypeCode>(type)).value_or(0);
        if (bytes.size() != length * width) {
            return std::nullopt;
        }
        return ColumnView{
            .type = static_cast<codec::TypeCode>(type),
            .bytes = bytes,
            .length = length,
        };
    }

    [[nodiscard]] auto decode() const -> codec::Value {
        if (kind_ == ResultKind::Error) {
            return codec::Value{codec::Error{.code = codec::kErrorCodeWithMessage, .message = error_}};
        }
        if (kind_ == ResultKind::Null) {
            return codec::Value{codec::Null{}};
        }
        auto bytes = handle_.evaluator()->serialize(handle_.get());
        if (!bytes) {
            spdlog::warn("[local] serialize failed: {}", bytes.error());
            return codec::Value{codec::Error{
                .code = codec::kErrorCodeWithMessage,
                .message = "Deserialize error: " + bytes.error(),
            }};
        }
        auto decoded = codec::decode_value(*bytes);
        if (!decoded) {
            return codec::Value{codec::Error{
                .code = codec::kErrorCodeWithMessage,
                .message = "Deserialize error: " + decoded.error().format(),
            }};
        }
        return std::move(*decoded);
    }

    engine::OwnedHandle handle_;
    ResultKind kind_ = ResultKind::Null;
    std::string error_;
    std::vector<std::string> names_;
    std::vector<engine::OwnedHandle> column_handles_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
    mutable std::once_flag decoded_once_;
    mutable codec::Value decoded_;
};

}  // namespace

auto to_string(ResultKind kind) -> std::string_view {
    switch (kind) {
        case ResultKind::Table:
            return "table";
        case ResultKind::Scalar:
            return "scalar";
        case ResultKind::Vector:
            return "vector";
        case ResultKind::Error:
            return "error";
        case ResultKind::Null:
            return "null";
    }
    return "unknown";
}

auto to_string(Origin origin) -> std::string_view {
    return origin == Origin::Local ? "local" : "remote";
}

auto Result::from_value(codec::Value value) -> Result {
    return Result(std::make_shared<const DecodedSource>(std::move(value)));
}

auto Result::from_error(std::string message) -> Result {
    return from_value(codec::Value{codec::Error{
        .code = codec::kErrorCodeWithMessage,
        .message = std::move(message),
    }});
}

auto Result::null() -> Result {
    return from_value(codec::Value{codec::Null{}});
}

auto Result::from_native(engine::OwnedHandle handle) -> Result {
    return Result(std::make_shared<const NativeSource>(std::move(handle)));
}

auto Result::kind() const -> ResultKind {
    return source_->kind();
}

auto Result::columns() const -> const std::vector<std::string>& {
    return source_->columns();
}

auto Result::column_types() const -> std::vector<std::string> {
    return source_->column_types();
}

auto Result::row_count() const -> std::size_t {
    return source_->row_count();
}

auto Result::column(std::string_view name) const -> std::optional<ColumnView> {
    return source_->column(name);
}

auto Result::vector_view() const -> std::optional<ColumnView> {
    return source_->vector_view();
}

auto Result::error_message() const -> std::string {
    return source_->error_message();
}

auto Result::value() const -> const codec::Value& {
    return source_->value();
}

auto Result::materialize() const -> const Materialized& {
    return source_->materialize();
}

auto Result::with_execution(double elapsed_ms, Origin origin) const -> Result {
    Result stamped = *this;
    stamped.execution_ = ExecutionInfo{.elapsed_ms = elapsed_ms, .origin = origin};
    return stamped;
}

}  // namespace raylink::runtime
