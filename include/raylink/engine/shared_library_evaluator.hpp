#pragma once

#include <raylink/engine/evaluator.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace raylink::engine {

/// Evaluator backed by the engine's C library, loaded with dlopen.
///
/// Object layout assumed by `type_code`, `raw_data`: type tag (i8) at offset
/// 2, element count (i64) at offset 8, inline elements from offset 16.
class SharedLibraryEvaluator final : public Evaluator {
   public:
    /// Load `path`, resolve the required symbols and initialise the runtime.
    [[nodiscard]] static auto load(const std::string& path)
        -> std::expected<std::shared_ptr<SharedLibraryEvaluator>, std::string>;

    ~SharedLibraryEvaluator() override;

    SharedLibraryEvaluator(const SharedLibraryEvaluator&) = delete;
    auto operator=(const SharedLibraryEvaluator&) -> SharedLibraryEvaluator& = delete;

    [[nodiscard]] auto version() const -> std::string override;
    [[nodiscard]] auto evaluate(std::string_view code)
        -> std::expected<Handle, std::string> override;
    [[nodiscard]] auto is_null(Handle handle) const -> bool override;
    [[nodiscard]] auto is_error(Handle handle) const -> bool override;
    [[nodiscard]] auto type_code(Handle handle) const -> std::int8_t override;
    [[nodiscard]] auto is_vector(Handle handle) const -> bool override;
    [[nodiscard]] auto length(Handle handle) const -> std::int64_t override;
    [[nodiscard]] auto error_message(Handle handle) const -> std::string override;
    [[nodiscard]] auto column_names(Handle handle) const -> std::vector<std::string> override;
    [[nodiscard]] auto column(Handle table, std::string_view name) -> Handle override;
    [[nodiscard]] auto raw_data(Handle handle) const -> std::span<const std::byte> override;
    [[nodiscard]] auto serialize(Handle handle) const
        -> std::expected<std::vector<std::uint8_t>, std::string> override;
    void release(Handle handle) noexcept override;

   private:
    struct Api {
        std::int32_t (*ray_init)() = nullptr;
        void (*ray_clean)() = nullptr;
        Handle (*eval_str)(const char*) = nullptr;
        void (*drop_obj)(Handle) = nullptr;
        std::int8_t (*is_null)(Handle) = nullptr;
        Handle (*ser_obj)(Handle) = nullptr;
        Handle (*at_sym)(Handle, const char*, std::int64_t) = nullptr;
        Handle (*ray_key)(Handle) = nullptr;
        std::int64_t (*ray_count)(Handle) = nullptr;
    };

    SharedLibraryEvaluator(void* library, Api api) : library_(library), api_(api) {}

    void* library_ = nullptr;
    Api api_;
};

}  // namespace raylink::engine
