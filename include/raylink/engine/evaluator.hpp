#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace raylink::engine {

/// Opaque reference to an object living inside the embedded engine.
using Handle = void*;

/// The embedded evaluator capability.
///
/// Implementations own the engine runtime; handles they return must be passed
/// back to `release` exactly once. Wrap them in OwnedHandle.
class Evaluator {
   public:
    virtual ~Evaluator() = default;

    /// Engine version string, e.g. "1".
    [[nodiscard]] virtual auto version() const -> std::string = 0;

    /// Evaluate source text. Engine-level errors come back as error objects,
    /// not as the unexpected side; that is reserved for a missing runtime.
    [[nodiscard]] virtual auto evaluate(std::string_view code)
        -> std::expected<Handle, std::string> = 0;

    [[nodiscard]] virtual auto is_null(Handle handle) const -> bool = 0;
    [[nodiscard]] virtual auto is_error(Handle handle) const -> bool = 0;
    [[nodiscard]] virtual auto type_code(Handle handle) const -> std::int8_t = 0;
    [[nodiscard]] virtual auto is_vector(Handle handle) const -> bool = 0;
    [[nodiscard]] virtual auto length(Handle handle) const -> std::int64_t = 0;

    /// Message carried by an error object.
    [[nodiscard]] virtual auto error_message(Handle handle) const -> std::string = 0;

    /// Column names of a table object.
    [[nodiscard]] virtual auto column_names(Handle handle) const -> std::vector<std::string> = 0;

    /// New reference to the named column of a table, or nullptr.
    [[nodiscard]] virtual auto column(Handle table, std::string_view name) -> Handle = 0;

    /// Element storage of a fixed-width vector. Empty for anything else.
    [[nodiscard]] virtual auto raw_data(Handle handle) const -> std::span<const std::byte> = 0;

    /// Engine value encoding of an object, without the frame header.
    [[nodiscard]] virtual auto serialize(Handle handle) const
        -> std::expected<std::vector<std::uint8_t>, std::string> = 0;

    virtual void release(Handle handle) noexcept = 0;
};

/// Move-only owner of one engine handle. Releases it through the evaluator
/// that produced it, which it keeps alive.
class OwnedHandle {
   public:
    OwnedHandle() = default;
    OwnedHandle(std::shared_ptr<Evaluator> evaluator, Handle handle) noexcept
        : evaluator_(std::move(evaluator)), handle_(handle) {}

    ~OwnedHandle() { reset(); }

    OwnedHandle(const OwnedHandle&) = delete;
    auto operator=(const OwnedHandle&) -> OwnedHandle& = delete;

    OwnedHandle(OwnedHandle&& other) noexcept
        : evaluator_(std::move(other.evaluator_)), handle_(std::exchange(other.handle_, nullptr)) {}

    auto operator=(OwnedHandle&& other) noexcept -> OwnedHandle& {
        if (this != &other) {
            reset();
            evaluator_ = std::move(other.evaluator_);
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> Handle { return handle_; }
    [[nodiscard]] auto evaluator() const noexcept -> Evaluator* { return evaluator_.get(); }
    [[nodiscard]] auto shared_evaluator() const noexcept -> const std::shared_ptr<Evaluator>& {
        return evaluator_;
    }
    explicit operator bool() const noexcept { return handle_ != nullptr; }

    void reset() noexcept {
        if (handle_ != nullptr && evaluator_) {
            evaluator_->release(handle_);
        }
        handle_ = nullptr;
    }

   private:
    std::shared_ptr<Evaluator> evaluator_;
    Handle handle_ = nullptr;
};

/// Builds an evaluator on the thread that will use it.
using EvaluatorFactory = std::function<std::expected<std::shared_ptr<Evaluator>, std::string>()>;

}  // namespace raylink::engine
