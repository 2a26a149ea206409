#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace raylink {

/// Element storage of one decoded vector.
///
/// Booleans and chars travel as std::uint8_t, dates and times as
/// std::int32_t, timestamps as std::int64_t; every fixed-width column can
/// therefore hand out its elements as raw bytes without copying.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    Column() = default;
    explicit Column(std::vector<T> data) : data_(std::move(data)) {}
    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Throws std::out_of_range past the last element.
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }

    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return data_; }
    [[nodiscard]] auto data() const noexcept -> const T* { return data_.data(); }

    /// Elements as stored, for fixed-width element types.
    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte>
        requires std::is_trivially_copyable_v<T>
    {
        return std::as_bytes(span());
    }

    void push_back(T value) { data_.push_back(std::move(value)); }
    void reserve(size_type capacity) { data_.reserve(capacity); }

    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

    bool operator==(const Column&) const = default;

   private:
    std::vector<T> data_;
};

}  // namespace raylink
