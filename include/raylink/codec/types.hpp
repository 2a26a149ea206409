#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace raylink::codec {

/// Engine type tags. A negative wire tag is the atom of `-tag`; 1..97 are
/// vectors of that element type.
enum class TypeCode : std::int8_t {
    List = 0,
    B8 = 1,
    U8 = 2,
    I16 = 3,
    I32 = 4,
    I64 = 5,
    Symbol = 6,
    Date = 7,
    Time = 8,
    Timestamp = 9,
    F64 = 10,
    Guid = 11,
    C8 = 12,
    Table = 98,
    Dict = 99,
    Lambda = 100,
    Null = 126,
    Error = 127,
};

/// Highest tag that still denotes a vector.
inline constexpr std::int8_t kMaxVectorTag = 97;

/// Error code whose payload carries a NUL-terminated message.
inline constexpr std::uint8_t kErrorCodeWithMessage = 255;

/// Byte order of a frame's size field and of every payload integer.
enum class Endian : std::uint8_t { Little = 0, Big = 1 };

/// 16-byte globally unique identifier, stored in wire order.
struct Guid {
    std::array<std::uint8_t, 16> bytes{};
    auto operator<=>(const Guid&) const = default;
};

/// Canonical `8-4-4-4-12` hex rendering.
[[nodiscard]] auto format_guid(const Guid& guid) -> std::string;

/// Whether `code` is an element type the codec can read.
[[nodiscard]] auto is_element_type(std::int8_t code) noexcept -> bool;

/// Fixed width of an element in bytes. Symbols have no fixed width.
[[nodiscard]] auto element_width(TypeCode type) noexcept -> std::optional<std::size_t>;

/// Engine display name for a type (`i64`, `sym`, `ts`, ...).
[[nodiscard]] auto type_name(TypeCode type) -> std::string_view;

}  // namespace raylink::codec
