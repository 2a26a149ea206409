#pragma once

#include <raylink/codec/types.hpp>
#include <raylink/codec/value.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace raylink::codec {

/// Decode failure with the byte offset at which it was detected.
struct DecodeError {
    std::string message;
    std::size_t offset = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// Nesting depth beyond which a payload is rejected instead of recursed into.
inline constexpr std::size_t kMaxDecodeDepth = 256;

/// Decode one value from the front of `bytes`. Trailing bytes are ignored.
///
/// Never reads past the end of `bytes`; truncated or malformed input yields a
/// DecodeError rather than undefined behaviour.
[[nodiscard]] auto decode_value(std::span<const std::uint8_t> bytes,
                                Endian endian = Endian::Little)
    -> std::expected<Value, DecodeError>;

}  // namespace raylink::codec
