#pragma once

#include <raylink/codec/types.hpp>
#include <raylink/codec/value.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace raylink::codec {

/// Append-only byte sink for the engine's value encoding.
class Writer {
   public:
    explicit Writer(Endian endian = Endian::Little) : endian_(endian) {}

    void put_u8(std::uint8_t value) { bytes_.push_back(value); }
    void put_i8(std::int8_t value) { bytes_.push_back(static_cast<std::uint8_t>(value)); }
    void put_i16(std::int16_t value) { put_uint(static_cast<std::uint16_t>(value), 2); }
    void put_i32(std::int32_t value) { put_uint(static_cast<std::uint32_t>(value), 4); }
    void put_i64(std::int64_t value) { put_uint(static_cast<std::uint64_t>(value), 8); }
    void put_f64(double value);
    void put_cstr(std::string_view text);
    void put_guid(const Guid& guid);

    [[nodiscard]] auto bytes() const noexcept -> const std::vector<std::uint8_t>& { return bytes_; }
    [[nodiscard]] auto take() noexcept -> std::vector<std::uint8_t> { return std::move(bytes_); }

   private:
    void put_uint(std::uint64_t value, std::size_t width);

    Endian endian_;
    std::vector<std::uint8_t> bytes_;
};

/// Append the encoding of `value` to `writer`.
///
/// Char atoms are always written as char vectors, the form the decoder
/// collapses back into a single string.
void encode_value(Writer& writer, const Value& value);

/// Encode `value` into a fresh buffer.
[[nodiscard]] auto encode_value(const Value& value, Endian endian = Endian::Little)
    -> std::vector<std::uint8_t>;

/// The value the server evaluates for a textual request: a char vector.
[[nodiscard]] auto make_string_request(std::string_view code) -> Value;

}  // namespace raylink::codec
