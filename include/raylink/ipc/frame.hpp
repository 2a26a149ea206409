#pragma once

#include <raylink/codec/decoder.hpp>
#include <raylink/codec/types.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace raylink::runtime {
class Result;
}  // namespace raylink::runtime

namespace raylink::ipc {

/// Little-endian magic that opens every frame.
inline constexpr std::uint32_t kFrameMagic = 0xcefadefa;

/// Size of the fixed frame header in bytes.
inline constexpr std::size_t kHeaderSize = 16;

/// Protocol version written into outgoing headers and the handshake.
inline constexpr std::uint8_t kProtocolVersion = 0x01;

/// Longest printable preview quoted in a bad-prefix error.
inline constexpr std::size_t kPreviewBytes = 64;

enum class MessageType : std::uint8_t { Sync = 0, Response = 1, Async = 2 };

/// Decoded frame header.
///
/// Layout: prefix u32 LE, version u8, flags u8, endian u8, msgtype u8,
/// size i64 in the byte order named by `endian`.
struct Header {
    std::uint32_t prefix = kFrameMagic;
    std::uint8_t version = kProtocolVersion;
    std::uint8_t flags = 0;
    codec::Endian endian = codec::Endian::Little;
    std::uint8_t msg_type = 0;
    std::int64_t size = 0;
};

/// A validated frame. `payload` aliases the input buffer.
struct Frame {
    Header header;
    std::span<const std::uint8_t> payload;
};

/// Validate the first kHeaderSize bytes of a frame. The payload is not
/// required to be present.
[[nodiscard]] auto decode_header(std::span<const std::uint8_t> bytes)
    -> std::expected<Header, codec::DecodeError>;

/// Validate and split a frame. Bytes past `header.size` are ignored.
[[nodiscard]] auto decode_frame(std::span<const std::uint8_t> bytes)
    -> std::expected<Frame, codec::DecodeError>;

/// Prepend a header to an encoded payload.
[[nodiscard]] auto encode_frame(std::span<const std::uint8_t> payload,
                                MessageType type = MessageType::Sync,
                                codec::Endian endian = codec::Endian::Little)
    -> std::vector<std::uint8_t>;

/// Full request frame asking the peer to evaluate `code`.
[[nodiscard]] auto encode_request(std::string_view code, MessageType type = MessageType::Sync)
    -> std::vector<std::uint8_t>;

/// Decode an inbound message into a Result. Never fails: protocol and codec
/// failures become error results, an empty payload a null result.
[[nodiscard]] auto decode_message(std::span<const std::uint8_t> bytes) -> runtime::Result;

/// Printable rendering of the first bytes of a buffer for diagnostics.
[[nodiscard]] auto preview(std::span<const std::uint8_t> bytes,
                           std::size_t limit = kPreviewBytes) -> std::string;

}  // namespace raylink::ipc
