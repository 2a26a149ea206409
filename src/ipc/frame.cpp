#include <raylink/codec/encoder.hpp>
#include <raylink/ipc/frame.hpp>
#include <raylink/runtime/result.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace raylink::ipc {

namespace {

auto read_prefix(std::span<const std::uint8_t> bytes) -> std::uint32_t {
    std::uint32_t prefix = 0;
    const std::size_t present = std::min<std::size_t>(bytes.size(), 4);
    for (std::size_t i = 0; i < present; ++i) {
        prefix |= static_cast<std::uint32_t>(bytes[i]) << (8 * i);
    }
    return prefix;
}

auto read_size(std::span<const std::uint8_t> bytes, codec::Endian endian) -> std::int64_t {
    std::uint64_t raw = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        const std::size_t shift = endian == codec::Endian::Little ? (8 * i) : (8 * (7 - i));
        raw |= static_cast<std::uint64_t>(bytes[8 + i]) << shift;
    }
    return static_cast<std::int64_t>(raw);
}

auto fail(std::string message, std::size_t offset) -> std::unexpected<codec::DecodeError> {
    return std::unexpected(codec::DecodeError{.message = std::move(message), .offset = offset});
}

}  // namespace

auto preview(std::span<const std::uint8_t> bytes, std::size_t limit) -> std::string {
    std::string out;
    const std::size_t count = std::min(bytes.size(), limit);
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto ch = static_cast<unsigned char>(bytes[i]);
        out.push_back(std::isprint(ch) != 0 ? static_cast<char>(ch) : '.');
    }
    return out;
}

auto decode_header(std::span<const std::uint8_t> bytes)
    -> std::expected<Header, codec::DecodeError> {
    const std::uint32_t prefix = read_prefix(bytes);
    if (bytes.size() < 4 || prefix != kFrameMagic) {
        return fail(fmt::format("Invalid IPC prefix: 0x{:08x}. Expected: 0x{:08x}. Preview: \"{}\"",
                                prefix, kFrameMagic, preview(bytes)),
                    0);
    }
    if (bytes.size() < kHeaderSize) {
        return fail(fmt::format("truncated header: need {} bytes, have {}", kHeaderSize,
                                bytes.size()),
                    bytes.size());
    }

    Header header;
    header.prefix = prefix;
    header.version = bytes[4];
    header.flags = bytes[5];
    if (bytes[6] > 1) {
        return fail(fmt::format("invalid endian flag {}", bytes[6]), 6);
    }
    header.endian = static_cast<codec::Endian>(bytes[6]);
    header.msg_type = bytes[7];
    header.size = read_size(bytes, header.endian);
    if (header.size < 0) {
        return fail(fmt::format("negative payload size {}", header.size), 8);
    }
    return header;
}

auto decode_frame(std::span<const std::uint8_t> bytes)
    -> std::expected<Frame, codec::DecodeError> {
    auto header = decode_header(bytes);
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }
    const std::size_t available = bytes.size() - kHeaderSize;
    if (static_cast<std::uint64_t>(header->size) > available) {
        return fail(fmt::format("truncated payload: expected {} bytes, have {}", header->size,
                                available),
                    bytes.size());
    }
    return Frame{
        .header = *header,
        .payload = bytes.subspan(kHeaderSize, static_cast<std::size_t>(header->size)),
    };
}

auto encode_frame(std::span<const std::uint8_t> payload, MessageType type, codec::Endian endian)
    -> std::vector<std::uint8_t> {
    codec::Writer writer(endian);
    for (std::size_t i = 0; i < 4; ++i) {
        writer.put_u8(static_cast<std::uint8_t>((kFrameMagic >> (8 * i)) & 0xFF));
    }
    writer.put_u8(kProtocolVersion);
    writer.put_u8(0);  // flags
    writer.put_u8(static_cast<std::uint8_t>(endian));
    writer.put_u8(static_cast<std::uint8_t>(type));
    writer.put_i64(static_cast<std::int64_t>(payload.size()));
    auto bytes = writer.take();
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    return bytes;
}

auto encode_request(std::string_view code, MessageType type) -> std::vector<std::uint8_t> {
    const auto payload = codec::encode_value(codec::make_string_request(code));
    return encode_frame(payload, type);
}

auto decode_message(std::span<const std::uint8_t> bytes) -> runtime::Result {
    auto frame = decode_frame(bytes);
    if (!frame) {
        spdlog::error("[remote] {}", frame.error().message);
        return runtime::Result::from_error(frame.error().message);
    }
    spdlog::debug("[remote] header: version={}, flags={}, endian={}, msgtype={}, size={}",
                  frame->header.version, frame->header.flags,
                  static_cast<int>(frame->header.endian), frame->header.msg_type,
                  frame->header.size);
    if (frame->payload.empty()) {
        return runtime::Result::null();
    }
    auto value = codec::decode_value(frame->payload, frame->header.endian);
    if (!value) {
        spdlog::error("[remote] deserialize failed: {}", value.error().format());
        return runtime::Result::from_error("Deserialize error: " + value.error().format());
    }
    return runtime::Result::from_value(std::move(*value));
}

}  // namespace raylink::ipc
