#pragma once

#include <raylink/ipc/channel.hpp>

#include <cstdint>
#include <memory>

namespace raylink::ipc {

/// Largest frame payload accepted from a raw TCP peer.
inline constexpr std::int64_t kMaxTcpPayload = std::int64_t{1} << 32;

/// Channel over a raw TCP socket.
///
/// The byte stream is cut into messages: the first inbound byte (the
/// handshake reply) is delivered alone, every later message is one frame,
/// header included, sized by the header's `size` field.
class TcpChannel final : public Channel {
   public:
    TcpChannel(boost::asio::io_context& io, Address address);
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    auto operator=(const TcpChannel&) -> TcpChannel& = delete;

    void open(ChannelHandlers handlers) override;
    void send(std::vector<std::uint8_t> bytes) override;
    void close() override;

   private:
    class Session;
    std::shared_ptr<Session> session_;
};

}  // namespace raylink::ipc
