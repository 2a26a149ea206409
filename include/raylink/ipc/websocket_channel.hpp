#pragma once

#include <raylink/ipc/channel.hpp>

#include <memory>

namespace raylink::ipc {

/// Channel over a WebSocket (Boost.Beast). Every outbound message is sent as
/// a binary frame; inbound text and binary frames are delivered separately.
class WebSocketChannel final : public Channel {
   public:
    WebSocketChannel(boost::asio::io_context& io, Address address);
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    auto operator=(const WebSocketChannel&) -> WebSocketChannel& = delete;

    void open(ChannelHandlers handlers) override;
    void send(std::vector<std::uint8_t> bytes) override;
    void close() override;

   private:
    class Session;
    std::shared_ptr<Session> session_;
};

}  // namespace raylink::ipc
