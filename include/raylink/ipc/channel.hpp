#pragma once

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace raylink::ipc {

enum class Scheme : std::uint8_t { WebSocket, Tcp };

/// Parsed server address: `ws://host:port/path`, `tcp://host:port` or
/// `host:port` (raw TCP).
struct Address {
    Scheme scheme = Scheme::WebSocket;
    std::string host;
    std::uint16_t port = 0;
    std::string path = "/";

    [[nodiscard]] auto to_string() const -> std::string;
};

[[nodiscard]] auto parse_address(std::string_view text) -> std::expected<Address, std::string>;

/// Callbacks a channel invokes on its io_context.
struct ChannelHandlers {
    std::function<void()> on_open;
    std::function<void(std::vector<std::uint8_t>)> on_binary;
    std::function<void(std::string)> on_text;
    /// Peer closed the connection.
    std::function<void()> on_close;
    std::function<void(std::string)> on_error;
};

/// A bidirectional message socket.
///
/// After `close()` returns no handler fires again; the owner performs its own
/// teardown.
class Channel {
   public:
    virtual ~Channel() = default;

    virtual void open(ChannelHandlers handlers) = 0;
    virtual void send(std::vector<std::uint8_t> bytes) = 0;
    virtual void close() = 0;
};

using ChannelFactory =
    std::function<std::unique_ptr<Channel>(boost::asio::io_context&, const Address&)>;

/// WebSocketChannel for `ws` addresses, TcpChannel for `tcp`.
[[nodiscard]] auto make_channel(boost::asio::io_context& io, const Address& address)
    -> std::unique_ptr<Channel>;

}  // namespace raylink::ipc
