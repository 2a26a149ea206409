#include <raylink/ipc/channel.hpp>
#include <raylink/ipc/tcp_channel.hpp>
#include <raylink/ipc/websocket_channel.hpp>

#include <fmt/core.h>

#include <charconv>

namespace raylink::ipc {

auto Address::to_string() const -> std::string {
    if (scheme == Scheme::Tcp) {
        return fmt::format("tcp://{}:{}", host, port);
    }
    return fmt::format("ws://{}:{}{}", host, port, path);
}

auto parse_address(std::string_view text) -> std::expected<Address, std::string> {
    Address address;
    std::string_view rest = text;
    if (rest.starts_with("ws://")) {
        address.scheme = Scheme::WebSocket;
        rest.remove_prefix(5);
    } else if (rest.starts_with("tcp://")) {
        address.scheme = Scheme::Tcp;
        rest.remove_prefix(6);
    } else if (rest.find("://") != std::string_view::npos) {
        return std::unexpected(fmt::format("unsupported address scheme: '{}'", text));
    } else {
        address.scheme = Scheme::Tcp;
    }

    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        if (address.scheme == Scheme::Tcp && rest.substr(slash) != "/") {
            return std::unexpected(fmt::format("tcp address takes no path: '{}'", text));
        }
        address.path = std::string(rest.substr(slash));
    }

    auto colon = authority.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::unexpected(fmt::format("address needs host:port: '{}'", text));
    }
    address.host = std::string(authority.substr(0, colon));
    auto port_text = authority.substr(colon + 1);
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || value == 0 ||
        value > 65535) {
        return std::unexpected(fmt::format("invalid port in address: '{}'", text));
    }
    address.port = static_cast<std::uint16_t>(value);
    return address;
}

auto make_channel(boost::asio::io_context& io, const Address& address) -> std::unique_ptr<Channel> {
    if (address.scheme == Scheme::Tcp) {
        return std::make_unique<TcpChannel>(io, address);
    }
    return std::make_unique<WebSocketChannel>(io, address);
}

}  // namespace raylink::ipc
