#pragma once

#include <raylink/ipc/channel.hpp>
#include <raylink/ipc/frame.hpp>
#include <raylink/runtime/events.hpp>
#include <raylink/runtime/result.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace raylink::ipc {

enum class ConnectionState : std::uint8_t { Disconnected, Connecting, Connected, Error };

[[nodiscard]] auto to_string(ConnectionState state) -> std::string_view;

/// Handshake bytes sent as soon as the channel opens.
inline constexpr std::array<std::uint8_t, 2> kHandshake{kProtocolVersion, 0x00};

using ConnectHandler = std::function<void(std::expected<void, std::string>)>;
using QueryHandler = std::function<void(std::expected<runtime::Result, std::string>)>;

/// Connection to a remote engine.
///
/// The wire carries no correlation id, so requests are strictly
/// single-flight: only the head of the queue is on the wire and the next one
/// is sent when it settles. A timed-out request still owes one response;
/// that many later responses are discarded before matching.
///
/// All members must be called from the thread running the io_context.
class RemoteTransport {
   public:
    RemoteTransport(boost::asio::io_context& io, runtime::EventBus& events,
                    ChannelFactory factory = make_channel);
    ~RemoteTransport();

    RemoteTransport(const RemoteTransport&) = delete;
    auto operator=(const RemoteTransport&) -> RemoteTransport& = delete;

    /// Open a channel and perform the handshake. Replaces any existing
    /// connection. `handler` runs once the handshake reply arrives or the
    /// attempt fails.
    void connect(const Address& address, ConnectHandler handler);
    void disconnect();

    [[nodiscard]] auto state() const noexcept -> ConnectionState { return state_; }
    [[nodiscard]] auto is_connected() const noexcept -> bool {
        return state_ == ConnectionState::Connected;
    }
    [[nodiscard]] auto server_version() const noexcept -> std::optional<std::uint8_t> {
        return server_version_;
    }
    [[nodiscard]] auto address() const noexcept -> const std::optional<Address>& {
        return address_;
    }

    /// Queue `code` for remote evaluation.
    void query(std::string code, std::chrono::milliseconds timeout, QueryHandler handler);

    /// Queued plus in-flight requests.
    [[nodiscard]] auto pending_count() const noexcept -> std::size_t;
    /// Responses still owed by the peer for timed-out requests.
    [[nodiscard]] auto owed_responses() const noexcept -> std::size_t { return owed_; }
    /// Late responses discarded so far.
    [[nodiscard]] auto stale_responses() const noexcept -> std::size_t { return stale_; }

   private:
    struct PendingQuery {
        std::string code;
        std::chrono::milliseconds timeout{};
        QueryHandler handler;
    };

    void on_open();
    void on_binary(std::vector<std::uint8_t> bytes);
    void on_text(const std::string& text);
    void on_close();
    void on_error(const std::string& message);

    void finish_handshake(std::optional<std::uint8_t> version);
    void handle_binary(std::span<const std::uint8_t> bytes);
    void handle_json(std::string_view text, bool from_binary_frame);
    void handle_response(std::expected<runtime::Result, std::string> response);

    void send_next();
    void on_timeout(std::uint64_t sequence);
    void settle_connect(std::expected<void, std::string> outcome);
    void reject_all(const std::string& reason);
    void drop_channel();

    boost::asio::io_context& io_;
    runtime::EventBus& events_;
    ChannelFactory factory_;
    std::unique_ptr<Channel> channel_;
    std::optional<Address> address_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::optional<std::uint8_t> server_version_;
    bool handshake_done_ = false;
    ConnectHandler connect_handler_;

    std::deque<PendingQuery> queue_;
    std::optional<PendingQuery> in_flight_;
    boost::asio::steady_timer timer_;
    std::uint64_t sequence_ = 0;
    std::size_t owed_ = 0;
    std::size_t stale_ = 0;
};

}  // namespace raylink::ipc
