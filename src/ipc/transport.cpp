#include <raylink/ipc/frame.hpp>
#include <raylink/ipc/transport.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace raylink::ipc {

namespace {

constexpr std::size_t kUnexpectedPreview = 100;

}  // namespace

auto to_string(ConnectionState state) -> std::string_view {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Error:
            return "error";
    }
    return "unknown";
}

RemoteTransport::RemoteTransport(boost::asio::io_context& io, runtime::EventBus& events,
                                 ChannelFactory factory)
    : io_(io), events_(events), factory_(std::move(factory)), timer_(io) {}

RemoteTransport::~RemoteTransport() {
    drop_channel();
    timer_.cancel();
}

void RemoteTransport::connect(const Address& address, ConnectHandler handler) {
    if (channel_) {
        disconnect();
    }
    address_ = address;
    state_ = ConnectionState::Connecting;
    server_version_.reset();
    handshake_done_ = false;
    connect_handler_ = std::move(handler);
    spdlog::info("[remote] connecting to {}", address.to_string());

    channel_ = factory_(io_, address);
    channel_->open(ChannelHandlers{
        .on_open = [this] { on_open(); },
        .on_binary = [this](std::vector<std::uint8_t> bytes) { on_binary(std::move(bytes)); },
        .on_text = [this](std::string text) { on_text(text); },
        .on_close = [this] { on_close(); },
        .on_error = [this](std::string message) { on_error(message); },
    });
}

void RemoteTransport::disconnect() {
    if (!channel_) {
        return;
    }
    spdlog::info("[remote] disconnecting");
    on_close();
}

auto RemoteTransport::pending_count() const noexcept -> std::size_t {
    return queue_.size() + (in_flight_.has_value() ? 1 : 0);
}

void RemoteTransport::query(std::string code, std::chrono::milliseconds timeout,
                            QueryHandler handler) {
    if (!is_connected()) {
        handler(std::unexpected(std::string("Not connected to server")));
        return;
    }
    queue_.push_back(PendingQuery{
        .code = std::move(code),
        .timeout = timeout,
        .handler = std::move(handler),
    });
    if (!in_flight_) {
        send_next();
    }
}

void RemoteTransport::on_open() {
    spdlog::debug("[remote] channel open, sending handshake");
    channel_->send(std::vector<std::uint8_t>(kHandshake.begin(), kHandshake.end()));
}

void RemoteTransport::on_binary(std::vector<std::uint8_t> bytes) {
    if (!handshake_done_) {
        if (!bytes.empty()) {
            finish_handshake(bytes[0]);
            return;
        }
        finish_handshake(std::nullopt);
    }
    handle_binary(bytes);
}

void RemoteTransport::on_text(const std::string& text) {
    if (!handshake_done_) {
        finish_handshake(std::nullopt);
    }
    handle_json(text, false);
}

void RemoteTransport::on_close() {
    const bool was_open = channel_ != nullptr;
    drop_channel();
    state_ = ConnectionState::Disconnected;
    handshake_done_ = false;
    owed_ = 0;
    settle_connect(std::unexpected(std::string("Connection closed")));
    reject_all("Connection closed");
    if (was_open) {
        spdlog::info("[remote] disconnected");
        events_.emit(runtime::DisconnectedEvent{});
    }
}

void RemoteTransport::on_error(const std::string& message) {
    spdlog::error("[remote] connection error: {}", message);
    drop_channel();
    state_ = ConnectionState::Error;
    handshake_done_ = false;
    owed_ = 0;
    settle_connect(std::unexpected(message));
    events_.emit(runtime::ErrorEvent{.message = message});
    reject_all(message);
}

void RemoteTransport::finish_handshake(std::optional<std::uint8_t> version) {
    handshake_done_ = true;
    server_version_ = version;
    state_ = ConnectionState::Connected;
    if (version) {
        spdlog::info("[remote] connected, server version {}", *version);
    } else {
        spdlog::warn("[remote] connected without a handshake reply");
    }
    events_.emit(runtime::ConnectedEvent{.server_version = version});
    settle_connect({});
}

void RemoteTransport::handle_binary(std::span<const std::uint8_t> bytes) {
    if (!bytes.empty() && bytes.front() == '{') {
        const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        if (nlohmann::json::accept(text)) {
            handle_json(text, true);
            return;
        }
    }
    auto header = decode_header(bytes);
    const bool pushed =
        header.has_value() && header->msg_type == static_cast<std::uint8_t>(MessageType::Async);
    auto result = decode_message(bytes);
    events_.emit(runtime::ResultEvent{.result = result});
    if (pushed) {
        // Server-initiated; answers no request.
        spdlog::debug("[remote] async message from server");
        return;
    }
    handle_response(std::move(result));
}

void RemoteTransport::handle_json(std::string_view text, bool from_binary_frame) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        spdlog::warn("[remote] dropping unparsable text message: {}",
                     text.substr(0, kUnexpectedPreview));
        return;
    }
    if (json.is_object() && json.contains("error")) {
        const auto& error = json["error"];
        std::string message = error.is_string() ? error.get<std::string>() : error.dump();
        spdlog::error("[remote] server error: {}", message);
        handle_response(runtime::Result::from_error(std::move(message)));
        return;
    }
    if (!from_binary_frame) {
        spdlog::warn("[remote] dropping text message without error: {}",
                     text.substr(0, kUnexpectedPreview));
        return;
    }
    handle_response(runtime::Result::from_error(
        fmt::format("Unexpected response: {}", text.substr(0, kUnexpectedPreview))));
}

void RemoteTransport::handle_response(std::expected<runtime::Result, std::string> response) {
    if (owed_ > 0) {
        --owed_;
        ++stale_;
        spdlog::debug("[remote] discarding late response ({} still owed)", owed_);
        return;
    }
    if (!in_flight_) {
        spdlog::warn("[remote] response with no request in flight, discarding");
        return;
    }
    auto settled = std::move(*in_flight_);
    in_flight_.reset();
    timer_.cancel();
    send_next();
    settled.handler(std::move(response));
}

void RemoteTransport::send_next() {
    if (in_flight_ || queue_.empty() || !channel_) {
        return;
    }
    in_flight_ = std::move(queue_.front());
    queue_.pop_front();
    const std::uint64_t sequence = ++sequence_;

    spdlog::debug("[remote] sending query ({} bytes, timeout {}ms)", in_flight_->code.size(),
                  in_flight_->timeout.count());
    channel_->send(encode_request(in_flight_->code));

    timer_.expires_after(in_flight_->timeout);
    timer_.async_wait([this, sequence](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        on_timeout(sequence);
    });
}

void RemoteTransport::on_timeout(std::uint64_t sequence) {
    if (!in_flight_ || sequence != sequence_) {
        return;
    }
    auto expired = std::move(*in_flight_);
    in_flight_.reset();
    ++owed_;
    spdlog::warn("[remote] query timed out after {}ms", expired.timeout.count());
    send_next();
    expired.handler(
        std::unexpected(fmt::format("Query timeout after {}ms", expired.timeout.count())));
}

void RemoteTransport::settle_connect(std::expected<void, std::string> outcome) {
    if (!connect_handler_) {
        return;
    }
    auto handler = std::move(connect_handler_);
    connect_handler_ = nullptr;
    handler(std::move(outcome));
}

void RemoteTransport::reject_all(const std::string& reason) {
    timer_.cancel();
    std::vector<QueryHandler> handlers;
    handlers.reserve(pending_count());
    if (in_flight_) {
        handlers.push_back(std::move(in_flight_->handler));
        in_flight_.reset();
    }
    for (auto& pending : queue_) {
        handlers.push_back(std::move(pending.handler));
    }
    queue_.clear();
    if (!handlers.empty()) {
        spdlog::debug("[remote] rejecting {} pending request(s): {}", handlers.size(), reason);
    }
    for (auto& handler : handlers) {
        handler(std::unexpected(reason));
    }
}

void RemoteTransport::drop_channel() {
    if (!channel_) {
        return;
    }
    auto channel = std::move(channel_);
    channel->close();
}

}  // namespace raylink::ipc
