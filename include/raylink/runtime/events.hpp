#pragma once

#include <raylink/runtime/result.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace raylink::runtime {

struct ConnectedEvent {
    /// Version byte from the handshake reply, when the peer sent one.
    std::optional<std::uint8_t> server_version;
};

struct DisconnectedEvent {};

struct ErrorEvent {
    std::string message;
};

struct ResultEvent {
    Result result;
};

using Event = std::variant<ConnectedEvent, DisconnectedEvent, ErrorEvent, ResultEvent>;

/// Discriminator matching the alternatives of Event, in order.
enum class EventKind : std::uint8_t { Connected, Disconnected, Error, Result };

[[nodiscard]] auto kind_of(const Event& event) noexcept -> EventKind;

/// Connection lifecycle notifications.
///
/// Listeners run synchronously on the emitting thread, in subscription order.
class EventBus {
   public:
    using Listener = std::function<void(const Event&)>;
    using ListenerId = std::uint64_t;

    auto on(EventKind kind, Listener listener) -> ListenerId;
    void off(ListenerId id);
    void emit(const Event& event);

    [[nodiscard]] auto listener_count(EventKind kind) const -> std::size_t;

   private:
    struct Subscription {
        ListenerId id = 0;
        EventKind kind = EventKind::Connected;
        Listener listener;
    };

    std::vector<Subscription> subscriptions_;
    ListenerId next_id_ = 1;
};

}  // namespace raylink::runtime
