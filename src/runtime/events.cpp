#include <raylink/runtime/events.hpp>

#include <algorithm>

namespace raylink::runtime {

auto kind_of(const Event& event) noexcept -> EventKind {
    return static_cast<EventKind>(event.index());
}

auto EventBus::on(EventKind kind, Listener listener) -> ListenerId {
    const ListenerId id = next_id_++;
    subscriptions_.push_back(Subscription{.id = id, .kind = kind, .listener = std::move(listener)});
    return id;
}

void EventBus::off(ListenerId id) {
    std::erase_if(subscriptions_, [id](const Subscription& sub) { return sub.id == id; });
}

void EventBus::emit(const Event& event) {
    const EventKind kind = kind_of(event);
    // Snapshot so listeners may subscribe or unsubscribe while being notified.
    std::vector<Listener> targets;
    for (const auto& sub : subscriptions_) {
        if (sub.kind == kind) {
            targets.push_back(sub.listener);
        }
    }
    for (const auto& listener : targets) {
        listener(event);
    }
}

auto EventBus::listener_count(EventKind kind) const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(
        subscriptions_, [kind](const Subscription& sub) { return sub.kind == kind; }));
}

}  // namespace raylink::runtime
