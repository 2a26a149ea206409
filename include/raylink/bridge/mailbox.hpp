#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace raylink::bridge {

/// Blocking FIFO shared by exactly one producer side and one consumer thread.
template <typename T>
class Mailbox {
   public:
    /// Returns false once the mailbox is closed.
    auto push(T message) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    /// Queue ahead of everything not yet taken.
    auto push_front(T message) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_front(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    /// Block until a message arrives. Empty once closed and drained.
    auto pop() -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto empty() const -> bool {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

    [[nodiscard]] auto closed() const -> bool {
        std::lock_guard lock(mutex_);
        return closed_;
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}  // namespace raylink::bridge
