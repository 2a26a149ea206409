#include <raylink/bridge/bridge.hpp>
#include <raylink/bridge/worker.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/core.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <type_traits>
#include <utility>
#include <variant>

namespace raylink::bridge {

/// Caller-side bookkeeping. Lives on the io_context thread only; posted
/// replies hold it weakly so they are dropped once the bridge is gone.
struct Bridge::State {
    explicit State(boost::asio::io_context& io) : init_timer(io) {}

    robin_hood::unordered_node_map<std::string, ReplyHandler> pending;
    std::vector<ProgressObserver> observers;
    InitHandler init_handler;
    boost::asio::steady_timer init_timer;
    /// Bumped per worker; replies from an older worker are ignored.
    std::uint64_t generation = 0;
    bool initialized = false;
    bool running = false;

    void settle_init(std::expected<std::string, std::string> outcome) {
        init_timer.cancel();
        if (!init_handler) {
            return;
        }
        auto handler = std::move(init_handler);
        init_handler = nullptr;
        handler(std::move(outcome));
    }

    void settle(const std::string& id, std::expected<Reply, std::string> outcome) {
        auto it = pending.find(id);
        if (it == pending.end()) {
            spdlog::debug("[bridge] reply for unknown request {}", id);
            return;
        }
        auto handler = std::move(it->second);
        pending.erase(it);
        handler(std::move(outcome));
    }

    void reject_all(const std::string& reason) {
        auto entries = std::move(pending);
        pending.clear();
        for (auto& [id, handler] : entries) {
            handler(std::unexpected(reason));
        }
    }

    void dispatch(std::uint64_t from, Response response) {
        if (from != generation) {
            spdlog::debug("[bridge] dropping reply from a stopped worker");
            return;
        }
        std::visit(
            [this](auto& message) {
                using T = std::decay_t<decltype(message)>;
                if constexpr (std::is_same_v<T, ReadyResponse>) {
                    initialized = true;
                    settle_init(std::move(message.version));
                } else if constexpr (std::is_same_v<T, ResultResponse>) {
                    settle(message.id, std::move(message.data));
                } else if constexpr (std::is_same_v<T, ProgressResponse>) {
                    for (const auto& observer : observers) {
                        observer(message.id, message.fraction);
                    }
                } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                    if (message.id == kInitId) {
                        settle_init(std::unexpected(std::move(message.message)));
                        return;
                    }
                    settle(message.id, std::unexpected(std::move(message.message)));
                } else {
                    running = false;
                    const auto reason = fmt::format("Worker error: {}", message.message);
                    settle_init(std::unexpected(reason));
                    reject_all(reason);
                }
            },
            response);
    }
};

namespace {

auto default_scratch_dir() -> std::filesystem::path {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return base / fmt::format("raylink-{}", ::getpid());
}

template <typename T>
auto narrow_reply(std::expected<Reply, std::string> outcome) -> std::expected<T, std::string> {
    if (!outcome) {
        return std::unexpected(std::move(outcome.error()));
    }
    if (auto* value = std::get_if<T>(&*outcome)) {
        return std::move(*value);
    }
    return std::unexpected(std::string("Unexpected reply type"));
}

}  // namespace

Bridge::Bridge(boost::asio::io_context& io, engine::EvaluatorFactory factory, BridgeConfig config)
    : io_(io),
      factory_(std::move(factory)),
      config_(std::move(config)),
      state_(std::make_shared<State>(io)) {
    if (config_.scratch_dir.empty()) {
        config_.scratch_dir = default_scratch_dir();
    }
}

Bridge::~Bridge() {
    terminate();
}

void Bridge::init(InitHandler handler) {
    if (state_->initialized || state_->running) {
        handler(std::unexpected(std::string("Already initialized")));
        return;
    }
    state_->init_handler = std::move(handler);
    state_->running = true;

    if (thread_.joinable()) {
        thread_.join();
    }
    mailbox_ = std::make_shared<Mailbox<Request>>();
    const std::uint64_t generation = ++state_->generation;
    std::weak_ptr<State> weak = state_;
    boost::asio::io_context& io = io_;
    ResponseSink sink = [weak, generation, &io](Response response) {
        boost::asio::post(io, [weak, generation, response = std::move(response)]() mutable {
            if (auto state = weak.lock()) {
                state->dispatch(generation, std::move(response));
            }
        });
    };
    thread_ = std::thread(
        [mailbox = mailbox_, worker = Worker(factory_, config_.scratch_dir, std::move(sink))]() mutable {
            worker.run(*mailbox);
        });

    state_->init_timer.expires_after(config_.init_timeout);
    state_->init_timer.async_wait([this, weak](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto state = weak.lock();
        if (!state || !state->init_handler) {
            return;
        }
        spdlog::error("[bridge] worker did not become ready in {}ms",
                      config_.init_timeout.count());
        state->settle_init(std::unexpected(std::string("Worker initialization timeout")));
        state->reject_all("Worker initialization timeout");
        release_worker();
    });
    mailbox_->push(InitRequest{});
}

auto Bridge::evaluate(std::string expression, EvalHandler handler) -> std::string {
    auto id = next_id();
    spdlog::debug("[bridge] {} eval: {}", id, expression);
    return submit(EvalRequest{.id = id, .expression = std::move(expression)}, id,
                  [handler = std::move(handler)](std::expected<Reply, std::string> outcome) {
                      handler(narrow_reply<std::string>(std::move(outcome)));
                  });
}

auto Bridge::load_data(std::vector<std::uint8_t>&& data, DataFormat format, LoadHandler handler)
    -> std::string {
    auto id = next_id();
    spdlog::debug("[bridge] {} load_data: {} bytes as {}", id, data.size(), to_string(format));
    LoadDataRequest request{.id = id, .data = std::move(data), .format = format};
    data.clear();
    return submit(std::move(request), id,
                  [handler = std::move(handler)](std::expected<Reply, std::string> outcome) {
                      handler(narrow_reply<LoadSummary>(std::move(outcome)));
                  });
}

auto Bridge::write_file(std::string path, std::string content, WriteHandler handler)
    -> std::string {
    auto id = next_id();
    spdlog::debug("[bridge] {} write_file: {} ({} bytes)", id, path, content.size());
    return submit(WriteFileRequest{.id = id, .path = std::move(path), .content = std::move(content)},
                  id, [handler = std::move(handler)](std::expected<Reply, std::string> outcome) {
                      handler(narrow_reply<WrittenFile>(std::move(outcome)));
                  });
}

void Bridge::cancel(const std::string& id) {
    if (state_->pending.find(id) == state_->pending.end()) {
        spdlog::debug("[bridge] cancel for settled or unknown request {}", id);
        return;
    }
    if (mailbox_) {
        mailbox_->push_front(CancelRequest{.id = id});
    }
    spdlog::debug("[bridge] cancelled {}", id);
    state_->settle(id, std::unexpected(std::string("Cancelled")));
}

void Bridge::terminate() {
    state_->settle_init(std::unexpected(std::string("Worker terminated")));
    state_->reject_all("Worker terminated");
    stop_worker();
}

auto Bridge::on_progress(ProgressObserver observer) -> std::size_t {
    state_->observers.push_back(std::move(observer));
    return state_->observers.size() - 1;
}

auto Bridge::is_initialized() const noexcept -> bool {
    return state_->initialized;
}

auto Bridge::pending_count() const noexcept -> std::size_t {
    return state_->pending.size();
}

auto Bridge::submit(Request request, std::string id, ReplyHandler handler) -> std::string {
    if (!state_->running || !mailbox_) {
        handler(std::unexpected(std::string("Worker not running")));
        return id;
    }
    state_->pending.emplace(id, std::move(handler));
    if (!mailbox_->push(std::move(request))) {
        state_->settle(id, std::unexpected(std::string("Worker not running")));
    }
    return id;
}

auto Bridge::next_id() -> std::string {
    return fmt::format("req-{}", ++request_id_);
}

void Bridge::release_worker() {
    state_->running = false;
    state_->initialized = false;
    ++state_->generation;
    if (mailbox_) {
        mailbox_->push(ShutdownRequest{});
        mailbox_->close();
    }
    mailbox_.reset();
}

void Bridge::stop_worker() {
    release_worker();
    if (thread_.joinable()) {
        thread_.join();
        spdlog::debug("[bridge] worker joined");
    }
}

}  // namespace raylink::bridge
