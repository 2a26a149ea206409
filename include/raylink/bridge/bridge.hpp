#pragma once

#include <raylink/bridge/mailbox.hpp>
#include <raylink/bridge/messages.hpp>
#include <raylink/engine/evaluator.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace raylink::bridge {

/// Time allowed for the worker to build its engine.
inline constexpr std::chrono::milliseconds kDefaultInitTimeout{30000};

struct BridgeConfig {
    std::chrono::milliseconds init_timeout = kDefaultInitTimeout;
    /// Directory `write_file` writes into. Empty selects a per-process
    /// directory under the system temp directory.
    std::filesystem::path scratch_dir;
};

using InitHandler = std::function<void(std::expected<std::string, std::string>)>;
using EvalHandler = std::function<void(std::expected<std::string, std::string>)>;
using LoadHandler = std::function<void(std::expected<LoadSummary, std::string>)>;
using WriteHandler = std::function<void(std::expected<WrittenFile, std::string>)>;
using ProgressObserver = std::function<void(const std::string& id, double fraction)>;

/// Runs an engine on a dedicated worker thread.
///
/// The worker builds its own evaluator and shares nothing with the caller;
/// requests travel through a mailbox and replies are posted back onto the
/// caller's io_context, so every handler runs on the thread driving it.
/// Requests are identified by `req-<n>` ids and may be pipelined freely.
class Bridge {
   public:
    Bridge(boost::asio::io_context& io, engine::EvaluatorFactory factory,
           BridgeConfig config = {});
    ~Bridge();

    Bridge(const Bridge&) = delete;
    auto operator=(const Bridge&) -> Bridge& = delete;

    /// Start the worker and wait for its engine. `handler` receives the
    /// engine version.
    void init(InitHandler handler);

    /// Evaluate `expression`; the reply is the rendered value.
    auto evaluate(std::string expression, EvalHandler handler) -> std::string;

    /// Hand `data` to the worker. The buffer is moved out of the caller.
    auto load_data(std::vector<std::uint8_t>&& data, DataFormat format, LoadHandler handler)
        -> std::string;

    /// Write `content` to `path` inside the worker's scratch directory.
    auto write_file(std::string path, std::string content, WriteHandler handler) -> std::string;

    /// Reject `id` with "Cancelled" now and tell the worker to skip it.
    void cancel(const std::string& id);

    /// Reject everything pending with "Worker terminated" and stop the worker.
    void terminate();

    auto on_progress(ProgressObserver observer) -> std::size_t;

    [[nodiscard]] auto is_initialized() const noexcept -> bool;
    [[nodiscard]] auto pending_count() const noexcept -> std::size_t;
    [[nodiscard]] auto scratch_dir() const noexcept -> const std::filesystem::path& {
        return config_.scratch_dir;
    }

   private:
    struct State;

    using ReplyHandler = std::function<void(std::expected<Reply, std::string>)>;

    auto submit(Request request, std::string id, ReplyHandler handler) -> std::string;
    auto next_id() -> std::string;
    /// Detach from the worker and ask it to stop without waiting.
    void release_worker();
    void stop_worker();

    boost::asio::io_context& io_;
    engine::EvaluatorFactory factory_;
    BridgeConfig config_;
    std::shared_ptr<State> state_;
    std::shared_ptr<Mailbox<Request>> mailbox_;
    std::thread thread_;
    std::uint64_t request_id_ = 0;
};

}  // namespace raylink::bridge
