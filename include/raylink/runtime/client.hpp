#pragma once

#include <raylink/engine/evaluator.hpp>
#include <raylink/ipc/transport.hpp>
#include <raylink/runtime/directives.hpp>
#include <raylink/runtime/events.hpp>
#include <raylink/runtime/result.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace raylink::runtime {

/// Settings for a Client, filled from command-line flags and environment.
struct ClientConfig {
    /// Shared library implementing the embedded engine ABI.
    std::optional<std::string> engine_path;
    /// Server to connect to at startup.
    std::optional<std::string> server;
    /// Timeout for queries that carry no `@timeout:` directive.
    std::chrono::milliseconds default_timeout = kDefaultQueryTimeout;
};

using ResultHandler = std::function<void(std::expected<Result, std::string>)>;

/// Routes query text to the remote engine or the embedded evaluator.
///
/// Owns the RemoteTransport and the EventBus it reports on. Every result
/// handed back carries elapsed time and origin.
class Client {
   public:
    Client(boost::asio::io_context& io, std::shared_ptr<engine::Evaluator> evaluator,
           ClientConfig config = {}, ipc::ChannelFactory factory = ipc::make_channel);

    Client(const Client&) = delete;
    auto operator=(const Client&) -> Client& = delete;

    /// Parse `text` as an address and connect to it.
    void connect(std::string_view address, ipc::ConnectHandler handler);
    void disconnect();
    [[nodiscard]] auto is_connected() const noexcept -> bool { return transport_.is_connected(); }

    /// Strip directives from `text` and evaluate it where they say.
    void execute(std::string_view text, ResultHandler handler);

    /// Synchronous evaluation through the embedded engine.
    [[nodiscard]] auto evaluate_local(std::string_view code) -> Result;

    /// Remote evaluation; transport failures arrive as the unexpected side.
    void query(std::string code, std::chrono::milliseconds timeout, ResultHandler handler);

    [[nodiscard]] auto has_evaluator() const noexcept -> bool { return evaluator_ != nullptr; }
    [[nodiscard]] auto events() noexcept -> EventBus& { return events_; }
    [[nodiscard]] auto transport() const noexcept -> const ipc::RemoteTransport& {
        return transport_;
    }
    [[nodiscard]] auto config() const noexcept -> const ClientConfig& { return config_; }

   private:
    EventBus events_;
    std::shared_ptr<engine::Evaluator> evaluator_;
    ClientConfig config_;
    ipc::RemoteTransport transport_;
};

/// Load the engine named by `config.engine_path`. No path gives a null
/// evaluator and local evaluation reports an error.
[[nodiscard]] auto load_evaluator(const ClientConfig& config)
    -> std::expected<std::shared_ptr<engine::Evaluator>, std::string>;

}  // namespace raylink::runtime
