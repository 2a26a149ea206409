#include <raylink/engine/shared_library_evaluator.hpp>
#include <raylink/runtime/client.hpp>

#include <spdlog/spdlog.h>

namespace raylink::runtime {

namespace {

using Clock = std::chrono::steady_clock;

auto elapsed_ms(Clock::time_point start) -> double {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

}  // namespace

Client::Client(boost::asio::io_context& io, std::shared_ptr<engine::Evaluator> evaluator,
               ClientConfig config, ipc::ChannelFactory factory)
    : evaluator_(std::move(evaluator)),
      config_(std::move(config)),
      transport_(io, events_, std::move(factory)) {}

void Client::connect(std::string_view address, ipc::ConnectHandler handler) {
    auto parsed = ipc::parse_address(address);
    if (!parsed) {
        spdlog::error("[remote] {}", parsed.error());
        handler(std::unexpected(std::move(parsed.error())));
        return;
    }
    transport_.connect(*parsed, std::move(handler));
}

void Client::disconnect() {
    transport_.disconnect();
}

void Client::execute(std::string_view text, ResultHandler handler) {
    auto directives = parse_directives(text, config_.default_timeout);
    if (directives.force_local) {
        if (directives.force_remote) {
            spdlog::debug("[local] both @local and @remote given, evaluating locally");
        }
        handler(evaluate_local(directives.code));
        return;
    }
    if (directives.force_remote) {
        if (!is_connected()) {
            handler(Result::from_error("@remote specified but not connected to server")
                        .with_execution(0.0, Origin::Remote));
            return;
        }
        query(std::move(directives.code), directives.timeout, std::move(handler));
        return;
    }
    if (is_connected()) {
        query(std::move(directives.code), directives.timeout, std::move(handler));
        return;
    }
    handler(evaluate_local(directives.code));
}

auto Client::evaluate_local(std::string_view code) -> Result {
    const auto start = Clock::now();
    spdlog::debug("[local] {}", code);
    if (!evaluator_) {
        spdlog::error("[local] no embedded engine loaded");
        return Result::from_error("Embedded engine not loaded")
            .with_execution(elapsed_ms(start), Origin::Local);
    }

    auto handle = evaluator_->evaluate(code);
    if (!handle) {
        spdlog::error("[local] failed: {}", handle.error());
        return Result::from_error(std::move(handle.error()))
            .with_execution(elapsed_ms(start), Origin::Local);
    }
    auto result = Result::from_native(engine::OwnedHandle(evaluator_, *handle));
    const double elapsed = elapsed_ms(start);
    if (result.is_error()) {
        spdlog::error("[local] failed: {}", result.error_message());
    } else {
        spdlog::info("[local] complete in {:.2f}ms, type: {}", elapsed, to_string(result.kind()));
    }
    return result.with_execution(elapsed, Origin::Local);
}

void Client::query(std::string code, std::chrono::milliseconds timeout, ResultHandler handler) {
    const auto start = Clock::now();
    spdlog::debug("[remote] {}", code);
    transport_.query(
        std::move(code), timeout,
        [start, handler = std::move(handler)](std::expected<Result, std::string> outcome) {
            if (!outcome) {
                spdlog::error("[remote] failed: {}", outcome.error());
                handler(std::unexpected(std::move(outcome.error())));
                return;
            }
            const double elapsed = elapsed_ms(start);
            if (outcome->is_error()) {
                spdlog::error("[remote] failed: {}", outcome->error_message());
            } else {
                spdlog::info("[remote] complete in {:.2f}ms, type: {}", elapsed,
                             to_string(outcome->kind()));
            }
            handler(outcome->with_execution(elapsed, Origin::Remote));
        });
}

auto load_evaluator(const ClientConfig& config)
    -> std::expected<std::shared_ptr<engine::Evaluator>, std::string> {
    if (!config.engine_path || config.engine_path->empty()) {
        return std::shared_ptr<engine::Evaluator>{};
    }
    auto loaded = engine::SharedLibraryEvaluator::load(*config.engine_path);
    if (!loaded) {
        return std::unexpected(std::move(loaded.error()));
    }
    spdlog::info("[local] engine {} loaded from {}", (*loaded)->version(), *config.engine_path);
    return std::shared_ptr<engine::Evaluator>(std::move(*loaded));
}

}  // namespace raylink::runtime
