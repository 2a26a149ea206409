#pragma once

#include <raylink/bridge/mailbox.hpp>
#include <raylink/bridge/messages.hpp>
#include <raylink/engine/evaluator.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace raylink::bridge {

/// Receives every response the worker produces, on the worker thread.
using ResponseSink = std::function<void(Response)>;

/// Body of the bridge's worker thread.
///
/// Owns its own evaluator, built from the factory when `init` arrives, and
/// talks to the caller only through the mailbox and the sink.
class Worker {
   public:
    Worker(engine::EvaluatorFactory factory, std::filesystem::path scratch_dir, ResponseSink sink);

    /// Process requests until shutdown or until the mailbox is closed and
    /// drained. An exception escaping a request handler ends the loop with a
    /// FailedResponse.
    void run(Mailbox<Request>& mailbox);

    /// Cancelled ids still waiting for their request.
    [[nodiscard]] auto cancelled_count() const noexcept -> std::size_t {
        return cancelled_.size();
    }

   private:
    void handle(const InitRequest& request);
    void handle(const EvalRequest& request);
    void handle(const LoadDataRequest& request);
    void handle(const WriteFileRequest& request);
    void handle(const CancelRequest& request);
    void handle(const ShutdownRequest& request);

    /// True (and forgets the id) when `id` was cancelled before it ran.
    auto take_cancelled(const std::string& id) -> bool;

    engine::EvaluatorFactory factory_;
    std::shared_ptr<engine::Evaluator> evaluator_;
    std::filesystem::path scratch_dir_;
    ResponseSink sink_;
    robin_hood::unordered_flat_set<std::string> cancelled_;
    bool stopping_ = false;
};

/// Row count and header of CSV text (first row is the header).
[[nodiscard]] auto summarize_csv(std::string_view text) -> std::expected<LoadSummary, std::string>;

/// Row count and column names of an encoded table, bare or framed.
[[nodiscard]] auto summarize_encoded(std::span<const std::uint8_t> bytes)
    -> std::expected<LoadSummary, std::string>;

/// Location of `path` inside `scratch_dir`. Absolute paths are re-rooted;
/// paths escaping the directory are rejected.
[[nodiscard]] auto resolve_scratch_path(const std::filesystem::path& scratch_dir,
                                        std::string_view path)
    -> std::expected<std::filesystem::path, std::string>;

}  // namespace raylink::bridge
