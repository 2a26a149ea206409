#include <raylink/bridge/worker.hpp>
#include <raylink/codec/decoder.hpp>
#include <raylink/codec/format.hpp>
#include <raylink/ipc/frame.hpp>
#include <raylink/runtime/result.hpp>

#include <fmt/core.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace raylink::bridge {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

auto summarize_csv(std::string_view text) -> std::expected<LoadSummary, std::string> {
    const auto body = trim(text);
    if (body.empty()) {
        return LoadSummary{};
    }
    try {
        std::istringstream stream{std::string(body)};
        rapidcsv::Document doc(stream,
                               rapidcsv::LabelParams(0, -1),      // header row, no index column
                               rapidcsv::SeparatorParams(',', true)  // trim cells
        );
        return LoadSummary{
            .row_count = doc.GetRowCount(),
            .columns = doc.GetColumnNames(),
        };
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("CSV parse error: {}", e.what()));
    }
}

auto summarize_encoded(std::span<const std::uint8_t> bytes)
    -> std::expected<LoadSummary, std::string> {
    auto payload = bytes;
    auto endian = codec::Endian::Little;
    if (bytes.size() >= 4 && bytes[0] == (ipc::kFrameMagic & 0xFF) &&
        bytes[1] == ((ipc::kFrameMagic >> 8) & 0xFF) &&
        bytes[2] == ((ipc::kFrameMagic >> 16) & 0xFF) &&
        bytes[3] == ((ipc::kFrameMagic >> 24) & 0xFF)) {
        auto frame = ipc::decode_frame(bytes);
        if (!frame) {
            return std::unexpected(frame.error().format());
        }
        payload = frame->payload;
        endian = frame->header.endian;
    }
    auto value = codec::decode_value(payload, endian);
    if (!value) {
        return std::unexpected("Deserialize error: " + value.error().format());
    }
    const auto* table = value->get_if<codec::Table>();
    if (table == nullptr) {
        return std::unexpected(std::string("Loaded data is not a table"));
    }
    return LoadSummary{
        .row_count = table->row_count(),
        .columns = table->names,
    };
}

auto resolve_scratch_path(const std::filesystem::path& scratch_dir, std::string_view path)
    -> std::expected<std::filesystem::path, std::string> {
    auto relative = std::filesystem::path(path).relative_path().lexically_normal();
    if (relative.empty() || relative == ".") {
        return std::unexpected(fmt::format("invalid file path '{}'", path));
    }
    if (*relative.begin() == "..") {
        return std::unexpected(fmt::format("path '{}' leaves the scratch directory", path));
    }
    return scratch_dir / relative;
}

Worker::Worker(engine::EvaluatorFactory factory, std::filesystem::path scratch_dir,
               ResponseSink sink)
    : factory_(std::move(factory)), scratch_dir_(std::move(scratch_dir)), sink_(std::move(sink)) {}

void Worker::run(Mailbox<Request>& mailbox) {
    spdlog::debug("[bridge] worker started");
    try {
        while (!stopping_) {
            auto request = mailbox.pop();
            if (!request) {
                break;
            }
            std::visit([this](const auto& message) { handle(message); }, *request);
            // Cancels jump the queue, so once it is empty no cancelled
            // request can still arrive.
            if (!cancelled_.empty() && mailbox.empty()) {
                spdlog::debug("[bridge] forgetting {} stale cancel(s)", cancelled_.size());
                cancelled_.clear();
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[bridge] worker failed: {}", e.what());
        mailbox.close();
        evaluator_.reset();
        sink_(FailedResponse{.message = e.what()});
        return;
    }
    evaluator_.reset();
    spdlog::debug("[bridge] worker stopped");
}

void Worker::handle(const InitRequest& /*request*/) {
    if (evaluator_) {
        sink_(ReadyResponse{.version = evaluator_->version()});
        return;
    }
    spdlog::debug("[bridge] initializing engine");
    auto evaluator = factory_();
    if (!evaluator) {
        spdlog::error("[bridge] init failed: {}", evaluator.error());
        sink_(ErrorResponse{.id = std::string(kInitId), .message = evaluator.error()});
        return;
    }
    if (!*evaluator) {
        sink_(ErrorResponse{.id = std::string(kInitId), .message = "No engine available"});
        return;
    }
    evaluator_ = std::move(*evaluator);
    std::error_code ec;
    std::filesystem::create_directories(scratch_dir_, ec);
    if (ec) {
        spdlog::warn("[bridge] cannot create scratch directory {}: {}", scratch_dir_.string(),
                     ec.message());
    }
    spdlog::info("[bridge] engine ready, version {}", evaluator_->version());
    sink_(ReadyResponse{.version = evaluator_->version()});
}

void Worker::handle(const EvalRequest& request) {
    if (take_cancelled(request.id)) {
        return;
    }
    if (!evaluator_) {
        sink_(ErrorResponse{.id = request.id, .message = "Engine not initialized"});
        return;
    }
    auto handle = evaluator_->evaluate(request.expression);
    if (!handle) {
        sink_(ErrorResponse{.id = request.id, .message = handle.error()});
        return;
    }
    auto result = runtime::Result::from_native(engine::OwnedHandle(evaluator_, *handle));
    if (result.is_error()) {
        sink_(ErrorResponse{.id = request.id, .message = result.error_message()});
        return;
    }
    sink_(ResultResponse{.id = request.id, .data = codec::format_value(result.value())});
}

void Worker::handle(const LoadDataRequest& request) {
    if (take_cancelled(request.id)) {
        return;
    }
    spdlog::debug("[bridge] loading {} bytes as {}", request.data.size(),
                  to_string(request.format));
    sink_(ProgressResponse{.id = request.id, .fraction = 0.0});

    std::expected<LoadSummary, std::string> summary;
    if (request.format == DataFormat::Csv) {
        const std::string_view text(reinterpret_cast<const char*>(request.data.data()),
                                    request.data.size());
        summary = summarize_csv(text);
    } else {
        summary = summarize_encoded(request.data);
    }
    if (!summary) {
        sink_(ErrorResponse{.id = request.id, .message = summary.error()});
        return;
    }
    sink_(ProgressResponse{.id = request.id, .fraction = 1.0});
    sink_(ResultResponse{.id = request.id, .data = std::move(*summary)});
}

void Worker::handle(const WriteFileRequest& request) {
    if (take_cancelled(request.id)) {
        return;
    }
    auto target = resolve_scratch_path(scratch_dir_, request.path);
    if (!target) {
        sink_(ErrorResponse{.id = request.id, .message = target.error()});
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(target->parent_path(), ec);
    if (ec) {
        sink_(ErrorResponse{.id = request.id,
                            .message = fmt::format("cannot create directory {}: {}",
                                                   target->parent_path().string(), ec.message())});
        return;
    }
    {
        std::ofstream out(*target, std::ios::binary | std::ios::trunc);
        out.write(request.content.data(), static_cast<std::streamsize>(request.content.size()));
        if (!out) {
            sink_(ErrorResponse{.id = request.id,
                                .message = fmt::format("cannot write {}", target->string())});
            return;
        }
    }
    const auto size = std::filesystem::file_size(*target, ec);
    if (ec) {
        sink_(ErrorResponse{.id = request.id,
                            .message = fmt::format("cannot stat {}: {}", target->string(),
                                                   ec.message())});
        return;
    }
    spdlog::debug("[bridge] wrote {} ({} bytes)", target->string(), size);
    sink_(ResultResponse{.id = request.id,
                         .data = WrittenFile{.path = target->string(), .size = size}});
}

void Worker::handle(const CancelRequest& request) {
    spdlog::debug("[bridge] cancel requested for {}", request.id);
    cancelled_.insert(request.id);
}

void Worker::handle(const ShutdownRequest& /*request*/) {
    stopping_ = true;
}

auto Worker::take_cancelled(const std::string& id) -> bool {
    auto it = cancelled_.find(id);
    if (it == cancelled_.end()) {
        return false;
    }
    cancelled_.erase(it);
    spdlog::debug("[bridge] skipping cancelled request {}", id);
    return true;
}

}  // namespace raylink::bridge
