#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace raylink::bridge {

/// Encoding of a buffer handed to `Bridge::load_data`.
enum class DataFormat : std::uint8_t { Csv, Rayforce };

[[nodiscard]] auto to_string(DataFormat format) -> std::string_view;
[[nodiscard]] auto parse_format(std::string_view text) -> std::optional<DataFormat>;

/// Shape of a loaded dataset.
struct LoadSummary {
    std::size_t row_count = 0;
    std::vector<std::string> columns;

    bool operator==(const LoadSummary&) const = default;
};

/// A file written into the worker's scratch directory.
struct WrittenFile {
    std::string path;
    std::uintmax_t size = 0;

    bool operator==(const WrittenFile&) const = default;
};

// Caller -> worker.

struct InitRequest {};

struct EvalRequest {
    std::string id;
    std::string expression;
};

struct LoadDataRequest {
    std::string id;
    std::vector<std::uint8_t> data;
    DataFormat format = DataFormat::Csv;
};

struct WriteFileRequest {
    std::string id;
    std::string path;
    std::string content;
};

struct CancelRequest {
    std::string id;
};

struct ShutdownRequest {};

using Request = std::variant<InitRequest, EvalRequest, LoadDataRequest, WriteFileRequest,
                             CancelRequest, ShutdownRequest>;

// Worker -> caller.

/// Id used by an error that answers the init request.
inline constexpr std::string_view kInitId = "init";

/// Payload of a successful reply: rendered value, load summary or file.
using Reply = std::variant<std::string, LoadSummary, WrittenFile>;

struct ReadyResponse {
    std::string version;
};

struct ResultResponse {
    std::string id;
    Reply data;
};

struct ProgressResponse {
    std::string id;
    double fraction = 0.0;
};

struct ErrorResponse {
    std::string id;
    std::string message;
};

/// The worker loop itself failed and stopped.
struct FailedResponse {
    std::string message;
};

using Response =
    std::variant<ReadyResponse, ResultResponse, ProgressResponse, ErrorResponse, FailedResponse>;

}  // namespace raylink::bridge
