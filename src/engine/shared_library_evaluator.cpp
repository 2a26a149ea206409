#include <raylink/codec/decoder.hpp>
#include <raylink/codec/types.hpp>
#include <raylink/engine/shared_library_evaluator.hpp>
#include <raylink/ipc/frame.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <dlfcn.h>

namespace raylink::engine {

namespace {

constexpr std::size_t kTypeOffset = 2;
constexpr std::size_t kLengthOffset = 8;
constexpr std::size_t kDataOffset = 16;

template <typename Fn>
auto resolve(void* library, const char* name, Fn& out) -> std::expected<void, std::string> {
    dlerror();
    void* symbol = dlsym(library, name);
    if (symbol == nullptr) {
        const char* err = dlerror();
        return std::unexpected(
            fmt::format("missing symbol '{}': {}", name, err != nullptr ? err : "not found"));
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    out = reinterpret_cast<Fn>(symbol);
    return {};
}

auto read_type(Handle handle) -> std::int8_t {
    std::int8_t type = 0;
    std::memcpy(&type, static_cast<const std::byte*>(handle) + kTypeOffset, sizeof(type));
    return type;
}

auto read_length(Handle handle) -> std::int64_t {
    std::int64_t length = 0;
    std::memcpy(&length, static_cast<const std::byte*>(handle) + kLengthOffset, sizeof(length));
    return length;
}

}  // namespace

auto SharedLibraryEvaluator::load(const std::string& path)
    -> std::expected<std::shared_ptr<SharedLibraryEvaluator>, std::string> {
    void* library = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (library == nullptr) {
        const char* err = dlerror();
        return std::unexpected(fmt::format("failed to load '{}': {}", path,
                                           err != nullptr ? err : "unknown error"));
    }

    Api api;
    for (auto status : {
             resolve(library, "ray_init", api.ray_init),
             resolve(library, "ray_clean", api.ray_clean),
             resolve(library, "eval_str", api.eval_str),
             resolve(library, "drop_obj", api.drop_obj),
             resolve(library, "is_null", api.is_null),
             resolve(library, "ser_obj", api.ser_obj),
             resolve(library, "at_sym", api.at_sym),
             resolve(library, "ray_key", api.ray_key),
             resolve(library, "ray_count", api.ray_count),
         }) {
        if (!status) {
            dlclose(library);
            return std::unexpected(fmt::format("'{}': {}", path, status.error()));
        }
    }

    const std::int32_t rc = api.ray_init();
    if (rc != 0) {
        dlclose(library);
        return std::unexpected(fmt::format("engine runtime failed to initialise (code {})", rc));
    }
    spdlog::debug("[local] loaded engine library {}", path);
    return std::shared_ptr<SharedLibraryEvaluator>(new SharedLibraryEvaluator(library, api));
}

SharedLibraryEvaluator::~SharedLibraryEvaluator() {
    if (library_ != nullptr) {
        api_.ray_clean();
        dlclose(library_);
    }
}

auto SharedLibraryEvaluator::version() const -> std::string {
    return fmt::format("{}", ipc::kProtocolVersion);
}

auto SharedLibraryEvaluator::evaluate(std::string_view code) -> std::expected<Handle, std::string> {
    const std::string source(code);
    Handle result = api_.eval_str(source.c_str());
    if (result == nullptr) {
        return std::unexpected("engine returned no object");
    }
    return result;
}

auto SharedLibraryEvaluator::is_null(Handle handle) const -> bool {
    return handle == nullptr || api_.is_null(handle) != 0;
}

auto SharedLibraryEvaluator::is_error(Handle handle) const -> bool {
    return handle != nullptr && read_type(handle) == static_cast<std::int8_t>(codec::TypeCode::Error);
}

auto SharedLibraryEvaluator::type_code(Handle handle) const -> std::int8_t {
    if (handle == nullptr) {
        return static_cast<std::int8_t>(codec::TypeCode::Null);
    }
    return read_type(handle);
}

auto SharedLibraryEvaluator::is_vector(Handle handle) const -> bool {
    const auto type = type_code(handle);
    return type >= static_cast<std::int8_t>(codec::TypeCode::List) &&
           type <= static_cast<std::int8_t>(codec::TypeCode::C8);
}

auto SharedLibraryEvaluator::length(Handle handle) const -> std::int64_t {
    if (handle == nullptr) {
        return 0;
    }
    return api_.ray_count(handle);
}

auto SharedLibraryEvaluator::error_message(Handle handle) const -> std::string {
    auto bytes = serialize(handle);
    if (bytes) {
        auto decoded = codec::decode_value(*bytes);
        if (decoded) {
            if (const auto* error = decoded->get_if<codec::Error>()) {
                return error->message;
            }
        }
    }
    return "Query execution error";
}

auto SharedLibraryEvaluator::column_names(Handle handle) const -> std::vector<std::string> {
    if (type_code(handle) != static_cast<std::int8_t>(codec::TypeCode::Table)) {
        return {};
    }
    Handle keys = api_.ray_key(handle);
    if (keys == nullptr) {
        return {};
    }
    auto bytes = serialize(keys);
    api_.drop_obj(keys);
    if (!bytes) {
        spdlog::warn("[local] cannot read column names: {}", bytes.error());
        return {};
    }
    auto decoded = codec::decode_value(*bytes);
    if (!decoded) {
        spdlog::warn("[local] cannot decode column names: {}", decoded.error().format());
        return {};
    }
    const auto* names = decoded->get_if<codec::Vector>();
    if (names == nullptr || names->type != codec::TypeCode::Symbol) {
        return {};
    }
    const auto& column = std::get<Column<std::string>>(names->data);
    return {column.begin(), column.end()};
}

auto SharedLibraryEvaluator::column(Handle table, std::string_view name) -> Handle {
    if (table == nullptr) {
        return nullptr;
    }
    const std::string key(name);
    return api_.at_sym(table, key.c_str(), static_cast<std::int64_t>(key.size()));
}

auto SharedLibraryEvaluator::raw_data(Handle handle) const -> std::span<const std::byte> {
    const auto type = type_code(handle);
    if (!codec::is_element_type(type) || type == static_cast<std::int8_t>(codec::TypeCode::Symbol)) {
        return {};
    }
    const auto width = codec::element_width(static_cast<codec::TypeCode>(type));
    const auto count = read_length(handle);
    if (!width.has_value() || count <= 0) {
        return {};
    }
    const auto* base = static_cast<const std::byte*>(handle) + kDataOffset;
    return {base, static_cast<std::size_t>(count) * *width};
}

auto SharedLibraryEvaluator::serialize(Handle handle) const
    -> std::expected<std::vector<std::uint8_t>, std::string> {
    if (handle == nullptr) {
        return std::unexpected("cannot serialize a null handle");
    }
    Handle buffer = api_.ser_obj(handle);
    if (buffer == nullptr) {
        return std::unexpected("engine failed to serialize object");
    }
    if (read_type(buffer) == static_cast<std::int8_t>(codec::TypeCode::Error)) {
        api_.drop_obj(buffer);
        return std::unexpected("engine failed to serialize object");
    }
    const auto count = read_length(buffer);
    const auto* base = static_cast<const std::uint8_t*>(buffer) + kDataOffset;
    std::vector<std::uint8_t> bytes(base, base + (count > 0 ? count : 0));
    api_.drop_obj(buffer);

    if (bytes.size() >= ipc::kHeaderSize) {
        std::uint32_t prefix = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            prefix |= static_cast<std::uint32_t>(bytes[i]) << (8 * i);
        }
        if (prefix == ipc::kFrameMagic) {
            bytes.erase(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(ipc::kHeaderSize));
        }
    }
    return bytes;
}

void SharedLibraryEvaluator::release(Handle handle) noexcept {
    if (handle != nullptr) {
        api_.drop_obj(handle);
    }
}

}  // namespace raylink::engine
