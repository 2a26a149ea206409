#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <string>

namespace raylink {

/// Engine null sentinel for 32-bit integral and temporal elements.
inline constexpr std::int32_t kNullI32 = std::numeric_limits<std::int32_t>::min();

/// Engine null sentinel for 64-bit integral and temporal elements.
inline constexpr std::int64_t kNullI64 = std::numeric_limits<std::int64_t>::min();

/// Days between 1970-01-01 and the engine epoch 2000-01-01.
inline constexpr std::int32_t kEpochOffsetDays = 10957;

/// Calendar date in days since 2000-01-01.
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Time of day in milliseconds since midnight.
struct Time {
    std::int32_t millis = 0;
    auto operator<=>(const Time&) const = default;
};

/// Instant in nanoseconds since 2000-01-01T00:00:00.
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// `YYYY.MM.DD`, or `null` for the sentinel.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// `HH:MM:SS.mmm` with a leading `-` for negative values, or `null`.
[[nodiscard]] auto format_time(Time time) -> std::string;

/// `YYYY.MM.DDDHH:MM:SS.nnnnnnnnn`, or `null` for the sentinel.
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

}  // namespace raylink
