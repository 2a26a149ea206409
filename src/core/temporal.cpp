#include <raylink/core/temporal.hpp>

#include <fmt/core.h>

#include <chrono>

namespace raylink {

auto format_date(Date date) -> std::string {
    if (date.days == kNullI32) {
        return "null";
    }
    using namespace std::chrono;
    sys_days day = sys_days{days{static_cast<std::int64_t>(date.days) + kEpochOffsetDays}};
    year_month_day ymd{day};
    return fmt::format("{:04}.{:02}.{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_time(Time time) -> std::string {
    if (time.millis == kNullI32) {
        return "null";
    }
    std::int64_t ms = time.millis;
    const char* sign = "";
    if (ms < 0) {
        sign = "-";
        ms = -ms;
    }
    const auto hours = ms / 3'600'000;
    const auto minutes = (ms / 60'000) % 60;
    const auto seconds = (ms / 1000) % 60;
    const auto millis = ms % 1000;
    return fmt::format("{}{:02}:{:02}:{:02}.{:03}", sign, hours, minutes, seconds, millis);
}

auto format_timestamp(Timestamp ts) -> std::string {
    if (ts.nanos == kNullI64) {
        return "null";
    }
    using namespace std::chrono;
    const sys_days epoch = sys_days{days{kEpochOffsetDays}};
    const auto tp = epoch + nanoseconds{ts.nanos};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<nanoseconds> hms{tp - day};
    return fmt::format("{:04}.{:02}.{:02}D{:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

}  // namespace raylink
