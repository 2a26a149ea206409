#include <raylink/core/temporal.hpp>

#include <catch2/catch_test_macros.hpp>

using raylink::Date;
using raylink::Time;
using raylink::Timestamp;

TEST_CASE("Dates count days from 2000-01-01", "[core][temporal]") {
    REQUIRE(raylink::format_date(Date{0}) == "2000.01.01");
    REQUIRE(raylink::format_date(Date{31}) == "2000.02.01");
    REQUIRE(raylink::format_date(Date{-1}) == "1999.12.31");
    REQUIRE(raylink::format_date(Date{366}) == "2001.01.01");
    REQUIRE(raylink::format_date(Date{raylink::kNullI32}) == "null");
}

TEST_CASE("Times are milliseconds since midnight", "[core][temporal]") {
    REQUIRE(raylink::format_time(Time{0}) == "00:00:00.000");
    REQUIRE(raylink::format_time(Time{3'723'004}) == "01:02:03.004");
    REQUIRE(raylink::format_time(Time{-1500}) == "-00:00:01.500");
    REQUIRE(raylink::format_time(Time{raylink::kNullI32}) == "null");
}

TEST_CASE("Timestamps are nanoseconds since 2000-01-01", "[core][temporal]") {
    REQUIRE(raylink::format_timestamp(Timestamp{0}) == "2000.01.01D00:00:00.000000000");
    REQUIRE(raylink::format_timestamp(Timestamp{86'400'000'000'001}) ==
            "2000.01.02D00:00:00.000000001");
    REQUIRE(raylink::format_timestamp(Timestamp{-1}) == "1999.12.31D23:59:59.999999999");
    REQUIRE(raylink::format_timestamp(Timestamp{raylink::kNullI64}) == "null");
}
