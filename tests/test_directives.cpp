#include <raylink/runtime/directives.hpp>

#include <catch2/catch_test_macros.hpp>

using raylink::runtime::parse_directives;
using namespace std::chrono_literals;

TEST_CASE("Plain queries carry no directives", "[runtime][directives]") {
    auto directives = parse_directives("  select from trades  ");
    REQUIRE_FALSE(directives.force_local);
    REQUIRE_FALSE(directives.force_remote);
    REQUIRE(directives.timeout == raylink::runtime::kDefaultQueryTimeout);
    REQUIRE(directives.code == "select from trades");
}

TEST_CASE("Directive lines are stripped from the code", "[runtime][directives]") {
    auto directives = parse_directives("@remote\n@timeout:500\nx: 1\n  y: x + 1\n");
    REQUIRE(directives.force_remote);
    REQUIRE_FALSE(directives.force_local);
    REQUIRE(directives.timeout == 500ms);
    REQUIRE(directives.code == "x: 1\n  y: x + 1");
}

TEST_CASE("Directives match by prefix on trimmed lines", "[runtime][directives]") {
    auto directives = parse_directives("   @local please\n1+2");
    REQUIRE(directives.force_local);
    REQUIRE(directives.code == "1+2");
}

TEST_CASE("Unknown @ lines are dropped", "[runtime][directives]") {
    auto directives = parse_directives("@trace\n1");
    REQUIRE_FALSE(directives.force_local);
    REQUIRE_FALSE(directives.force_remote);
    REQUIRE(directives.code == "1");
}

TEST_CASE("Timeouts parse a leading integer", "[runtime][directives]") {
    SECTION("trailing text is ignored") {
        REQUIRE(parse_directives("@timeout: 250ms\n1").timeout == 250ms);
    }

    SECTION("unparsable values keep the default") {
        REQUIRE(parse_directives("@timeout:soon\n1").timeout ==
                raylink::runtime::kDefaultQueryTimeout);
    }

    SECTION("negative values keep the default") {
        REQUIRE(parse_directives("@timeout:-5\n1", 1000ms).timeout == 1000ms);
    }

    SECTION("zero is accepted") {
        REQUIRE(parse_directives("@timeout:0\n1").timeout == 0ms);
    }

    SECTION("the caller's default applies without a directive") {
        REQUIRE(parse_directives("1", 750ms).timeout == 750ms);
    }
}

TEST_CASE("Only directives leaves empty code", "[runtime][directives]") {
    auto directives = parse_directives("@local\n@remote");
    REQUIRE(directives.force_local);
    REQUIRE(directives.force_remote);
    REQUIRE(directives.code.empty());
}
