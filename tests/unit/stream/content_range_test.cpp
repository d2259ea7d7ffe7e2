#include <catch2/catch_test_macros.hpp>
#include <httprange/stream/content_range.hpp>

using httprange::content_range;

TEST_CASE("Content-Range parsing", "[stream][content_range][unit]") {

    SECTION("complete value") {
        auto range = content_range::parse("bytes 0-0/2600");
        REQUIRE(range);
        REQUIRE(range->first == 0);
        REQUIRE(range->last == 0);
        REQUIRE(range->complete_length == 2600u);
    }

    SECTION("unknown complete length") {
        auto range = content_range::parse("bytes 1024-2047/*");
        REQUIRE(range);
        REQUIRE(range->first == 1024);
        REQUIRE(range->last == 2047);
        REQUIRE_FALSE(range->complete_length);
    }

    SECTION("case and surrounding whitespace") {
        auto range = content_range::parse("  Bytes 5-9/10 ");
        REQUIRE(range);
        REQUIRE(range->complete_length == 10u);
    }

    SECTION("large offsets") {
        auto range = content_range::parse("bytes 6000000000-6000000099/7000000000");
        REQUIRE(range);
        REQUIRE(range->first == 6000000000ull);
        REQUIRE(range->complete_length == 7000000000ull);
    }

    SECTION("rejected values") {
        REQUIRE_FALSE(content_range::parse(""));
        REQUIRE_FALSE(content_range::parse("bytes */2600"));
        REQUIRE_FALSE(content_range::parse("bytes 10-5/100"));
        REQUIRE_FALSE(content_range::parse("items 0-1/2"));
        REQUIRE_FALSE(content_range::parse("bytes 0-99999999999999999999999/1"));
    }
}

TEST_CASE("Range header formatting", "[stream][content_range][unit]") {
    REQUIRE(httprange::format_range(0, 1023) == "bytes=0-1023");
    REQUIRE(httprange::format_range(2048, 2599) == "bytes=2048-2599");
}
