#include <catch2/catch_test_macros.hpp>
#include <httprange/http/client/retry_policy.hpp>

using httprange::http::retry_policy;
using namespace std::chrono_literals;

TEST_CASE("Retry policy statuses", "[http][retry][unit]") {
    for (int status : {500, 502, 503, 504}) {
        REQUIRE(retry_policy::is_retryable_status(status));
    }
    for (int status : {200, 206, 404, 416, 501, 505}) {
        REQUIRE_FALSE(retry_policy::is_retryable_status(status));
    }
}

TEST_CASE("Retry policy backoff", "[http][retry][unit]") {
    retry_policy policy;

    SECTION("defaults") {
        REQUIRE(policy.max_retries == 3);
        REQUIRE(policy.backoff == 500ms);
    }

    SECTION("exponential growth") {
        policy.backoff = 100ms;
        REQUIRE(policy.delay(1) == 100ms);
        REQUIRE(policy.delay(2) == 200ms);
        REQUIRE(policy.delay(3) == 400ms);
    }

    SECTION("no delay before the first attempt or without backoff") {
        REQUIRE(policy.delay(0) == 0ms);
        policy.backoff = 0ms;
        REQUIRE(policy.delay(3) == 0ms);
    }
}
