#include <catch2/catch_test_macros.hpp>
#include <httprange/stream/stream_options.hpp>
#include <stdexcept>

using httprange::stream_options;
using namespace std::chrono_literals;

TEST_CASE("Stream options defaults", "[stream][options][unit]") {
    stream_options options("https://example.com/a.zip");

    REQUIRE(options.get_url() == "https://example.com/a.zip");
    REQUIRE(options.get_chunk_size() == 1024 * 1024);
    REQUIRE(options.get_timeout() == 10s);
    REQUIRE(options.get_max_retries() == 3);
    REQUIRE(options.get_backoff() == 500ms);
    REQUIRE(options.get_user_agent() == "httprange/1.0");
    REQUIRE(options.get_prefetch());
    REQUIRE(options.get_verify_ssl());
    REQUIRE_FALSE(options.get_transport());
    REQUIRE_NOTHROW(options.validate());
}

TEST_CASE("Stream options fluent setters", "[stream][options][unit]") {
    auto options = stream_options()
        .url("http://localhost/x")
        .chunk_size(4096)
        .timeout(30s)
        .max_retries(5)
        .backoff(250ms)
        .user_agent("zip-reader/2.0")
        .prefetch(false)
        .verify_ssl(false);

    REQUIRE(options.get_url() == "http://localhost/x");
    REQUIRE(options.get_chunk_size() == 4096);
    REQUIRE(options.get_timeout() == 30s);
    REQUIRE(options.get_max_retries() == 5);
    REQUIRE(options.get_backoff() == 250ms);
    REQUIRE(options.get_user_agent() == "zip-reader/2.0");
    REQUIRE_FALSE(options.get_prefetch());
    REQUIRE_FALSE(options.get_verify_ssl());
}

TEST_CASE("Stream options validation", "[stream][options][unit]") {
    SECTION("missing url") {
        REQUIRE_THROWS_AS(stream_options().validate(), std::invalid_argument);
    }

    SECTION("zero chunk size") {
        REQUIRE_THROWS_AS(stream_options("http://x/").chunk_size(0).validate(), std::invalid_argument);
    }

    SECTION("non-positive timeout") {
        REQUIRE_THROWS_AS(stream_options("http://x/").timeout(0s).validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(stream_options("http://x/").timeout(-1s).validate(), std::invalid_argument);
        REQUIRE_NOTHROW(stream_options("http://x/").timeout(1s).validate());
    }
}

TEST_CASE("Stream options JSON", "[stream][options][json][unit]") {

    SECTION("from_json reads known keys") {
        auto options = stream_options::from_json({
            {"url", "https://example.com/data.bin"},
            {"chunk_size", 65536},
            {"timeout_ms", 2500},
            {"max_retries", 1},
            {"backoff_ms", 100},
            {"user_agent", "tester"},
            {"prefetch", false},
            {"verify_ssl", false}
        });

        REQUIRE(options.get_url() == "https://example.com/data.bin");
        REQUIRE(options.get_chunk_size() == 65536);
        REQUIRE(options.get_timeout() == 3s);
        REQUIRE(options.get_max_retries() == 1);
        REQUIRE(options.get_backoff() == 100ms);
        REQUIRE(options.get_user_agent() == "tester");
        REQUIRE_FALSE(options.get_prefetch());
        REQUIRE_FALSE(options.get_verify_ssl());
    }

    SECTION("missing keys keep defaults") {
        auto options = stream_options::from_json({{"url", "http://h/f"}});
        REQUIRE(options.get_chunk_size() == stream_options::DEFAULT_CHUNK_SIZE);
        REQUIRE(options.get_prefetch());
    }

    SECTION("to_json round trips the settings") {
        auto original = stream_options("http://h/f").chunk_size(100).backoff(42ms);
        auto json = original.to_json();
        REQUIRE(json["chunk_size"] == 100);
        REQUIRE(json["timeout_ms"] == 10000);
        REQUIRE(json["backoff_ms"] == 42);

        auto restored = stream_options::from_json(json);
        REQUIRE(restored.get_chunk_size() == 100);
        REQUIRE(restored.get_timeout() == 10s);
        REQUIRE(restored.get_backoff() == 42ms);
    }

    SECTION("invalid values") {
        REQUIRE_THROWS_AS(stream_options::from_json({{"chunk_size", 0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(stream_options::from_json({{"chunk_size", "big"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(stream_options::from_json({{"timeout_ms", 0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(stream_options::from_json({{"timeout_ms", -500}}), std::invalid_argument);
        REQUIRE_THROWS_AS(stream_options::from_json(nlohmann::json::array()), std::invalid_argument);
    }
}
