#include <catch2/catch_test_macros.hpp>
#include <httprange/stream/remote_probe.hpp>
#include <httprange/stream/errors.hpp>
#include "../../fixtures/fake_transport.hpp"

using namespace httprange;
using httprange::test::fake_transport;
using httprange::test::make_content;

namespace {
    const std::string url = "http://files.test/resource.bin";
}

TEST_CASE("Remote probe with a range capable server", "[stream][probe][unit]") {
    fake_transport transport(make_content(2600));

    SECTION("HEAD is enough") {
        auto meta = probe_remote(transport, url, {});
        REQUIRE(meta.size == 2600);
        REQUIRE(meta.supports_ranges);
        REQUIRE(meta.etag == "\"v1\"");
        REQUIRE(meta.validator() == "\"v1\"");
        REQUIRE_FALSE(meta.initial_body);
        REQUIRE(transport.count("HEAD") == 1);
        REQUIRE(transport.count("GET") == 0);
    }

    SECTION("base headers are sent") {
        probe_remote(transport, url, {{"User-Agent", "probe-test"}});
        REQUIRE(transport.requests().front().header("User-Agent") == "probe-test");
    }

    SECTION("missing Content-Length falls back to a one byte range") {
        transport.head_content_length = false;
        auto meta = probe_remote(transport, url, {});
        REQUIRE(meta.size == 2600);
        REQUIRE(meta.supports_ranges);

        auto requests = transport.requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[1].method == "GET");
        REQUIRE(requests[1].header("Range") == "bytes=0-0");
    }

    SECTION("missing Accept-Ranges still discovers range support") {
        transport.head_accept_ranges = false;
        auto meta = probe_remote(transport, url, {});
        REQUIRE(meta.size == 2600);
        REQUIRE(meta.supports_ranges);
        REQUIRE(transport.count("GET") == 1);
    }

    SECTION("HEAD not allowed falls through to GET") {
        transport.head_status = 405;
        auto meta = probe_remote(transport, url, {});
        REQUIRE(meta.size == 2600);
        REQUIRE(meta.supports_ranges);
        // validator taken from the range response
        REQUIRE(meta.etag == "\"v1\"");
    }
}

TEST_CASE("Remote probe without range support", "[stream][probe][unit]") {
    auto content = make_content(500);
    fake_transport transport(content);
    transport.head_accept_ranges = false;
    transport.ignore_ranges = true;

    auto meta = probe_remote(transport, url, {});
    REQUIRE(meta.size == 500);
    REQUIRE_FALSE(meta.supports_ranges);
    REQUIRE(meta.initial_body);
    REQUIRE(*meta.initial_body == content);
}

TEST_CASE("Remote probe failures", "[stream][probe][unit]") {

    SECTION("HEAD error status") {
        fake_transport transport(make_content(10));
        transport.head_status = 404;
        REQUIRE_THROWS_AS(probe_remote(transport, url, {}), initialization_error);
    }

    SECTION("empty resource") {
        fake_transport transport("");
        REQUIRE_THROWS_AS(probe_remote(transport, url, {}), initialization_error);
    }

    SECTION("range probe rejected") {
        fake_transport transport(make_content(10));
        transport.head_content_length = false;
        transport.head_status = 501;
        // a 416 for bytes=0-0 on a non-empty resource is not expected
        transport.replace_content("", "\"v1\"");
        REQUIRE_THROWS_AS(probe_remote(transport, url, {}), initialization_error);
    }
}

TEST_CASE("Remote metadata validator", "[stream][probe][unit]") {
    remote_metadata meta;

    SECTION("strong etag wins") {
        meta.etag = "\"abc\"";
        meta.last_modified = "Tue, 01 Jan 2030 00:00:00 GMT";
        REQUIRE(meta.validator() == "\"abc\"");
    }

    SECTION("weak etag is not usable for If-Range") {
        meta.etag = "W/\"abc\"";
        meta.last_modified = "Tue, 01 Jan 2030 00:00:00 GMT";
        REQUIRE(meta.validator() == "Tue, 01 Jan 2030 00:00:00 GMT");
    }

    SECTION("nothing known") {
        REQUIRE(meta.validator().empty());
    }
}
