#include <catch2/catch_test_macros.hpp>
#include <httprange/http/common/http_response.hpp>

using namespace httprange::http;

TEST_CASE("HTTP Headers operations", "[http][headers][unit]") {
    // http_response is a concrete headers implementation
    http_response headers;

    SECTION("Add and get header") {
        headers.add_header("Content-Range", "bytes 0-9/100");

        REQUIRE(headers.has_header("Content-Range"));
        REQUIRE(headers.get_header("Content-Range") == "bytes 0-9/100");
        REQUIRE(headers.get_header("content-range") == "bytes 0-9/100"); // Case insensitive
    }

    SECTION("Multiple values for same header") {
        headers.add_header("Via", "1.1 proxy-a");
        headers.add_header("Via", "1.1 proxy-b");

        auto values = headers.get_headers_with_key("via");
        REQUIRE(values.size() == 2);
        REQUIRE(values[0] == "1.1 proxy-a");
        REQUIRE(values[1] == "1.1 proxy-b");
    }

    SECTION("set_header replaces existing case-insensitive") {
        headers.add_header("ETag", "\"a\"");
        headers.set_header("etag", "\"b\"");
        REQUIRE(headers.get_header("ETag") == "\"b\"");
        REQUIRE(headers.get_headers().size() == 1);
    }

    SECTION("Remove header") {
        headers.add_header("Range", "bytes=0-1");
        REQUIRE(headers.remove_header("RANGE"));
        REQUIRE_FALSE(headers.has_header("Range"));
        REQUIRE_FALSE(headers.remove_header("Range"));
    }

    SECTION("Empty keys are ignored") {
        headers.add_header("", "value");
        REQUIRE(headers.empty_headers());
    }

    SECTION("get_header returns empty for non-existent") {
        REQUIRE(headers.get_header("Last-Modified").empty());
    }
}

TEST_CASE("Headers process_header", "[http][headers][unit]") {

    SECTION("Connection: keep-alive sets keep_alive") {
        http_response h;
        h.set_http_version_minor(0);
        h.process_header("Connection", "Keep-Alive");
        REQUIRE(h.keep_alive());
    }

    SECTION("Connection: close sets keep_alive false") {
        http_response h;
        h.process_header("Connection", "close");
        REQUIRE_FALSE(h.keep_alive());
    }

    SECTION("Connection token list") {
        http_response h;
        h.process_header("Connection", "Upgrade, close");
        REQUIRE_FALSE(h.keep_alive());
    }

    SECTION("Content-Length with valid value") {
        http_response h;
        h.process_header("Content-Length", " 4096 ");
        REQUIRE(h.has_content_length());
        REQUIRE(h.get_content_length() == 4096);
    }

    SECTION("Content-Length with invalid value is not trusted") {
        http_response h;
        h.process_header("Content-Length", "lots");
        REQUIRE_FALSE(h.has_content_length());
        REQUIRE(h.get_content_length() == 0);
    }

    SECTION("Transfer-Encoding chunked") {
        http_response h;
        h.process_header("Transfer-Encoding", "gzip, Chunked");
        REQUIRE(h.is_chunked());
    }
}

TEST_CASE("Headers keep_alive and HTTP version", "[http][headers][unit]") {

    SECTION("HTTP/1.1 defaults to keep-alive") {
        http_response h;
        REQUIRE(h.keep_alive());
    }

    SECTION("HTTP/1.0 defaults to close") {
        http_response h;
        h.set_http_version_major(1);
        h.set_http_version_minor(0);
        REQUIRE_FALSE(h.keep_alive());
    }

    SECTION("set_keep_alive writes the Connection header") {
        http_response h;
        h.set_keep_alive(false);
        REQUIRE_FALSE(h.keep_alive());
        REQUIRE(h.get_header("Connection") == "close");
    }
}

TEST_CASE("HTTP Response status helpers", "[http][response][unit]") {
    http_response res;

    SECTION("2xx is ok") {
        res.set_status(http_response::status::partial_content);
        REQUIRE(res.is_ok());
        REQUIRE(res.get_status_code() == 206);
        REQUIRE_FALSE(res.is_redirect_response());
    }

    SECTION("redirect statuses") {
        for (uint16_t code : {301, 302, 303, 307, 308}) {
            res.set_status(code);
            REQUIRE(res.is_redirect_response());
        }
        res.set_status(304);
        REQUIRE_FALSE(res.is_redirect_response());
    }

    SECTION("bodies are not allowed for 1xx, 204 and 304") {
        res.set_status(http_response::status::no_content);
        REQUIRE_FALSE(res.status_allows_body());
        res.set_status(http_response::status::not_modified);
        REQUIRE_FALSE(res.status_allows_body());
        res.set_status(http_response::status::range_not_satisfiable);
        REQUIRE(res.status_allows_body());
    }

    SECTION("content") {
        res.set_content("payload");
        REQUIRE(res.get_content() == "payload");
        REQUIRE(res.get_content_size() == 7);
    }
}
