#include <catch2/catch_test_macros.hpp>
#include <httprange/http/client/response_parser.hpp>
#include <httprange/http/common/http_response.hpp>
#include <string>

using namespace httprange::http;

namespace {

    boost::tribool feed(response_parser& parser, const std::string& data, bool head = false) {
        return parser.parse(data.data(), data.data() + data.size(), head);
    }

}

TEST_CASE("Response parser Content-Length bodies", "[http][parser][unit]") {
    response_parser parser;

    SECTION("complete 206 response") {
        auto result = feed(parser,
            "HTTP/1.1 206 Partial Content\r\n"
            "Content-Range: bytes 10-14/100\r\n"
            "Content-Length: 5\r\n"
            "\r\n"
            "hello");
        REQUIRE(bool(result));

        auto res = parser.consume_response();
        REQUIRE(res->get_status_code() == 206);
        REQUIRE(res->get_reason_phrase() == "Partial Content");
        REQUIRE(res->get_header("content-range") == "bytes 10-14/100");
        REQUIRE(res->get_content() == "hello");
        REQUIRE(res->keep_alive());
    }

    SECTION("byte by byte") {
        std::string wire = "HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabc";
        boost::tribool result = boost::indeterminate;
        for (size_t i = 0; i < wire.size(); ++i) {
            result = parser.parse(wire.data() + i, wire.data() + i + 1);
            if (i + 1 < wire.size()) {
                REQUIRE(boost::indeterminate(result));
            }
        }
        REQUIRE(bool(result));
        REQUIRE(parser.consume_response()->get_content() == "abc");
    }

    SECTION("zero length body completes with the headers") {
        REQUIRE(bool(feed(parser, "HTTP/1.1 416 Range Not Satisfiable\r\nContent-Length: 0\r\n\r\n")));
        REQUIRE(parser.consume_response()->get_status_code() == 416);
    }

    SECTION("HEAD responses carry no body") {
        REQUIRE(bool(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 5000\r\nAccept-Ranges: bytes\r\n\r\n", true)));
        auto res = parser.consume_response();
        REQUIRE(res->get_content_length() == 5000);
        REQUIRE(res->get_content().empty());
    }

    SECTION("content above the limit is rejected") {
        parser.set_max_content_size(4);
        REQUIRE_FALSE(bool(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n")));
    }

    SECTION("consume_response resets for the next response") {
        REQUIRE(bool(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\na")));
        parser.consume_response();
        REQUIRE(bool(feed(parser, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n")));
        REQUIRE(parser.consume_response()->get_status_code() == 404);
    }
}

TEST_CASE("Response parser chunked bodies", "[http][parser][unit]") {
    response_parser parser;

    SECTION("several chunks with extension and trailer") {
        auto result = feed(parser,
            "HTTP/1.1 200 OK\r\n"
            "Transfer-Encoding: chunked\r\n"
            "\r\n"
            "4\r\nWiki\r\n"
            "5;name=value\r\npedia\r\n"
            "0\r\n"
            "X-Checksum: abc\r\n"
            "\r\n");
        REQUIRE(bool(result));
        REQUIRE(parser.consume_response()->get_content() == "Wikipedia");
    }

    SECTION("hex sizes") {
        std::string payload(26, 'z');
        auto result = feed(parser,
            "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n1A\r\n" + payload + "\r\n0\r\n\r\n");
        REQUIRE(bool(result));
        REQUIRE(parser.consume_response()->get_content() == payload);
    }

    SECTION("malformed chunk size") {
        REQUIRE_FALSE(bool(feed(parser, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nxyz\r\n")));
    }
}

TEST_CASE("Response parser close-delimited bodies", "[http][parser][unit]") {
    response_parser parser;

    auto result = feed(parser, "HTTP/1.0 200 OK\r\n\r\nsome bytes");
    REQUIRE(boost::indeterminate(result));
    REQUIRE(parser.on_eof());

    auto res = parser.consume_response();
    REQUIRE(res->get_content() == "some bytes");
    REQUIRE_FALSE(res->keep_alive());
}

TEST_CASE("Response parser framing rules", "[http][parser][unit]") {
    response_parser parser;

    SECTION("204 has no body even without Content-Length") {
        REQUIRE(bool(feed(parser, "HTTP/1.1 204 No Content\r\n\r\n")));
    }

    SECTION("304 has no body") {
        REQUIRE(bool(feed(parser, "HTTP/1.1 304 Not Modified\r\nETag: \"x\"\r\n\r\n")));
    }

    SECTION("on_eof before the body is complete fails") {
        REQUIRE(boost::indeterminate(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc")));
        REQUIRE_FALSE(parser.on_eof());
    }

    SECTION("garbage status line") {
        REQUIRE_FALSE(bool(feed(parser, "HTTX/1.1 200 OK\r\n\r\n")));
    }

    SECTION("status code is available after the status line") {
        feed(parser, "HTTP/1.1 503 Service Unavailable\r\n");
        REQUIRE(parser.get_status_code() == 503);
    }

    SECTION("folded header values") {
        REQUIRE(bool(feed(parser,
            "HTTP/1.1 200 OK\r\n"
            "X-Long: first\r\n"
            " second\r\n"
            "Content-Length: 0\r\n"
            "\r\n")));
        auto value = parser.consume_response()->get_header("X-Long");
        REQUIRE(value.find("first") != std::string::npos);
        REQUIRE(value.find("second") != std::string::npos);
    }
}
