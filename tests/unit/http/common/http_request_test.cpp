#include <catch2/catch_test_macros.hpp>
#include <httprange/http/common/http_request.hpp>

using namespace httprange::http;

TEST_CASE("HTTP Request method handling", "[http][request][unit]") {
    REQUIRE(get_method(method::GET) == "GET");
    REQUIRE(get_method(method::HEAD) == "HEAD");
}

TEST_CASE("HTTP Request URL parsing", "[http][request][unit]") {
    http_request req;

    SECTION("HTTP URL") {
        REQUIRE(req.set_url("http://example.com/files/archive.zip"));
        REQUIRE(req.get_host() == "example.com");
        REQUIRE(req.get_port() == "80");
        REQUIRE(req.get_target() == "/files/archive.zip");
        REQUIRE_FALSE(req.is_ssl());
        REQUIRE(req.get_base_path() == "http://example.com:80");
    }

    SECTION("HTTPS URL with port and query") {
        REQUIRE(req.set_url("https://cdn.example.com:8443/a/b.bin?sig=abc"));
        REQUIRE(req.get_host() == "cdn.example.com");
        REQUIRE(req.get_port() == "8443");
        REQUIRE(req.get_target() == "/a/b.bin?sig=abc");
        REQUIRE(req.is_ssl());
    }

    SECTION("No path defaults to root") {
        REQUIRE(req.set_url("https://example.com"));
        REQUIRE(req.get_port() == "443");
        REQUIRE(req.get_target() == "/");
    }

    SECTION("Query without path") {
        REQUIRE(req.set_url("http://example.com?x=1"));
        REQUIRE(req.get_target() == "/?x=1");
    }

    SECTION("Fragment is dropped") {
        REQUIRE(req.set_url("http://example.com/page#section"));
        REQUIRE(req.get_target() == "/page");
    }

    SECTION("IPv6 literal") {
        REQUIRE(req.set_url("http://[::1]:8080/file"));
        REQUIRE(req.get_host() == "::1");
        REQUIRE(req.get_port() == "8080");
    }

    SECTION("Invalid URLs") {
        REQUIRE_FALSE(req.set_url("ftp://example.com/file"));
        REQUIRE_FALSE(req.set_url("not a url"));
        REQUIRE_FALSE(req.set_url(""));
    }
}

TEST_CASE("HTTP Request serialization", "[http][request][unit]") {

    SECTION("Request line and Host header") {
        http_request req(method::GET, "http://example.com:8080/data.bin");
        req.add_header("Range", "bytes=0-99");

        auto wire = req.to_string();
        REQUIRE(wire.rfind("GET /data.bin HTTP/1.1\r\n", 0) == 0);
        REQUIRE(wire.find("Host: example.com:8080\r\n") != std::string::npos);
        REQUIRE(wire.find("Range: bytes=0-99\r\n") != std::string::npos);
        REQUIRE(wire.size() >= 4);
        REQUIRE(wire.substr(wire.size() - 4) == "\r\n\r\n");
    }

    SECTION("Default port is omitted from Host") {
        http_request req(method::HEAD, "https://example.com/x");
        auto wire = req.to_string();
        REQUIRE(wire.rfind("HEAD /x HTTP/1.1\r\n", 0) == 0);
        REQUIRE(wire.find("Host: example.com\r\n") != std::string::npos);
    }

    SECTION("Explicit Host header is kept") {
        http_request req(method::GET, "http://127.0.0.1/x");
        req.add_header("Host", "files.example.com");
        auto wire = req.to_string();
        REQUIRE(wire.find("Host: files.example.com\r\n") != std::string::npos);
        REQUIRE(wire.find("Host: 127.0.0.1") == std::string::npos);
    }

    SECTION("to_buffer matches to_string") {
        http_request req(method::GET, "http://example.com/");
        std::vector<boost::asio::const_buffer> buffers;
        std::string storage;
        req.to_buffer(buffers, storage);

        std::string joined;
        for (const auto& b : buffers) {
            joined.append(static_cast<const char*>(b.data()), b.size());
        }
        REQUIRE(joined == req.to_string());
    }
}
