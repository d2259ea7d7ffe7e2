#ifndef HTTPRANGE_HTTP_HEADERS_HPP
#define HTTPRANGE_HTTP_HEADERS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/logic/tribool.hpp>

namespace httprange::http {

    namespace header {
        constexpr std::string_view accept_encoding   = "Accept-Encoding";
        constexpr std::string_view accept_ranges     = "Accept-Ranges";
        constexpr std::string_view connection        = "Connection";
        constexpr std::string_view content_length    = "Content-Length";
        constexpr std::string_view content_range     = "Content-Range";
        constexpr std::string_view etag              = "ETag";
        constexpr std::string_view host              = "Host";
        constexpr std::string_view if_range          = "If-Range";
        constexpr std::string_view last_modified     = "Last-Modified";
        constexpr std::string_view location          = "Location";
        constexpr std::string_view range             = "Range";
        constexpr std::string_view transfer_encoding = "Transfer-Encoding";
        constexpr std::string_view user_agent        = "User-Agent";
    }

    namespace connection {
        constexpr std::string_view keep_alive = "keep-alive";
        constexpr std::string_view close      = "close";
    }

    namespace misc_strings {
        constexpr std::string_view name_value_separator = ": ";
        constexpr std::string_view crlf                 = "\r\n";
    }

    /// Ordered header list with case-insensitive lookups, shared by requests
    /// and responses.
    class headers {
    public:
        using http_header = std::pair<std::string, std::string>;

        headers() = default;
        virtual ~headers() = default;

        // called by the parser: tracks connection and framing headers
        void process_header(std::string key, std::string value);

        void add_header(std::string key, std::string value);
        void set_header(std::string key, std::string value);
        bool remove_header(std::string_view key);

        bool has_header(std::string_view key) const;
        const std::string& get_header(std::string_view key) const;
        std::vector<std::string> get_headers_with_key(std::string_view key) const;
        const std::vector<http_header>& get_headers() const;

        bool empty_headers() const;
        void log(const char* scope) const;

        size_t get_content_length() const;
        bool has_content_length() const { return content_length_present_; }
        bool is_chunked() const { return chunked_; }

        bool keep_alive() const;
        void set_keep_alive(bool keep_alive);

        void set_http_version_major(uint8_t http_version_major);
        void set_http_version_minor(uint8_t http_version_minor);
        int get_http_version_major() const;
        int get_http_version_minor() const;

        static bool is_header(std::string_view key, std::string_view header);

    protected:
        std::vector<http_header> headers_;
        boost::tribool keep_alive_ = boost::indeterminate;
        size_t content_length_ = 0;
        bool content_length_present_ = false;
        bool chunked_ = false;
        uint8_t http_version_major_ = 1;
        uint8_t http_version_minor_ = 1;
    };

}

#endif
