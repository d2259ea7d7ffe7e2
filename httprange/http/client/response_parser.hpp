#ifndef HTTPRANGE_HTTP_RESPONSE_PARSER_HPP
#define HTTPRANGE_HTTP_RESPONSE_PARSER_HPP

#include <memory>
#include <string>
#include <boost/logic/tribool.hpp>

namespace httprange::http {

    class http_response;

    /// Incremental HTTP/1.1 response parser.
    class response_parser {
    public:
        static constexpr size_t MAX_HEADERS_SIZE = 64*1024;       // 64KB
        static constexpr size_t DEFAULT_MAX_CONTENT_SIZE = 1024*1048576;  // 1GB

        response_parser();

        /// Parse some data. The tribool return value is true when a complete response
        /// has been parsed, false if the data is invalid, indeterminate when more
        /// data is required.
        boost::tribool parse(const char* begin, const char* end, bool head_request = false);

        /// Called when the peer closed the connection. Completes a response whose
        /// body is delimited by connection close; returns false otherwise.
        bool on_eof();

        std::shared_ptr<http_response> consume_response();
        void reset();

        void set_max_content_size(size_t size) { max_content_size_ = size; }

        /// HTTP status code, available once the status line is parsed
        int get_status_code() const;

    private:
        /// Handle the next character of input.
        boost::tribool consume(char input, bool head_request);

        /// Decide the body framing once all headers are read.
        boost::tribool on_headers_complete(bool head_request);

        static bool is_char(int c);
        static bool is_ctl(int c);
        static bool is_tspecial(int c);
        static bool is_digit(int c);
        static int hex_value(int c);

        std::shared_ptr<http_response> resp_;

        std::string name_;
        std::string value_;
        size_t number_          = 0;
        size_t remaining_       = 0;
        size_t headers_size_    = 0;
        size_t max_content_size_ = DEFAULT_MAX_CONTENT_SIZE;

        /// The current state of the parser.
        enum state {
            http_version_h,
            http_version_t_1,
            http_version_t_2,
            http_version_p,
            http_version_slash,
            http_version_major_start,
            http_version_major,
            http_version_minor_start,
            http_version_minor,
            status_code_start,
            status_code,
            reason_phrase,
            expecting_newline_1,
            header_line_start,
            header_lws,
            header_name,
            space_before_header_value,
            header_value,
            expecting_newline_2,
            expecting_newline_3,
            length_delimited_content,
            until_close_content,
            chunk_size_start,
            chunk_size,
            chunk_extension,
            chunk_size_expecting_n,
            chunk_content,
            chunk_content_expecting_r,
            chunk_content_expecting_n,
            trailer_line_start,
            trailer_line,
            trailer_expecting_n,
            completed
        } state_ = http_version_h;
    };

}

#endif
