#include "response_parser.hpp"
#include "../common/http_response.hpp"
#include "../../util/logger.hpp"
#include <algorithm>

namespace httprange::http {

    response_parser::response_parser() {
        reset();
    }

    void response_parser::reset() {
        resp_ = std::make_shared<http_response>();
        name_.clear();
        value_.clear();
        number_ = 0;
        remaining_ = 0;
        headers_size_ = 0;
        state_ = http_version_h;
    }

    std::shared_ptr<http_response> response_parser::consume_response() {
        auto response = std::move(resp_);
        reset();
        return response;
    }

    int response_parser::get_status_code() const {
        return resp_ ? resp_->get_status_code() : 0;
    }

    boost::tribool response_parser::parse(const char* begin, const char* end, bool head_request) {
        while (begin != end) {
            if (state_ == completed) {
                // extra bytes after a complete response are not expected
                return false;
            }

            if (state_ == length_delimited_content || state_ == chunk_content || state_ == until_close_content) {
                size_t available = static_cast<size_t>(end - begin);
                size_t to_read = state_ == until_close_content ? available : std::min(available, remaining_);
                if (resp_->get_content_size() + to_read > max_content_size_) {
                    LOG_ERROR("response content exceeds maximum size ({} bytes)", max_content_size_);
                    return false;
                }
                resp_->get_content().append(begin, to_read);
                begin += to_read;
                if (state_ == until_close_content) {
                    continue;
                }
                remaining_ -= to_read;
                if (remaining_ == 0) {
                    if (state_ == length_delimited_content) {
                        state_ = completed;
                        return true;
                    }
                    state_ = chunk_content_expecting_r;
                }
                continue;
            }

            boost::tribool result = consume(*begin++, head_request);
            if (result || !result) {
                return result;
            }
        }
        return boost::indeterminate;
    }

    bool response_parser::on_eof() {
        if (state_ == until_close_content) {
            state_ = completed;
            return true;
        }
        return false;
    }

    boost::tribool response_parser::on_headers_complete(bool head_request) {
        if (head_request || !resp_->status_allows_body()) {
            state_ = completed;
            return true;
        }
        if (resp_->is_chunked()) {
            state_ = chunk_size_start;
            return boost::indeterminate;
        }
        if (resp_->has_content_length()) {
            remaining_ = resp_->get_content_length();
            if (remaining_ > max_content_size_) {
                LOG_ERROR("declared content length {} exceeds maximum size ({} bytes)", remaining_, max_content_size_);
                return false;
            }
            if (remaining_ == 0) {
                state_ = completed;
                return true;
            }
            resp_->get_content().reserve(remaining_);
            state_ = length_delimited_content;
            return boost::indeterminate;
        }
        // body delimited by connection close
        resp_->set_keep_alive(false);
        state_ = until_close_content;
        return boost::indeterminate;
    }

    boost::tribool response_parser::consume(char c, bool head_request) {
        const int input = static_cast<unsigned char>(c);

        if (state_ < length_delimited_content && ++headers_size_ > MAX_HEADERS_SIZE) {
            LOG_ERROR("response headers exceed maximum size ({} bytes)", MAX_HEADERS_SIZE);
            return false;
        }

        switch (state_) {
            case http_version_h:
                if (input == 'H') {
                    state_ = http_version_t_1;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_1:
                if (input == 'T') {
                    state_ = http_version_t_2;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_2:
                if (input == 'T') {
                    state_ = http_version_p;
                    return boost::indeterminate;
                }
                return false;
            case http_version_p:
                if (input == 'P') {
                    state_ = http_version_slash;
                    return boost::indeterminate;
                }
                return false;
            case http_version_slash:
                if (input == '/') {
                    state_ = http_version_major_start;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major_start:
                if (is_digit(input)) {
                    resp_->set_http_version_major(static_cast<uint8_t>(input - '0'));
                    state_ = http_version_major;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major:
                if (input == '.') {
                    state_ = http_version_minor_start;
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor_start:
                if (is_digit(input)) {
                    resp_->set_http_version_minor(static_cast<uint8_t>(input - '0'));
                    state_ = http_version_minor;
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor:
                if (input == ' ') {
                    number_ = 0;
                    state_ = status_code_start;
                    return boost::indeterminate;
                }
                return false;
            case status_code_start:
                if (is_digit(input)) {
                    number_ = static_cast<size_t>(input - '0');
                    state_ = status_code;
                    return boost::indeterminate;
                }
                return false;
            case status_code:
                if (is_digit(input)) {
                    number_ = number_ * 10 + static_cast<size_t>(input - '0');
                    if (number_ > 999) return false;
                    return boost::indeterminate;
                } else if (input == ' ' || input == '\r') {
                    resp_->set_status(static_cast<uint16_t>(number_));
                    value_.clear();
                    state_ = input == ' ' ? reason_phrase : expecting_newline_1;
                    return boost::indeterminate;
                }
                return false;
            case reason_phrase:
                if (input == '\r') {
                    resp_->set_reason_phrase(value_);
                    value_.clear();
                    state_ = expecting_newline_1;
                    return boost::indeterminate;
                } else if (is_ctl(input) && input != '\t') {
                    return false;
                }
                value_.push_back(c);
                return boost::indeterminate;
            case expecting_newline_1:
                if (input == '\n') {
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case header_line_start:
                if (!name_.empty() && (input == ' ' || input == '\t')) {
                    value_.push_back(' ');
                    state_ = header_lws;
                    return boost::indeterminate;
                }
                // no folding follows: the pending header is complete
                if (!name_.empty()) {
                    resp_->process_header(std::move(name_), std::move(value_));
                    name_.clear();
                    value_.clear();
                }
                if (input == '\r') {
                    state_ = expecting_newline_3;
                    return boost::indeterminate;
                } else if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                    return false;
                }
                name_.clear();
                value_.clear();
                name_.push_back(c);
                state_ = header_name;
                return boost::indeterminate;
            case header_lws:
                // obsolete line folding: continuation of the previous header value
                if (input == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                } else if (input == ' ' || input == '\t') {
                    return boost::indeterminate;
                } else if (is_ctl(input)) {
                    return false;
                }
                value_.push_back(c);
                state_ = header_value;
                return boost::indeterminate;
            case header_name:
                if (input == ':') {
                    state_ = space_before_header_value;
                    return boost::indeterminate;
                } else if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                    return false;
                }
                name_.push_back(c);
                return boost::indeterminate;
            case space_before_header_value:
                if (input == ' ' || input == '\t') {
                    return boost::indeterminate;
                } else if (input == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                }
                state_ = header_value;
                [[fallthrough]];
            case header_value:
                if (input == '\r') {
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                } else if (is_ctl(input) && input != '\t') {
                    return false;
                }
                value_.push_back(c);
                return boost::indeterminate;
            case expecting_newline_2:
                if (input == '\n') {
                    while (!value_.empty() && (value_.back() == ' ' || value_.back() == '\t')) {
                        value_.pop_back();
                    }
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case expecting_newline_3:
                if (input == '\n') {
                    return on_headers_complete(head_request);
                }
                return false;
            case chunk_size_start:
                if (hex_value(input) < 0) return false;
                number_ = 0;
                state_ = chunk_size;
                [[fallthrough]];
            case chunk_size:
                if (hex_value(input) >= 0) {
                    number_ = number_ * 16 + static_cast<size_t>(hex_value(input));
                    if (number_ > max_content_size_) return false;
                    return boost::indeterminate;
                } else if (input == ';' || input == ' ' || input == '\t') {
                    state_ = chunk_extension;
                    return boost::indeterminate;
                } else if (input == '\r') {
                    state_ = chunk_size_expecting_n;
                    return boost::indeterminate;
                }
                return false;
            case chunk_extension:
                if (input == '\r') {
                    state_ = chunk_size_expecting_n;
                }
                return boost::indeterminate;
            case chunk_size_expecting_n:
                if (input != '\n') return false;
                if (number_ == 0) {
                    state_ = trailer_line_start;
                } else {
                    remaining_ = number_;
                    state_ = chunk_content;
                }
                return boost::indeterminate;
            case chunk_content_expecting_r:
                if (input == '\r') {
                    state_ = chunk_content_expecting_n;
                    return boost::indeterminate;
                }
                return false;
            case chunk_content_expecting_n:
                if (input == '\n') {
                    state_ = chunk_size_start;
                    return boost::indeterminate;
                }
                return false;
            case trailer_line_start:
                if (input == '\r') {
                    state_ = trailer_expecting_n;
                    return boost::indeterminate;
                }
                state_ = trailer_line;
                return boost::indeterminate;
            case trailer_line:
                if (input == '\r') {
                    state_ = chunk_size_expecting_n;
                    number_ = 0;
                }
                return boost::indeterminate;
            case trailer_expecting_n:
                if (input == '\n') {
                    state_ = completed;
                    return true;
                }
                return false;
            default:
                return false;
        }
    }

    bool response_parser::is_char(int c) {
        return c >= 0 && c <= 127;
    }

    bool response_parser::is_ctl(int c) {
        return (c >= 0 && c <= 31) || (c == 127);
    }

    bool response_parser::is_tspecial(int c) {
        switch (c) {
            case '(': case ')': case '<': case '>': case '@':
            case ',': case ';': case ':': case '\\': case '"':
            case '/': case '[': case ']': case '?': case '=':
            case '{': case '}': case ' ': case '\t':
                return true;
            default:
                return false;
        }
    }

    bool response_parser::is_digit(int c) {
        return c >= '0' && c <= '9';
    }

    int response_parser::hex_value(int c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

}
