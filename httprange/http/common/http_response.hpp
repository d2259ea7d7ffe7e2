#ifndef HTTPRANGE_HTTP_RESPONSE_HPP
#define HTTPRANGE_HTTP_RESPONSE_HPP

#include <memory>
#include <string>
#include "headers.hpp"

namespace httprange::http {

class http_response : public headers {

public:

    // the status of the http_response.
    enum class status {
        ok = 200,
        no_content = 204,
        partial_content = 206,
        moved_permanently = 301,
        moved_temporarily = 302,
        see_other = 303,
        not_modified = 304,
        temporary_redirect = 307,
        permanent_redirect = 308,
        bad_request = 400,
        forbidden = 403,
        not_found = 404,
        not_allowed = 405,
        precondition_failed = 412,
        range_not_satisfiable = 416,
        internal_server_error = 500,
        not_implemented = 501,
        bad_gateway = 502,
        service_unavailable = 503,
        gateway_timeout = 504
    };

    http_response() = default;
    ~http_response() override = default;

    // some setters
    void set_content(std::string content);
    void set_status(uint16_t status_code);
    void set_status(status status_code);
    void set_reason_phrase(std::string reason);

    // some getters
    const std::string& get_content() const;
    std::string& get_content();
    size_t get_content_size() const;
    status get_status() const;
    int get_status_code() const;
    const std::string& get_reason_phrase() const;
    bool is_ok() const;
    bool is_redirect_response() const;

    // true when a message body follows the headers for this status
    bool status_allows_body() const;

    void log(const char* scope) const;

private:
    std::string content_;
    status status_ = status::ok;
    std::string reason_phrase_;
};

}

#endif
