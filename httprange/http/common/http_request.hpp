#ifndef HTTPRANGE_HTTP_REQUEST_HPP
#define HTTPRANGE_HTTP_REQUEST_HPP

#include <string>
#include <vector>
#include <boost/asio/buffer.hpp>
#include "headers.hpp"

namespace httprange::http {

enum class method {
    GET,
    HEAD
};

std::string_view get_method(method m);

/// Outgoing request: method, target url and headers. Only body-less methods
/// are modelled.
class http_request : public headers {

public:
    http_request() = default;
    http_request(method m, const std::string& url);
    ~http_request() override = default;

    // url handling; returns false when the url cannot be parsed
    bool set_url(const std::string& url);
    const std::string& get_url() const { return url_; }

    void set_method(method m) { method_ = m; }
    method get_method() const { return method_; }

    const std::string& get_host() const { return host_; }
    const std::string& get_port() const { return port_; }
    const std::string& get_target() const { return target_; }
    bool is_ssl() const { return ssl_; }

    // scheme://host:port, used as connection pool key
    std::string get_base_path() const;

    // serialized request line, headers and terminating crlf
    std::string to_string() const;
    void to_buffer(std::vector<boost::asio::const_buffer>& buffer, std::string& storage) const;

    void log(const char* scope) const;

private:
    method method_ = method::GET;
    std::string url_;
    std::string host_;
    std::string port_;
    std::string target_ = "/";
    bool ssl_ = false;
};

}

#endif
