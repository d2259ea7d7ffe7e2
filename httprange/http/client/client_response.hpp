#ifndef HTTPRANGE_HTTP_CLIENT_RESPONSE_HPP
#define HTTPRANGE_HTTP_CLIENT_RESPONSE_HPP

#include "../common/http_response.hpp"
#include <boost/system/error_code.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace httprange::http {

/// Outcome of a transport call: either a network error or a parsed response.
class client_response {
private:
    std::shared_ptr<http_response> response_;
    boost::system::error_code error_;

public:
    client_response() = default;

    client_response(const boost::system::error_code& ec,
                    std::shared_ptr<http_response> res)
        : response_(std::move(res)), error_(ec) {}

    // Status checks
    bool ok() const {
        return !error_ && response_ && response_->is_ok();
    }

    operator bool() const { return !error_ && response_; }

    bool has_error() const { return error_ || !response_; }

    bool has_network_error() const { return error_.value() != 0; }

    bool has_http_error() const {
        return !error_ && response_ && response_->get_status_code() >= 400;
    }

    // Content access
    const std::string& body() const {
        static const std::string empty;
        return response_ ? response_->get_content() : empty;
    }

    // moves the body out of the response
    std::string take_body() {
        return response_ ? std::move(response_->get_content()) : std::string{};
    }

    int status() const {
        return response_ ? response_->get_status_code() : 0;
    }

    bool is_server_error() const {
        return response_ && status() >= 500;
    }

    // Headers
    std::string header(std::string_view key) const {
        return response_ && response_->has_header(key) ?
               response_->get_header(key) : "";
    }

    bool has_header(std::string_view key) const {
        return response_ && response_->has_header(key);
    }

    // Error info
    std::string error() const {
        if (error_) {
            return error_.message();
        } else if (!response_) {
            return "No response received";
        } else if (has_http_error()) {
            return "HTTP error " + std::to_string(status());
        }
        return "";
    }

    const boost::system::error_code& error_code() const { return error_; }

    const http_response& operator*() const {
        if (!response_) throw std::runtime_error("No response available");
        return *response_;
    }

    std::shared_ptr<http_response> get() const { return response_; }
};

} // namespace httprange::http

#endif // HTTPRANGE_HTTP_CLIENT_RESPONSE_HPP
