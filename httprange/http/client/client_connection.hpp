#ifndef HTTPRANGE_HTTP_CLIENT_CONNECTION_HPP
#define HTTPRANGE_HTTP_CLIENT_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <boost/noncopyable.hpp>

#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "response_parser.hpp"
#include "../../asio/sockets/socket.hpp"
#include "../../util/types.hpp"

namespace httprange::http {

/// A single HTTP/1.1 connection. Requests are sent one at a time; the
/// connection stays open between requests when the server allows keep-alive.
class client_connection : public std::enable_shared_from_this<client_connection>, public boost::noncopyable {

    static constexpr unsigned MAX_BUFFER_SIZE = 16384;
    static constexpr auto DEFAULT_TIMEOUT = std::chrono::seconds{60};
    static constexpr auto CONNECT_TIMEOUT = std::chrono::seconds{10};

public:
    static std::atomic<unsigned long> connections;

    explicit client_connection(std::shared_ptr<httprange::asio::socket> socket,
                               std::chrono::seconds timeout = DEFAULT_TIMEOUT);
    virtual ~client_connection();

    /// Send request and read the full response. Throws boost::system::system_error
    /// on connect, write, read or parse failures and on timeout.
    awaitable<std::shared_ptr<http_response>> send_request(std::shared_ptr<http_request> request);

    void close();

    /// Abort the exchange in progress. Must run on the connection's io thread.
    void cancel();

    bool is_open() const { return socket_ && socket_->is_open(); }

    /// requests completed over this connection
    unsigned long requests_served() const { return requests_served_; }

private:
    awaitable<void> ensure_connected(const http_request& request);
    awaitable<std::shared_ptr<http_response>> read_response(bool head_request);
    static void check_aborted(bool aborted);

    std::shared_ptr<httprange::asio::socket> socket_;
    std::chrono::seconds timeout_;
    uint8_t buffer_[MAX_BUFFER_SIZE];
    response_parser response_parser_;
    unsigned long requests_served_ = 0;
    bool cancelled_ = false;
};

}

#endif
