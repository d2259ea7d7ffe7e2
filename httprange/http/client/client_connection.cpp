#include "client_connection.hpp"
#include "../../util/logger.hpp"
#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/error.hpp>

namespace httprange::http {

std::atomic<unsigned long> client_connection::connections(0);

client_connection::client_connection(std::shared_ptr<httprange::asio::socket> socket,
                                     std::chrono::seconds timeout)
    : socket_(std::move(socket))
    , timeout_(timeout) {
    ++connections;
    LOG_TRACE("created http client connection with timeout: {} seconds. total: {}",
              timeout.count(), connections.load());
}

client_connection::~client_connection() {
    --connections;
    LOG_TRACE("releasing http client connection. total: {}", connections.load());
}

awaitable<void> client_connection::ensure_connected(const http_request& request) {
    if (socket_->is_open()) {
        co_return;
    }

    LOG_TRACE("connecting to: {}:{}", request.get_host(), request.get_port());

    auto ec = co_await socket_->connect(request.get_host(), request.get_port(),
                                        std::min(timeout_, std::chrono::seconds(CONNECT_TIMEOUT)));
    if (ec) {
        LOG_DEBUG("error while connecting to {}:{}: {} ({})",
                  request.get_host(), request.get_port(), ec.message(), ec.value());
        socket_->close();
        throw boost::system::system_error(ec);
    }
    requests_served_ = 0;
    LOG_TRACE("connection established");
}

awaitable<std::shared_ptr<http_response>> client_connection::read_response(bool head_request) {
    response_parser_.reset();

    while (true) {
        auto [ec, bytes] = co_await socket_->read_some(buffer_, MAX_BUFFER_SIZE);

        if (ec) {
            bool closed_by_peer = ec == boost::asio::error::eof ||
                                  ec == boost::asio::ssl::error::stream_truncated;
            if (closed_by_peer && response_parser_.on_eof()) {
                socket_->close();
                co_return response_parser_.consume_response();
            }
            socket_->close();
            throw boost::system::system_error(ec);
        }

        const char* data = reinterpret_cast<const char*>(buffer_);
        boost::tribool result = response_parser_.parse(data, data + bytes, head_request);

        if (result) {
            co_return response_parser_.consume_response();
        } else if (!result) {
            socket_->close();
            throw boost::system::system_error(boost::asio::error::invalid_argument);
        }
        // else: indeterminate, keep reading
    }
}

awaitable<std::shared_ptr<http_response>> client_connection::send_request(
    std::shared_ptr<http_request> request) {

    // keep the connection alive until the exchange completes
    auto self = shared_from_this();

    // watchdog: cancel the pending socket operation once the timeout expires
    auto timed_out = std::make_shared<bool>(false);
    auto timer = std::make_shared<boost::asio::steady_timer>(socket_->get_io_context(), timeout_);
    timer->async_wait([socket = socket_, timed_out](const boost::system::error_code& ec) {
        if (!ec) {
            *timed_out = true;
            socket->cancel();
        }
    });

    std::shared_ptr<http_response> response;
    try {
        check_aborted(cancelled_);
        co_await ensure_connected(*request);
        check_aborted(*timed_out || cancelled_);

        request->log("CLIENT->");

        std::vector<boost::asio::const_buffer> buffers;
        std::string storage;
        request->to_buffer(buffers, storage);

        auto [write_ec, written] = co_await socket_->write(buffers);
        if (write_ec) {
            socket_->close();
            throw boost::system::system_error(write_ec);
        }
        check_aborted(*timed_out || cancelled_);

        bool is_head = request->get_method() == http::method::HEAD;
        response = co_await read_response(is_head);
    } catch (const boost::system::system_error& e) {
        timer->cancel();
        if (*timed_out) {
            LOG_DEBUG("request to {} timed out after {} seconds", request->get_url(), timeout_.count());
            socket_->close();
            throw boost::system::system_error(boost::asio::error::timed_out);
        }
        if (cancelled_) {
            LOG_DEBUG("request to {} cancelled", request->get_url());
            socket_->close();
            throw boost::system::system_error(boost::asio::error::operation_aborted);
        }
        throw;
    }
    timer->cancel();
    ++requests_served_;

    response->log("<-SERVER");

    if (!response->keep_alive()) {
        socket_->close();
    }

    co_return response;
}

void client_connection::check_aborted(bool aborted) {
    if (aborted) {
        throw boost::system::system_error(boost::asio::error::operation_aborted);
    }
}

void client_connection::cancel() {
    cancelled_ = true;
    socket_->cancel();
}

void client_connection::close() {
    if (socket_->is_open()) {
        socket_->close();
    }
    response_parser_.reset();
}

}
