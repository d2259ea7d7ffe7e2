#include "tcp_socket.hpp"

namespace httprange::asio {

tcp_socket::tcp_socket(std::string context, boost::asio::io_context& io_context)
    : socket(std::move(context), io_context), socket_(io_context) {
}

tcp_socket::~tcp_socket() {
    LOG_TRACE("releasing tcp connection");
    close();
}

void tcp_socket::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    socket_.close(ec);
}

void tcp_socket::cancel() {
    boost::system::error_code ec;
    socket_.cancel(ec);
}

awaitable<boost::system::error_code> tcp_socket::connect(
    const std::string& host,
    const std::string& port,
    std::chrono::seconds timeout)
{
    close();

    boost::asio::ip::tcp::resolver resolver(io_context_);
    boost::system::error_code ec_resolve;
    auto endpoints = co_await resolver.async_resolve(
        host, port, use_nothrow_awaitable(ec_resolve));

    if (ec_resolve) {
        co_return ec_resolve;
    }

    // Race between connect and timeout
    boost::asio::steady_timer timer(io_context_);
    timer.expires_after(timeout);
    auto timed_out = std::make_shared<bool>(false);

    timer.async_wait([this, timed_out](const boost::system::error_code& ec) {
        if (!ec) {
            *timed_out = true;
            cancel();
        }
    });

    boost::system::error_code connect_ec;
    auto endpoint = co_await boost::asio::async_connect(
        socket_, endpoints, use_nothrow_awaitable(connect_ec));
    timer.cancel();

    if (connect_ec) {
        co_return *timed_out ? boost::system::error_code(boost::asio::error::timed_out) : connect_ec;
    }

    LOG_TRACE("connected to {}:{} ({})", host, port, endpoint.address().to_string());
    enable_tcp_no_delay();

    // Run handshake if required (for SSL sockets)
    if (requires_handshake()) {
        auto hs_ec = co_await handshake(host);
        if (hs_ec) {
            close();
            co_return hs_ec;
        }
    }

    co_return boost::system::error_code{};
}

boost::asio::ip::tcp::socket& tcp_socket::get_socket() {
    return socket_;
}

awaitable<io_result> tcp_socket::read_some(uint8_t* buffer, size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await socket_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        use_nothrow_awaitable(ec));
    co_return io_result{ec, bytes};
}

awaitable<io_result> tcp_socket::write(const std::vector<boost::asio::const_buffer>& buffers) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(
        socket_,
        buffers,
        use_nothrow_awaitable(ec));
    co_return io_result{ec, bytes};
}

void tcp_socket::enable_tcp_no_delay() {
    boost::system::error_code ec;
    socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
}

bool tcp_socket::is_open() const {
    return socket_.is_open();
}

bool tcp_socket::is_secure() const {
    return false;
}

}
