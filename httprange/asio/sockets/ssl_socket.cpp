#include "ssl_socket.hpp"

namespace httprange::asio {

ssl_socket::ssl_socket(std::string context, boost::asio::io_context& io_context,
                       const std::shared_ptr<boost::asio::ssl::context>& ssl_context)
    : tcp_socket(std::move(context), io_context)
    , ssl_stream_(socket_, *ssl_context)
    , ssl_context_(ssl_context) {
}

ssl_socket::~ssl_socket() {
    LOG_TRACE("releasing ssl connection");
}

void ssl_socket::close() {
    tcp_socket::close();

    // clear ssl session so the stream can be reconnected
    SSL_clear(ssl_stream_.native_handle());
}

bool ssl_socket::requires_handshake() const {
    return true;
}

awaitable<boost::system::error_code> ssl_socket::handshake(const std::string& host) {
    // SNI and hostname verification
    if (!SSL_set_tlsext_host_name(ssl_stream_.native_handle(), host.c_str())) {
        LOG_ERROR("SSL_set_tlsext_host_name failed. SNI will fail");
    }
    ssl_stream_.set_verify_callback(boost::asio::ssl::host_name_verification(host));

    boost::system::error_code ec;
    co_await ssl_stream_.async_handshake(
        boost::asio::ssl::stream_base::client,
        use_nothrow_awaitable(ec));
    co_return ec;
}

awaitable<io_result> ssl_socket::read_some(uint8_t buffer[], size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await ssl_stream_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        use_nothrow_awaitable(ec));
    co_return io_result{ec, bytes};
}

awaitable<io_result> ssl_socket::write(const std::vector<boost::asio::const_buffer>& buffers) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(
        ssl_stream_,
        buffers,
        use_nothrow_awaitable(ec));
    co_return io_result{ec, bytes};
}

bool ssl_socket::is_secure() const {
    return true;
}

}
