#include "socket.hpp"

namespace httprange::asio {

    std::atomic<unsigned long> socket::connections(0);

    socket::socket(std::string context, boost::asio::io_context& io_context)
        : context_(std::move(context)), io_context_(io_context) {
        ++connections;
    }

    socket::~socket() {
        --connections;
    }

    boost::asio::io_context& socket::get_io_context() const {
        return io_context_;
    }

    bool socket::requires_handshake() const {
        return false;
    }

    awaitable<boost::system::error_code> socket::handshake(const std::string&) {
        co_return boost::system::error_code{};
    }

}
