#ifndef HTTPRANGE_ASIO_TCP_SOCKET_HPP
#define HTTPRANGE_ASIO_TCP_SOCKET_HPP

#include <memory>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../../util/logger.hpp"
#include "socket.hpp"

namespace httprange::asio {

class tcp_socket : public socket {

public:
    // constructors and destructors
    tcp_socket(std::string context, boost::asio::io_context& io_context);
    ~tcp_socket() override;

    // socket control
    awaitable<boost::system::error_code> connect(
        const std::string& host,
        const std::string& port,
        std::chrono::seconds timeout) override;
    void close() override;
    void cancel() override;

    // read/write operations
    awaitable<io_result> read_some(uint8_t buffer[], size_t max_size) override;
    awaitable<io_result> write(const std::vector<boost::asio::const_buffer>& buffers) override;

    // some getters to check the state
    bool is_open() const override;
    bool is_secure() const override;

    // other methods
    void enable_tcp_no_delay();
    boost::asio::ip::tcp::socket& get_socket();

protected:
    boost::asio::ip::tcp::socket socket_;
};

}

#endif
