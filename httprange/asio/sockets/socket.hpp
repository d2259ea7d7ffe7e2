#ifndef HTTPRANGE_ASIO_SOCKET_HPP
#define HTTPRANGE_ASIO_SOCKET_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/types.hpp"

namespace httprange::asio {

/// Transport socket used by client connections. Implementations wrap a plain
/// TCP stream or a TLS stream over it.
class socket : private boost::asio::noncopyable {

public:
    // constructors and destructors
    socket(std::string context, boost::asio::io_context& io_context);
    virtual ~socket();

    // socket control
    virtual awaitable<boost::system::error_code> connect(
        const std::string& host,
        const std::string& port,
        std::chrono::seconds timeout) = 0;
    virtual void close() = 0;
    virtual void cancel() = 0;
    virtual bool requires_handshake() const;
    virtual awaitable<boost::system::error_code> handshake(const std::string& host);

    // read/write operations
    virtual awaitable<io_result> read_some(uint8_t buffer[], size_t max_size) = 0;
    virtual awaitable<io_result> write(const std::vector<boost::asio::const_buffer>& buffers) = 0;

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual bool is_secure() const = 0;

    const std::string& get_context() const { return context_; }
    boost::asio::io_context& get_io_context() const;

    // number of live sockets in the process
    static unsigned long live_sockets() { return connections.load(); }

protected:
    std::string context_;
    boost::asio::io_context& io_context_;
    static std::atomic<unsigned long> connections;
};

}

#endif
