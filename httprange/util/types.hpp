#ifndef HTTPRANGE_TYPES
#define HTTPRANGE_TYPES

#include <cstddef>
#include <tuple>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/system/error_code.hpp>

namespace httprange {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;

    // For error handling without exceptions: the error lands in `ec`
    inline auto use_nothrow_awaitable(boost::system::error_code& ec) {
        return boost::asio::redirect_error(boost::asio::use_awaitable, ec);
    }

    // Result of a socket read/write: error and transferred bytes
    using io_result = std::tuple<boost::system::error_code, std::size_t>;

}

#endif
