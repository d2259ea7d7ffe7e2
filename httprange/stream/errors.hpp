#ifndef HTTPRANGE_STREAM_ERRORS_HPP
#define HTTPRANGE_STREAM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace httprange {

    /// Base for failures raised by a range stream.
    class stream_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// The remote resource size could not be determined, or the server neither
    /// serves byte ranges nor returned the full body. The stream is unusable.
    class initialization_error : public stream_error {
    public:
        using stream_error::stream_error;
    };

    /// A range request failed after the transport exhausted its retries.
    class transfer_error : public stream_error {
    public:
        transfer_error(const std::string& message, int status)
            : stream_error(message), status_(status) {}

        /// HTTP status of the failed response, 0 for network failures
        int status() const noexcept { return status_; }

    private:
        int status_;
    };

}

#endif
