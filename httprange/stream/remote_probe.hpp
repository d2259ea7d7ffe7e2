#ifndef HTTPRANGE_STREAM_REMOTE_PROBE_HPP
#define HTTPRANGE_STREAM_REMOTE_PROBE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "../http/client/transport.hpp"

namespace httprange {

    /// What the server told us about the resource before the first read.
    struct remote_metadata {
        uint64_t size = 0;
        bool supports_ranges = false;
        std::string etag;
        std::string last_modified;
        // full body, captured when the server ignored the probe range
        std::optional<std::string> initial_body;

        /// token for If-Range: a strong entity tag, else the modification date
        std::string validator() const;
    };

    /// Determine size and byte-range support of `url`: HEAD first, then a
    /// `Range: bytes=0-0` GET when HEAD was not conclusive.
    /// Throws initialization_error when the stream cannot be served.
    remote_metadata probe_remote(http::transport& transport,
                                 const std::string& url,
                                 const http::headers_map& base_headers);

}

#endif
