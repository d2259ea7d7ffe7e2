#ifndef HTTPRANGE_STREAM_RANGE_FETCHER_HPP
#define HTTPRANGE_STREAM_RANGE_FETCHER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "../http/client/transport.hpp"

namespace httprange {

    /// Bytes returned for one range request.
    struct fetch_result {
        enum class kind {
            partial,        // 206: the requested span, possibly shorter
            full,           // 200: the server sent the whole resource
            unsatisfiable   // 416: nothing at that offset
        };

        kind type = kind::unsatisfiable;
        std::string data;

        bool empty() const { return data.empty(); }
    };

    /// Issues single `Range` GETs against one url. Safe to call from the
    /// foreground and the prefetch thread at the same time.
    class range_fetcher {
    public:
        range_fetcher(std::shared_ptr<http::transport> transport,
                      std::string url,
                      http::headers_map base_headers,
                      std::string validator);

        /// Fetch [first, last] (inclusive). Throws transfer_error on network
        /// failures and on statuses other than 200/206/416, including a
        /// fetch aborted through `cancel`.
        fetch_result fetch(uint64_t first, uint64_t last,
                           const std::shared_ptr<http::cancellation>& cancel = nullptr) const;

        const std::string& url() const { return url_; }
        const std::string& validator() const { return validator_; }

    private:
        http::headers_map headers_for_range(uint64_t first, uint64_t last) const;

        std::shared_ptr<http::transport> transport_;
        std::string url_;
        http::headers_map base_headers_;
        std::string validator_;
    };

}

#endif
