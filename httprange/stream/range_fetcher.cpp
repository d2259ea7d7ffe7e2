#include "range_fetcher.hpp"
#include "content_range.hpp"
#include "errors.hpp"
#include "../http/common/headers.hpp"
#include "../util/logger.hpp"

namespace httprange {

range_fetcher::range_fetcher(std::shared_ptr<http::transport> transport,
                             std::string url,
                             http::headers_map base_headers,
                             std::string validator)
    : transport_(std::move(transport))
    , url_(std::move(url))
    , base_headers_(std::move(base_headers))
    , validator_(std::move(validator)) {
}

http::headers_map range_fetcher::headers_for_range(uint64_t first, uint64_t last) const {
    auto headers = base_headers_;
    headers[std::string(http::header::range)] = format_range(first, last);
    if (!validator_.empty()) {
        headers[std::string(http::header::if_range)] = validator_;
    }
    return headers;
}

fetch_result range_fetcher::fetch(uint64_t first, uint64_t last,
                                  const std::shared_ptr<http::cancellation>& cancel) const {
    LOG_DEBUG("fetching {} bytes={}-{}", url_, first, last);

    auto response = transport_->get(url_, headers_for_range(first, last), cancel);
    if (response.has_network_error()) {
        throw transfer_error("GET " + url_ + " bytes=" + std::to_string(first) + "-" +
                             std::to_string(last) + " failed: " + response.error(), 0);
    }

    fetch_result result;
    switch (response.status()) {
        case 416:
            LOG_DEBUG("range {}-{} not satisfiable", first, last);
            result.type = fetch_result::kind::unsatisfiable;
            return result;

        case 206: {
            if (response.has_header(http::header::content_range)) {
                auto range = content_range::parse(response.header(http::header::content_range));
                if (range && range->first != first) {
                    throw transfer_error("server answered bytes " + std::to_string(range->first) +
                                         " for a request starting at " + std::to_string(first), 206);
                }
            }
            result.type = fetch_result::kind::partial;
            result.data = response.take_body();
            uint64_t span = last - first + 1;
            if (result.data.size() > span) {
                result.data.resize(span);
            }
            return result;
        }

        case 200:
            // range ignored or validator mismatch: this is a snapshot of the whole resource
            LOG_WARNING("server ignored range {}-{} of {} and sent the full resource", first, last, url_);
            result.type = fetch_result::kind::full;
            result.data = response.take_body();
            return result;

        default:
            throw transfer_error("GET " + url_ + " bytes=" + std::to_string(first) + "-" +
                                 std::to_string(last) + " returned status " +
                                 std::to_string(response.status()), response.status());
    }
}

}
