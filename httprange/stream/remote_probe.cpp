#include "remote_probe.hpp"
#include "content_range.hpp"
#include "errors.hpp"
#include "../http/common/headers.hpp"
#include "../util/logger.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace httprange {

namespace {

    void capture_validators(const http::client_response& response, remote_metadata& meta) {
        if (meta.etag.empty()) {
            meta.etag = response.header(http::header::etag);
        }
        if (meta.last_modified.empty()) {
            meta.last_modified = response.header(http::header::last_modified);
        }
    }

    uint64_t parse_length(const std::string& value) {
        try {
            return boost::lexical_cast<uint64_t>(boost::algorithm::trim_copy(value));
        } catch (const boost::bad_lexical_cast&) {
            return 0;
        }
    }

}

std::string remote_metadata::validator() const {
    // weak tags are not allowed in If-Range
    if (!etag.empty() && !boost::starts_with(etag, "W/")) {
        return etag;
    }
    return last_modified;
}

remote_metadata probe_remote(http::transport& transport,
                             const std::string& url,
                             const http::headers_map& base_headers) {
    remote_metadata meta;

    auto head = transport.head(url, base_headers);
    if (head.has_network_error()) {
        throw initialization_error("HEAD " + url + " failed: " + head.error());
    }

    int status = head.status();
    if (head.ok()) {
        if (head.has_header(http::header::content_length)) {
            meta.size = parse_length(head.header(http::header::content_length));
        }
        meta.supports_ranges = boost::iequals(
            boost::algorithm::trim_copy(head.header(http::header::accept_ranges)), "bytes");
        capture_validators(head, meta);
    } else if (status != 405 && status != 501) {
        // HEAD not allowed falls through to the range probe, anything else is fatal
        throw initialization_error("HEAD " + url + " returned status " + std::to_string(status));
    }

    LOG_DEBUG("HEAD {}: status={} size={} ranges={}", url, status, meta.size, meta.supports_ranges);

    if (meta.size == 0 || !meta.supports_ranges) {
        auto headers = base_headers;
        headers[std::string(http::header::range)] = "bytes=0-0";
        auto response = transport.get(url, headers);
        if (response.has_network_error()) {
            throw initialization_error("range probe of " + url + " failed: " + response.error());
        }

        switch (response.status()) {
            case 206: {
                auto range = content_range::parse(response.header(http::header::content_range));
                if (range && range->complete_length) {
                    meta.size = *range->complete_length;
                }
                meta.supports_ranges = true;
                capture_validators(response, meta);
                break;
            }
            case 200:
                meta.supports_ranges = false;
                meta.size = response.body().size();
                capture_validators(response, meta);
                meta.initial_body = response.take_body();
                break;
            default:
                throw initialization_error("range probe of " + url + " returned status " +
                                           std::to_string(response.status()));
        }
        LOG_DEBUG("range probe {}: status={} size={} ranges={}", url, response.status(),
                  meta.size, meta.supports_ranges);
    }

    if (meta.size == 0) {
        throw initialization_error("unable to determine remote size of " + url);
    }
    if (!meta.supports_ranges && !meta.initial_body) {
        throw initialization_error("server does not support HTTP byte ranges for " + url);
    }
    return meta;
}

}
