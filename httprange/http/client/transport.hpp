#ifndef HTTPRANGE_HTTP_TRANSPORT_HPP
#define HTTPRANGE_HTTP_TRANSPORT_HPP

#include <map>
#include <memory>
#include <string>
#include "cancellation.hpp"
#include "client_response.hpp"

namespace httprange::http {

using headers_map = std::map<std::string, std::string>;

/// Blocking HTTP capability consumed by the range stream. Implementations must
/// accept calls from more than one thread at a time.
class transport {
public:
    virtual ~transport() = default;

    virtual client_response head(const std::string& url, const headers_map& headers) = 0;

    /// `cancel` aborts the call from another thread; it then fails with operation_aborted
    virtual client_response get(const std::string& url, const headers_map& headers,
                                const std::shared_ptr<cancellation>& cancel = nullptr) = 0;

    /// Release connections and background threads. Further calls fail.
    virtual void close() {}
};

}

#endif
