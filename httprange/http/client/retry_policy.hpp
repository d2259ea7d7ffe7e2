#ifndef HTTPRANGE_HTTP_RETRY_POLICY_HPP
#define HTTPRANGE_HTTP_RETRY_POLICY_HPP

#include <chrono>

namespace httprange::http {

/// Bounded retries with exponential backoff for idempotent requests.
struct retry_policy {
    unsigned max_retries = 3;
    std::chrono::milliseconds backoff{500};

    /// statuses worth another attempt: transient gateway/server failures
    static bool is_retryable_status(int status) {
        return status == 500 || status == 502 || status == 503 || status == 504;
    }

    /// delay before retry number `attempt` (1-based): backoff * 2^(attempt-1)
    std::chrono::milliseconds delay(unsigned attempt) const {
        if (attempt == 0 || backoff.count() <= 0) return std::chrono::milliseconds{0};
        unsigned shift = attempt - 1 < 16 ? attempt - 1 : 16;
        return backoff * (1LL << shift);
    }
};

}

#endif
