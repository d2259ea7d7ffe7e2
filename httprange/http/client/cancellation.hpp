#ifndef HTTPRANGE_HTTP_CANCELLATION_HPP
#define HTTPRANGE_HTTP_CANCELLATION_HPP

#include <functional>
#include <mutex>

namespace httprange::http {

/**
 * One-shot cancellation for a transport call. The caller keeps a reference and
 * may cancel from any thread; while the call is waiting on something, the
 * transport installs a handler that aborts it.
 *
 * Usage:
 *   auto cancel = std::make_shared<http::cancellation>();
 *   // thread A
 *   auto res = transport.get(url, headers, cancel);
 *   // thread B
 *   cancel->cancel();   // res fails with operation_aborted
 */
class cancellation {
public:
    using handler = std::function<void()>;

    /// idempotent, runs the installed handler at most once
    void cancel() {
        handler pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) return;
            cancelled_ = true;
            pending = std::move(handler_);
            handler_ = nullptr;
        }
        if (pending) pending();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /// Install the abort handler. Runs it right away when already cancelled.
    void on_cancel(handler h) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_) {
                handler_ = std::move(h);
                return;
            }
        }
        if (h) h();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = nullptr;
    }

private:
    mutable std::mutex mutex_;
    bool cancelled_ = false;
    handler handler_;
};

}

#endif
