#ifndef HTTPRANGE_STREAM_PREFETCH_SCHEDULER_HPP
#define HTTPRANGE_STREAM_PREFETCH_SCHEDULER_HPP

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include "range_fetcher.hpp"
#include "../http/client/cancellation.hpp"
#include "../asio/io_worker.hpp"

namespace httprange {

    enum class prefetch_state {
        idle,
        pending,
        ready
    };

    /**
     * Single-slot speculative fetcher. At most one chunk is in flight on a
     * dedicated background thread; scheduling a different target cancels the
     * previous one, and a result is only handed out to a caller asking for the
     * same start offset. Cancelling aborts the fetch through the cancellation
     * passed to the fetch function.
     */
    class prefetch_scheduler {
    public:
        using fetch_function = std::function<fetch_result(uint64_t start,
                                                          const std::shared_ptr<http::cancellation>& cancel)>;

        explicit prefetch_scheduler(fetch_function fetch);
        ~prefetch_scheduler();

        prefetch_scheduler(const prefetch_scheduler&) = delete;
        prefetch_scheduler& operator=(const prefetch_scheduler&) = delete;

        /// Start fetching the chunk at `start` in the background. No-op when
        /// the slot already targets `start`.
        void schedule(uint64_t start);

        /**
         * Take the prefetched chunk for `expected`. Waits for a matching fetch
         * that is still in flight. A slot holding any other target is
         * cancelled and dropped. Returns nothing when there was no match or
         * the background fetch failed.
         */
        std::optional<fetch_result> try_consume(uint64_t expected);

        /// drop the slot and abort its fetch, a result that still lands is discarded
        void cancel();

        /// cancel and join the background thread, further schedules are ignored
        void stop();

        std::optional<uint64_t> pending_target() const;
        prefetch_state state() const;

    private:
        struct task {
            uint64_t start;
            std::shared_ptr<http::cancellation> cancel;
            std::shared_future<std::optional<fetch_result>> result;
        };

        void cancel_locked();

        fetch_function fetch_;
        asio::io_worker worker_;
        mutable std::mutex mutex_;
        std::optional<task> slot_;
        bool stopped_ = false;
    };

}

#endif
