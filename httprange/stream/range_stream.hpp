#ifndef HTTPRANGE_STREAM_RANGE_STREAM_HPP
#define HTTPRANGE_STREAM_RANGE_STREAM_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "chunk_cache.hpp"
#include "errors.hpp"
#include "prefetch_scheduler.hpp"
#include "range_fetcher.hpp"
#include "stream_options.hpp"
#include "../http/client/transport.hpp"

namespace httprange {

    enum class seek_origin {
        begin = 0,
        current = 1,
        end = 2
    };

    /**
     * Read-only, seekable view of a remote resource served through HTTP byte
     * range requests. Data is fetched in aligned chunks; the chunk after the
     * current window is fetched ahead in the background while the caller
     * consumes the current one.
     *
     * A stream is meant for one reader at a time.
     *
     * Usage:
     *   httprange::range_stream stream(httprange::stream_options(url).chunk_size(64 * 1024));
     *   stream.seek(-22, httprange::seek_origin::end);
     *   auto trailer = stream.read(22);
     */
    class range_stream {
    public:
        /// Probes the remote resource. Throws initialization_error when its size
        /// cannot be determined and std::invalid_argument for bad options.
        explicit range_stream(stream_options options);
        ~range_stream();

        range_stream(const range_stream&) = delete;
        range_stream& operator=(const range_stream&) = delete;

        /// Read up to `n` bytes, or to the end when `n` is negative. The result is
        /// shorter than `n` only at the end of the resource.
        std::string read(int64_t n = -1);

        /// Read up to `n` bytes into `buffer`, returning the number copied
        size_t read(char* buffer, size_t n);

        /// Move the cursor. The target is clamped to [0, size()].
        uint64_t seek(int64_t offset, seek_origin origin = seek_origin::begin);

        uint64_t tell() const;
        uint64_t size() const { return size_; }

        bool supports_ranges() const { return supports_ranges_; }
        uint64_t chunk_size() const { return options_.get_chunk_size(); }
        const std::string& url() const { return options_.get_url(); }

        bool readable() const { return !closed_; }
        bool seekable() const { return !closed_; }
        bool closed() const { return closed_; }

        /// start offsets of the resident chunks, most recently used last
        std::vector<uint64_t> cached_chunks() const { return cache_.keys(); }

        /// Cancel prefetching and release the transport when it is owned by
        /// this stream. Safe to call more than once.
        void close() noexcept;

    private:
        void init_remote();
        void ensure_open() const;

        size_t read_into(char* out, size_t n);
        void load_chunk(uint64_t position);
        void install_result(uint64_t start, fetch_result result);
        void install_snapshot(std::string body);
        void queue_prefetch(uint64_t next);
        fetch_result fetch_chunk(uint64_t start, const std::shared_ptr<http::cancellation>& cancel) const;

        uint64_t aligned_start(uint64_t position) const;
        uint64_t chunk_last(uint64_t start) const;

        stream_options options_;
        std::shared_ptr<http::transport> transport_;
        bool owns_transport_ = false;
        http::headers_map base_headers_;

        std::unique_ptr<range_fetcher> fetcher_;
        chunk_cache cache_;
        std::unique_ptr<prefetch_scheduler> prefetch_;

        uint64_t position_ = 0;
        std::atomic<uint64_t> size_{0};
        bool supports_ranges_ = false;
        // first offset known to hold no data although it is below size
        std::optional<uint64_t> exhausted_from_;
        std::atomic<bool> closed_{false};
    };

}

#endif
