#ifndef HTTPRANGE_STREAM_CHUNK_CACHE_HPP
#define HTTPRANGE_STREAM_CHUNK_CACHE_HPP

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace httprange {

    /// An immutable span of the remote resource starting at `start`.
    struct chunk {
        uint64_t start = 0;
        std::shared_ptr<const std::string> data;

        uint64_t size() const { return data ? data->size() : 0; }
        uint64_t end() const { return start + size(); }
        bool contains(uint64_t position) const { return position >= start && position < end(); }
    };

    /// Two-slot LRU of chunks keyed by start offset. The most recently
    /// installed chunk is the current window of the reader.
    class chunk_cache {
    public:
        static constexpr size_t CAPACITY = 2;

        /// Store a chunk as most recently used and make it the current window.
        /// Evicts the least recently used entry when a third key arrives.
        void install(uint64_t start, std::shared_ptr<const std::string> data);

        /// Find a chunk by start offset, promoting it on hit. Does not move
        /// the current window.
        std::optional<chunk> lookup(uint64_t start);

        /// Like lookup, but leaves the recency order untouched
        std::optional<chunk> peek(uint64_t start) const;

        /// The current window, if any chunk was installed
        std::optional<chunk> current() const;

        bool contains(uint64_t start) const;

        /// resident chunk starts, least recently used first
        std::vector<uint64_t> keys() const;

        size_t size() const;
        void clear();

    private:
        mutable std::mutex mutex_;
        std::list<chunk> entries_;
        std::optional<uint64_t> current_;
    };

}

#endif
