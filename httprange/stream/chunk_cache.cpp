#include "chunk_cache.hpp"
#include "../util/logger.hpp"
#include <algorithm>

namespace httprange {

void chunk_cache::install(uint64_t start, std::shared_ptr<const std::string> data) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [start](const chunk& c) { return c.start == start; });
    if (it != entries_.end()) {
        entries_.erase(it);
    }

    entries_.push_back(chunk{start, std::move(data)});
    current_ = start;
    LOG_TRACE("installed chunk at {} ({} bytes)", start, entries_.back().size());

    while (entries_.size() > CAPACITY) {
        LOG_TRACE("evicting chunk at {}", entries_.front().start);
        entries_.pop_front();
    }
}

std::optional<chunk> chunk_cache::lookup(uint64_t start) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [start](const chunk& c) { return c.start == start; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    entries_.splice(entries_.end(), entries_, it);
    return entries_.back();
}

std::optional<chunk> chunk_cache::peek(uint64_t start) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : entries_) {
        if (c.start == start) {
            return c;
        }
    }
    return std::nullopt;
}

std::optional<chunk> chunk_cache::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) {
        return std::nullopt;
    }
    for (const auto& c : entries_) {
        if (c.start == *current_) {
            return c;
        }
    }
    return std::nullopt;
}

bool chunk_cache::contains(uint64_t start) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [start](const chunk& c) { return c.start == start; });
}

std::vector<uint64_t> chunk_cache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> result;
    result.reserve(entries_.size());
    for (const auto& c : entries_) {
        result.push_back(c.start);
    }
    return result;
}

size_t chunk_cache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void chunk_cache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    current_.reset();
}

}
