#include "range_stream.hpp"
#include "remote_probe.hpp"
#include "../http/client/http_transport.hpp"
#include "../http/common/headers.hpp"
#include "../util/logger.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace httprange {

range_stream::range_stream(stream_options options)
    : options_(std::move(options)) {
    options_.validate();

    transport_ = options_.get_transport();
    if (!transport_) {
        auto transport = std::make_shared<http::http_transport>();
        transport->timeout(options_.get_timeout())
                  .max_retries(options_.get_max_retries())
                  .backoff(options_.get_backoff())
                  .user_agent(options_.get_user_agent())
                  .verify_ssl(options_.get_verify_ssl());
        transport_ = std::move(transport);
        owns_transport_ = true;
    }

    base_headers_[std::string(http::header::user_agent)] = options_.get_user_agent();

    try {
        init_remote();
    } catch (...) {
        close();
        throw;
    }
}

range_stream::~range_stream() {
    close();
}

void range_stream::init_remote() {
    auto metadata = probe_remote(*transport_, options_.get_url(), base_headers_);

    size_ = metadata.size;
    supports_ranges_ = metadata.supports_ranges;
    fetcher_ = std::make_unique<range_fetcher>(transport_, options_.get_url(),
                                               base_headers_, metadata.validator());

    if (metadata.initial_body && !metadata.initial_body->empty()) {
        cache_.install(0, std::make_shared<const std::string>(std::move(*metadata.initial_body)));
    }

    if (options_.get_prefetch() && supports_ranges_) {
        prefetch_ = std::make_unique<prefetch_scheduler>(
            [this](uint64_t start, const std::shared_ptr<http::cancellation>& cancel) {
                return fetch_chunk(start, cancel);
            });
    }

    LOG_INFO("opened {} (size: {}, ranges: {}, chunk: {})", options_.get_url(),
             size_.load(), supports_ranges_, options_.get_chunk_size());
}

void range_stream::ensure_open() const {
    if (closed_) {
        throw std::logic_error("I/O operation on closed stream");
    }
}

uint64_t range_stream::aligned_start(uint64_t position) const {
    auto chunk = options_.get_chunk_size();
    return (position / chunk) * chunk;
}

uint64_t range_stream::chunk_last(uint64_t start) const {
    uint64_t size = size_;
    uint64_t last = aligned_start(start) + options_.get_chunk_size() - 1;
    return size == 0 ? last : std::min(last, size - 1);
}

fetch_result range_stream::fetch_chunk(uint64_t start,
                                       const std::shared_ptr<http::cancellation>& cancel) const {
    return fetcher_->fetch(start, chunk_last(start), cancel);
}

std::string range_stream::read(int64_t n) {
    ensure_open();

    uint64_t available = position_ < size_ ? size_ - position_ : 0;
    uint64_t wanted = n < 0 ? available : std::min<uint64_t>(static_cast<uint64_t>(n), available);
    if (wanted == 0) {
        return {};
    }

    std::string result(wanted, '\0');
    result.resize(read_into(result.data(), result.size()));
    return result;
}

size_t range_stream::read(char* buffer, size_t n) {
    ensure_open();
    if (n == 0) return 0;
    return read_into(buffer, n);
}

size_t range_stream::read_into(char* out, size_t n) {
    size_t copied = 0;

    while (copied < n && position_ < size_) {
        auto window = cache_.current();
        if (!window || !window->contains(position_)) {
            if (exhausted_from_ && position_ >= *exhausted_from_) {
                break;
            }
            load_chunk(position_);
            continue;
        }

        uint64_t offset = position_ - window->start;
        size_t count = static_cast<size_t>(std::min<uint64_t>(n - copied, window->size() - offset));
        std::memcpy(out + copied, window->data->data() + offset, count);
        copied += count;
        position_ += count;
    }

    return copied;
}

void range_stream::load_chunk(uint64_t position) {
    uint64_t first = aligned_start(position);

    // a short response left a gap inside this chunk: continue right at the cursor
    auto resident = cache_.peek(first);
    auto window = cache_.current();
    bool after_short_chunk = (resident && !resident->contains(position)) ||
                             (window && window->start > first && window->end() <= position);
    if (after_short_chunk) {
        first = position;
        resident = cache_.peek(first);
    }

    if (prefetch_) {
        if (auto ready = prefetch_->try_consume(first)) {
            install_result(first, std::move(*ready));
            return;
        }
    }

    if (resident && cache_.lookup(first)) {
        LOG_TRACE("cache hit for chunk at {}", first);
        cache_.install(resident->start, resident->data);
        queue_prefetch(resident->end());
        return;
    }

    install_result(first, fetcher_->fetch(first, chunk_last(first)));
}

void range_stream::install_result(uint64_t start, fetch_result result) {
    switch (result.type) {
        case fetch_result::kind::full:
            install_snapshot(std::move(result.data));
            return;

        case fetch_result::kind::unsatisfiable:
        case fetch_result::kind::partial:
            if (result.empty()) {
                LOG_DEBUG("no data at {}, treating as end of stream", start);
                exhausted_from_ = exhausted_from_ ? std::min(*exhausted_from_, start) : start;
                return;
            }
            break;
    }

    auto data = std::make_shared<const std::string>(std::move(result.data));
    uint64_t end = start + data->size();
    cache_.install(start, std::move(data));
    queue_prefetch(end);
}

void range_stream::install_snapshot(std::string body) {
    if (prefetch_) {
        prefetch_->cancel();
    }

    uint64_t length = body.size();
    if (length > size_) {
        LOG_WARNING("{} grew from {} to {} bytes", options_.get_url(), size_.load(), length);
        size_ = length;
    }

    cache_.clear();
    exhausted_from_.reset();
    if (length == 0) {
        exhausted_from_ = 0;
        return;
    }

    cache_.install(0, std::make_shared<const std::string>(std::move(body)));
    if (length < size_) {
        exhausted_from_ = length;
    }
}

void range_stream::queue_prefetch(uint64_t next) {
    if (!prefetch_ || next >= size_ || cache_.contains(next)) {
        return;
    }
    prefetch_->schedule(next);
}

uint64_t range_stream::seek(int64_t offset, seek_origin origin) {
    ensure_open();

    int64_t base;
    switch (origin) {
        case seek_origin::begin:
            base = 0;
            break;
        case seek_origin::current:
            base = static_cast<int64_t>(position_);
            break;
        case seek_origin::end:
            base = static_cast<int64_t>(size_.load());
            break;
        default:
            throw std::invalid_argument("invalid seek origin: " + std::to_string(static_cast<int>(origin)));
    }

    int64_t target;
    if (offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) {
        target = std::numeric_limits<int64_t>::max();
    } else {
        target = base + offset;
    }

    position_ = static_cast<uint64_t>(std::clamp<int64_t>(target, 0, static_cast<int64_t>(size_.load())));
    return position_;
}

uint64_t range_stream::tell() const {
    ensure_open();
    return position_;
}

void range_stream::close() noexcept {
    if (closed_.exchange(true)) {
        return;
    }

    // the prefetch thread must be gone before the transport it uses
    if (prefetch_) {
        try {
            prefetch_->stop();
        } catch (const std::exception& e) {
            LOG_WARNING("error stopping prefetch for {}: {}", options_.get_url(), e.what());
        }
    }

    if (owns_transport_ && transport_) {
        try {
            transport_->close();
        } catch (const std::exception& e) {
            LOG_WARNING("error closing transport for {}: {}", options_.get_url(), e.what());
        }
    }

    cache_.clear();
    LOG_DEBUG("closed {}", options_.get_url());
}

}
