#include "prefetch_scheduler.hpp"
#include "../util/logger.hpp"
#include <boost/asio/post.hpp>

namespace httprange {

prefetch_scheduler::prefetch_scheduler(fetch_function fetch)
    : fetch_(std::move(fetch))
    , worker_("prefetch") {
    worker_.start();
}

prefetch_scheduler::~prefetch_scheduler() {
    stop();
}

void prefetch_scheduler::schedule(uint64_t start) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return;

    if (slot_) {
        if (slot_->start == start) {
            return;
        }
        LOG_DEBUG("prefetch for {} superseded by {}", slot_->start, start);
        cancel_locked();
    }

    auto cancel = std::make_shared<http::cancellation>();
    auto promise = std::make_shared<std::promise<std::optional<fetch_result>>>();
    slot_ = task{start, cancel, promise->get_future().share()};

    LOG_DEBUG("prefetch scheduled for {}", start);
    boost::asio::post(worker_.get_io_context(), [fetch = fetch_, start, cancel, promise]() {
        if (cancel->cancelled()) {
            promise->set_value(std::nullopt);
            return;
        }
        try {
            auto result = fetch(start, cancel);
            if (cancel->cancelled()) {
                LOG_DEBUG("discarding cancelled prefetch result for {}", start);
                promise->set_value(std::nullopt);
            } else {
                promise->set_value(std::move(result));
            }
        } catch (const std::exception& e) {
            if (cancel->cancelled()) {
                LOG_DEBUG("prefetch of {} aborted", start);
            } else {
                LOG_WARNING("prefetch of {} failed: {}", start, e.what());
            }
            promise->set_value(std::nullopt);
        }
    });
}

std::optional<fetch_result> prefetch_scheduler::try_consume(uint64_t expected) {
    std::shared_future<std::optional<fetch_result>> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!slot_) {
            return std::nullopt;
        }
        if (slot_->start != expected) {
            LOG_DEBUG("prefetch for {} is stale, reader wants {}", slot_->start, expected);
            cancel_locked();
            return std::nullopt;
        }
        result = slot_->result;
        slot_.reset();
    }

    // the fetch may still be running, wait outside the lock
    auto value = result.get();
    if (value) {
        LOG_DEBUG("consumed prefetched chunk at {} ({} bytes)", expected, value->data.size());
    }
    return value;
}

void prefetch_scheduler::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_locked();
}

void prefetch_scheduler::cancel_locked() {
    if (!slot_) return;
    auto cancel = std::move(slot_->cancel);
    slot_.reset();
    // abort handlers never call back into the scheduler, safe under our lock
    cancel->cancel();
}

void prefetch_scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        cancel_locked();
    }
    worker_.stop();
}

std::optional<uint64_t> prefetch_scheduler::pending_target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!slot_) return std::nullopt;
    return slot_->start;
}

prefetch_state prefetch_scheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!slot_) {
        return prefetch_state::idle;
    }
    if (slot_->result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return prefetch_state::ready;
    }
    return prefetch_state::pending;
}

}
