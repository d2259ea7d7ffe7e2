#include "connection_pool.hpp"
#include "../../util/logger.hpp"
#include <vector>

namespace httprange::http {

connection_pool::~connection_pool() {
    clear();
}

std::shared_ptr<client_connection> connection_pool::checkout(const std::string& host,
                                                             const std::string& port,
                                                             bool ssl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& index = connections_.get<by_key>();
    auto range = index.equal_range(boost::make_tuple(host, port, ssl));

    for (auto it = range.first; it != range.second; ) {
        auto connection = it->connection;
        it = index.erase(it);
        if (connection && connection->is_open()) {
            LOG_TRACE("reusing pooled connection for {}:{}", host, port);
            return connection;
        }
    }
    return nullptr;
}

void connection_pool::checkin(const std::string& host,
                              const std::string& port,
                              bool ssl,
                              std::shared_ptr<client_connection> connection) {
    if (!connection || !connection->is_open()) {
        return;
    }

    std::shared_ptr<client_connection> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.emplace(host, port, ssl, std::move(connection));

        auto& sequence = connections_.get<by_sequence>();
        if (sequence.size() > max_idle_) {
            evicted = sequence.front().connection;
            sequence.pop_front();
        }
    }

    if (evicted) {
        LOG_TRACE("idle pool full, closing oldest connection");
        evicted->close();
    }
}

size_t connection_pool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void connection_pool::clear() {
    std::vector<std::shared_ptr<client_connection>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : connections_) {
            to_close.push_back(entry.connection);
        }
        connections_.clear();
    }

    for (auto& connection : to_close) {
        if (connection) {
            connection->close();
        }
    }
}

} // namespace httprange::http
