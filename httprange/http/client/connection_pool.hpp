#ifndef HTTPRANGE_HTTP_CLIENT_CONNECTION_POOL_HPP
#define HTTPRANGE_HTTP_CLIENT_CONNECTION_POOL_HPP

#include <memory>
#include <mutex>
#include <string>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include "client_connection.hpp"

namespace httprange::http {

/// Idle keep-alive connections, keyed by origin. A connection is checked out
/// for the duration of one request, so concurrent callers never share one.
class connection_pool {
private:
    struct connection_entry {
        std::string host;
        std::string port;
        bool ssl;
        std::shared_ptr<client_connection> connection;

        connection_entry(std::string h, std::string p, bool s,
                         std::shared_ptr<client_connection> conn)
            : host(std::move(h)), port(std::move(p)), ssl(s), connection(std::move(conn)) {}
    };

    struct by_key {};
    struct by_sequence {};

    using connection_container = boost::multi_index_container<
        connection_entry,
        boost::multi_index::indexed_by<
            // several idle connections may exist for the same origin
            boost::multi_index::hashed_non_unique<
                boost::multi_index::tag<by_key>,
                boost::multi_index::composite_key<
                    connection_entry,
                    boost::multi_index::member<connection_entry, std::string, &connection_entry::host>,
                    boost::multi_index::member<connection_entry, std::string, &connection_entry::port>,
                    boost::multi_index::member<connection_entry, bool, &connection_entry::ssl>
                >
            >,
            // insertion order, oldest first, used to cap the idle set
            boost::multi_index::sequenced<
                boost::multi_index::tag<by_sequence>
            >
        >
    >;

    connection_container connections_;
    mutable std::mutex mutex_;
    size_t max_idle_;

public:
    explicit connection_pool(size_t max_idle = 4) : max_idle_(max_idle) {}
    ~connection_pool();

    /// Take an idle open connection for the origin, or nullptr
    std::shared_ptr<client_connection> checkout(const std::string& host,
                                                const std::string& port,
                                                bool ssl);

    /// Return a connection after use; closed connections are dropped
    void checkin(const std::string& host,
                 const std::string& port,
                 bool ssl,
                 std::shared_ptr<client_connection> connection);

    size_t size() const;

    /// Close and drop all idle connections
    void clear();
};

} // namespace httprange::http

#endif // HTTPRANGE_HTTP_CLIENT_CONNECTION_POOL_HPP
