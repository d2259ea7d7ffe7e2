#ifndef HTTPRANGE_HTTP_TRANSPORT_ASIO_HPP
#define HTTPRANGE_HTTP_TRANSPORT_ASIO_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>
#include <string>
#include <boost/asio/ssl/context.hpp>

#include "transport.hpp"
#include "connection_pool.hpp"
#include "retry_policy.hpp"
#include "../common/http_request.hpp"
#include "../../asio/io_worker.hpp"
#include "../../util/types.hpp"

namespace httprange::http {

/**
 * HTTP/1.1 transport over Boost.Asio coroutines. Requests run on a dedicated
 * io worker thread; the public methods block the caller until the response
 * is complete, so it can be shared by a foreground reader and a background
 * prefetch thread.
 *
 * Usage:
 *   http::http_transport transport;
 *   transport.timeout(std::chrono::seconds(10)).max_retries(3);
 *   auto res = transport.get("https://example.com/file.zip", {{"Range", "bytes=0-1023"}});
 */
class http_transport : public transport {
public:
    http_transport();
    ~http_transport() override;

    // Configuration setters (fluent API)
    http_transport& timeout(std::chrono::seconds t) { timeout_ = t; return *this; }
    http_transport& max_retries(unsigned retries) { retry_.max_retries = retries; return *this; }
    http_transport& backoff(std::chrono::milliseconds b) { retry_.backoff = b; return *this; }
    http_transport& user_agent(const std::string& agent) { user_agent_ = agent; return *this; }
    http_transport& verify_ssl(bool verify) { verify_ssl_ = verify; return *this; }
    http_transport& max_redirects(unsigned max) { max_redirects_ = max; return *this; }

    // Configuration getters
    std::chrono::seconds get_timeout() const { return timeout_; }
    const retry_policy& get_retry_policy() const { return retry_; }
    const std::string& get_user_agent() const { return user_agent_; }
    bool get_verify_ssl() const { return verify_ssl_; }
    unsigned get_max_redirects() const { return max_redirects_; }

    client_response head(const std::string& url, const headers_map& headers) override;
    client_response get(const std::string& url, const headers_map& headers,
                        const std::shared_ptr<cancellation>& cancel = nullptr) override;
    void close() override;

    bool closed() const { return closed_; }
    size_t pool_size() const { return pool_.size(); }

private:
    client_response execute(method m, const std::string& url, const headers_map& headers,
                            std::shared_ptr<cancellation> cancel);

    // request with retries and redirects
    awaitable<client_response> send(method m, std::string url, headers_map headers,
                                    std::shared_ptr<cancellation> cancel);

    // single attempt over a pooled or new connection
    awaitable<std::shared_ptr<http_response>> send_once(std::shared_ptr<http_request> request,
                                                        std::shared_ptr<cancellation> cancel);

    // one exchange on a connection, returned to the pool on success
    awaitable<std::shared_ptr<http_response>> exchange(std::shared_ptr<client_connection> connection,
                                                       std::shared_ptr<http_request> request,
                                                       std::shared_ptr<cancellation> cancel);

    std::shared_ptr<client_connection> create_connection(const http_request& request);
    std::shared_ptr<http_request> create_request(method m, const std::string& url, const headers_map& headers) const;

    // Track in-flight calls so close() can wait for them. False once closed.
    bool track_request_start();
    void track_request_end();

    std::chrono::seconds timeout_{10};
    retry_policy retry_;
    std::string user_agent_{"httprange/1.0"};
    bool verify_ssl_{true};
    unsigned max_redirects_{5};

    asio::io_worker worker_;
    connection_pool pool_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
    std::atomic<bool> closed_{false};
    std::condition_variable requests_cv_;
    std::mutex requests_mutex_;
    size_t active_requests_{0};
};

}

#endif
