#include "http_transport.hpp"
#include "../../asio/sockets/ssl_socket.hpp"
#include "../../asio/sockets/tcp_socket.hpp"
#include "../../util/logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_future.hpp>
#include <functional>
#include <future>

namespace httprange::http {

namespace {

    // errors where another attempt cannot help
    bool is_permanent_error(const boost::system::error_code& ec) {
        return ec == boost::asio::error::host_not_found ||
               ec == boost::asio::error::invalid_argument ||
               ec == boost::asio::error::operation_aborted;
    }

    std::string resolve_location(const http_request& request, const std::string& location) {
        if (location.starts_with("http://") || location.starts_with("https://")) {
            return location;
        }
        if (location.starts_with("/")) {
            return request.get_base_path() + location;
        }
        auto target = request.get_target();
        auto query = target.find('?');
        if (query != std::string::npos) {
            target.resize(query);
        }
        auto slash = target.rfind('/');
        return request.get_base_path() + target.substr(0, slash + 1) + location;
    }

    bool is_cancelled(const std::shared_ptr<cancellation>& cancel) {
        return cancel && cancel->cancelled();
    }

    // routes a cancellation to the io thread while one step of a request is pending
    class cancel_scope {
    public:
        cancel_scope(std::shared_ptr<cancellation> cancel, boost::asio::io_context& io,
                     std::function<void()> action)
            : cancel_(std::move(cancel)) {
            if (cancel_) {
                cancel_->on_cancel([&io, action = std::move(action)] {
                    boost::asio::post(io, action);
                });
            }
        }

        ~cancel_scope() {
            if (cancel_) cancel_->clear();
        }

        cancel_scope(const cancel_scope&) = delete;
        cancel_scope& operator=(const cancel_scope&) = delete;

    private:
        std::shared_ptr<cancellation> cancel_;
    };

}

http_transport::http_transport()
    : worker_("http_transport") {
    worker_.start();
    LOG_DEBUG("created http transport");
}

http_transport::~http_transport() {
    close();
}

bool http_transport::track_request_start() {
    // tested under the counter lock so close() cannot stop the worker in between
    std::lock_guard<std::mutex> lock(requests_mutex_);
    if (closed_) {
        return false;
    }
    ++active_requests_;
    return true;
}

void http_transport::track_request_end() {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    if (--active_requests_ == 0) {
        requests_cv_.notify_all();
    }
}

std::shared_ptr<http_request> http_transport::create_request(method m, const std::string& url,
                                                             const headers_map& headers) const {
    auto request = std::make_shared<http_request>();
    request->set_method(m);
    if (!request->set_url(url)) {
        return nullptr;
    }
    request->add_header(std::string(header::user_agent), user_agent_);
    // byte offsets must refer to the stored representation
    request->add_header(std::string(header::accept_encoding), "identity");
    for (const auto& [key, value] : headers) {
        request->set_header(key, value);
    }
    return request;
}

std::shared_ptr<client_connection> http_transport::create_connection(const http_request& request) {
    auto& io_context = worker_.get_io_context();
    std::shared_ptr<httprange::asio::socket> sock;
    if (!request.is_ssl()) {
        sock = std::make_shared<httprange::asio::tcp_socket>("http_transport", io_context);
    } else {
        if (!ssl_context_) {
            ssl_context_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
            ssl_context_->set_default_verify_paths();
            ssl_context_->set_verify_mode(verify_ssl_ ? boost::asio::ssl::verify_peer
                                                      : boost::asio::ssl::verify_none);
        }
        sock = std::make_shared<httprange::asio::ssl_socket>("http_transport", io_context, ssl_context_);
    }
    LOG_DEBUG("creating new connection for {}", request.get_base_path());
    return std::make_shared<client_connection>(sock, timeout_);
}

awaitable<std::shared_ptr<http_response>> http_transport::exchange(std::shared_ptr<client_connection> connection,
                                                                  std::shared_ptr<http_request> request,
                                                                  std::shared_ptr<cancellation> cancel) {
    std::shared_ptr<http_response> response;
    {
        cancel_scope scope(cancel, worker_.get_io_context(), [connection] { connection->cancel(); });
        response = co_await connection->send_request(request);
    }

    if (is_cancelled(cancel)) {
        // an abort may still be queued for this connection
        connection->close();
    } else {
        pool_.checkin(request->get_host(), request->get_port(), request->is_ssl(), connection);
    }
    co_return response;
}

awaitable<std::shared_ptr<http_response>> http_transport::send_once(std::shared_ptr<http_request> request,
                                                                   std::shared_ptr<cancellation> cancel) {
    auto connection = pool_.checkout(request->get_host(), request->get_port(), request->is_ssl());
    bool reused = connection != nullptr;
    if (!connection) {
        connection = create_connection(*request);
    }

    boost::system::error_code stale_ec;
    try {
        co_return co_await exchange(connection, request, cancel);
    } catch (const boost::system::system_error& e) {
        if (!reused || e.code() == boost::asio::error::timed_out ||
            e.code() == boost::asio::error::operation_aborted) {
            throw;
        }
        stale_ec = e.code();
    }

    // the server dropped an idle keep-alive connection: one more go on a fresh one
    LOG_DEBUG("pooled connection to {} failed ({}), reconnecting", request->get_base_path(), stale_ec.message());
    co_return co_await exchange(create_connection(*request), request, cancel);
}

awaitable<client_response> http_transport::send(method m, std::string url, headers_map headers,
                                                std::shared_ptr<cancellation> cancel) {
    unsigned attempt = 0;
    unsigned redirects = 0;

    auto request = create_request(m, url, headers);
    if (!request) {
        co_return client_response(boost::asio::error::invalid_argument, nullptr);
    }

    for (;;) {
        if (is_cancelled(cancel)) {
            co_return client_response(boost::asio::error::operation_aborted, nullptr);
        }

        boost::system::error_code ec;
        std::shared_ptr<http_response> response;
        try {
            response = co_await send_once(request, cancel);
        } catch (const boost::system::system_error& e) {
            ec = e.code();
        }

        bool retry = ec ? !is_permanent_error(ec)
                        : retry_policy::is_retryable_status(response->get_status_code());

        if (retry && attempt < retry_.max_retries && !closed_ && !is_cancelled(cancel)) {
            ++attempt;
            auto delay = retry_.delay(attempt);
            LOG_WARNING("{} {} failed ({}), retry {}/{} in {} ms", get_method(m), request->get_url(),
                        ec ? ec.message() : std::to_string(response->get_status_code()),
                        attempt, retry_.max_retries, delay.count());
            if (delay.count() > 0) {
                auto timer = std::make_shared<boost::asio::steady_timer>(worker_.get_io_context(), delay);
                cancel_scope scope(cancel, worker_.get_io_context(), [timer] { timer->cancel(); });
                boost::system::error_code timer_ec;
                co_await timer->async_wait(use_nothrow_awaitable(timer_ec));
            }
            continue;
        }

        if (ec) {
            co_return client_response(ec, nullptr);
        }

        if (response->is_redirect_response() && response->has_header(header::location) &&
            redirects < max_redirects_) {
            auto location = resolve_location(*request, response->get_header(header::location));
            LOG_DEBUG("following redirect #{} to: {}", redirects + 1, location);
            auto redirected = create_request(m, location, headers);
            if (!redirected) {
                co_return client_response(boost::asio::error::invalid_argument, nullptr);
            }
            request = std::move(redirected);
            ++redirects;
            attempt = 0;
            continue;
        }

        co_return client_response(boost::system::error_code{}, response);
    }
}

client_response http_transport::execute(method m, const std::string& url, const headers_map& headers,
                                        std::shared_ptr<cancellation> cancel) {
    if (!track_request_start()) {
        return client_response(boost::asio::error::shut_down, nullptr);
    }

    client_response result;
    try {
        auto future = co_spawn(worker_.get_io_context(), send(m, url, headers, std::move(cancel)),
                               boost::asio::use_future);
        result = future.get();
    } catch (const boost::system::system_error& e) {
        result = client_response(e.code(), nullptr);
    } catch (const std::future_error& e) {
        LOG_ERROR("{} {} abandoned: {}", get_method(m), url, e.what());
        result = client_response(boost::asio::error::operation_aborted, nullptr);
    }
    track_request_end();
    return result;
}

client_response http_transport::head(const std::string& url, const headers_map& headers) {
    return execute(method::HEAD, url, headers, nullptr);
}

client_response http_transport::get(const std::string& url, const headers_map& headers,
                                    const std::shared_ptr<cancellation>& cancel) {
    return execute(method::GET, url, headers, cancel);
}

void http_transport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    LOG_DEBUG("closing http transport");

    {
        // requests in flight finish or time out on their own
        std::unique_lock<std::mutex> lock(requests_mutex_);
        requests_cv_.wait(lock, [this] { return active_requests_ == 0; });
    }

    worker_.stop();
    pool_.clear();
}

}
