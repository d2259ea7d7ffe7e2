#ifndef HTTPRANGE_STREAM_OPTIONS_HPP
#define HTTPRANGE_STREAM_OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace httprange {

namespace http {
    class transport;
}

/**
 * Settings for a range_stream.
 *
 * Usage:
 *   auto options = stream_options("https://example.com/archive.zip")
 *       .chunk_size(256 * 1024)
 *       .timeout(std::chrono::seconds(30))
 *       .prefetch(false);
 */
class stream_options {
public:
    static constexpr uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

    stream_options() = default;
    explicit stream_options(std::string url) : url_(std::move(url)) {}

    // Configuration setters (fluent API)
    stream_options& url(std::string url) { url_ = std::move(url); return *this; }
    stream_options& chunk_size(uint64_t size) { chunk_size_ = size; return *this; }
    stream_options& timeout(std::chrono::seconds t) { timeout_ = t; return *this; }
    stream_options& max_retries(unsigned retries) { max_retries_ = retries; return *this; }
    stream_options& backoff(std::chrono::milliseconds b) { backoff_ = b; return *this; }
    stream_options& user_agent(std::string agent) { user_agent_ = std::move(agent); return *this; }
    stream_options& prefetch(bool enabled) { prefetch_ = enabled; return *this; }
    stream_options& verify_ssl(bool verify) { verify_ssl_ = verify; return *this; }

    /// Use an externally owned transport. The stream never closes it.
    stream_options& transport(std::shared_ptr<http::transport> transport) {
        transport_ = std::move(transport);
        return *this;
    }

    // Configuration getters
    const std::string& get_url() const { return url_; }
    uint64_t get_chunk_size() const { return chunk_size_; }
    std::chrono::seconds get_timeout() const { return timeout_; }
    unsigned get_max_retries() const { return max_retries_; }
    std::chrono::milliseconds get_backoff() const { return backoff_; }
    const std::string& get_user_agent() const { return user_agent_; }
    bool get_prefetch() const { return prefetch_; }
    bool get_verify_ssl() const { return verify_ssl_; }
    const std::shared_ptr<http::transport>& get_transport() const { return transport_; }

    /// throws std::invalid_argument for an empty url, a zero chunk size or a
    /// non-positive timeout
    void validate() const;

    /// keys: url, chunk_size, timeout_ms, max_retries, backoff_ms, user_agent,
    /// prefetch, verify_ssl. Missing keys keep their defaults.
    static stream_options from_json(const nlohmann::json& json);
    nlohmann::json to_json() const;

private:
    std::string url_;
    uint64_t chunk_size_ = DEFAULT_CHUNK_SIZE;
    std::chrono::seconds timeout_{10};
    unsigned max_retries_ = 3;
    std::chrono::milliseconds backoff_{500};
    std::string user_agent_ = "httprange/1.0";
    bool prefetch_ = true;
    bool verify_ssl_ = true;
    std::shared_ptr<http::transport> transport_;
};

}

#endif
