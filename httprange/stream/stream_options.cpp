#include "stream_options.hpp"
#include <stdexcept>

namespace httprange {

void stream_options::validate() const {
    if (url_.empty()) {
        throw std::invalid_argument("url must not be empty");
    }
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk_size must be > 0");
    }
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("timeout must be > 0");
    }
}

stream_options stream_options::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("stream options must be a json object");
    }

    stream_options options;
    try {
        if (json.contains("url")) {
            options.url(json.at("url").get<std::string>());
        }
        if (json.contains("chunk_size")) {
            auto size = json.at("chunk_size").get<int64_t>();
            if (size <= 0) {
                throw std::invalid_argument("chunk_size must be > 0");
            }
            options.chunk_size(static_cast<uint64_t>(size));
        }
        if (json.contains("timeout_ms")) {
            // sub-second timeouts round up to one second
            auto ms = json.at("timeout_ms").get<int64_t>();
            if (ms <= 0) {
                throw std::invalid_argument("timeout_ms must be > 0");
            }
            options.timeout(std::chrono::seconds((ms + 999) / 1000));
        }
        if (json.contains("max_retries")) {
            options.max_retries(json.at("max_retries").get<unsigned>());
        }
        if (json.contains("backoff_ms")) {
            options.backoff(std::chrono::milliseconds(json.at("backoff_ms").get<int64_t>()));
        }
        if (json.contains("user_agent")) {
            options.user_agent(json.at("user_agent").get<std::string>());
        }
        if (json.contains("prefetch")) {
            options.prefetch(json.at("prefetch").get<bool>());
        }
        if (json.contains("verify_ssl")) {
            options.verify_ssl(json.at("verify_ssl").get<bool>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("invalid stream options: ") + e.what());
    }
    return options;
}

nlohmann::json stream_options::to_json() const {
    return {
        {"url", url_},
        {"chunk_size", chunk_size_},
        {"timeout_ms", std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count()},
        {"max_retries", max_retries_},
        {"backoff_ms", backoff_.count()},
        {"user_agent", user_agent_},
        {"prefetch", prefetch_},
        {"verify_ssl", verify_ssl_}
    };
}

}
