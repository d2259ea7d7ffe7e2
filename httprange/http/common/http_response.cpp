#include "http_response.hpp"
#include "../../util/logger.hpp"

namespace httprange::http{

    bool http_response::is_redirect_response() const{
        return status_ == status::temporary_redirect ||
               status_ == status::moved_temporarily ||
               status_ == status::see_other ||
               status_ == status::permanent_redirect ||
               status_ == status::moved_permanently;
    }

    bool http_response::status_allows_body() const{
        auto code = get_status_code();
        return !(code < 200 || code == 204 || code == 304);
    }

    void http_response::set_status(uint16_t status_code){
        status_ = static_cast<status>(status_code);
    }

    void http_response::set_status(http_response::status status_code){
        status_ = status_code;
    }

    http_response::status http_response::get_status() const{
        return status_;
    }

    int http_response::get_status_code() const{
        return static_cast<int>(status_);
    }

    bool http_response::is_ok() const{
        auto code = get_status_code();
        return code >= 200 && code < 300;
    }

    const std::string& http_response::get_content() const{
        return content_;
    }

    std::string& http_response::get_content(){
        return content_;
    }

    size_t http_response::get_content_size() const{
        return content_.size();
    }

    void http_response::set_content(std::string content){
        content_ = std::move(content);
    }

    void http_response::set_reason_phrase(std::string reason) {
        reason_phrase_ = std::move(reason);
    }

    const std::string& http_response::get_reason_phrase() const{
        return reason_phrase_;
    }

    void http_response::log(const char* scope) const{
        LOG_DEBUG("[{}] HTTP/{}.{} {} {} ({} bytes)", scope, get_http_version_major(),
                  get_http_version_minor(), get_status_code(), reason_phrase_, content_.size());
        headers::log(scope);
    }

}
