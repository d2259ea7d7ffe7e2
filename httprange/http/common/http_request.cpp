#include "http_request.hpp"
#include <regex>
#include <boost/algorithm/string.hpp>
#include "../../util/logger.hpp"

namespace httprange::http{

    std::string_view get_method(method m){
        switch(m){
            case method::HEAD:
                return "HEAD";
            case method::GET:
            default:
                return "GET";
        }
    }

    http_request::http_request(method m, const std::string& url) : method_(m){
        set_url(url);
    }

    bool http_request::set_url(const std::string& url){
        // scheme, host (plain or bracketed ipv6), optional port, optional target
        static const std::regex url_regex(R"(^(https?)://(\[[^\]]+\]|[^/?#:]+)(?::(\d+))?([^#]*)?(?:#.*)?$)",
                                          std::regex::icase);
        std::smatch what;
        if(!std::regex_match(url, what, url_regex)){
            LOG_ERROR("invalid url: {}", url);
            return false;
        }

        url_ = url;
        ssl_ = boost::iequals(what[1].str(), "https");
        host_ = what[2].str();
        if(host_.size() > 2 && host_.front() == '[' && host_.back() == ']'){
            host_ = host_.substr(1, host_.size() - 2);
        }
        port_ = what[3].matched ? what[3].str() : (ssl_ ? "443" : "80");
        target_ = what[4].matched && !what[4].str().empty() ? what[4].str() : "/";
        if(target_.front() == '?'){
            target_ = "/" + target_;
        }
        return true;
    }

    std::string http_request::get_base_path() const{
        return std::string(ssl_ ? "https://" : "http://") + host_ + ":" + port_;
    }

    std::string http_request::to_string() const{
        std::string out;
        out.reserve(256);
        out.append(http::get_method(method_));
        out.append(" ");
        out.append(target_);
        out.append(" HTTP/1.1");
        out.append(misc_strings::crlf);

        if(!has_header(header::host)){
            out.append(header::host);
            out.append(misc_strings::name_value_separator);
            out.append(host_.find(':') != std::string::npos ? "[" + host_ + "]" : host_);
            bool default_port = (ssl_ && port_ == "443") || (!ssl_ && port_ == "80");
            if(!default_port){
                out.append(":");
                out.append(port_);
            }
            out.append(misc_strings::crlf);
        }

        for(const auto& t: headers_){
            out.append(t.first);
            out.append(misc_strings::name_value_separator);
            out.append(t.second);
            out.append(misc_strings::crlf);
        }
        out.append(misc_strings::crlf);
        return out;
    }

    void http_request::to_buffer(std::vector<boost::asio::const_buffer>& buffer, std::string& storage) const{
        storage = to_string();
        buffer.emplace_back(boost::asio::buffer(storage));
    }

    void http_request::log(const char* scope) const{
        LOG_DEBUG("[{}] {} {}", scope, http::get_method(method_), url_);
        headers::log(scope);
    }

}
