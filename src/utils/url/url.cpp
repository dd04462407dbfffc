#include "url.hpp"
#include <curl/curl.h>
#include <memory>
#include <string_view>
#include "../text/string_utils.hpp"

namespace Trawl {
namespace Utils {

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find("://");
    if (colon != std::string_view::npos && sv.substr(0, colon).find_first_of("/?#") == std::string_view::npos) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 3);
    }

    size_t      end_auth  = sv.find_first_of("/?#");
    std::string authority = std::string(sv.substr(0, end_auth));
    sv = end_auth == std::string_view::npos ? std::string_view{} : sv.substr(end_auth);

    size_t at = authority.find_last_of('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority            = authority.substr(at + 1);
        size_t sep           = userinfo.find(':');
        parsed.username      = userinfo.substr(0, sep);
        if (sep != std::string::npos)
            parsed.password = userinfo.substr(sep + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        size_t end_bracket = authority.find(']');
        if (end_bracket != std::string::npos) {
            parsed.host    = authority.substr(0, end_bracket + 1);
            size_t p_colon = authority.find(':', end_bracket + 1);
            if (p_colon != std::string::npos)
                parsed.port = authority.substr(p_colon + 1);
        }
        else {
            parsed.host = authority;
        }
    }
    else {
        size_t p_colon = authority.find_last_of(':');
        if (p_colon != std::string::npos) {
            parsed.host = authority.substr(0, p_colon);
            parsed.port = authority.substr(p_colon + 1);
        }
        else {
            parsed.host = authority;
        }
    }

    size_t hash = sv.find('#');
    if (hash != std::string_view::npos)
        sv = sv.substr(0, hash);
    size_t q = sv.find('?');
    if (q != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q + 1));
        sv           = sv.substr(0, q);
    }
    parsed.path = sv.empty() ? "/" : std::string(sv);
    return parsed;
}

std::string Url::encode_component(const std::string& value) {
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size())), &curl_free);
    if (!escaped)
        return value;
    return std::string(escaped.get());
}

std::string Url::build_query(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (value.empty())
            continue;
        if (!query.empty())
            query += '&';
        query += encode_component(key) + "=" + encode_component(value);
    }
    return query;
}

std::string Url::default_port(const std::string& scheme) {
    if (scheme == "https")
        return "443";
    if (scheme == "socks4" || scheme == "socks5")
        return "1080";
    return "80";
}

std::string Url::authority(const UrlParsed& url) {
    if (url.port.empty() || url.port == default_port(url.scheme))
        return url.host;
    return url.host + ":" + url.port;
}

}  // namespace Utils
}  // namespace Trawl
