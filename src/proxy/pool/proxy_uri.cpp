#include "proxy_uri.hpp"
#include <cctype>
#include "../../core/errors/errors.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Proxy {
namespace Pool {

using Core::ConfigError;
using namespace Trawl::Utils;

namespace {

bool is_supported_scheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https" || scheme == "socks4" || scheme == "socks5";
}

bool is_valid_host(const std::string& host) {
    if (host.empty() || host.size() > 253)
        return false;
    if (host.front() == '[')
        return host.back() == ']' && host.size() > 2;
    for (unsigned char c : host) {
        if (!std::isalnum(c) && c != '.' && c != '-' && c != '_')
            return false;
    }
    return host.front() != '.' && host.front() != '-';
}

uint16_t parse_port(const std::string& text, const std::string& original) {
    if (text.empty() || text.size() > 5)
        throw ConfigError("Invalid proxy port in '" + original + "'");
    for (unsigned char c : text) {
        if (!std::isdigit(c))
            throw ConfigError("Invalid proxy port in '" + original + "'");
    }
    int port = std::stoi(text);
    if (port < 1 || port > 65535)
        throw ConfigError("Proxy port out of range in '" + original + "'");
    return static_cast<uint16_t>(port);
}

}  // namespace

ProxyUri ProxyUri::parse(const std::string& text) {
    std::string input = Text::trim(text);
    if (input.empty())
        throw ConfigError("Empty proxy entry");

    ProxyUri uri;
    if (input.find("://") != std::string::npos) {
        UrlParsed parsed = Url::parse(input);
        if (!is_supported_scheme(parsed.scheme))
            throw ConfigError("Unsupported proxy scheme '" + parsed.scheme + "' in '" + input
                              + "'");
        if (parsed.path != "/" || !parsed.query.empty())
            throw ConfigError("Proxy URI must not carry a path: '" + input + "'");
        uri.scheme   = parsed.scheme;
        uri.host     = parsed.host;
        uri.port     = parse_port(parsed.port, input);
        uri.username = parsed.username;
        uri.password = parsed.password;
    }
    else {
        auto parts = Text::split(input, ':');
        if (parts.size() != 2 && parts.size() != 4)
            throw ConfigError("Expected host:port or host:port:user:pass, got '" + input + "'");
        uri.scheme = "http";
        uri.host   = parts[0];
        uri.port   = parse_port(parts[1], input);
        if (parts.size() == 4) {
            if (parts[2].empty())
                throw ConfigError("Empty proxy username in '" + input + "'");
            uri.username = parts[2];
            uri.password = parts[3];
        }
    }

    if (!is_valid_host(uri.host))
        throw ConfigError("Invalid proxy host in '" + input + "'");
    return uri;
}

std::string ProxyUri::to_string() const {
    std::string out = scheme + "://";
    if (has_credentials())
        out += username + ":" + password + "@";
    return out + host + ":" + std::to_string(port);
}

std::string ProxyUri::masked() const {
    std::string out = scheme + "://";
    if (has_credentials())
        out += username + ":***@";
    return out + host + ":" + std::to_string(port);
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Trawl
