#pragma once
#include <cstdint>
#include <string>

namespace Trawl {
namespace Proxy {
namespace Pool {

struct ProxyUri {
    std::string scheme;  // http, https, socks4, socks5
    std::string host;
    uint16_t    port = 0;
    std::string username;
    std::string password;

    // Accepts "scheme://[user:pass@]host:port", "host:port" and "host:port:user:pass".
    // Colon forms become http. Throws Core::ConfigError on anything else.
    static ProxyUri parse(const std::string& text);

    bool has_credentials() const {
        return !username.empty();
    }

    // Canonical identifier, credentials included.
    std::string to_string() const;
    // Same as to_string() with the password replaced by "***". Safe to log.
    std::string masked() const;

    bool operator==(const ProxyUri& other) const = default;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Trawl
