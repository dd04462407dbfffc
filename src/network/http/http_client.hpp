#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <map>
#include <string>

namespace Trawl {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Timeout };

struct RequestOptions {
    std::string                        proxy;  // canonical proxy URI, empty = direct
    std::map<std::string, std::string> headers;
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl

namespace Trawl {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    double                   elapsed_ms = 0;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual void set_request_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual boost::asio::awaitable<Response> get(const std::string&    url,
                                                 const RequestOptions& options = {}) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
