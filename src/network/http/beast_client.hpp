#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../utils/url/url.hpp"
#include "http_client.hpp"

namespace Trawl {
namespace Network {
namespace Http {

// Header value for "Proxy-Authorization": "Basic base64(user:pass)".
std::string basic_credentials(const std::string& username, const std::string& password);

class BeastClient : public HttpClient {
public:
    explicit BeastClient(boost::asio::io_context& ioc, std::string user_agent = "");
    ~BeastClient() override = default;

    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const std::string&    url,
                                         const RequestOptions& options = {}) override;

private:
    struct Target {
        std::string host;
        std::string port;
        std::string path;  // origin-form, query included
        bool        is_ssl = false;
    };

    std::string               user_agent_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds request_timeout_{30000};
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Response> perform_http_request(const Target&              target,
                                                          const Utils::UrlParsed*    proxy,
                                                          const RequestOptions&      options,
                                                          const std::string&         effective_url);
    boost::asio::awaitable<Response> perform_https_request(const Target&              target,
                                                           const Utils::UrlParsed*    proxy,
                                                           const RequestOptions&      options,
                                                           const std::string&         effective_url);

    boost::asio::awaitable<void> connect_through_proxy(boost::asio::ip::tcp::socket& socket,
                                                       const Target&                 target,
                                                       const Utils::UrlParsed&       proxy);

    template <typename Request>
    void apply_headers(Request& req, const Target& target, const RequestOptions& options) const;
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
