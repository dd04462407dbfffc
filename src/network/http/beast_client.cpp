#include "beast_client.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <optional>
#include <vector>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../proxy/socks_handshake.hpp"

namespace Trawl {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;
using Trawl::Utils::Url;
using Trawl::Utils::UrlParsed;

std::string basic_credentials(const std::string& username, const std::string& password) {
    std::string          plain = username + ":" + password;
    std::vector<uint8_t> encoded(4 * ((plain.size() + 2) / 3) + 1);
    int                  length = EVP_EncodeBlock(encoded.data(),
                                 reinterpret_cast<const unsigned char*>(plain.data()),
                                 static_cast<int>(plain.size()));
    return "Basic " + std::string(reinterpret_cast<const char*>(encoded.data()),
                                  static_cast<size_t>(length));
}

BeastClient::BeastClient(net::io_context& /*ioc*/, std::string user_agent)
    : user_agent_(user_agent.empty() ? Trawl::Core::Constants::USER_AGENT
                                     : std::move(user_agent)) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout_ = timeout;
}

template <typename Request>
void BeastClient::apply_headers(Request&              req,
                                const Target&         target,
                                const RequestOptions& options) const {
    req.set(http::field::host, target.host);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "application/json");
    for (const auto& [name, value] : options.headers)
        req.set(name, value);
}

net::awaitable<Response> BeastClient::get(const std::string& url, const RequestOptions& options) {
    auto parsed = Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        Response response;
        response.effective_url = url;
        response.error         = "Invalid URL";
        response.error_type    = ErrorType::Network;
        co_return response;
    }

    Target target;
    target.host   = parsed.host;
    target.is_ssl = parsed.scheme == "https";
    target.port   = parsed.port.empty() ? Url::default_port(parsed.scheme) : parsed.port;
    target.path   = parsed.path;
    if (!parsed.query.empty())
        target.path += "?" + parsed.query;

    std::string effective_url =
        parsed.scheme + "://" + Url::authority(parsed) + target.path;

    std::optional<UrlParsed> proxy;
    if (!options.proxy.empty()) {
        proxy = Url::parse(options.proxy);
        if (proxy->port.empty())
            proxy->port = Url::default_port(proxy->scheme);
    }

    auto started = std::chrono::steady_clock::now();
    Response response;
    try {
        if (target.is_ssl)
            response = co_await perform_https_request(
                target, proxy ? &*proxy : nullptr, options, effective_url);
        else
            response = co_await perform_http_request(
                target, proxy ? &*proxy : nullptr, options, effective_url);
    } catch (const beast::system_error& e) {
        response               = Response{};
        response.effective_url = effective_url;
        response.error         = e.what();
        response.error_type    = e.code() == beast::error::timeout ? ErrorType::Timeout
                                 : proxy                           ? ErrorType::Proxy
                                                                   : ErrorType::Network;
    } catch (const std::exception& e) {
        response               = Response{};
        response.effective_url = effective_url;
        response.error         = e.what();
        response.error_type    = proxy ? ErrorType::Proxy : ErrorType::Network;
    }

    response.elapsed_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    co_return response;
}

net::awaitable<void> BeastClient::connect_through_proxy(tcp::socket&     socket,
                                                        const Target&    target,
                                                        const UrlParsed& proxy) {
    if (proxy.scheme == "socks5") {
        co_await Trawl::Network::Proxy::SocksHandshake::perform_socks5(
            socket, target.host, target.port, proxy.username, proxy.password);
    }
    else if (proxy.scheme == "socks4") {
        co_await Trawl::Network::Proxy::SocksHandshake::perform_socks4(
            socket, target.host, target.port, proxy.username);
    }
    else {
        // HTTP CONNECT
        std::string                     authority = target.host + ":" + target.port;
        http::request<http::empty_body> req{http::verb::connect, authority, 11};
        req.set(http::field::host, authority);
        req.set(http::field::user_agent, user_agent_);
        if (!proxy.username.empty())
            req.set(http::field::proxy_authorization,
                    basic_credentials(proxy.username, proxy.password));
        co_await http::async_write(socket, req, net::use_awaitable);

        beast::flat_buffer               b;
        http::response_parser<http::empty_body> parser;
        parser.skip(true);
        co_await http::async_read_header(socket, b, parser, net::use_awaitable);

        if (parser.get().result() != http::status::ok) {
            throw std::runtime_error("Proxy CONNECT failed with status "
                                     + std::to_string(parser.get().result_int()));
        }
    }
    co_return;
}

net::awaitable<Response> BeastClient::perform_http_request(const Target&         target,
                                                           const UrlParsed*      proxy,
                                                           const RequestOptions& options,
                                                           const std::string&    effective_url) {
    Response response;
    response.effective_url = effective_url;

    std::string connect_host = proxy ? proxy->host : target.host;
    std::string connect_port = proxy ? proxy->port : target.port;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    bool absolute_form = proxy && (proxy->scheme == "http" || proxy->scheme == "https");
    if (proxy && !absolute_form)
        co_await connect_through_proxy(stream.socket(), target, *proxy);

    stream.expires_after(request_timeout_);

    http::request<http::string_body> req{
        http::verb::get, absolute_form ? effective_url : target.path, 11};
    apply_headers(req, target, options);
    if (absolute_form && !proxy->username.empty())
        req.set(http::field::proxy_authorization,
                basic_credentials(proxy->username, proxy->password));

    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(stream, b, res, net::use_awaitable);

    response.status_code = res.result_int();
    response.body        = std::move(res.body());
    response.success     = (response.status_code >= 200 && response.status_code < 400);
    auto ct              = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const Target&         target,
                                                            const UrlParsed*      proxy,
                                                            const RequestOptions& options,
                                                            const std::string&    effective_url) {
    Response response;
    response.effective_url = effective_url;

    std::string connect_host = proxy ? proxy->host : target.host;
    std::string connect_port = proxy ? proxy->port : target.port;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);

    if (proxy)
        co_await connect_through_proxy(
            beast::get_lowest_layer(ssl_stream).socket(), target, *proxy);

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(request_timeout_);

    http::request<http::string_body> req{http::verb::get, target.path, 11};
    apply_headers(req, target, options);

    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(ssl_stream, b, res, net::use_awaitable);

    response.status_code = res.result_int();
    response.body        = std::move(res.body());
    response.success     = (response.status_code >= 200 && response.status_code < 400);
    auto ct              = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());

    // Servers often drop the connection without close_notify.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
