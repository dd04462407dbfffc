#include "xrpc_client.hpp"
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../network/ratelimit/rate_limiter.hpp"
#include "../proxy/pool/proxy_pool.hpp"
#include "response_parser.hpp"

namespace Trawl {
namespace Api {

using namespace Trawl::Core;
using Trawl::Network::Retry::classify;
namespace net = boost::asio;

XrpcClient::XrpcClient(XrpcConfig                       config,
                       Network::Http::HttpClient&       http,
                       Network::RateLimit::RateLimiter& limiter,
                       Proxy::Pool::ProxyPool&          pool,
                       Network::Retry::RetryPolicy      retry)
    : config_(std::move(config)), http_(http), limiter_(limiter), pool_(pool), retry_(retry) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/')
        config_.base_url.pop_back();
}

const char* XrpcClient::endpoint_for(Direction direction) {
    return direction == Direction::Followers ? Endpoints::GET_FOLLOWERS : Endpoints::GET_FOLLOWS;
}

void XrpcClient::record(bool success, bool rate_limited, double elapsed_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.total;
    if (success) {
        ++stats_.successful;
        stats_.avg_response_ms += (elapsed_ms - stats_.avg_response_ms)
                                  / static_cast<double>(stats_.successful);
    }
    else {
        ++stats_.failed;
    }
    if (rate_limited)
        ++stats_.rate_limited;
}

RequestStats XrpcClient::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

net::awaitable<std::string> XrpcClient::call(const std::string&        endpoint,
                                             const Utils::QueryParams& params) {
    std::string url   = config_.base_url + endpoint;
    std::string query = Utils::Url::build_query(params);
    if (!query.empty())
        url += "?" + query;

    for (int attempt = 1;; ++attempt) {
        auto slot  = co_await limiter_.acquire_slot(endpoint);
        auto proxy = pool_.acquire();

        Network::Http::RequestOptions options;
        if (proxy)
            options.proxy = proxy->id;

        std::string log_msg = "GET " + endpoint;
        if (attempt > 1)
            log_msg += " [Retry " + std::to_string(attempt) + "]";
        if (proxy)
            log_msg += " [" + proxy->uri.masked() + "]";
        Logger::debug(log_msg);

        Response res = co_await http_.get(url, options);
        slot.release();

        ErrorKind kind = classify(res);
        record(kind == ErrorKind::None, kind == ErrorKind::RateLimit, res.elapsed_ms);

        if (kind == ErrorKind::None) {
            if (proxy)
                pool_.report_success(proxy->id, res.elapsed_ms);
            co_return std::move(res.body);
        }

        std::string reason = res.error.empty() ? "HTTP " + std::to_string(res.status_code)
                                               : res.error;
        if (proxy) {
            if (kind == ErrorKind::RateLimit) {
                pool_.report_rate_limited(proxy->id, config_.rate_limit_cooldown);
            }
            else if (kind == ErrorKind::TransientNetwork) {
                pool_.report_failure(proxy->id, reason);
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.proxy_failures;
            }
        }

        auto decision = retry_.decide(attempt, kind);
        if (!decision.retry) {
            if (kind == ErrorKind::Client)
                Logger::warn("Abandoned " + endpoint + ": " + reason);
            else
                Logger::error("Giving up on " + endpoint + " after " + std::to_string(attempt)
                              + " attempts: " + reason);
            throw ApiError(kind, res.status_code, endpoint + ": " + reason);
        }

        Logger::warn(std::string("Retrying ") + endpoint + " (" + to_string(kind) + ", "
                     + reason + ")");
        if (decision.delay.count() > 0) {
            net::steady_timer timer(co_await net::this_coro::executor);
            timer.expires_after(decision.delay);
            co_await timer.async_wait(net::use_awaitable);
        }
    }
}

net::awaitable<Actor> XrpcClient::get_profile(const std::string& actor) {
    Utils::QueryParams params{{"actor", actor}};
    std::string body = co_await call(Endpoints::GET_PROFILE, params);
    try {
        co_return ResponseParser::parse_profile(body);
    } catch (const ValidationError& e) {
        throw ApiError(ErrorKind::Validation, 200, std::string("getProfile: ") + e.what());
    }
}

net::awaitable<EdgePage> XrpcClient::list_edges(const std::string&                actor,
                                                Direction                         direction,
                                                const std::optional<std::string>& cursor,
                                                int                               limit) {
    Utils::QueryParams params{
        {"actor", actor}, {"limit", std::to_string(limit)}, {"cursor", cursor.value_or("")}};
    std::string body = co_await call(endpoint_for(direction), params);

    EdgePage page;
    try {
        page = ResponseParser::parse_edge_page(body, direction);
    } catch (const ValidationError& e) {
        throw ApiError(ErrorKind::Validation, 200, std::string(endpoint_for(direction)) + ": "
                                                       + e.what());
    }
    if (page.dropped > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.dropped_entities += page.dropped;
    }
    co_return page;
}

net::awaitable<SearchPage> XrpcClient::search_actors(const std::string&                query,
                                                     const std::optional<std::string>& cursor,
                                                     int                               limit) {
    Utils::QueryParams params{
        {"q", query}, {"limit", std::to_string(limit)}, {"cursor", cursor.value_or("")}};
    std::string body = co_await call(Endpoints::SEARCH_ACTORS, params);

    SearchPage page;
    try {
        page = ResponseParser::parse_search_page(body);
    } catch (const ValidationError& e) {
        throw ApiError(ErrorKind::Validation, 200, std::string("searchActors: ") + e.what());
    }
    if (page.dropped > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.dropped_entities += page.dropped;
    }
    co_return page;
}

}  // namespace Api
}  // namespace Trawl
