#pragma once
#include <mutex>
#include <nlohmann/json.hpp>
#include "../core/clock/clock.hpp"
#include "../network/http/http_client.hpp"
#include "../network/retry/retry_policy.hpp"
#include "../utils/url/url.hpp"
#include "graph_api.hpp"

namespace Trawl {
namespace Network {
namespace RateLimit {
class RateLimiter;
}
}  // namespace Network
namespace Proxy {
namespace Pool {
class ProxyPool;
}
}  // namespace Proxy

namespace Api {

struct XrpcConfig {
    std::string  base_url = Core::Constants::DEFAULT_API_BASE;
    Core::Millis rate_limit_cooldown{Core::Constants::DEFAULT_COOLDOWN_MS};
};

struct RequestStats {
    uint64_t total           = 0;
    uint64_t successful      = 0;
    uint64_t failed          = 0;
    uint64_t rate_limited    = 0;
    uint64_t proxy_failures  = 0;
    uint64_t dropped_entities = 0;
    double   avg_response_ms = 0;
};

// GraphApi over XRPC GET endpoints. Every attempt waits for the endpoint's rate
// limiter slot, egresses through a pool proxy when one is healthy, and reports the
// outcome back to the pool.
class XrpcClient : public GraphApi {
public:
    XrpcClient(XrpcConfig                        config,
               Network::Http::HttpClient&        http,
               Network::RateLimit::RateLimiter&  limiter,
               Proxy::Pool::ProxyPool&           pool,
               Network::Retry::RetryPolicy       retry);

    boost::asio::awaitable<Actor>    get_profile(const std::string& actor) override;
    boost::asio::awaitable<EdgePage> list_edges(const std::string&                actor,
                                                Direction                         direction,
                                                const std::optional<std::string>& cursor,
                                                int                               limit) override;
    boost::asio::awaitable<SearchPage> search_actors(const std::string&                query,
                                                     const std::optional<std::string>& cursor,
                                                     int limit) override;

    RequestStats stats() const;

    static const char* endpoint_for(Direction direction);

private:
    // Returns the body of the first successful attempt; throws Core::ApiError otherwise.
    boost::asio::awaitable<std::string> call(const std::string& endpoint, const Utils::QueryParams& params);

    void record(bool success, bool rate_limited, double elapsed_ms);

    XrpcConfig                       config_;
    Network::Http::HttpClient&       http_;
    Network::RateLimit::RateLimiter& limiter_;
    Proxy::Pool::ProxyPool&          pool_;
    Network::Retry::RetryPolicy      retry_;
    RequestStats                     stats_;
    mutable std::mutex               mutex_;
};

}  // namespace Api
}  // namespace Trawl
