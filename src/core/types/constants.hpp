#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace Trawl {
namespace Core {

struct Constants {
    static constexpr const char* VERSION            = "0.3.0";
    static constexpr const char* USER_AGENT         = "Trawl-GraphCrawler/0.3";
    static constexpr const char* DEFAULT_OUTPUT_DIR = "data";
    static constexpr const char* DEFAULT_API_BASE   = "https://public.api.bsky.app";
    static constexpr const char* KEY_PREFIX         = "trawl:";
    static constexpr const char* SCRAPER_TYPE       = "relationships";
    static constexpr const char* HEALTH_CHECK_URL   = "https://httpbin.org/ip";

    static constexpr int DEFAULT_MAX_DEPTH               = 2;
    static constexpr int MAX_SUPPORTED_DEPTH             = 5;
    static constexpr int DEFAULT_PAGE_LIMIT              = 100;
    static constexpr int DEFAULT_MAX_PER_NODE            = 1000;
    static constexpr int DEFAULT_MIN_FOLLOWERS           = 10;
    static constexpr int DEFAULT_BATCH_SIZE              = 1000;
    static constexpr int DEFAULT_CHECKPOINT_EVERY_NODES  = 50;
    static constexpr int DEFAULT_SEARCH_PAGES            = 5;
    static constexpr int PRIOR_SEED_LIMIT                = 1000;
    static constexpr int64_t DEFAULT_MAX_NODES           = 1000000;
    static constexpr int64_t DEFAULT_MAX_EDGES           = 10000000;

    static constexpr int REQUEST_TIMEOUT_SECONDS = 30;
    static constexpr int CONNECT_TIMEOUT_MS      = 10000;

    static constexpr int DEFAULT_REQUESTS_PER_MINUTE = 60;
    static constexpr int DEFAULT_BURST_LIMIT         = 10;
    static constexpr int DEFAULT_MAX_CONCURRENT      = 5;
    static constexpr int DEFAULT_MIN_INTERVAL_MS     = 500;
    static constexpr int THROTTLE_THRESHOLD_MS       = 100;
    static constexpr double JITTER_FRACTION          = 0.2;

    static constexpr int DEFAULT_FAILURE_THRESHOLD = 3;
    static constexpr int DEFAULT_COOLDOWN_MS       = 60000;
    static constexpr int DEFAULT_HEALTH_CHECK_MS   = 300000;

    static constexpr int DEFAULT_RETRY_ATTEMPTS  = 3;
    static constexpr int DEFAULT_RETRY_BASE_MS   = 1000;
    static constexpr int DEFAULT_RETRY_MAX_MS    = 30000;

    static constexpr int64_t DEFAULT_BLOOM_EXPECTED    = 1000000;
    static constexpr double  DEFAULT_BLOOM_FP_RATE     = 0.01;
    static constexpr int     EDGE_CARDINALITY_FACTOR   = 10;
    static constexpr int64_t DEFAULT_DEDUP_TTL_SECONDS = 86400 * 7;

    static constexpr int     DEFAULT_CHECKPOINT_FREQUENCY = 5;
    static constexpr int64_t DEFAULT_MAX_CHECKPOINT_AGE   = 86400000;
};

struct EndpointLimit {
    int requests_per_minute = Constants::DEFAULT_REQUESTS_PER_MINUTE;
    int burst_limit         = Constants::DEFAULT_BURST_LIMIT;
};

namespace Endpoints {
inline constexpr const char* GET_PROFILE    = "/xrpc/app.bsky.actor.getProfile";
inline constexpr const char* SEARCH_ACTORS  = "/xrpc/app.bsky.actor.searchActors";
inline constexpr const char* GET_FOLLOWERS  = "/xrpc/app.bsky.graph.getFollowers";
inline constexpr const char* GET_FOLLOWS    = "/xrpc/app.bsky.graph.getFollows";
}  // namespace Endpoints

inline const std::map<std::string, EndpointLimit>& get_default_endpoint_limits() {
    static const std::map<std::string, EndpointLimit> limits = {
        {Endpoints::SEARCH_ACTORS, {30, 5}},
        {Endpoints::GET_PROFILE, {100, 10}},
        {Endpoints::GET_FOLLOWERS, {50, 8}},
        {Endpoints::GET_FOLLOWS, {50, 8}},
    };
    return limits;
}

}  // namespace Core
}  // namespace Trawl
