#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Trawl {
namespace Core {

struct Config {
    std::string config_path;
    std::string log_level  = "info";
    std::string output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string redis_url;  // empty = in-process store
    std::string session_id;

    // Maintenance instead of a crawl: command "proxies" (list, remove, reset) or
    // "checkpoints" (list, remove, export, import). Empty command means crawl.
    std::string              command;
    std::string              action;
    std::vector<std::string> command_args;

    std::vector<std::string> seeds;
    std::vector<std::string> seed_queries;  // search terms, used when seeds is empty
    std::vector<std::string> proxies;

    // Upstream API
    std::string api_base_url       = Constants::DEFAULT_API_BASE;
    std::string user_agent         = Constants::USER_AGENT;
    int         request_timeout_ms = Constants::REQUEST_TIMEOUT_SECONDS * 1000;
    int         connect_timeout_ms = Constants::CONNECT_TIMEOUT_MS;

    // Traversal budgets
    int     max_depth              = Constants::DEFAULT_MAX_DEPTH;
    int64_t max_nodes              = Constants::DEFAULT_MAX_NODES;
    int64_t max_edges              = Constants::DEFAULT_MAX_EDGES;
    int     max_followers_per_node = Constants::DEFAULT_MAX_PER_NODE;
    int     max_following_per_node = Constants::DEFAULT_MAX_PER_NODE;
    int     min_follower_count     = Constants::DEFAULT_MIN_FOLLOWERS;
    int     page_limit             = Constants::DEFAULT_PAGE_LIMIT;
    bool    prioritize_popular     = true;
    int     batch_size             = Constants::DEFAULT_BATCH_SIZE;
    int     checkpoint_every_nodes = Constants::DEFAULT_CHECKPOINT_EVERY_NODES;
    bool    resume                 = true;
    bool    respect_robots_txt     = true;
    int     search_pages           = Constants::DEFAULT_SEARCH_PAGES;
    int     prior_seed_limit       = Constants::PRIOR_SEED_LIMIT;

    // Rate limiting
    int                                  requests_per_minute = Constants::DEFAULT_REQUESTS_PER_MINUTE;
    int                                  burst_limit         = Constants::DEFAULT_BURST_LIMIT;
    int                                  max_concurrent      = Constants::DEFAULT_MAX_CONCURRENT;
    int                                  min_interval_ms     = Constants::DEFAULT_MIN_INTERVAL_MS;
    bool                                 randomize_delays    = true;
    std::map<std::string, EndpointLimit> rate_limits         = get_default_endpoint_limits();

    // Proxy health
    int         failure_threshold        = Constants::DEFAULT_FAILURE_THRESHOLD;
    int         rate_limit_cooldown_ms   = Constants::DEFAULT_COOLDOWN_MS;
    int         health_check_interval_ms = Constants::DEFAULT_HEALTH_CHECK_MS;
    std::string health_check_url         = Constants::HEALTH_CHECK_URL;

    // Retry
    int retry_attempts = Constants::DEFAULT_RETRY_ATTEMPTS;
    int retry_base_ms  = Constants::DEFAULT_RETRY_BASE_MS;
    int retry_max_ms   = Constants::DEFAULT_RETRY_MAX_MS;

    // Deduplication
    int64_t bloom_expected_nodes    = Constants::DEFAULT_BLOOM_EXPECTED;
    double  bloom_fp_rate           = Constants::DEFAULT_BLOOM_FP_RATE;
    int     edge_cardinality_factor = Constants::EDGE_CARDINALITY_FACTOR;
    int64_t dedup_ttl_seconds       = Constants::DEFAULT_DEDUP_TTL_SECONDS;

    // Checkpoints
    bool    auto_checkpoint       = true;
    bool    backup_checkpoints    = true;
    int     checkpoint_frequency  = Constants::DEFAULT_CHECKPOINT_FREQUENCY;
    int64_t max_checkpoint_age_ms = Constants::DEFAULT_MAX_CHECKPOINT_AGE;

    static Config parse(int argc, char* argv[]);

    // Throws ConfigError naming the first offending field.
    void validate() const;
};

void                     load_yaml(Config& config, const std::string& path);
std::vector<std::string> read_list_file(const std::string& path);

}  // namespace Core
}  // namespace Trawl
