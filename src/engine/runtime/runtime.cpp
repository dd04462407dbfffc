#include "runtime.hpp"
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"
#include "../../store/memory_store.hpp"
#include "../../store/redis_store.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;
namespace net = boost::asio;

CrawlerConfig Runtime::crawler_config(const Config& config) {
    CrawlerConfig out;
    out.max_depth              = config.max_depth;
    out.max_nodes              = config.max_nodes;
    out.max_edges              = config.max_edges;
    out.max_followers_per_node = config.max_followers_per_node;
    out.max_following_per_node = config.max_following_per_node;
    out.min_follower_count     = config.min_follower_count;
    out.page_limit             = config.page_limit;
    out.prioritize_popular     = config.prioritize_popular;
    out.resume                 = config.resume;
    out.seed_queries           = config.seed_queries;
    out.search_pages           = config.search_pages;
    out.prior_seed_limit       = config.prior_seed_limit;
    return out;
}

Network::RateLimit::RateLimiterConfig Runtime::limiter_config(const Config& config) {
    Network::RateLimit::RateLimiterConfig out;
    out.requests_per_minute = config.requests_per_minute;
    out.burst_limit         = config.burst_limit;
    out.max_concurrent      = config.max_concurrent;
    out.min_interval_ms     = config.min_interval_ms;
    out.randomize_delays    = config.randomize_delays;
    out.endpoints           = config.rate_limits;
    return out;
}

Dedup::DedupConfig Runtime::dedup_config(const Config& config) {
    Dedup::DedupConfig out;
    out.expected_nodes      = config.bloom_expected_nodes;
    out.false_positive_rate = config.bloom_fp_rate;
    out.edge_factor         = config.edge_cardinality_factor;
    out.ttl_seconds         = config.dedup_ttl_seconds;
    return out;
}

Proxy::Pool::ProxyPoolConfig Runtime::pool_config(const Config& config) {
    Proxy::Pool::ProxyPoolConfig out;
    out.failure_threshold = config.failure_threshold;
    out.default_cooldown  = Millis(config.rate_limit_cooldown_ms);
    return out;
}

Runtime::Runtime(const Config& config, net::io_context& ioc)
    : config_(config),
      session_id_(config.session_id.empty() ? to_compact_stamp(std::chrono::system_clock::now())
                                            : config.session_id),
      health_timer_(ioc) {
    store_   = make_store(config, clock_);
    storage_ = std::make_unique<Storage::DiskStorage>(config.output_dir);

    pool_ = std::make_unique<Proxy::Pool::ProxyPool>(pool_config(config), clock_, store_.get());

    if (!config.proxies.empty())
        pool_->register_proxies(config.proxies);

    limiter_ = std::make_unique<Network::RateLimit::RateLimiter>(limiter_config(config), clock_);

    http_ = std::make_unique<Network::Http::BeastClient>(ioc, config.user_agent);
    http_->set_connect_timeout(std::chrono::milliseconds(config.connect_timeout_ms));
    http_->set_request_timeout(std::chrono::milliseconds(config.request_timeout_ms));

    Api::XrpcConfig xrpc_config;
    xrpc_config.base_url            = config.api_base_url;
    xrpc_config.rate_limit_cooldown = Millis(config.rate_limit_cooldown_ms);
    api_ = std::make_unique<Api::XrpcClient>(
        xrpc_config,
        *http_,
        *limiter_,
        *pool_,
        Network::Retry::RetryPolicy(config.retry_attempts,
                                    std::chrono::milliseconds(config.retry_base_ms),
                                    std::chrono::milliseconds(config.retry_max_ms)));

    dedup_ = std::make_unique<Dedup::Deduplicator>(dedup_config(config), *store_, clock_);

    Checkpoint::CheckpointConfig checkpoint_config;
    checkpoint_config.session_id      = session_id_;
    checkpoint_config.frequency       = config.checkpoint_frequency;
    checkpoint_config.item_interval   = config.checkpoint_every_nodes;
    checkpoint_config.max_age         = Millis(config.max_checkpoint_age_ms);
    checkpoint_config.backup          = config.backup_checkpoints;
    checkpoint_config.auto_checkpoint = config.auto_checkpoint;
    checkpoints_ =
        std::make_unique<Checkpoint::CheckpointStore>(checkpoint_config, *storage_, clock_);

    sink_ = std::make_unique<Output::JsonlSink>(
        *storage_, session_id_, static_cast<size_t>(config.batch_size));

    crawler_ = std::make_unique<Crawler>(crawler_config(config),
                                         Services{clock_, *api_, *dedup_, *checkpoints_, *sink_, *storage_});

    if (config.respect_robots_txt)
        Logger::debug("respect_robots_txt is set; the XRPC API publishes no robots policy");
    Logger::info("Session " + session_id_ + ", output in " + config.output_dir);
}

std::unique_ptr<Store::KeyValueStore> Runtime::make_store(const Config& config, const Clock& clock) {
    if (config.redis_url.empty()) {
        Logger::info("No Redis URL configured, shared state stays in-process");
        return std::make_unique<Store::MemoryStore>(clock);
    }

    auto redis = std::make_unique<Store::RedisStore>(config.redis_url);
    if (!redis->ping())
        Logger::warn("Redis at " + config.redis_url
                     + " is not answering; components will fall back to in-process state");
    return redis;
}

net::awaitable<void> Runtime::monitor_proxies() {
    if (pool_->empty() || config_.health_check_url.empty())
        co_return;

    while (monitoring_) {
        co_await pool_->health_check(*http_, config_.health_check_url);
        if (config_.health_check_interval_ms <= 0)
            co_return;

        health_timer_.expires_after(std::chrono::milliseconds(config_.health_check_interval_ms));
        boost::system::error_code ec;
        co_await health_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec == net::error::operation_aborted)
            co_return;
    }
}

void Runtime::stop_monitor() {
    monitoring_ = false;
    health_timer_.cancel();
}

net::awaitable<CrawlSummary> Runtime::run() {
    auto summary = co_await crawler_->run(config_.seeds);

    auto requests = api_->stats();
    Logger::info("Requests: " + std::to_string(requests.total) + " total, "
                 + std::to_string(requests.failed) + " failed, "
                 + std::to_string(requests.rate_limited) + " rate limited");
    if (!pool_->empty()) {
        auto proxies = pool_->stats();
        Logger::info("Proxies: " + std::to_string(proxies.healthy) + "/"
                     + std::to_string(proxies.total) + " healthy");
    }
    co_return summary;
}

}  // namespace Engine
}  // namespace Trawl
