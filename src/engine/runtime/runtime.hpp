#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>

#include "../../api/xrpc_client.hpp"
#include "../../checkpoint/checkpoint_store.hpp"
#include "../../core/clock/clock.hpp"
#include "../../core/config/config.hpp"
#include "../../dedup/deduplicator.hpp"
#include "../../network/http/beast_client.hpp"
#include "../../network/ratelimit/rate_limiter.hpp"
#include "../../output/jsonl_sink.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../../storage/disk_storage.hpp"
#include "../../store/key_value_store.hpp"
#include "../crawler/crawler.hpp"

namespace Trawl {
namespace Engine {

// Owns one crawl's collaborators, built from the validated Config. Members are
// declared in dependency order so destruction runs the other way round.
class Runtime {
public:
    Runtime(const Core::Config& config, boost::asio::io_context& ioc);

    // Checks every proxy once, then again every health_check_interval_ms until
    // stop_monitor(). Returns immediately when no proxies are configured.
    boost::asio::awaitable<void> monitor_proxies();
    void                         stop_monitor();

    boost::asio::awaitable<CrawlSummary> run();

    Crawler& crawler() {
        return *crawler_;
    }
    Proxy::Pool::ProxyPool& pool() {
        return *pool_;
    }
    const std::string& session_id() const {
        return session_id_;
    }

    static CrawlerConfig                         crawler_config(const Core::Config& config);
    static Network::RateLimit::RateLimiterConfig limiter_config(const Core::Config& config);
    static Dedup::DedupConfig                    dedup_config(const Core::Config& config);
    static Proxy::Pool::ProxyPoolConfig          pool_config(const Core::Config& config);
    // Redis when a URL is configured, otherwise a fresh in-process store.
    static std::unique_ptr<Store::KeyValueStore> make_store(const Core::Config& config, const Core::Clock& clock);

private:

    const Core::Config& config_;
    std::string         session_id_;
    Core::SystemClock   clock_;

    std::unique_ptr<Store::KeyValueStore>              store_;
    std::unique_ptr<Storage::DiskStorage>              storage_;
    std::unique_ptr<Proxy::Pool::ProxyPool>            pool_;
    std::unique_ptr<Network::RateLimit::RateLimiter>   limiter_;
    std::unique_ptr<Network::Http::BeastClient>        http_;
    std::unique_ptr<Api::XrpcClient>                   api_;
    std::unique_ptr<Dedup::Deduplicator>               dedup_;
    std::unique_ptr<Checkpoint::CheckpointStore>       checkpoints_;
    std::unique_ptr<Output::JsonlSink>                 sink_;
    std::unique_ptr<Crawler>                           crawler_;

    boost::asio::steady_timer health_timer_;
    std::atomic<bool>         monitoring_{true};
};

}  // namespace Engine
}  // namespace Trawl
