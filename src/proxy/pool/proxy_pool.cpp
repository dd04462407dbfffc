#include "proxy_pool.hpp"
#include <algorithm>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../network/http/http_client.hpp"
#include "../../store/key_value_store.hpp"

namespace Trawl {
namespace Proxy {
namespace Pool {

using namespace Trawl::Core;
namespace net = boost::asio;

const char* to_string(ProxyStatus status) {
    switch (status) {
        case ProxyStatus::Healthy:
            return "healthy";
        case ProxyStatus::Unhealthy:
            return "unhealthy";
        case ProxyStatus::RateLimited:
            return "rate_limited";
    }
    return "unknown";
}

ProxyPool::ProxyPool(ProxyPoolConfig         config,
                     const Clock&            clock,
                     Store::KeyValueStore*   mirror,
                     std::optional<uint32_t> seed)
    : config_(std::move(config)),
      clock_(clock),
      store_(mirror),
      mirror_enabled_(mirror != nullptr),
      rng_(seed ? *seed : std::random_device{}()) {
}

RegisterResult ProxyPool::register_proxies(const std::vector<std::string>& uris) {
    RegisterResult result;
    for (const auto& text : uris) {
        ProxyUri uri;
        try {
            uri = ProxyUri::parse(text);
        } catch (const ConfigError& e) {
            Logger::error(std::string("Rejected proxy entry: ") + e.what());
            result.errors.push_back(e.what());
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::string                 id = uri.to_string();
        if (proxies_.count(id)) {
            Logger::debug("Proxy already registered: " + uri.masked());
            continue;
        }
        ProxyRecord record;
        record.id  = id;
        record.uri = uri;
        auto& stored = proxies_.emplace(id, std::move(record)).first->second;
        mirror(stored, std::nullopt);
        ++result.registered;
    }

    Logger::info("Registered " + std::to_string(result.registered) + " proxies ("
                 + std::to_string(result.errors.size()) + " rejected)");
    return result;
}

namespace {
uint64_t counter(const std::map<std::string, std::string>& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty())
        return 0;
    try {
        return std::stoull(it->second);
    } catch (const std::logic_error&) {
        return 0;
    }
}

ProxyStatus status_named(const std::string& name) {
    for (auto status : {ProxyStatus::Healthy, ProxyStatus::Unhealthy, ProxyStatus::RateLimited}) {
        if (name == to_string(status))
            return status;
    }
    return ProxyStatus::Healthy;
}
}  // namespace

size_t ProxyPool::load_mirror() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!mirror_enabled_)
        return 0;

    size_t loaded = 0;
    try {
        const std::string& prefix = config_.key_prefix;
        for (const auto& id : store_->smembers(prefix + "all")) {
            if (proxies_.count(id))
                continue;

            ProxyRecord record;
            try {
                record.uri = ProxyUri::parse(id);
            } catch (const ConfigError& e) {
                Logger::warn(std::string("Ignoring mirrored proxy entry: ") + e.what());
                continue;
            }
            record.id = id;

            auto fields                 = store_->hgetall(prefix + "stats:" + id);
            record.status               = status_named(fields["status"]);
            record.requests             = counter(fields, "requests");
            record.successes            = counter(fields, "successes");
            record.failures             = counter(fields, "failures");
            record.consecutive_failures = static_cast<int>(counter(fields, "consecutive_failures"));
            try {
                record.avg_response_ms = fields["avg_response_ms"].empty() ? 0 : std::stod(fields["avg_response_ms"]);
            } catch (const std::logic_error&) {
                record.avg_response_ms = 0;
            }
            if (uint64_t until = counter(fields, "cooldown_until"))
                record.cooldown_until = from_unix_ms(static_cast<int64_t>(until));
            if (record.status == ProxyStatus::RateLimited && !record.cooldown_until)
                record.cooldown_until = clock_.now();

            proxies_.emplace(id, std::move(record));
            ++loaded;
        }
    } catch (const StoreUnavailableError& e) {
        mirror_enabled_ = false;
        Logger::warn(std::string("Proxy health mirror disabled: ") + e.what());
    }

    if (loaded > 0)
        Logger::info("Loaded " + std::to_string(loaded) + " proxies from the shared store");
    return loaded;
}

void ProxyPool::promote_expired(TimePoint now) {
    for (auto& [id, record] : proxies_) {
        if (record.status != ProxyStatus::RateLimited || !record.cooldown_until
            || now < *record.cooldown_until)
            continue;

        record.cooldown_until.reset();
        bool was_unhealthy = unhealthy_before_cooldown_.erase(id) > 0;
        set_status(record, was_unhealthy ? ProxyStatus::Unhealthy : ProxyStatus::Healthy);
        Logger::debug("Proxy cooldown elapsed (" + std::string(to_string(record.status))
                      + "): " + record.uri.masked());
    }
}

std::optional<ProxyRecord> ProxyPool::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    promote_expired(clock_.now());

    std::vector<const ProxyRecord*> healthy;
    for (const auto& [id, record] : proxies_) {
        if (record.status == ProxyStatus::Healthy)
            healthy.push_back(&record);
    }
    if (healthy.empty())
        return std::nullopt;

    std::uniform_int_distribution<size_t> pick(0, healthy.size() - 1);
    return *healthy[pick(rng_)];
}

void ProxyPool::report_success(const std::string& id, double response_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = proxies_.find(id);
    if (it == proxies_.end())
        return;

    ProxyRecord& record = it->second;
    ++record.requests;
    ++record.successes;
    record.consecutive_failures = 0;
    record.avg_response_ms += (response_ms - record.avg_response_ms)
                              / static_cast<double>(record.successes);
    record.cooldown_until.reset();
    unhealthy_before_cooldown_.erase(id);

    if (record.status != ProxyStatus::Healthy) {
        Logger::info("Proxy recovered: " + record.uri.masked());
        set_status(record, ProxyStatus::Healthy);
    }
    else {
        mirror(record, std::nullopt);
    }
}

void ProxyPool::report_failure(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = proxies_.find(id);
    if (it == proxies_.end())
        return;

    ProxyRecord& record = it->second;
    ++record.requests;
    ++record.failures;
    record.last_error = reason;

    // A cooling-down proxy keeps its streak; the failure is already explained.
    if (record.status == ProxyStatus::RateLimited) {
        Logger::debug("Proxy failed during cooldown: " + record.uri.masked() + " (" + reason + ")");
        mirror(record, std::nullopt);
        return;
    }
    ++record.consecutive_failures;

    if (record.status == ProxyStatus::Healthy
        && record.consecutive_failures >= config_.failure_threshold) {
        Logger::warn("Proxy marked unhealthy after " + std::to_string(record.consecutive_failures)
                     + " failures: " + record.uri.masked() + " (" + reason + ")");
        set_status(record, ProxyStatus::Unhealthy);
        return;
    }

    Logger::debug("Proxy failed (" + std::to_string(record.consecutive_failures) + "/"
                  + std::to_string(config_.failure_threshold) + "): " + record.uri.masked()
                  + " (" + reason + ")");
    mirror(record, std::nullopt);
}

void ProxyPool::report_rate_limited(const std::string& id, std::optional<Millis> cooldown) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = proxies_.find(id);
    if (it == proxies_.end())
        return;

    ProxyRecord& record = it->second;
    ++record.requests;
    if (record.status == ProxyStatus::Unhealthy)
        unhealthy_before_cooldown_.insert(id);

    Millis wait           = cooldown.value_or(config_.default_cooldown);
    record.cooldown_until = clock_.now() + wait;
    Logger::warn("Proxy rate limited for " + std::to_string(wait.count())
                 + "ms: " + record.uri.masked());
    set_status(record, ProxyStatus::RateLimited);
}

bool ProxyPool::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = proxies_.find(id);
    if (it == proxies_.end())
        return false;

    Logger::info("Proxy removed: " + it->second.uri.masked());
    proxies_.erase(it);
    unhealthy_before_cooldown_.erase(id);
    mirror_removal(id);
    return true;
}

size_t ProxyPool::remove(const std::vector<std::string>& ids) {
    size_t removed = 0;
    for (const auto& text : ids) {
        std::string id = text;
        try {
            id = ProxyUri::parse(text).to_string();
        } catch (const ConfigError&) {
            // Not parseable; try the raw text as an identifier.
        }
        if (remove(id))
            ++removed;
    }
    return removed;
}

void ProxyPool::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    unhealthy_before_cooldown_.clear();
    for (auto& [id, record] : proxies_) {
        record.requests             = 0;
        record.successes            = 0;
        record.failures             = 0;
        record.consecutive_failures = 0;
        record.avg_response_ms      = 0;
        record.cooldown_until.reset();
        record.last_error.clear();
        set_status(record, ProxyStatus::Healthy);
    }
    Logger::info("Proxy statistics reset");
}

std::vector<ProxyRecord> ProxyPool::proxies(std::optional<ProxyStatus> status) {
    std::lock_guard<std::mutex> lock(mutex_);
    promote_expired(clock_.now());
    std::vector<ProxyRecord> out;
    for (const auto& [id, record] : proxies_) {
        if (!status || record.status == *status)
            out.push_back(record);
    }
    return out;
}

std::optional<ProxyRecord> ProxyPool::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = proxies_.find(id);
    if (it == proxies_.end())
        return std::nullopt;
    return it->second;
}

PoolStats ProxyPool::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    promote_expired(clock_.now());

    PoolStats stats;
    stats.total = proxies_.size();
    for (const auto& [id, record] : proxies_) {
        switch (record.status) {
            case ProxyStatus::Healthy:
                ++stats.healthy;
                break;
            case ProxyStatus::Unhealthy:
                ++stats.unhealthy;
                break;
            case ProxyStatus::RateLimited:
                ++stats.rate_limited;
                break;
        }
        stats.requests += record.requests;
        stats.successes += record.successes;
        stats.failures += record.failures;
    }
    if (stats.requests > 0)
        stats.success_rate =
            static_cast<double>(stats.successes) / static_cast<double>(stats.requests);
    return stats;
}

bool ProxyPool::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.empty();
}

net::awaitable<HealthCheckResult> ProxyPool::health_check(Network::Http::HttpClient& client,
                                                          const std::string&         check_url) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : proxies_)
            ids.push_back(id);
    }

    HealthCheckResult result;
    for (const auto& id : ids) {
        Network::Http::RequestOptions options;
        options.proxy = id;
        Response response = co_await client.get(check_url, options);

        ++result.checked;
        if (response.success) {
            ++result.passed;
            report_success(id, response.elapsed_ms);
        }
        else {
            ++result.failed;
            report_failure(id,
                           response.error.empty()
                               ? "health check status " + std::to_string(response.status_code)
                               : response.error);
        }
    }

    Logger::info("Proxy health check: " + std::to_string(result.passed) + "/"
                 + std::to_string(result.checked) + " passed");
    co_return result;
}

void ProxyPool::set_status(ProxyRecord& record, ProxyStatus status) {
    ProxyStatus previous = record.status;
    record.status        = status;
    mirror(record, previous);
}

// Health in the shared store is advisory. A store outage turns mirroring off for the
// rest of the run; the in-process map stays authoritative.
void ProxyPool::mirror(const ProxyRecord& record, std::optional<ProxyStatus> previous) {
    if (!mirror_enabled_)
        return;
    try {
        const std::string& prefix = config_.key_prefix;
        store_->sadd(prefix + "all", record.id);
        if (previous && *previous != record.status)
            store_->srem(prefix + to_string(*previous), record.id);
        store_->sadd(prefix + to_string(record.status), record.id);

        std::string stats_key = prefix + "stats:" + record.id;
        store_->hset(stats_key, "status", to_string(record.status));
        store_->hset(stats_key, "requests", std::to_string(record.requests));
        store_->hset(stats_key, "successes", std::to_string(record.successes));
        store_->hset(stats_key, "failures", std::to_string(record.failures));
        store_->hset(stats_key, "consecutive_failures",
                     std::to_string(record.consecutive_failures));
        store_->hset(stats_key, "avg_response_ms", std::to_string(record.avg_response_ms));
        store_->hset(stats_key,
                     "cooldown_until",
                     record.cooldown_until ? std::to_string(to_unix_ms(*record.cooldown_until))
                                           : "");
    } catch (const StoreUnavailableError& e) {
        mirror_enabled_ = false;
        Logger::warn(std::string("Proxy health mirror disabled: ") + e.what());
    }
}

void ProxyPool::mirror_removal(const std::string& id) {
    if (!mirror_enabled_)
        return;
    try {
        const std::string& prefix = config_.key_prefix;
        store_->srem(prefix + "all", id);
        for (auto status : {ProxyStatus::Healthy, ProxyStatus::Unhealthy, ProxyStatus::RateLimited})
            store_->srem(prefix + to_string(status), id);
        store_->del(prefix + "stats:" + id);
    } catch (const StoreUnavailableError& e) {
        mirror_enabled_ = false;
        Logger::warn(std::string("Proxy health mirror disabled: ") + e.what());
    }
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Trawl
