#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>
#include "../../core/clock/clock.hpp"
#include "../../core/types/constants.hpp"
#include "proxy_uri.hpp"

namespace Trawl {
namespace Store {
class KeyValueStore;
}
namespace Network {
namespace Http {
class HttpClient;
}
}  // namespace Network
}  // namespace Trawl

namespace Trawl {
namespace Proxy {
namespace Pool {

enum class ProxyStatus { Healthy, Unhealthy, RateLimited };

const char* to_string(ProxyStatus status);

struct ProxyRecord {
    std::string                    id;  // canonical URI
    ProxyUri                       uri;
    ProxyStatus                    status               = ProxyStatus::Healthy;
    int                            consecutive_failures = 0;
    uint64_t                       requests             = 0;
    uint64_t                       successes            = 0;
    uint64_t                       failures             = 0;
    double                         avg_response_ms      = 0;
    std::optional<Core::TimePoint> cooldown_until;
    std::string                    last_error;
};

struct ProxyPoolConfig {
    int         failure_threshold = Core::Constants::DEFAULT_FAILURE_THRESHOLD;
    Core::Millis default_cooldown{Core::Constants::DEFAULT_COOLDOWN_MS};
    std::string  key_prefix = std::string(Core::Constants::KEY_PREFIX) + "proxies:";
};

struct RegisterResult {
    size_t                   registered = 0;
    std::vector<std::string> errors;
};

struct PoolStats {
    size_t   total        = 0;
    size_t   healthy      = 0;
    size_t   unhealthy    = 0;
    size_t   rate_limited = 0;
    uint64_t requests     = 0;
    uint64_t successes    = 0;
    uint64_t failures     = 0;
    double   success_rate = 0;  // successes / requests, 0 when idle
};

struct HealthCheckResult {
    size_t checked = 0;
    size_t passed  = 0;
    size_t failed  = 0;
};

class ProxyPool {
public:
    ProxyPool(ProxyPoolConfig                config,
              const Core::Clock&             clock,
              Store::KeyValueStore*          mirror = nullptr,
              std::optional<uint32_t>        seed   = std::nullopt);

    // Malformed entries are reported in the result and skipped; the rest still register.
    RegisterResult register_proxies(const std::vector<std::string>& uris);
    // Adopts proxies another process mirrored to the store, with their health and counters.
    // Already registered ids keep their local state. Returns how many were added.
    size_t load_mirror();

    // Uniformly random over healthy proxies; nullopt means go direct.
    std::optional<ProxyRecord> acquire();

    void report_success(const std::string& id, double response_ms = 0);
    void report_failure(const std::string& id, const std::string& reason);
    void report_rate_limited(const std::string& id, std::optional<Core::Millis> cooldown = std::nullopt);

    bool   remove(const std::string& id);
    size_t remove(const std::vector<std::string>& ids);
    void   reset_stats();

    std::vector<ProxyRecord>   proxies(std::optional<ProxyStatus> status = std::nullopt);
    std::optional<ProxyRecord> get(const std::string& id);
    PoolStats                  stats();
    bool                       empty() const;

    // One request per registered proxy; outcomes feed report_success / report_failure.
    boost::asio::awaitable<HealthCheckResult> health_check(Network::Http::HttpClient& client,
                                                           const std::string&         check_url);

private:
    // Caller holds mutex_.
    void promote_expired(Core::TimePoint now);
    void set_status(ProxyRecord& record, ProxyStatus status);
    void mirror(const ProxyRecord& record, std::optional<ProxyStatus> previous);
    void mirror_removal(const std::string& id);

    ProxyPoolConfig                    config_;
    const Core::Clock&                 clock_;
    Store::KeyValueStore*              store_;
    bool                               mirror_enabled_;
    std::mt19937                       rng_;
    std::map<std::string, ProxyRecord> proxies_;
    std::set<std::string>              unhealthy_before_cooldown_;
    mutable std::mutex                 mutex_;

#ifndef CPPCHECK
    friend class ProxyPoolTest_MirrorFailureDegradesToLocal_Test;
#endif
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Trawl
