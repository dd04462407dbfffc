#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include "../../core/clock/clock.hpp"
#include "../../core/types/constants.hpp"

namespace Trawl {
namespace Network {
namespace RateLimit {

struct RateLimiterConfig {
    int                                        requests_per_minute = Core::Constants::DEFAULT_REQUESTS_PER_MINUTE;
    int                                        burst_limit         = Core::Constants::DEFAULT_BURST_LIMIT;
    int                                        max_concurrent      = Core::Constants::DEFAULT_MAX_CONCURRENT;
    int                                        min_interval_ms     = Core::Constants::DEFAULT_MIN_INTERVAL_MS;
    bool                                       randomize_delays    = true;
    int                                        throttle_threshold_ms = Core::Constants::THROTTLE_THRESHOLD_MS;
    std::map<std::string, Core::EndpointLimit> endpoints;
    std::optional<uint32_t>                    seed;
};

struct EndpointStats {
    std::string endpoint;
    uint64_t    requests        = 0;
    uint64_t    throttled       = 0;
    double      throttle_rate   = 0;
    double      avg_wait_ms     = 0;  // over the last WAIT_WINDOW admissions
    int         reservoir       = 0;  // tokens available right now
    int         capacity        = 0;
    int64_t     spacing_ms      = 0;
    int         in_flight       = 0;
    int         queued          = 0;
};

struct LimiterStats {
    uint64_t                   requests      = 0;
    uint64_t                   throttled     = 0;
    double                     throttle_rate = 0;
    double                     avg_wait_ms   = 0;
    bool                       paused        = false;
    std::vector<EndpointStats> endpoints;
};

class RateLimiter;

// Holds one in-flight slot for its endpoint until destroyed.
class SlotGuard {
public:
    SlotGuard() = default;
    SlotGuard(RateLimiter* limiter, std::string endpoint, Core::Millis waited);
    SlotGuard(SlotGuard&& other) noexcept;
    SlotGuard& operator=(SlotGuard&& other) noexcept;
    SlotGuard(const SlotGuard&)            = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;
    ~SlotGuard();

    Core::Millis waited() const {
        return waited_;
    }
    void release();

private:
    RateLimiter* limiter_ = nullptr;
    std::string  endpoint_;
    Core::Millis waited_{0};
};

// Token bucket per endpoint, scheduled as a virtual arrival time: the first `burst`
// requests are admitted at once, every later one is spaced by at least the endpoint's
// minimum interval. Admission order is request order.
class RateLimiter {
public:
    static constexpr size_t WAIT_WINDOW = 100;

    RateLimiter(RateLimiterConfig config, const Core::Clock& clock);

    // Books the next admission slot for `endpoint` and records its wait.
    Core::TimePoint reserve(const std::string& endpoint, Core::TimePoint now);

    // Suspends until the endpoint admits the caller and an in-flight slot is free.
    boost::asio::awaitable<SlotGuard> acquire_slot(const std::string& endpoint);

    void pause_all();
    void resume_all();
    bool paused() const;

    // floor(60000 / rpm), never below the configured minimum interval.
    Core::Millis                 base_spacing(const std::string& endpoint) const;
    LimiterStats                 stats();
    std::optional<EndpointStats> endpoint_info(const std::string& endpoint);
    void                         reset_stats();

private:
    friend class SlotGuard;

    struct Bucket {
        int               capacity       = 0;
        int               max_concurrent = 0;
        Core::Millis      spacing{0};
        Core::TimePoint   tat{};  // theoretical arrival time of the next request
        Core::TimePoint   last_admit{};
        bool              started   = false;
        int               in_flight = 0;
        int               queued    = 0;
        uint64_t          requests  = 0;
        uint64_t          throttled = 0;
        std::deque<double> waits;
    };

    // Caller holds mutex_.
    Bucket&       bucket_for(const std::string& endpoint);
    Core::Millis  jitter(const Bucket& bucket);  // extra delay for a throttled admission
    EndpointStats snapshot(const std::string& endpoint, const Bucket& bucket, Core::TimePoint now) const;
    void          release(const std::string& endpoint);

    static double average(const std::deque<double>& values);

    RateLimiterConfig              config_;
    const Core::Clock&             clock_;
    std::map<std::string, Bucket>  buckets_;
    std::deque<double>             waits_;
    uint64_t                       requests_  = 0;
    uint64_t                       throttled_ = 0;
    bool                           paused_    = false;
    std::mt19937                   rng_;
    mutable std::mutex             mutex_;
};

}  // namespace RateLimit
}  // namespace Network
}  // namespace Trawl
