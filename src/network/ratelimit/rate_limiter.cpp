#include "rate_limiter.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cmath>
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Network {
namespace RateLimit {

using namespace Trawl::Core;
namespace net = boost::asio;

namespace {
constexpr int PAUSE_POLL_INTERVAL_MS  = 50;
constexpr int SLOT_POLL_INTERVAL_MS   = 10;
}  // namespace

SlotGuard::SlotGuard(RateLimiter* limiter, std::string endpoint, Millis waited)
    : limiter_(limiter), endpoint_(std::move(endpoint)), waited_(waited) {
}

SlotGuard::SlotGuard(SlotGuard&& other) noexcept
    : limiter_(other.limiter_), endpoint_(std::move(other.endpoint_)), waited_(other.waited_) {
    other.limiter_ = nullptr;
}

SlotGuard& SlotGuard::operator=(SlotGuard&& other) noexcept {
    if (this != &other) {
        release();
        limiter_       = other.limiter_;
        endpoint_      = std::move(other.endpoint_);
        waited_        = other.waited_;
        other.limiter_ = nullptr;
    }
    return *this;
}

SlotGuard::~SlotGuard() {
    release();
}

void SlotGuard::release() {
    if (limiter_) {
        limiter_->release(endpoint_);
        limiter_ = nullptr;
    }
}

RateLimiter::RateLimiter(RateLimiterConfig config, const Clock& clock)
    : config_(std::move(config)),
      clock_(clock),
      rng_(config_.seed ? *config_.seed : std::random_device{}()) {
}

RateLimiter::Bucket& RateLimiter::bucket_for(const std::string& endpoint) {
    auto it = buckets_.find(endpoint);
    if (it != buckets_.end())
        return it->second;

    EndpointLimit limit{config_.requests_per_minute, config_.burst_limit};
    auto          override_it = config_.endpoints.find(endpoint);
    if (override_it != config_.endpoints.end())
        limit = override_it->second;

    Bucket bucket;
    bucket.capacity       = std::max(1, limit.burst_limit);
    bucket.max_concurrent = std::max(1, config_.max_concurrent);
    bucket.spacing = std::max(Millis(60000 / std::max(1, limit.requests_per_minute)),
                              Millis(config_.min_interval_ms));

    Logger::debug("Rate bucket for " + endpoint + ": burst " + std::to_string(bucket.capacity)
                  + ", spacing " + std::to_string(bucket.spacing.count()) + "ms");
    return buckets_.emplace(endpoint, std::move(bucket)).first->second;
}

Millis RateLimiter::jitter(const Bucket& bucket) {
    if (!config_.randomize_delays)
        return Millis(0);
    std::uniform_real_distribution<double> fraction(0.0, Constants::JITTER_FRACTION);
    return Millis(static_cast<int64_t>(
        std::floor(static_cast<double>(bucket.spacing.count()) * fraction(rng_))));
}

TimePoint RateLimiter::reserve(const std::string& endpoint, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Bucket&                     bucket = bucket_for(endpoint);
    if (!bucket.started) {
        bucket.tat        = now;
        bucket.last_admit = now;
        bucket.started    = true;
    }

    // The schedule advances by the plain spacing; jitter only widens a throttled wait.
    Millis    tolerance = bucket.spacing * (bucket.capacity - 1);
    TimePoint admit_at  = std::max(now, bucket.tat - tolerance);
    bucket.tat          = std::max(bucket.tat, admit_at) + bucket.spacing;

    if (admit_at > now) {
        admit_at += jitter(bucket);
        admit_at = std::max(admit_at, bucket.last_admit + Millis(config_.min_interval_ms));
    }
    bucket.last_admit = std::max(bucket.last_admit, admit_at);

    double wait_ms = static_cast<double>(
        std::chrono::duration_cast<Millis>(admit_at - now).count());
    ++bucket.requests;
    ++requests_;
    if (wait_ms > config_.throttle_threshold_ms) {
        ++bucket.throttled;
        ++throttled_;
    }

    bucket.waits.push_back(wait_ms);
    if (bucket.waits.size() > WAIT_WINDOW)
        bucket.waits.pop_front();
    waits_.push_back(wait_ms);
    if (waits_.size() > WAIT_WINDOW)
        waits_.pop_front();

    return admit_at;
}

net::awaitable<SlotGuard> RateLimiter::acquire_slot(const std::string& endpoint) {
    net::steady_timer timer(co_await net::this_coro::executor);

    while (paused()) {
        timer.expires_after(Millis(PAUSE_POLL_INTERVAL_MS));
        co_await timer.async_wait(net::use_awaitable);
    }

    TimePoint now      = clock_.now();
    TimePoint admit_at = reserve(endpoint, now);
    Millis    delay    = std::chrono::duration_cast<Millis>(admit_at - now);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++bucket_for(endpoint).queued;
    }

    try {
        if (delay.count() > 0) {
            Logger::debug("Throttling " + endpoint + " for " + std::to_string(delay.count())
                          + "ms");
            timer.expires_after(delay);
            co_await timer.async_wait(net::use_awaitable);
        }

        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                Bucket&                     bucket = bucket_for(endpoint);
                if (bucket.in_flight < bucket.max_concurrent) {
                    ++bucket.in_flight;
                    --bucket.queued;
                    break;
                }
            }
            timer.expires_after(Millis(SLOT_POLL_INTERVAL_MS));
            co_await timer.async_wait(net::use_awaitable);
        }
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        --bucket_for(endpoint).queued;
        throw;
    }

    co_return SlotGuard(this, endpoint, delay);
}

void RateLimiter::release(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = buckets_.find(endpoint);
    if (it != buckets_.end() && it->second.in_flight > 0)
        --it->second.in_flight;
}

void RateLimiter::pause_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paused_)
        Logger::warn("Rate limiter paused");
    paused_ = true;
}

void RateLimiter::resume_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_)
        Logger::info("Rate limiter resumed");
    paused_ = false;
}

bool RateLimiter::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

Millis RateLimiter::base_spacing(const std::string& endpoint) const {
    EndpointLimit limit{config_.requests_per_minute, config_.burst_limit};
    auto          it = config_.endpoints.find(endpoint);
    if (it != config_.endpoints.end())
        limit = it->second;
    return std::max(Millis(60000 / std::max(1, limit.requests_per_minute)),
                    Millis(config_.min_interval_ms));
}

double RateLimiter::average(const std::deque<double>& values) {
    if (values.empty())
        return 0;
    double sum = 0;
    for (double v : values)
        sum += v;
    return sum / static_cast<double>(values.size());
}

EndpointStats RateLimiter::snapshot(const std::string& endpoint,
                                    const Bucket&      bucket,
                                    TimePoint          now) const {
    EndpointStats stats;
    stats.endpoint      = endpoint;
    stats.requests      = bucket.requests;
    stats.throttled     = bucket.throttled;
    stats.throttle_rate = bucket.requests == 0 ? 0
                                               : static_cast<double>(bucket.throttled)
                                                     / static_cast<double>(bucket.requests);
    stats.avg_wait_ms = average(bucket.waits);
    stats.capacity    = bucket.capacity;
    stats.spacing_ms  = bucket.spacing.count();
    stats.in_flight   = bucket.in_flight;
    stats.queued      = bucket.queued;

    if (!bucket.started || bucket.tat <= now) {
        stats.reservoir = bucket.capacity;
    }
    else {
        Millis  tolerance = bucket.spacing * (bucket.capacity - 1);
        auto    headroom  = std::chrono::duration_cast<Millis>(now + tolerance - bucket.tat);
        int64_t tokens    = headroom.count() < 0 ? 0 : headroom.count() / bucket.spacing.count() + 1;
        stats.reservoir   = static_cast<int>(std::clamp<int64_t>(tokens, 0, bucket.capacity));
    }
    return stats;
}

LimiterStats RateLimiter::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint                   now = clock_.now();

    LimiterStats stats;
    stats.requests      = requests_;
    stats.throttled     = throttled_;
    stats.throttle_rate = requests_ == 0 ? 0
                                         : static_cast<double>(throttled_)
                                               / static_cast<double>(requests_);
    stats.avg_wait_ms = average(waits_);
    stats.paused      = paused_;
    for (const auto& [endpoint, bucket] : buckets_)
        stats.endpoints.push_back(snapshot(endpoint, bucket, now));
    return stats;
}

std::optional<EndpointStats> RateLimiter::endpoint_info(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = buckets_.find(endpoint);
    if (it == buckets_.end())
        return std::nullopt;
    return snapshot(endpoint, it->second, clock_.now());
}

void RateLimiter::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_  = 0;
    throttled_ = 0;
    waits_.clear();
    for (auto& [endpoint, bucket] : buckets_) {
        bucket.requests  = 0;
        bucket.throttled = 0;
        bucket.waits.clear();
    }
}

}  // namespace RateLimit
}  // namespace Network
}  // namespace Trawl
