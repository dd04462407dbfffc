#pragma once
#include <chrono>
#include "../../core/errors/errors.hpp"
#include "../../core/types/constants.hpp"
#include "../http/http_client.hpp"

namespace Trawl {
namespace Network {
namespace Retry {

struct RetryDecision {
    bool                      retry = false;
    std::chrono::milliseconds delay{0};
};

// Pure: no clock, no transport. `attempt` is 1-based and counts the attempt that just failed.
class RetryPolicy {
public:
    RetryPolicy(int max_attempts = Core::Constants::DEFAULT_RETRY_ATTEMPTS,
                std::chrono::milliseconds base_delay = std::chrono::milliseconds(Core::Constants::DEFAULT_RETRY_BASE_MS),
                std::chrono::milliseconds max_delay = std::chrono::milliseconds(Core::Constants::DEFAULT_RETRY_MAX_MS))
        : max_attempts_(max_attempts), base_delay_(base_delay), max_delay_(max_delay) {
    }

    RetryDecision decide(int attempt, Core::ErrorKind kind) const;

    // base * 2^(attempt-1), capped at max_delay.
    std::chrono::milliseconds backoff(int attempt) const;

    int max_attempts() const {
        return max_attempts_;
    }

private:
    int                       max_attempts_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
};

// 0 / 5xx -> TransientNetwork, 429 -> RateLimit, other 4xx -> Client, 2xx/3xx -> None.
Core::ErrorKind classify(const Response& response);

}  // namespace Retry
}  // namespace Network
}  // namespace Trawl
