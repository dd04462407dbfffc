#include "retry_policy.hpp"
#include <algorithm>

namespace Trawl {
namespace Network {
namespace Retry {

using Core::ErrorKind;

std::chrono::milliseconds RetryPolicy::backoff(int attempt) const {
    if (attempt < 1)
        attempt = 1;
    int64_t delay = base_delay_.count();
    for (int i = 1; i < attempt && delay < max_delay_.count(); ++i)
        delay *= 2;
    return std::min(std::chrono::milliseconds(delay), max_delay_);
}

RetryDecision RetryPolicy::decide(int attempt, ErrorKind kind) const {
    if (attempt >= max_attempts_)
        return {};

    switch (kind) {
        case ErrorKind::TransientNetwork:
            return {true, backoff(attempt)};
        case ErrorKind::RateLimit:
            // The rate limiter spaces the retry; the proxy sits out its cooldown.
            return {true, std::chrono::milliseconds(0)};
        case ErrorKind::None:
        case ErrorKind::Client:
        case ErrorKind::Validation:
        case ErrorKind::Configuration:
        case ErrorKind::StoreUnavailable:
            break;
    }
    return {};
}

ErrorKind classify(const Response& response) {
    long status = response.status_code;
    if (status == 0 || status >= 500)
        return ErrorKind::TransientNetwork;
    if (status == 429)
        return ErrorKind::RateLimit;
    if (status >= 400)
        return ErrorKind::Client;
    return ErrorKind::None;
}

}  // namespace Retry
}  // namespace Network
}  // namespace Trawl
