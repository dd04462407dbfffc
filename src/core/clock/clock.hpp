#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace Trawl {
namespace Core {

using TimePoint = std::chrono::system_clock::time_point;
using Millis    = std::chrono::milliseconds;

class Clock {
public:
    virtual ~Clock()           = default;
    virtual TimePoint now() const = 0;

    int64_t now_ms() const;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

// Only moves when told to. Tests drive cooldowns, TTLs and checkpoint ages through it.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(24 * 365 * 50))
        : now_(start) {
    }

    TimePoint now() const override;
    void      advance(Millis delta);
    void      set(TimePoint at);

private:
    mutable std::mutex mutex_;
    TimePoint          now_;
};

int64_t     to_unix_ms(TimePoint tp);
TimePoint   from_unix_ms(int64_t ms);
std::string to_iso8601(TimePoint tp);
// Accepts "YYYY-mm-ddTHH:MM:SS[.mmm]Z" as written by to_iso8601.
std::optional<TimePoint> from_iso8601(const std::string& text);
std::string to_compact_stamp(TimePoint tp);

}  // namespace Core
}  // namespace Trawl
