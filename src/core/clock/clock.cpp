#include "clock.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Trawl {
namespace Core {

int64_t Clock::now_ms() const {
    return to_unix_ms(now());
}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(Millis delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::set(TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = at;
}

int64_t to_unix_ms(TimePoint tp) {
    return std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
}

TimePoint from_unix_ms(int64_t ms) {
    return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(Millis(ms));
}

namespace {
std::tm to_utc_tm(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm{};
    gmtime_r(&t, &tm);
    return tm;
}
}  // namespace

std::string to_iso8601(TimePoint tp) {
    std::tm            tm = to_utc_tm(tp);
    auto               ms = to_unix_ms(tp) % 1000;
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (ms < 0 ? ms + 1000 : ms) << 'Z';
    return out.str();
}

std::optional<TimePoint> from_iso8601(const std::string& text) {
    std::tm            tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        return std::nullopt;

    int64_t millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek()) && digits.size() < 9)
            digits.push_back(static_cast<char>(in.get()));
        if (digits.empty())
            return std::nullopt;
        digits.resize(3, '0');
        millis = std::stoll(digits);
    }

    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1))
        return std::nullopt;
    return from_unix_ms(static_cast<int64_t>(seconds) * 1000 + millis);
}

std::string to_compact_stamp(TimePoint tp) {
    std::tm            tm = to_utc_tm(tp);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return out.str();
}

}  // namespace Core
}  // namespace Trawl
