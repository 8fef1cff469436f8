#include "tinyboard/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace tinyboard {
namespace time {

TimePoint now() {
    return Clock::now();
}

int64_t timestamp_seconds() {
    return to_timestamp(now());
}

int64_t to_timestamp(const TimePoint& tp) {
    return std::chrono::duration_cast<Seconds>(
        tp.time_since_epoch()
    ).count();
}

TimePoint from_timestamp(int64_t timestamp_seconds) {
    return TimePoint(Seconds(timestamp_seconds));
}

std::string to_string(int64_t timestamp_seconds) {
    auto time_t_val = static_cast<std::time_t>(timestamp_seconds);
    std::tm tm_val;

#ifdef TINYBOARD_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace time
} // namespace tinyboard
