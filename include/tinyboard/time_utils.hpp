#pragma once

#include "tinyboard/common.hpp"
#include <chrono>
#include <string>

namespace tinyboard {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// Get current time
TimePoint now();

// Get current Unix timestamp (seconds since epoch)
int64_t timestamp_seconds();

// Convert TimePoint to Unix timestamp (seconds)
int64_t to_timestamp(const TimePoint& tp);

// Convert Unix timestamp to TimePoint
TimePoint from_timestamp(int64_t timestamp_seconds);

// Convert Unix timestamp to string (ISO 8601, UTC)
std::string to_string(int64_t timestamp_seconds);

// Timer for measuring elapsed time
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    // Reset the timer
    void reset() { start_ = std::chrono::steady_clock::now(); }

    // Get elapsed time in milliseconds
    double elapsed_milliseconds() const {
        auto duration = std::chrono::steady_clock::now() - start_;
        return std::chrono::duration<double, std::milli>(duration).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace time
} // namespace tinyboard
