#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace knora {
namespace log_utils {

// 850 ms, 2.4 s, 3m 12s, 1h 4m 0s
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    return std::to_string(total_minutes / 60) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Queries per second over an interval, "n/a" when the interval is empty
inline std::string format_rate(uint64_t count, int64_t ms) {
    if (ms <= 0) return "n/a";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << (static_cast<double>(count) * 1000.0 / static_cast<double>(ms)) << "/s";
    return oss.str();
}

}  // namespace log_utils
}  // namespace knora
