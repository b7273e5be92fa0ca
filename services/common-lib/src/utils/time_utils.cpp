/**
 * @file time_utils.cpp
 * @brief Time formatting utilities implementation
 */

#include "fdr/utils/time_utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace fdr {
namespace utils {

std::string formatIso8601(const std::chrono::system_clock::time_point& tp,
                          bool includeMilliseconds) {
    std::time_t timeValue = std::chrono::system_clock::to_time_t(tp);

    struct tm tmTime;
    if (!gmtime_r(&timeValue, &tmTime)) {
        return "";
    }

    // Format as ISO8601: YYYY-MM-DDTHH:MM:SS[.mmm]Z
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;

    if (includeMilliseconds) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        if (millis < 0) millis += 1000;
        oss << '.' << std::setw(3) << millis;
    }

    oss << 'Z';
    return oss.str();
}

std::string nowIso8601() {
    return formatIso8601(std::chrono::system_clock::now(), true);
}

std::chrono::steady_clock::time_point processStartTime() {
    static const auto start = std::chrono::steady_clock::now();
    return start;
}

double processUptimeSeconds() {
    auto elapsed = std::chrono::steady_clock::now() - processStartTime();
    return std::chrono::duration<double>(elapsed).count();
}

} // namespace utils
} // namespace fdr
