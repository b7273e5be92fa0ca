#pragma once

/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Formatting helpers for response timestamps and process uptime.
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#include <string>
#include <chrono>

namespace fdr {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 string (UTC)
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-10-18T12:34:56Z" or
 *         "2026-10-18T12:34:56.789Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Current time as ISO 8601 string with milliseconds
 */
std::string nowIso8601();

/**
 * @brief Monotonic instant recorded the first time this is called
 *
 * Called once from main() so that processUptimeSeconds() measures from
 * process start.
 */
std::chrono::steady_clock::time_point processStartTime();

/**
 * @brief Seconds elapsed since processStartTime()
 */
double processUptimeSeconds();

} // namespace utils
} // namespace fdr
