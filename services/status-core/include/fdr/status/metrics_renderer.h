#pragma once

/**
 * @file metrics_renderer.h
 * @brief Prometheus text exposition of the health state
 *
 * @date 2026-10-18
 */

#include "fdr/status/types.h"

#include <string>

namespace fdr::status {

/// Content-Type of renderMetrics() output
inline constexpr const char* METRICS_CONTENT_TYPE = "text/plain; version=0.0.4";

/**
 * @brief Render the fixed metric set
 *
 * Blocks appear in this order, each with HELP and TYPE lines and followed by
 * a blank line: fdr_cpu_usage_percent, fdr_memory_usage_percent,
 * fdr_disk_usage_percent, fdr_uptime_seconds, fdr_health_status.
 * fdr_health_status is 1 only when the overall verdict is Healthy.
 */
std::string renderMetrics(const AggregateReport& report,
                          const SystemSnapshot& snapshot,
                          double uptimeSeconds);

} // namespace fdr::status
