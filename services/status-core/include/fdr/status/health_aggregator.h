#pragma once

/**
 * @file health_aggregator.h
 * @brief Combines component reports into one verdict
 *
 * @date 2026-10-18
 */

#include "fdr/status/health_checkers.h"
#include "fdr/status/types.h"

#include <memory>
#include <vector>

namespace fdr::status {

/**
 * @brief Precedence rule: unhealthy > warning > healthy
 *
 * Unavailable and Unknown do not vote. With no voting verdict (including an
 * empty input) the result is Unknown.
 */
HealthVerdict aggregateVerdict(const std::vector<HealthVerdict>& verdicts);

/// Overall verdict over the reports; component order is preserved
AggregateReport aggregate(std::vector<ComponentReport> components);

/**
 * @brief Run one checker, converting exceptions into a report
 *
 * CapabilityException -> Unavailable, any other std::exception -> Unhealthy.
 * The message lands in detail.error.
 */
ComponentReport runChecker(IHealthChecker& checker);

/// Run all checkers concurrently; results follow checker order
std::vector<ComponentReport> runCheckers(const std::vector<std::shared_ptr<IHealthChecker>>& checkers);

} // namespace fdr::status
