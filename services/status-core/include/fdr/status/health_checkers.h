#pragma once

/**
 * @file health_checkers.h
 * @brief Independent component health checks
 *
 * @date 2026-10-18
 */

#include "fdr/status/database_probes.h"
#include "fdr/status/system_metrics.h"
#include "fdr/status/types.h"

#include <memory>
#include <string>
#include <vector>

namespace fdr::status {

/**
 * @brief One component health check
 *
 * check() may throw; callers run it through runChecker() which converts the
 * exception into a report.
 */
class IHealthChecker {
public:
    virtual ~IHealthChecker() = default;

    virtual std::string name() const = 0;
    virtual ComponentReport check() = 0;
};

/**
 * @brief Classify a utilization value
 *
 * value > critical -> Unhealthy, value > warning -> Warning, else Healthy
 */
HealthVerdict classify(double value, const ResourceThresholds& thresholds);

/**
 * @brief Reject thresholds classify() cannot order
 *
 * Each pair must be finite with 0 <= warning < critical <= 100.
 *
 * @throws fdr::common::ConfigException naming the offending resource
 */
void validateThresholds(const HealthThresholds& thresholds);

/// Worse of two verdicts among Healthy/Warning/Unhealthy
HealthVerdict worseOf(HealthVerdict a, HealthVerdict b);

/**
 * @brief Primary database first, fallback second
 *
 * Healthy when any probe is healthy. Unavailable when every probe is
 * unavailable. Unhealthy otherwise.
 */
class DatabaseHealthChecker : public IHealthChecker {
public:
    explicit DatabaseHealthChecker(std::vector<std::shared_ptr<IDatabaseProbe>> probes);

    std::string name() const override { return "database"; }
    ComponentReport check() override;

private:
    std::vector<std::shared_ptr<IDatabaseProbe>> probes_;
};

/// Worst of CPU, memory and disk
class SystemHealthChecker : public IHealthChecker {
public:
    SystemHealthChecker(std::shared_ptr<ISystemMetricsSource> source, HealthThresholds thresholds);

    std::string name() const override { return "system"; }
    ComponentReport check() override;

private:
    std::shared_ptr<ISystemMetricsSource> source_;
    HealthThresholds thresholds_;
};

class DiskHealthChecker : public IHealthChecker {
public:
    DiskHealthChecker(std::shared_ptr<ISystemMetricsSource> source, ResourceThresholds thresholds);

    std::string name() const override { return "disk"; }
    ComponentReport check() override;

private:
    std::shared_ptr<ISystemMetricsSource> source_;
    ResourceThresholds thresholds_;
};

class MemoryHealthChecker : public IHealthChecker {
public:
    MemoryHealthChecker(std::shared_ptr<ISystemMetricsSource> source, ResourceThresholds thresholds);

    std::string name() const override { return "memory"; }
    ComponentReport check() override;

private:
    std::shared_ptr<ISystemMetricsSource> source_;
    ResourceThresholds thresholds_;
};

} // namespace fdr::status
