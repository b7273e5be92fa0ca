/**
 * @file health_checkers.cpp
 * @brief Database and resource health checks
 */

#include "fdr/status/health_checkers.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace fdr::status {

namespace {

int severity(HealthVerdict verdict) {
    switch (verdict) {
        case HealthVerdict::Unhealthy: return 2;
        case HealthVerdict::Warning:   return 1;
        default:                       return 0;
    }
}

/// Percentages are reported with two decimals
double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

void validatePair(const std::string& resource, const ResourceThresholds& t) {
    if (!std::isfinite(t.warningPercent) || !std::isfinite(t.criticalPercent) ||
        t.warningPercent < 0 || t.criticalPercent > 100 ||
        t.warningPercent >= t.criticalPercent) {
        throw fdr::common::ConfigException(
            resource + " thresholds must satisfy 0 <= warning < critical <= 100");
    }
}

} // namespace

HealthVerdict classify(double value, const ResourceThresholds& thresholds) {
    if (value > thresholds.criticalPercent) {
        return HealthVerdict::Unhealthy;
    }
    if (value > thresholds.warningPercent) {
        return HealthVerdict::Warning;
    }
    return HealthVerdict::Healthy;
}

void validateThresholds(const HealthThresholds& thresholds) {
    validatePair("CPU", thresholds.cpu);
    validatePair("MEMORY", thresholds.memory);
    validatePair("DISK", thresholds.disk);
}

HealthVerdict worseOf(HealthVerdict a, HealthVerdict b) {
    return severity(b) > severity(a) ? b : a;
}

// --- DatabaseHealthChecker ---

DatabaseHealthChecker::DatabaseHealthChecker(std::vector<std::shared_ptr<IDatabaseProbe>> probes)
    : probes_(std::move(probes)) {}

ComponentReport DatabaseHealthChecker::check() {
    ComponentReport report;
    report.name = name();

    bool anyHealthy = false;
    bool allUnavailable = true;

    for (const auto& probe : probes_) {
        ProbeResult result;
        try {
            result = probe->probe();
        } catch (const fdr::common::CapabilityException& e) {
            spdlog::debug("[DatabaseHealth] {} cannot run: {}", probe->name(), e.what());
            result.verdict = HealthVerdict::Unavailable;
            result.detail["type"] = probe->name();
            result.detail["error"] = e.what();
        } catch (const std::exception& e) {
            spdlog::warn("[DatabaseHealth] {} probe failed: {}", probe->name(), e.what());
            result.verdict = HealthVerdict::Unhealthy;
            result.detail["type"] = probe->name();
            result.detail["error"] = e.what();
        }
        result.detail["status"] = toString(result.verdict);
        report.detail[probe->name()] = result.detail;

        if (result.verdict == HealthVerdict::Healthy) {
            anyHealthy = true;
        }
        if (result.verdict != HealthVerdict::Unavailable) {
            allUnavailable = false;
        }
    }

    if (anyHealthy) {
        report.verdict = HealthVerdict::Healthy;
    } else if (allUnavailable) {
        report.verdict = HealthVerdict::Unavailable;
    } else {
        report.verdict = HealthVerdict::Unhealthy;
        spdlog::warn("[DatabaseHealth] No database reachable");
    }

    report.timestamp = std::chrono::system_clock::now();
    return report;
}

// --- SystemHealthChecker ---

SystemHealthChecker::SystemHealthChecker(
    std::shared_ptr<ISystemMetricsSource> source, HealthThresholds thresholds)
    : source_(std::move(source)), thresholds_(thresholds) {}

ComponentReport SystemHealthChecker::check() {
    SystemSnapshot snapshot = source_->collect();

    HealthVerdict verdict = classify(snapshot.cpu.usagePercent, thresholds_.cpu);
    verdict = worseOf(verdict, classify(snapshot.memory.usagePercent, thresholds_.memory));
    verdict = worseOf(verdict, classify(snapshot.disk.usagePercent, thresholds_.disk));

    ComponentReport report;
    report.name = name();
    report.verdict = verdict;
    report.detail["cpu_percent"] = round2(snapshot.cpu.usagePercent);
    report.detail["memory_percent"] = round2(snapshot.memory.usagePercent);
    report.detail["memory_available"] = static_cast<Json::UInt64>(snapshot.memory.availableBytes);
    report.detail["disk_percent"] = round2(snapshot.disk.usagePercent);
    report.detail["disk_free"] = static_cast<Json::UInt64>(snapshot.disk.freeBytes);

    Json::Value load(Json::arrayValue);
    load.append(snapshot.cpu.load1min);
    load.append(snapshot.cpu.load5min);
    load.append(snapshot.cpu.load15min);
    report.detail["load_average"] = load;

    report.timestamp = std::chrono::system_clock::now();
    return report;
}

// --- DiskHealthChecker ---

DiskHealthChecker::DiskHealthChecker(
    std::shared_ptr<ISystemMetricsSource> source, ResourceThresholds thresholds)
    : source_(std::move(source)), thresholds_(thresholds) {}

ComponentReport DiskHealthChecker::check() {
    DiskMetrics disk = source_->collect().disk;

    ComponentReport report;
    report.name = name();
    report.verdict = classify(disk.usagePercent, thresholds_);
    report.detail["usage_percent"] = round2(disk.usagePercent);
    report.detail["free_bytes"] = static_cast<Json::UInt64>(disk.freeBytes);
    report.detail["total_bytes"] = static_cast<Json::UInt64>(disk.totalBytes);
    report.detail["used_bytes"] = static_cast<Json::UInt64>(disk.usedBytes);
    report.timestamp = std::chrono::system_clock::now();
    return report;
}

// --- MemoryHealthChecker ---

MemoryHealthChecker::MemoryHealthChecker(
    std::shared_ptr<ISystemMetricsSource> source, ResourceThresholds thresholds)
    : source_(std::move(source)), thresholds_(thresholds) {}

ComponentReport MemoryHealthChecker::check() {
    MemoryMetrics memory = source_->collect().memory;

    ComponentReport report;
    report.name = name();
    report.verdict = classify(memory.usagePercent, thresholds_);
    report.detail["usage_percent"] = round2(memory.usagePercent);
    report.detail["available_bytes"] = static_cast<Json::UInt64>(memory.availableBytes);
    report.detail["total_bytes"] = static_cast<Json::UInt64>(memory.totalBytes);
    report.detail["used_bytes"] = static_cast<Json::UInt64>(memory.usedBytes);
    report.timestamp = std::chrono::system_clock::now();
    return report;
}

} // namespace fdr::status
