/**
 * @file health_aggregator.cpp
 * @brief Verdict precedence and concurrent checker execution
 */

#include "fdr/status/health_aggregator.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>

#include <future>

namespace fdr::status {

HealthVerdict aggregateVerdict(const std::vector<HealthVerdict>& verdicts) {
    bool anyVote = false;
    bool anyWarning = false;

    for (HealthVerdict verdict : verdicts) {
        switch (verdict) {
            case HealthVerdict::Unhealthy:
                return HealthVerdict::Unhealthy;
            case HealthVerdict::Warning:
                anyWarning = true;
                anyVote = true;
                break;
            case HealthVerdict::Healthy:
                anyVote = true;
                break;
            case HealthVerdict::Unavailable:
            case HealthVerdict::Unknown:
                break;
        }
    }

    if (!anyVote) {
        return HealthVerdict::Unknown;
    }
    return anyWarning ? HealthVerdict::Warning : HealthVerdict::Healthy;
}

AggregateReport aggregate(std::vector<ComponentReport> components) {
    std::vector<HealthVerdict> verdicts;
    verdicts.reserve(components.size());
    for (const auto& component : components) {
        verdicts.push_back(component.verdict);
    }

    AggregateReport report;
    report.overallVerdict = aggregateVerdict(verdicts);
    report.components = std::move(components);
    report.timestamp = std::chrono::system_clock::now();
    return report;
}

ComponentReport runChecker(IHealthChecker& checker) {
    try {
        return checker.check();
    } catch (const common::CapabilityException& e) {
        spdlog::warn("[HealthAggregator] {} unavailable: {}", checker.name(), e.what());
        ComponentReport report;
        report.name = checker.name();
        report.verdict = HealthVerdict::Unavailable;
        report.detail["error"] = e.what();
        report.timestamp = std::chrono::system_clock::now();
        return report;
    } catch (const std::exception& e) {
        spdlog::error("[HealthAggregator] {} check failed: {}", checker.name(), e.what());
        ComponentReport report;
        report.name = checker.name();
        report.verdict = HealthVerdict::Unhealthy;
        report.detail["error"] = e.what();
        report.timestamp = std::chrono::system_clock::now();
        return report;
    }
}

std::vector<ComponentReport> runCheckers(const std::vector<std::shared_ptr<IHealthChecker>>& checkers) {
    std::vector<std::future<ComponentReport>> pending;
    pending.reserve(checkers.size());

    for (const auto& checker : checkers) {
        pending.push_back(std::async(std::launch::async, [checker]() {
            return runChecker(*checker);
        }));
    }

    std::vector<ComponentReport> reports;
    reports.reserve(pending.size());
    for (auto& future : pending) {
        reports.push_back(future.get());
    }
    return reports;
}

} // namespace fdr::status
