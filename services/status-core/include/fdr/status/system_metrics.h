#pragma once

/**
 * @file system_metrics.h
 * @brief Instantaneous CPU, memory and disk utilization
 *
 * @date 2026-10-18
 */

#include "fdr/status/types.h"

#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace fdr::status {

/**
 * @brief Source of system snapshots
 *
 * Health checkers and the metrics endpoint depend on this seam so tests can
 * feed fixed utilization values.
 */
class ISystemMetricsSource {
public:
    virtual ~ISystemMetricsSource() = default;

    virtual SystemSnapshot collect() = 0;
};

/// Aggregate "cpu" line of /proc/stat
struct CpuStat {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    uint64_t total() const {
        return user + nice + system + idle + iowait + irq + softirq + steal;
    }

    uint64_t active() const {
        return user + nice + system + irq + softirq + steal;
    }
};

/**
 * @brief Parse the first "cpu" line of /proc/stat content
 */
std::optional<CpuStat> parseCpuStat(std::istream& input);

/**
 * @brief Busy percentage between two samples (0 when no ticks elapsed)
 */
double cpuUsageBetween(const CpuStat& before, const CpuStat& after);

/**
 * @brief Parse /proc/meminfo content
 *
 * used = MemTotal - MemAvailable
 */
MemoryMetrics parseMeminfo(std::istream& input);

/**
 * @brief Reads /proc and statvfs
 *
 * Each collect() takes two /proc/stat samples cpuSampleWindow apart, so no
 * state survives between calls.
 */
class ProcSystemMetricsSource : public ISystemMetricsSource {
public:
    explicit ProcSystemMetricsSource(
        std::string diskMountPath = "/",
        std::chrono::milliseconds cpuSampleWindow = std::chrono::milliseconds(1000),
        std::string procRoot = "/proc");

    SystemSnapshot collect() override;

private:
    CpuMetrics collectCpuMetrics();
    MemoryMetrics collectMemoryMetrics();
    DiskMetrics collectDiskMetrics();

    std::optional<CpuStat> readCpuStat();

    std::string diskMountPath_;
    std::chrono::milliseconds cpuSampleWindow_;
    std::string procRoot_;
};

} // namespace fdr::status
