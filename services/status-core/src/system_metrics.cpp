/**
 * @file system_metrics.cpp
 * @brief /proc and statvfs based system metrics
 */

#include "fdr/status/system_metrics.h"

#include <spdlog/spdlog.h>

#include <sys/statvfs.h>

#include <fstream>
#include <sstream>
#include <thread>

namespace fdr::status {

std::optional<CpuStat> parseCpuStat(std::istream& input) {
    std::string line;
    while (std::getline(input, line)) {
        std::istringstream iss(line);
        std::string label;
        if (!(iss >> label) || label != "cpu") {
            continue;
        }

        CpuStat stat;
        iss >> stat.user >> stat.nice >> stat.system >> stat.idle;
        if (iss.fail()) {
            return std::nullopt;
        }
        // Older kernels stop after idle; missing trailing fields stay 0
        iss >> stat.iowait >> stat.irq >> stat.softirq >> stat.steal;
        return stat;
    }
    return std::nullopt;
}

double cpuUsageBetween(const CpuStat& before, const CpuStat& after) {
    if (after.total() <= before.total()) {
        return 0.0;
    }
    uint64_t totalDiff = after.total() - before.total();
    uint64_t activeDiff = after.active() >= before.active() ? after.active() - before.active() : 0;
    return static_cast<double>(activeDiff) / static_cast<double>(totalDiff) * 100.0;
}

MemoryMetrics parseMeminfo(std::istream& input) {
    MemoryMetrics metrics;
    bool haveAvailable = false;
    uint64_t freeKb = 0;

    std::string line;
    while (std::getline(input, line)) {
        std::istringstream iss(line);
        std::string key;
        uint64_t valueKb = 0;

        if (!(iss >> key >> valueKb)) {
            continue;
        }
        if (key == "MemTotal:") {
            metrics.totalBytes = valueKb * 1024;
        } else if (key == "MemAvailable:") {
            metrics.availableBytes = valueKb * 1024;
            haveAvailable = true;
        } else if (key == "MemFree:") {
            freeKb = valueKb;
        }
    }

    // Kernels before 3.14 lack MemAvailable
    if (!haveAvailable) {
        metrics.availableBytes = freeKb * 1024;
    }

    if (metrics.totalBytes > 0 && metrics.availableBytes <= metrics.totalBytes) {
        metrics.usedBytes = metrics.totalBytes - metrics.availableBytes;
        metrics.usagePercent = static_cast<double>(metrics.usedBytes) /
                               static_cast<double>(metrics.totalBytes) * 100.0;
    }

    return metrics;
}

// --- ProcSystemMetricsSource ---

ProcSystemMetricsSource::ProcSystemMetricsSource(
    std::string diskMountPath,
    std::chrono::milliseconds cpuSampleWindow,
    std::string procRoot)
    : diskMountPath_(std::move(diskMountPath)),
      cpuSampleWindow_(cpuSampleWindow),
      procRoot_(std::move(procRoot)) {}

SystemSnapshot ProcSystemMetricsSource::collect() {
    SystemSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.cpu = collectCpuMetrics();
    snapshot.memory = collectMemoryMetrics();
    snapshot.disk = collectDiskMetrics();
    return snapshot;
}

std::optional<CpuStat> ProcSystemMetricsSource::readCpuStat() {
    std::ifstream statFile(procRoot_ + "/stat");
    if (!statFile.is_open()) {
        return std::nullopt;
    }
    return parseCpuStat(statFile);
}

CpuMetrics ProcSystemMetricsSource::collectCpuMetrics() {
    CpuMetrics metrics;

    try {
        auto before = readCpuStat();
        if (before) {
            std::this_thread::sleep_for(cpuSampleWindow_);
            auto after = readCpuStat();
            if (after) {
                metrics.usagePercent = cpuUsageBetween(*before, *after);
            }
        }

        std::ifstream loadavgFile(procRoot_ + "/loadavg");
        if (loadavgFile.is_open()) {
            loadavgFile >> metrics.load1min >> metrics.load5min >> metrics.load15min;
        }
    } catch (const std::exception& e) {
        spdlog::warn("[SystemMetrics] Failed to collect CPU metrics: {}", e.what());
    }

    return metrics;
}

MemoryMetrics ProcSystemMetricsSource::collectMemoryMetrics() {
    try {
        std::ifstream meminfo(procRoot_ + "/meminfo");
        if (meminfo.is_open()) {
            return parseMeminfo(meminfo);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[SystemMetrics] Failed to collect memory metrics: {}", e.what());
    }
    return {};
}

DiskMetrics ProcSystemMetricsSource::collectDiskMetrics() {
    DiskMetrics metrics;

    struct statvfs stat;
    if (statvfs(diskMountPath_.c_str(), &stat) != 0) {
        spdlog::warn("[SystemMetrics] statvfs({}) failed", diskMountPath_);
        return metrics;
    }

    uint64_t blockSize = stat.f_frsize;
    uint64_t totalBytes = static_cast<uint64_t>(stat.f_blocks) * blockSize;
    uint64_t freeBytes = static_cast<uint64_t>(stat.f_bfree) * blockSize;
    uint64_t availBytes = static_cast<uint64_t>(stat.f_bavail) * blockSize;
    uint64_t usedBytes = totalBytes - freeBytes;

    metrics.totalBytes = totalBytes;
    metrics.usedBytes = usedBytes;
    metrics.freeBytes = availBytes;

    // Same basis as df: used / (used + available to unprivileged users)
    uint64_t basis = usedBytes + availBytes;
    if (basis > 0) {
        metrics.usagePercent = static_cast<double>(usedBytes) / static_cast<double>(basis) * 100.0;
    }

    return metrics;
}

} // namespace fdr::status
