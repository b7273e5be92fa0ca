#pragma once

/**
 * @file types.h
 * @brief Data model of the status engine
 *
 * Every value here is built fresh for one request and dropped after the
 * response is sent. Only ServiceCatalog and HealthThresholds are long-lived,
 * and both are immutable after startup.
 *
 * @date 2026-10-18
 */

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fdr::status {

/// Suffix every registry key must carry to be treated as a port assignment
inline constexpr const char* PORT_KEY_SUFFIX = "_PORT";

// --- Port registry ---

/// serviceKey (e.g. "FRONTEND_PORT") -> assigned port
using PortRegistry = std::map<std::string, int>;

struct PortStatus {
    std::string serviceKey;
    int port = 0;
    bool available = true;           ///< true = nothing accepted the probe connection
    std::optional<std::string> url;  ///< set only when !available
};

// --- Service directory ---

struct ServiceDescriptor {
    std::string serviceKey;
    std::string displayName;
    std::string icon;
    std::string rootPath;
};

using ServiceCatalog = std::vector<ServiceDescriptor>;

struct RunningService {
    ServiceDescriptor descriptor;
    int port = 0;
    std::string url;
    std::string healthCheckUrl;

    /// "FRONTEND_PORT" -> "frontend"
    std::string shortKey() const;
};

// --- Health ---

enum class HealthVerdict {
    Healthy,
    Warning,
    Unhealthy,
    Unavailable,  ///< the check could not run at all
    Unknown
};

std::string toString(HealthVerdict verdict);

/// Inverse of toString; anything unrecognised maps to Unknown
HealthVerdict verdictFromString(const std::string& value);

struct ComponentReport {
    std::string name;
    HealthVerdict verdict = HealthVerdict::Unknown;
    Json::Value detail{Json::objectValue};
    std::chrono::system_clock::time_point timestamp;
};

struct AggregateReport {
    HealthVerdict overallVerdict = HealthVerdict::Unknown;
    std::vector<ComponentReport> components;
    std::chrono::system_clock::time_point timestamp;
};

/// Warning/critical pair for one resource, in percent
struct ResourceThresholds {
    double warningPercent = 70.0;
    double criticalPercent = 90.0;
};

struct HealthThresholds {
    ResourceThresholds cpu{70.0, 90.0};
    ResourceThresholds memory{70.0, 90.0};
    ResourceThresholds disk{85.0, 95.0};
};

// --- System metrics ---

struct CpuMetrics {
    double usagePercent = 0.0;
    double load1min = 0.0;
    double load5min = 0.0;
    double load15min = 0.0;
};

struct MemoryMetrics {
    uint64_t totalBytes = 0;
    uint64_t usedBytes = 0;
    uint64_t availableBytes = 0;
    double usagePercent = 0.0;
};

struct DiskMetrics {
    uint64_t totalBytes = 0;
    uint64_t usedBytes = 0;
    uint64_t freeBytes = 0;
    double usagePercent = 0.0;
};

struct SystemSnapshot {
    std::chrono::system_clock::time_point timestamp;
    CpuMetrics cpu;
    MemoryMetrics memory;
    DiskMetrics disk;
};

// --- Containers ---

struct ContainerRecord {
    std::string name;
    std::string state;
    std::string image;
    std::string ports;
    std::string createdAt;
};

} // namespace fdr::status
