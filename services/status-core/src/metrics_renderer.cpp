/**
 * @file metrics_renderer.cpp
 * @brief Prometheus text exposition
 */

#include "fdr/status/metrics_renderer.h"

#include <iomanip>
#include <sstream>

namespace fdr::status {

namespace {

void writeMetric(std::ostringstream& out,
                 const char* name,
                 const char* help,
                 const char* type,
                 double value) {
    out << "# HELP " << name << ' ' << help << '\n';
    out << "# TYPE " << name << ' ' << type << '\n';
    out << name << ' ' << value << '\n';
    out << '\n';
}

} // namespace

std::string renderMetrics(const AggregateReport& report,
                          const SystemSnapshot& snapshot,
                          double uptimeSeconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    writeMetric(out, "fdr_cpu_usage_percent", "CPU usage percentage", "gauge",
                snapshot.cpu.usagePercent);
    writeMetric(out, "fdr_memory_usage_percent", "Memory usage percentage", "gauge",
                snapshot.memory.usagePercent);
    writeMetric(out, "fdr_disk_usage_percent", "Disk usage percentage", "gauge",
                snapshot.disk.usagePercent);
    writeMetric(out, "fdr_uptime_seconds", "Service uptime in seconds", "counter",
                uptimeSeconds);

    // Integer gauge, not affected by the fixed precision above
    int healthy = report.overallVerdict == HealthVerdict::Healthy ? 1 : 0;
    out << "# HELP fdr_health_status Health status (1=healthy, 0=not healthy)\n";
    out << "# TYPE fdr_health_status gauge\n";
    out << "fdr_health_status " << healthy << '\n';
    out << '\n';

    return out.str();
}

} // namespace fdr::status
