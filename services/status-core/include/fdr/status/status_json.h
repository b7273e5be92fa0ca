#pragma once

/**
 * @file status_json.h
 * @brief JSON response bodies for the status and health endpoints
 *
 * Builders are transport independent so the wire shapes can be tested
 * without an HTTP server. All timestamps are ISO 8601 UTC.
 *
 * @date 2026-10-18
 */

#include "fdr/status/types.h"

#include <json/json.h>

#include <string>
#include <vector>

namespace fdr::status {

/// Identity reported by /health
struct ServiceIdentity {
    std::string name;
    std::string version;
};

// --- Entity projections ---

/// {port, available, status:"free"|"in_use", url|null}
Json::Value toJson(const PortStatus& status);

/// {name, icon, port, url, status:"running", health_check}
Json::Value toJson(const RunningService& service);

/// {name, status, image, ports, created}
Json::Value toJson(const ContainerRecord& container);

/// detail members plus name, status and timestamp
Json::Value toJson(const ComponentReport& report);

// --- Response bodies ---

/// {status:"healthy", service, timestamp, version, uptime}
Json::Value buildLivenessResponse(const ServiceIdentity& identity, double uptimeSeconds);

/// {status:"success", timestamp, ports:{KEY:...}, total_ports, ports_in_use}
Json::Value buildPortsResponse(const std::vector<PortStatus>& ports);

/// {status:"success", timestamp, services:{shortKey:...}, total_services, running_services}
Json::Value buildServicesResponse(const std::vector<RunningService>& services);

/// {status:"success", timestamp, containers:[...], total_containers, running_containers}
Json::Value buildContainersResponse(const std::vector<ContainerRecord>& containers);

/// {status, service, timestamp, version, uptime, components:[...]}
Json::Value buildDetailedResponse(const AggregateReport& report,
                                  const ServiceIdentity& identity,
                                  double uptimeSeconds);

/// {status:"error", message, timestamp}
Json::Value buildErrorResponse(const std::string& message);

} // namespace fdr::status
