/**
 * @file status_json.cpp
 * @brief JSON response bodies
 */

#include "fdr/status/status_json.h"
#include "fdr/utils/time_utils.h"

#include <cmath>

namespace fdr::status {

namespace {

constexpr const char* CONTAINER_RUNNING_STATE = "running";

Json::Value roundedSeconds(double seconds) {
    return std::round(seconds * 100.0) / 100.0;
}

} // namespace

Json::Value toJson(const PortStatus& status) {
    Json::Value json;
    json["port"] = status.port;
    json["available"] = status.available;
    json["status"] = status.available ? "free" : "in_use";
    json["url"] = status.url ? Json::Value(*status.url) : Json::Value(Json::nullValue);
    return json;
}

Json::Value toJson(const RunningService& service) {
    Json::Value json;
    json["name"] = service.descriptor.displayName;
    json["icon"] = service.descriptor.icon;
    json["port"] = service.port;
    json["url"] = service.url;
    json["status"] = "running";
    json["health_check"] = service.healthCheckUrl;
    return json;
}

Json::Value toJson(const ContainerRecord& container) {
    Json::Value json;
    json["name"] = container.name;
    json["status"] = container.state;
    json["image"] = container.image;
    json["ports"] = container.ports;
    json["created"] = container.createdAt;
    return json;
}

Json::Value toJson(const ComponentReport& report) {
    Json::Value json = report.detail.isObject() ? report.detail : Json::Value(Json::objectValue);
    json["name"] = report.name;
    json["status"] = toString(report.verdict);
    json["timestamp"] = utils::formatIso8601(report.timestamp, true);
    return json;
}

Json::Value buildLivenessResponse(const ServiceIdentity& identity, double uptimeSeconds) {
    Json::Value json;
    json["status"] = "healthy";
    json["service"] = identity.name;
    json["timestamp"] = utils::nowIso8601();
    json["version"] = identity.version;
    json["uptime"] = roundedSeconds(uptimeSeconds);
    return json;
}

Json::Value buildPortsResponse(const std::vector<PortStatus>& ports) {
    Json::Value portsJson(Json::objectValue);
    int inUse = 0;

    for (const auto& status : ports) {
        portsJson[status.serviceKey] = toJson(status);
        if (!status.available) {
            ++inUse;
        }
    }

    Json::Value json;
    json["status"] = "success";
    json["timestamp"] = utils::nowIso8601();
    json["ports"] = portsJson;
    json["total_ports"] = static_cast<int>(portsJson.size());
    json["ports_in_use"] = inUse;
    return json;
}

Json::Value buildServicesResponse(const std::vector<RunningService>& services) {
    Json::Value servicesJson(Json::objectValue);
    for (const auto& service : services) {
        servicesJson[service.shortKey()] = toJson(service);
    }

    Json::Value json;
    json["status"] = "success";
    json["timestamp"] = utils::nowIso8601();
    json["services"] = servicesJson;
    json["total_services"] = static_cast<int>(servicesJson.size());
    // Only occupied ports are resolved, so every listed service is running
    json["running_services"] = static_cast<int>(servicesJson.size());
    return json;
}

Json::Value buildContainersResponse(const std::vector<ContainerRecord>& containers) {
    Json::Value list(Json::arrayValue);
    int running = 0;

    for (const auto& container : containers) {
        list.append(toJson(container));
        if (container.state == CONTAINER_RUNNING_STATE) {
            ++running;
        }
    }

    Json::Value json;
    json["status"] = "success";
    json["timestamp"] = utils::nowIso8601();
    json["containers"] = list;
    json["total_containers"] = static_cast<int>(containers.size());
    json["running_containers"] = running;
    return json;
}

Json::Value buildDetailedResponse(const AggregateReport& report,
                                  const ServiceIdentity& identity,
                                  double uptimeSeconds) {
    Json::Value components(Json::arrayValue);
    for (const auto& component : report.components) {
        components.append(toJson(component));
    }

    Json::Value json;
    json["status"] = toString(report.overallVerdict);
    json["service"] = identity.name;
    json["timestamp"] = utils::formatIso8601(report.timestamp, true);
    json["version"] = identity.version;
    json["uptime"] = roundedSeconds(uptimeSeconds);
    json["components"] = components;
    return json;
}

Json::Value buildErrorResponse(const std::string& message) {
    Json::Value json;
    json["status"] = "error";
    json["message"] = message;
    json["timestamp"] = utils::nowIso8601();
    return json;
}

} // namespace fdr::status
