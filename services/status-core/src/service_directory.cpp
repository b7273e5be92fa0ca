/**
 * @file service_directory.cpp
 * @brief Port status projection and running-service resolution
 */

#include "fdr/status/service_directory.h"

#include <spdlog/spdlog.h>

#include <string>

namespace fdr::status {

namespace {

std::string localUrl(int port, const std::string& path = "") {
    return "http://localhost:" + std::to_string(port) + path;
}

} // namespace

const ServiceCatalog& defaultServiceCatalog() {
    static const ServiceCatalog catalog = {
        {"FRONTEND_PORT",        "Frontend",        "🌐", "/"},
        {"BACKEND_PORT",         "Backend API",     "🔧", "/health"},
        {"GRAFANA_PORT",         "Grafana",         "📈", "/"},
        {"PROMETHEUS_PORT",      "Prometheus",      "📊", "/"},
        {"ADMINER_PORT",         "Database Admin",  "🗄️", "/"},
        {"REDIS_COMMANDER_PORT", "Redis Commander", "🔴", "/"},
        {"MAILHOG_WEB_PORT",     "Mailhog",         "📧", "/"},
        {"DEV_DASHBOARD_PORT",   "Dev Dashboard",   "🛠️", "/"},
    };
    return catalog;
}

std::vector<PortStatus> checkPorts(const PortRegistry& registry, const ProbeFn& probe) {
    std::vector<PortStatus> statuses;
    statuses.reserve(registry.size());

    for (const auto& [key, port] : registry) {
        PortStatus status;
        status.serviceKey = key;
        status.port = port;
        status.available = probe(port);
        if (!status.available) {
            status.url = localUrl(port);
        }
        statuses.push_back(std::move(status));
    }

    return statuses;
}

std::vector<RunningService> resolveServices(
    const PortRegistry& registry,
    const ServiceCatalog& catalog,
    const ProbeFn& probe) {

    std::vector<RunningService> running;

    for (const auto& descriptor : catalog) {
        auto it = registry.find(descriptor.serviceKey);
        if (it == registry.end()) {
            continue;
        }

        int port = it->second;
        if (probe(port)) {
            spdlog::debug("[ServiceDirectory] {} not listening on {}", descriptor.serviceKey, port);
            continue;
        }

        RunningService service;
        service.descriptor = descriptor;
        service.port = port;
        service.url = localUrl(port, descriptor.rootPath);
        service.healthCheckUrl = localUrl(port, "/health");
        running.push_back(std::move(service));
    }

    return running;
}

} // namespace fdr::status
