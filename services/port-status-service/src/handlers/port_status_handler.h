#pragma once

/**
 * @file port_status_handler.h
 * @brief Port, service and container status endpoints
 *
 * Endpoints:
 * - GET /health
 * - GET /ports
 * - GET /services
 * - GET /containers
 * - GET /            (dashboard)
 *
 * Every request re-reads the registry and re-probes; nothing is cached.
 */

#include "fdr/status/container_collector.h"
#include "fdr/status/port_probe.h"
#include "fdr/status/types.h"

#include <drogon/HttpAppFramework.h>

#include <functional>
#include <memory>
#include <string>

namespace handlers {

struct PortStatusSettings {
    std::string registryFile;
    std::string containerNameFilter;
};

class PortStatusHandler {
public:
    /**
     * @param settings Registry path and container filter
     * @param catalog Service catalog (must outlive the handler)
     * @param probe Port probe
     * @param containers Container runtime (non-owning use, shared lifetime)
     */
    PortStatusHandler(PortStatusSettings settings,
                      const fdr::status::ServiceCatalog& catalog,
                      fdr::status::ProbeFn probe,
                      std::shared_ptr<fdr::status::IContainerRuntime> containers);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    void handleHealth(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handlePorts(const drogon::HttpRequestPtr& req,
                     std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleServices(const drogon::HttpRequestPtr& req,
                        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleContainers(const drogon::HttpRequestPtr& req,
                          std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleDashboard(const drogon::HttpRequestPtr& req,
                         std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    PortStatusSettings settings_;
    const fdr::status::ServiceCatalog& catalog_;
    fdr::status::ProbeFn probe_;
    std::shared_ptr<fdr::status::IContainerRuntime> containers_;
};

} // namespace handlers
