#pragma once

/**
 * @file health_handler.h
 * @brief Liveness, component health and metrics endpoints
 *
 * Endpoints:
 * - GET /health
 * - GET /health/detailed
 * - GET /health/database
 * - GET /health/system
 * - GET /health/services
 * - GET /metrics
 */

#include "fdr/status/health_checkers.h"
#include "fdr/status/system_metrics.h"

#include <drogon/HttpAppFramework.h>

#include <functional>
#include <memory>
#include <vector>

namespace handlers {

/// Checkers wired at startup; each is stateless and safe to share
struct HealthCheckSet {
    std::shared_ptr<fdr::status::IHealthChecker> database;
    std::shared_ptr<fdr::status::IHealthChecker> system;
    std::shared_ptr<fdr::status::IHealthChecker> services;
    std::shared_ptr<fdr::status::IHealthChecker> disk;
    std::shared_ptr<fdr::status::IHealthChecker> memory;

    /// Detailed report order
    std::vector<std::shared_ptr<fdr::status::IHealthChecker>> all() const {
        return {database, system, services, disk, memory};
    }
};

class HealthHandler {
public:
    HealthHandler(HealthCheckSet checks, std::shared_ptr<fdr::status::ISystemMetricsSource> metrics);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    void handleHealth(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleDetailed(const drogon::HttpRequestPtr& req,
                        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /// Single component report for /health/database, /health/system, /health/services
    void handleComponent(fdr::status::IHealthChecker& checker,
                         std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleMetrics(const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    HealthCheckSet checks_;
    std::shared_ptr<fdr::status::ISystemMetricsSource> metrics_;
};

} // namespace handlers
