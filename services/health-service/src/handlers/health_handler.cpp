/**
 * @file health_handler.cpp
 * @brief HealthHandler implementation
 */

#include "health_handler.h"

#include "fdr/status/health_aggregator.h"
#include "fdr/status/metrics_renderer.h"
#include "fdr/status/status_json.h"
#include "fdr/utils/time_utils.h"

#include <spdlog/spdlog.h>

#include <future>
#include <stdexcept>

namespace handlers {

namespace {

const fdr::status::ServiceIdentity SERVICE_IDENTITY{"free-deep-research-backend", "3.0.0"};

drogon::HttpResponsePtr errorResponse(const std::string& message) {
    auto response = drogon::HttpResponse::newHttpJsonResponse(fdr::status::buildErrorResponse(message));
    response->setStatusCode(drogon::k500InternalServerError);
    return response;
}

} // namespace

HealthHandler::HealthHandler(HealthCheckSet checks,
                             std::shared_ptr<fdr::status::ISystemMetricsSource> metrics)
    : checks_(std::move(checks)), metrics_(std::move(metrics)) {

    for (const auto& checker : checks_.all()) {
        if (!checker) {
            throw std::invalid_argument("HealthHandler: checker cannot be nullptr");
        }
    }
    if (!metrics_) {
        throw std::invalid_argument("HealthHandler: metrics source cannot be nullptr");
    }

    spdlog::info("[HealthHandler] Initialized with {} checkers", checks_.all().size());
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /health
    app.registerHandler(
        "/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /health/detailed
    app.registerHandler(
        "/health/detailed",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleDetailed(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /health/database
    app.registerHandler(
        "/health/database",
        [this](const drogon::HttpRequestPtr&,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleComponent(*checks_.database, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /health/system
    app.registerHandler(
        "/health/system",
        [this](const drogon::HttpRequestPtr&,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleComponent(*checks_.system, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /health/services
    app.registerHandler(
        "/health/services",
        [this](const drogon::HttpRequestPtr&,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleComponent(*checks_.services, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /metrics
    app.registerHandler(
        "/metrics",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleMetrics(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[HealthHandler] Routes registered: /health, /health/detailed, "
                 "/health/database, /health/system, /health/services, /metrics");
}

void HealthHandler::handleHealth(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value body = fdr::status::buildLivenessResponse(
        SERVICE_IDENTITY, fdr::utils::processUptimeSeconds());
    callback(drogon::HttpResponse::newHttpJsonResponse(body));
}

void HealthHandler::handleDetailed(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        auto report = fdr::status::aggregate(fdr::status::runCheckers(checks_.all()));
        Json::Value body = fdr::status::buildDetailedResponse(
            report, SERVICE_IDENTITY, fdr::utils::processUptimeSeconds());
        callback(drogon::HttpResponse::newHttpJsonResponse(body));
    } catch (const std::exception& e) {
        spdlog::error("[HealthHandler] handleDetailed failed: {}", e.what());
        callback(errorResponse(std::string("Detailed health check failed: ") + e.what()));
    }
}

void HealthHandler::handleComponent(
    fdr::status::IHealthChecker& checker,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        auto report = fdr::status::runChecker(checker);
        callback(drogon::HttpResponse::newHttpJsonResponse(fdr::status::toJson(report)));
    } catch (const std::exception& e) {
        spdlog::error("[HealthHandler] {} check failed: {}", checker.name(), e.what());
        callback(errorResponse(checker.name() + " health check failed: " + e.what()));
    }
}

void HealthHandler::handleMetrics(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        // The snapshot sample window overlaps the checkers
        auto snapshotFuture = std::async(std::launch::async, [this]() {
            return metrics_->collect();
        });
        auto report = fdr::status::aggregate(fdr::status::runCheckers(checks_.all()));
        auto snapshot = snapshotFuture.get();

        auto response = drogon::HttpResponse::newHttpResponse();
        response->setContentTypeString(fdr::status::METRICS_CONTENT_TYPE);
        response->setBody(fdr::status::renderMetrics(report, snapshot, fdr::utils::processUptimeSeconds()));
        callback(response);
    } catch (const std::exception& e) {
        spdlog::error("[HealthHandler] handleMetrics failed: {}", e.what());
        callback(errorResponse(std::string("Metrics generation failed: ") + e.what()));
    }
}

} // namespace handlers
