/**
 * @file port_status_handler.cpp
 * @brief PortStatusHandler implementation
 */

#include "port_status_handler.h"
#include "dashboard_page.h"

#include "fdr/status/registry_reader.h"
#include "fdr/status/service_directory.h"
#include "fdr/status/status_json.h"
#include "fdr/utils/time_utils.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace handlers {

namespace {

const fdr::status::ServiceIdentity SERVICE_IDENTITY{"port-status-service", "1.0.0"};

drogon::HttpResponsePtr errorResponse(const std::string& message) {
    auto response = drogon::HttpResponse::newHttpJsonResponse(fdr::status::buildErrorResponse(message));
    response->setStatusCode(drogon::k500InternalServerError);
    return response;
}

} // namespace

PortStatusHandler::PortStatusHandler(PortStatusSettings settings,
                                     const fdr::status::ServiceCatalog& catalog,
                                     fdr::status::ProbeFn probe,
                                     std::shared_ptr<fdr::status::IContainerRuntime> containers)
    : settings_(std::move(settings)),
      catalog_(catalog),
      probe_(std::move(probe)),
      containers_(std::move(containers)) {

    if (!probe_) {
        throw std::invalid_argument("PortStatusHandler: probe cannot be empty");
    }
    if (!containers_) {
        throw std::invalid_argument("PortStatusHandler: container runtime cannot be nullptr");
    }

    spdlog::info("[PortStatusHandler] Initialized (registry={}, catalog={} entries)",
                 settings_.registryFile, catalog_.size());
}

void PortStatusHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /health
    app.registerHandler(
        "/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /ports
    app.registerHandler(
        "/ports",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handlePorts(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /services
    app.registerHandler(
        "/services",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleServices(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /containers
    app.registerHandler(
        "/containers",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleContainers(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /
    app.registerHandler(
        "/",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleDashboard(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[PortStatusHandler] Routes registered: /health, /ports, /services, /containers, /");
}

void PortStatusHandler::handleHealth(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value body = fdr::status::buildLivenessResponse(
        SERVICE_IDENTITY, fdr::utils::processUptimeSeconds());
    callback(drogon::HttpResponse::newHttpJsonResponse(body));
}

void PortStatusHandler::handlePorts(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        auto registry = fdr::status::readRegistry(settings_.registryFile);
        auto ports = fdr::status::checkPorts(registry, probe_);
        callback(drogon::HttpResponse::newHttpJsonResponse(fdr::status::buildPortsResponse(ports)));
    } catch (const std::exception& e) {
        spdlog::error("[PortStatusHandler] handlePorts failed: {}", e.what());
        callback(errorResponse(std::string("Failed to get port status: ") + e.what()));
    }
}

void PortStatusHandler::handleServices(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        auto registry = fdr::status::readRegistry(settings_.registryFile);
        auto services = fdr::status::resolveServices(registry, catalog_, probe_);
        callback(drogon::HttpResponse::newHttpJsonResponse(fdr::status::buildServicesResponse(services)));
    } catch (const std::exception& e) {
        spdlog::error("[PortStatusHandler] handleServices failed: {}", e.what());
        callback(errorResponse(std::string("Failed to get service discovery: ") + e.what()));
    }
}

void PortStatusHandler::handleContainers(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        auto containers = containers_->listContainers(settings_.containerNameFilter);
        callback(drogon::HttpResponse::newHttpJsonResponse(fdr::status::buildContainersResponse(containers)));
    } catch (const std::exception& e) {
        spdlog::error("[PortStatusHandler] handleContainers failed: {}", e.what());
        callback(errorResponse(std::string("Failed to get container status: ") + e.what()));
    }
}

void PortStatusHandler::handleDashboard(
    const drogon::HttpRequestPtr&,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto response = drogon::HttpResponse::newHttpResponse();
    response->setContentTypeCode(drogon::CT_TEXT_HTML);
    response->setBody(std::string(dashboardHtml()));
    callback(response);
}

} // namespace handlers
