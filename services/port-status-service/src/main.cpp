/**
 * @file main.cpp
 * @brief Port Status Service entry point
 *
 * Reports which registered ports are occupied, which known services are
 * reachable and which project containers exist, and serves an operator
 * dashboard on top of those endpoints.
 */

#include "handlers/port_status_handler.h"
#include "infrastructure/app_config.h"

#include "fdr/status/container_collector.h"
#include "fdr/status/port_probe.h"
#include "fdr/status/service_directory.h"
#include "fdr/utils/time_utils.h"
#include "logger.h"

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

namespace {

void printBanner() {
    std::cout << std::endl;
    std::cout << "  FDR Port Status Service" << std::endl;
    std::cout << "  Version: 1.0.0" << std::endl;
    std::cout << std::endl;
}

} // namespace

int main(int /* argc */, char* /* argv */[]) {
    fdr::utils::processStartTime();
    printBanner();

    AppConfig appConfig;
    try {
        appConfig = AppConfig::fromEnvironment();
        fdr::common::Logger::initialize("port-status-service", appConfig.logLevel,
                                        !appConfig.logFile.empty(), appConfig.logFile);
        appConfig.validate();
    } catch (const std::exception& e) {
        spdlog::critical("Startup failed: {}", e.what());
        return 1;
    }

    spdlog::info("Starting Port Status Service...");
    spdlog::info("Registry: {} (probe timeout {} ms)", appConfig.registryFile, appConfig.probeTimeoutMs);
    spdlog::info("Containers: {} ps, filter name={}", appConfig.containerRuntime, appConfig.containerNameFilter);

    try {
        auto containerRuntime = std::make_shared<fdr::status::CliContainerRuntime>(
            appConfig.containerRuntime, std::chrono::seconds(appConfig.containerListTimeoutSec));

        handlers::PortStatusHandler handler(
            {appConfig.registryFile, appConfig.containerNameFilter},
            fdr::status::defaultServiceCatalog(),
            fdr::status::makeTcpProbe(appConfig.probeTimeoutMs),
            containerRuntime);

        auto& app = drogon::app();

        app.addListener("0.0.0.0", appConfig.serverPort)
           .setThreadNum(appConfig.threadNum);

        // Enable CORS
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                         const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
        });

        handler.registerRoutes(app);

        spdlog::info("Server starting on http://0.0.0.0:{}", appConfig.serverPort);
        app.run();

    } catch (const std::exception& e) {
        spdlog::critical("Application error: {}", e.what());
        return 1;
    }

    spdlog::info("Server stopped");
    fdr::common::Logger::flush();
    return 0;
}
