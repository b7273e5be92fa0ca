/**
 * @file main.cpp
 * @brief Health Service entry point
 *
 * Liveness, per-component health (database, system resources, external
 * APIs), the aggregate report and a Prometheus metrics endpoint.
 */

#include "handlers/health_handler.h"
#include "infrastructure/app_config.h"

#include "fdr/status/database_probes.h"
#include "fdr/status/external_services.h"
#include "fdr/status/health_checkers.h"
#include "fdr/status/system_metrics.h"
#include "fdr/utils/time_utils.h"
#include "logger.h"

#include <curl/curl.h>
#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

namespace {

void printBanner() {
    std::cout << std::endl;
    std::cout << "  FDR Health Service" << std::endl;
    std::cout << "  Version: 3.0.0" << std::endl;
    std::cout << std::endl;
}

handlers::HealthCheckSet buildChecks(const AppConfig& config,
                                     const std::shared_ptr<fdr::status::ISystemMetricsSource>& metrics) {
    using namespace fdr::status;

    std::vector<std::shared_ptr<IDatabaseProbe>> probes = {
        std::make_shared<PostgresProbe>(config.postgres),
        std::make_shared<SqliteProbe>(config.sqlitePath),
    };

    handlers::HealthCheckSet checks;
    checks.database = std::make_shared<DatabaseHealthChecker>(std::move(probes));
    checks.system = std::make_shared<SystemHealthChecker>(metrics, config.thresholds);
    checks.services = std::make_shared<ExternalServicesChecker>(
        defaultExternalDependencies(), config.externalCheckTimeoutSec);
    checks.disk = std::make_shared<DiskHealthChecker>(metrics, config.thresholds.disk);
    checks.memory = std::make_shared<MemoryHealthChecker>(metrics, config.thresholds.memory);
    return checks;
}

} // namespace

int main(int /* argc */, char* /* argv */[]) {
    fdr::utils::processStartTime();
    printBanner();

    AppConfig appConfig;
    try {
        appConfig = AppConfig::fromEnvironment();
        fdr::common::Logger::initialize("health-service", appConfig.logLevel,
                                        !appConfig.logFile.empty(), appConfig.logFile);
        appConfig.validate();
    } catch (const std::exception& e) {
        spdlog::critical("Startup failed: {}", e.what());
        return 1;
    }

    // Must precede any worker thread creating a curl handle
    curl_global_init(CURL_GLOBAL_DEFAULT);

    spdlog::info("Starting Health Service...");
    spdlog::info("PostgreSQL: {}:{}/{}", appConfig.postgres.host, appConfig.postgres.port,
                 appConfig.postgres.database);
    spdlog::info("SQLite fallback: {}", appConfig.sqlitePath);

    int exitCode = 0;
    try {
        auto metrics = std::make_shared<fdr::status::ProcSystemMetricsSource>(
            appConfig.diskMountPath, std::chrono::milliseconds(appConfig.cpuSampleMs));

        handlers::HealthHandler handler(buildChecks(appConfig, metrics), metrics);

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
        exitCode = 1;
    }

    curl_global_cleanup();
    spdlog::info("Server stopped");
    fdr::common::Logger::flush();
    return exitCode;
}
