#pragma once

/**
 * @file app_config.h
 * @brief Port status service application configuration
 *
 * Loaded from environment variables at startup.
 */

#include "config_manager.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>

#include <string>

struct AppConfig {
    int serverPort = 8084;
    int threadNum = 4;

    std::string registryFile = ".env.ports";
    int probeTimeoutMs = 1000;

    std::string containerRuntime = "docker";
    std::string containerNameFilter = "free-deep-research";
    int containerListTimeoutSec = 10;

    std::string logLevel = "info";
    std::string logFile;

    static AppConfig fromEnvironment() {
        using fdr::common::ConfigManager;
        auto& cfg = ConfigManager::getInstance();

        AppConfig config;
        config.serverPort = cfg.getInt(ConfigManager::PORT_STATUS_SERVICE_PORT, config.serverPort);
        config.threadNum = cfg.getInt(ConfigManager::SERVICE_THREADS, config.threadNum);

        config.registryFile = cfg.getString(ConfigManager::PORT_REGISTRY_FILE, config.registryFile);
        config.probeTimeoutMs = cfg.getInt(ConfigManager::PORT_PROBE_TIMEOUT_MS, config.probeTimeoutMs);

        config.containerRuntime = cfg.getString(ConfigManager::CONTAINER_RUNTIME, config.containerRuntime);
        config.containerNameFilter = cfg.getString(ConfigManager::CONTAINER_NAME_FILTER, config.containerNameFilter);
        config.containerListTimeoutSec = cfg.getInt(ConfigManager::CONTAINER_LIST_TIMEOUT_SEC, config.containerListTimeoutSec);

        config.logLevel = cfg.getString(ConfigManager::LOG_LEVEL, config.logLevel);
        config.logFile = cfg.getString(ConfigManager::LOG_FILE, config.logFile);

        return config;
    }

    void validate() const {
        using fdr::common::ConfigException;

        if (serverPort <= 0 || serverPort > 65535) {
            throw ConfigException("PORT_STATUS_SERVICE_PORT out of range: " + std::to_string(serverPort));
        }
        if (threadNum <= 0) {
            throw ConfigException("SERVICE_THREADS must be positive");
        }
        if (probeTimeoutMs <= 0) {
            throw ConfigException("PORT_PROBE_TIMEOUT_MS must be positive");
        }
        if (containerListTimeoutSec <= 0) {
            throw ConfigException("CONTAINER_LIST_TIMEOUT_SEC must be positive");
        }
        if (containerRuntime.empty()) {
            throw ConfigException("CONTAINER_RUNTIME must not be empty");
        }
        spdlog::info("Configuration validated");
    }
};
