#pragma once

/**
 * @file app_config.h
 * @brief Health service application configuration
 *
 * Loaded from environment variables at startup.
 */

#include "config_manager.h"
#include "exceptions.h"

#include "fdr/status/database_probes.h"
#include "fdr/status/health_checkers.h"
#include "fdr/status/types.h"

#include <spdlog/spdlog.h>

#include <string>

struct AppConfig {
    int serverPort = 8080;
    int threadNum = 4;

    fdr::status::PostgresConfig postgres{"database", 5432, "free_deep_research", "fdr_user", "", 5};
    std::string sqlitePath = "/app/data/research.db";

    fdr::status::HealthThresholds thresholds;
    std::string diskMountPath = "/";
    int cpuSampleMs = 1000;
    int externalCheckTimeoutSec = 5;

    std::string logLevel = "info";
    std::string logFile;

    static AppConfig fromEnvironment() {
        using fdr::common::ConfigManager;
        auto& cfg = ConfigManager::getInstance();

        AppConfig config;
        config.serverPort = cfg.getInt(ConfigManager::HEALTH_CHECK_PORT, config.serverPort);
        config.threadNum = cfg.getInt(ConfigManager::SERVICE_THREADS, config.threadNum);

        config.postgres.host = cfg.getString(ConfigManager::DB_HOST, config.postgres.host);
        config.postgres.port = cfg.getInt(ConfigManager::DB_PORT, config.postgres.port);
        config.postgres.database = cfg.getString(ConfigManager::DB_NAME, config.postgres.database);
        config.postgres.user = cfg.getString(ConfigManager::DB_USER, config.postgres.user);
        config.postgres.password = cfg.getString(ConfigManager::DB_PASSWORD);
        config.postgres.connectTimeoutSec = cfg.getInt(ConfigManager::DB_CONNECT_TIMEOUT_SEC,
                                                       config.postgres.connectTimeoutSec);
        config.sqlitePath = cfg.getString(ConfigManager::SQLITE_DB_PATH, config.sqlitePath);

        auto& t = config.thresholds;
        t.cpu.warningPercent = cfg.getDouble(ConfigManager::CPU_WARNING_PERCENT, t.cpu.warningPercent);
        t.cpu.criticalPercent = cfg.getDouble(ConfigManager::CPU_CRITICAL_PERCENT, t.cpu.criticalPercent);
        t.memory.warningPercent = cfg.getDouble(ConfigManager::MEMORY_WARNING_PERCENT, t.memory.warningPercent);
        t.memory.criticalPercent = cfg.getDouble(ConfigManager::MEMORY_CRITICAL_PERCENT, t.memory.criticalPercent);
        t.disk.warningPercent = cfg.getDouble(ConfigManager::DISK_WARNING_PERCENT, t.disk.warningPercent);
        t.disk.criticalPercent = cfg.getDouble(ConfigManager::DISK_CRITICAL_PERCENT, t.disk.criticalPercent);

        config.diskMountPath = cfg.getString(ConfigManager::DISK_MOUNT_PATH, config.diskMountPath);
        config.cpuSampleMs = cfg.getInt(ConfigManager::CPU_SAMPLE_MS, config.cpuSampleMs);
        config.externalCheckTimeoutSec = cfg.getInt(ConfigManager::EXTERNAL_CHECK_TIMEOUT_SEC,
                                                    config.externalCheckTimeoutSec);

        config.logLevel = cfg.getString(ConfigManager::LOG_LEVEL, config.logLevel);
        config.logFile = cfg.getString(ConfigManager::LOG_FILE, config.logFile);

        return config;
    }

    void validate() const {
        using fdr::common::ConfigException;

        if (serverPort <= 0 || serverPort > 65535) {
            throw ConfigException("HEALTH_CHECK_PORT out of range: " + std::to_string(serverPort));
        }
        if (postgres.port <= 0 || postgres.port > 65535) {
            throw ConfigException("DB_PORT out of range: " + std::to_string(postgres.port));
        }
        if (threadNum <= 0) {
            throw ConfigException("SERVICE_THREADS must be positive");
        }
        if (postgres.connectTimeoutSec <= 0 || externalCheckTimeoutSec <= 0 || cpuSampleMs <= 0) {
            throw ConfigException("timeouts and sample windows must be positive");
        }
        fdr::status::validateThresholds(thresholds);

        if (postgres.host.empty()) {
            spdlog::warn("DB_HOST is empty, PostgreSQL check will report unavailable");
        }
        spdlog::info("Configuration validated");
    }
};
