#pragma once

/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables for both status services.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 *
 * Values are read once at process start; request handlers never consult
 * the environment directly.
 *
 * @date 2026-10-18
 */

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace fdr::common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Explicitly set values take precedence over the process environment.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager() = default;

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparsable values are logged and replaced by the default.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get floating point configuration value
     *
     * Trailing characters, NaN and infinity are rejected like other
     * unparsable values.
     */
    double getDouble(const std::string& key, double defaultValue = 0.0) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicitly set value
     */
    void unset(const std::string& key);

    /// @name Predefined Configuration Keys

    // Service
    static constexpr const char* SERVICE_THREADS = "SERVICE_THREADS";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    // Port status service
    static constexpr const char* PORT_STATUS_SERVICE_PORT = "PORT_STATUS_SERVICE_PORT";
    static constexpr const char* PORT_REGISTRY_FILE = "PORT_REGISTRY_FILE";
    static constexpr const char* PORT_PROBE_TIMEOUT_MS = "PORT_PROBE_TIMEOUT_MS";
    static constexpr const char* CONTAINER_RUNTIME = "CONTAINER_RUNTIME";
    static constexpr const char* CONTAINER_NAME_FILTER = "CONTAINER_NAME_FILTER";
    static constexpr const char* CONTAINER_LIST_TIMEOUT_SEC = "CONTAINER_LIST_TIMEOUT_SEC";

    // Health service
    static constexpr const char* HEALTH_CHECK_PORT = "HEALTH_CHECK_PORT";
    static constexpr const char* DB_HOST = "DB_HOST";
    static constexpr const char* DB_PORT = "DB_PORT";
    static constexpr const char* DB_NAME = "DB_NAME";
    static constexpr const char* DB_USER = "DB_USER";
    static constexpr const char* DB_PASSWORD = "DB_PASSWORD";
    static constexpr const char* DB_CONNECT_TIMEOUT_SEC = "DB_CONNECT_TIMEOUT_SEC";
    static constexpr const char* SQLITE_DB_PATH = "SQLITE_DB_PATH";
    static constexpr const char* CPU_WARNING_PERCENT = "CPU_WARNING_PERCENT";
    static constexpr const char* CPU_CRITICAL_PERCENT = "CPU_CRITICAL_PERCENT";
    static constexpr const char* MEMORY_WARNING_PERCENT = "MEMORY_WARNING_PERCENT";
    static constexpr const char* MEMORY_CRITICAL_PERCENT = "MEMORY_CRITICAL_PERCENT";
    static constexpr const char* DISK_WARNING_PERCENT = "DISK_WARNING_PERCENT";
    static constexpr const char* DISK_CRITICAL_PERCENT = "DISK_CRITICAL_PERCENT";
    static constexpr const char* DISK_MOUNT_PATH = "DISK_MOUNT_PATH";
    static constexpr const char* CPU_SAMPLE_MS = "CPU_SAMPLE_MS";
    static constexpr const char* EXTERNAL_CHECK_TIMEOUT_SEC = "EXTERNAL_CHECK_TIMEOUT_SEC";
};

} // namespace fdr::common
