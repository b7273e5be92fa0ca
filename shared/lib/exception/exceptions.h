#pragma once

/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Provides consistent exception types across the status services
 *
 * @date 2026-10-18
 */

#include <stdexcept>
#include <string>

namespace fdr::common {

/**
 * @brief Base exception for all FDR status exceptions
 */
class FdrException : public std::runtime_error {
public:
    explicit FdrException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public FdrException {
public:
    explicit ConfigException(const std::string& message)
        : FdrException("Configuration error: " + message) {}
};

/**
 * @brief External command could not be started or supervised
 */
class CommandException : public FdrException {
public:
    explicit CommandException(const std::string& message)
        : FdrException("Command error: " + message) {}
};

/**
 * @brief A check could not run because a required capability is missing
 *
 * Health checks map this to the "unavailable" verdict rather than "unhealthy".
 */
class CapabilityException : public FdrException {
public:
    explicit CapabilityException(const std::string& message)
        : FdrException("Capability unavailable: " + message) {}
};

} // namespace fdr::common
