#pragma once

/**
 * @file external_services.h
 * @brief Reachability of third-party research APIs
 *
 * @date 2026-10-18
 */

#include "fdr/status/health_checkers.h"

#include <optional>
#include <string>
#include <vector>

namespace fdr::status {

struct ExternalDependency {
    std::string name;                   ///< e.g. "openrouter"
    std::string baseUrl;
    std::optional<std::string> apiKey;  ///< absent = not configured
};

/**
 * @brief Built-in dependency list with credentials taken from the environment
 *
 * The key for "openrouter" is OPENROUTER_API_KEY; empty values count as
 * absent.
 */
std::vector<ExternalDependency> defaultExternalDependencies();

/// "openrouter" -> "OPENROUTER_API_KEY"
std::string apiKeyVariable(const std::string& dependencyName);

/**
 * @brief Per-dependency reachability
 *
 * A dependency without a credential is reported as unknown and never
 * contacted. With a credential, one GET to baseUrl is made: HTTP < 500 is
 * healthy, 5xx is warning, a transport failure is unhealthy. The credential
 * itself is not sent or validated.
 */
class ExternalServicesChecker : public IHealthChecker {
public:
    explicit ExternalServicesChecker(std::vector<ExternalDependency> dependencies, int timeoutSec = 5);

    std::string name() const override { return "services"; }
    ComponentReport check() override;

private:
    Json::Value checkDependency(const ExternalDependency& dependency) const;

    std::vector<ExternalDependency> dependencies_;
    int timeoutSec_;
};

} // namespace fdr::status
