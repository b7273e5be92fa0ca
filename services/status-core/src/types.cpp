/**
 * @file types.cpp
 * @brief Verdict string mapping and small data model helpers
 */

#include "fdr/status/types.h"
#include "fdr/utils/string_utils.h"

namespace fdr::status {

std::string RunningService::shortKey() const {
    std::string key = utils::toLower(descriptor.serviceKey);
    const std::string suffix = utils::toLower(PORT_KEY_SUFFIX);
    if (utils::endsWith(key, suffix)) {
        key.erase(key.size() - suffix.size());
    }
    return key;
}

std::string toString(HealthVerdict verdict) {
    switch (verdict) {
        case HealthVerdict::Healthy:     return "healthy";
        case HealthVerdict::Warning:     return "warning";
        case HealthVerdict::Unhealthy:   return "unhealthy";
        case HealthVerdict::Unavailable: return "unavailable";
        case HealthVerdict::Unknown:     return "unknown";
    }
    return "unknown";
}

HealthVerdict verdictFromString(const std::string& value) {
    if (value == "healthy") return HealthVerdict::Healthy;
    if (value == "warning") return HealthVerdict::Warning;
    if (value == "unhealthy") return HealthVerdict::Unhealthy;
    if (value == "unavailable") return HealthVerdict::Unavailable;
    return HealthVerdict::Unknown;
}

} // namespace fdr::status
