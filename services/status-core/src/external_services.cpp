/**
 * @file external_services.cpp
 * @brief libcurl reachability checks for external APIs
 */

#include "fdr/status/external_services.h"
#include "fdr/status/health_aggregator.h"
#include "fdr/utils/string_utils.h"
#include "config_manager.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>

namespace fdr::status {

namespace {

size_t discardWriteCallback(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) curl_easy_cleanup(curl);
    }
};

} // namespace

std::string apiKeyVariable(const std::string& dependencyName) {
    return utils::toUpper(dependencyName) + "_API_KEY";
}

std::vector<ExternalDependency> defaultExternalDependencies() {
    static const std::vector<std::pair<std::string, std::string>> known = {
        {"openrouter", "https://openrouter.ai/api/v1/models"},
        {"serpapi",    "https://serpapi.com/"},
        {"jina",       "https://r.jina.ai/"},
        {"firecrawl",  "https://api.firecrawl.dev/"},
        {"tavily",     "https://api.tavily.com/"},
        {"exa",        "https://api.exa.ai/"},
    };

    auto& config = common::ConfigManager::getInstance();

    std::vector<ExternalDependency> dependencies;
    for (const auto& [name, url] : known) {
        ExternalDependency dependency{name, url, std::nullopt};
        std::string key = config.getString(apiKeyVariable(name));
        if (!key.empty()) {
            dependency.apiKey = key;
        }
        dependencies.push_back(std::move(dependency));
    }
    return dependencies;
}

ExternalServicesChecker::ExternalServicesChecker(std::vector<ExternalDependency> dependencies, int timeoutSec)
    : dependencies_(std::move(dependencies)), timeoutSec_(timeoutSec) {}

ComponentReport ExternalServicesChecker::check() {
    ComponentReport report;
    report.name = name();

    Json::Value services(Json::objectValue);
    std::vector<HealthVerdict> verdicts;

    for (const auto& dependency : dependencies_) {
        Json::Value entry = checkDependency(dependency);
        verdicts.push_back(verdictFromString(entry["status"].asString()));
        services[dependency.name] = entry;
    }

    report.verdict = aggregateVerdict(verdicts);
    report.detail["api_services"] = services;
    report.timestamp = std::chrono::system_clock::now();
    return report;
}

Json::Value ExternalServicesChecker::checkDependency(const ExternalDependency& dependency) const {
    Json::Value entry(Json::objectValue);

    if (!dependency.apiKey) {
        entry["status"] = toString(HealthVerdict::Unknown);
        entry["note"] = "API key required for testing";
        return entry;
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        entry["status"] = toString(HealthVerdict::Unknown);
        entry["error"] = "Failed to initialize CURL";
        return entry;
    }

    auto startTime = std::chrono::steady_clock::now();

    curl_easy_setopt(curl.get(), CURLOPT_URL, dependency.baseUrl.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeoutSec_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discardWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, nullptr);

    CURLcode res = curl_easy_perform(curl.get());
    long responseCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
    entry["response_time_ms"] = static_cast<Json::Int64>(elapsed);

    if (res != CURLE_OK) {
        spdlog::debug("[ExternalServices] {} unreachable: {}", dependency.name, curl_easy_strerror(res));
        entry["status"] = toString(HealthVerdict::Unhealthy);
        entry["error"] = curl_easy_strerror(res);
    } else if (responseCode >= 500) {
        entry["status"] = toString(HealthVerdict::Warning);
        entry["error"] = "HTTP " + std::to_string(responseCode);
    } else {
        entry["status"] = toString(HealthVerdict::Healthy);
        entry["http_status"] = static_cast<Json::Int64>(responseCode);
    }

    return entry;
}

} // namespace fdr::status
