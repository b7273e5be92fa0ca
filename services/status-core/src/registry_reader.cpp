/**
 * @file registry_reader.cpp
 * @brief Port registry parsing
 */

#include "fdr/status/registry_reader.h"
#include "fdr/utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace fdr::status {

PortRegistry parseRegistry(std::istream& input) {
    PortRegistry registry;
    std::string rawLine;
    int lineNo = 0;

    while (std::getline(input, rawLine)) {
        ++lineNo;
        std::string line = utils::trim(rawLine);

        if (line.empty() || utils::startsWith(line, "#")) {
            continue;
        }

        auto kv = utils::splitFirst(line, '=');
        if (!kv) {
            spdlog::debug("[Registry] line {}: no '=', skipped", lineNo);
            continue;
        }

        std::string key = utils::trim(kv->first);
        std::string value = utils::trim(kv->second);

        if (!utils::endsWith(key, PORT_KEY_SUFFIX)) {
            continue;
        }

        auto port = utils::parseInt(value);
        if (!port || *port <= 0 || *port > 65535) {
            spdlog::debug("[Registry] line {}: invalid port '{}' for {}, skipped", lineNo, value, key);
            continue;
        }

        registry[key] = *port;
    }

    return registry;
}

PortRegistry readRegistry(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("[Registry] {} not found, using empty registry", path);
        return {};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("[Registry] Cannot open {}, using empty registry", path);
        return {};
    }

    PortRegistry registry = parseRegistry(file);
    spdlog::debug("[Registry] Loaded {} port assignments from {}", registry.size(), path);
    return registry;
}

} // namespace fdr::status
