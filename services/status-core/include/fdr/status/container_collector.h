#pragma once

/**
 * @file container_collector.h
 * @brief Container listing through the container runtime CLI
 *
 * @date 2026-10-18
 */

#include "fdr/status/types.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace fdr::status {

/**
 * @brief Source of container records
 *
 * listContainers() never throws; failures yield an empty list.
 */
class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    virtual std::vector<ContainerRecord> listContainers(const std::string& nameFilter) = 0;
};

/**
 * @brief Parse one line of `ps --format '{{json .}}'` output
 *
 * @return std::nullopt for blank, malformed or non-object lines
 */
std::optional<ContainerRecord> parseContainerLine(const std::string& line);

/// Parse every line, dropping those parseContainerLine() rejects
std::vector<ContainerRecord> parseContainerList(const std::string& output);

/**
 * @brief Runs `<binary> ps -a --filter name=<filter> --format {{json .}}`
 */
class CliContainerRuntime : public IContainerRuntime {
public:
    explicit CliContainerRuntime(std::string binary = "docker",
                                 std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::vector<ContainerRecord> listContainers(const std::string& nameFilter) override;

private:
    std::string binary_;
    std::chrono::milliseconds timeout_;
};

} // namespace fdr::status
