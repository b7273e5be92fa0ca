/**
 * @file container_collector.cpp
 * @brief Container runtime CLI adapter
 */

#include "fdr/status/container_collector.h"
#include "fdr/status/process_runner.h"
#include "fdr/utils/string_utils.h"
#include "exceptions.h"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>

namespace fdr::status {

namespace {

std::string stringField(const Json::Value& obj, const char* key) {
    const Json::Value& value = obj[key];
    if (value.isString()) {
        return value.asString();
    }
    if (value.isNull()) {
        return "";
    }
    // Some runtimes emit numbers or arrays; keep their JSON text
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

} // namespace

std::optional<ContainerRecord> parseContainerLine(const std::string& line) {
    std::string trimmed = utils::trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(trimmed.data(), trimmed.data() + trimmed.size(), &root, &errors)) {
        spdlog::debug("[ContainerCollector] Dropping unparsable line: {}", errors);
        return std::nullopt;
    }
    if (!root.isObject()) {
        spdlog::debug("[ContainerCollector] Dropping non-object line");
        return std::nullopt;
    }

    ContainerRecord record;
    record.name = stringField(root, "Names");
    record.state = stringField(root, "State");
    record.image = stringField(root, "Image");
    record.ports = stringField(root, "Ports");
    record.createdAt = stringField(root, "CreatedAt");
    return record;
}

std::vector<ContainerRecord> parseContainerList(const std::string& output) {
    std::vector<ContainerRecord> records;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (auto record = parseContainerLine(line)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

CliContainerRuntime::CliContainerRuntime(std::string binary, std::chrono::milliseconds timeout)
    : binary_(std::move(binary)), timeout_(timeout) {}

std::vector<ContainerRecord> CliContainerRuntime::listContainers(const std::string& nameFilter) {
    std::vector<std::string> argv = {
        binary_, "ps", "-a",
        "--filter", "name=" + nameFilter,
        "--format", "{{json .}}"
    };

    CommandResult result;
    try {
        result = runCommand(argv, timeout_);
    } catch (const common::CommandException& e) {
        spdlog::error("[ContainerCollector] Failed to run {}: {}", binary_, e.what());
        return {};
    }

    if (result.timedOut) {
        spdlog::warn("[ContainerCollector] {} ps timed out", binary_);
        return {};
    }
    if (result.exitCode != 0) {
        spdlog::warn("[ContainerCollector] {} ps exited with code {}", binary_, result.exitCode);
        return {};
    }

    return parseContainerList(result.output);
}

} // namespace fdr::status
