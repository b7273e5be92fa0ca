#pragma once

/**
 * @file process_runner.h
 * @brief Bounded subprocess execution
 *
 * @date 2026-10-18
 */

#include <chrono>
#include <string>
#include <vector>

namespace fdr::status {

struct CommandResult {
    int exitCode = -1;       ///< -1 when the child did not exit normally
    std::string output;      ///< captured stdout
    bool timedOut = false;
};

/**
 * @brief Run argv[0] (PATH lookup) with stdout captured
 *
 * stdin and stderr are redirected to /dev/null. When the deadline passes the
 * child is killed with SIGKILL and reaped before returning, with timedOut set.
 *
 * @throws fdr::common::CommandException if argv is empty or the pipe/fork fails
 */
CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace fdr::status
