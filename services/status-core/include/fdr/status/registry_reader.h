#pragma once

/**
 * @file registry_reader.h
 * @brief Port registry file parser
 *
 * The registry is a flat KEY=VALUE file (e.g. ".env.ports"):
 *
 *   # Assigned by the port manager
 *   FRONTEND_PORT=30000
 *   BACKEND_PORT=30010
 *
 * @date 2026-10-18
 */

#include "fdr/status/types.h"

#include <istream>
#include <string>

namespace fdr::status {

/**
 * @brief Read the registry file at path
 *
 * Re-reads the file on every call. A missing or unreadable file yields an
 * empty registry; it is never an error.
 */
PortRegistry readRegistry(const std::string& path);

/**
 * @brief Parse registry lines from a stream
 *
 * Skips blank lines, '#' comments and lines without '='. Splits on the first
 * '='. Keeps keys ending in PORT_KEY_SUFFIX whose value is a decimal integer
 * in [1, 65535]; every other line is dropped without failing the read.
 */
PortRegistry parseRegistry(std::istream& input);

} // namespace fdr::status
