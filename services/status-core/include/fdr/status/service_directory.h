#pragma once

/**
 * @file service_directory.h
 * @brief Joins the port registry, the service catalog and live probes
 *
 * @date 2026-10-18
 */

#include "fdr/status/port_probe.h"
#include "fdr/status/types.h"

#include <vector>

namespace fdr::status {

/**
 * @brief Built-in catalog of known services, in display order
 */
const ServiceCatalog& defaultServiceCatalog();

/**
 * @brief Probe every registry entry
 *
 * @return One PortStatus per registry key, in key order
 */
std::vector<PortStatus> checkPorts(const PortRegistry& registry, const ProbeFn& probe);

/**
 * @brief Services from the catalog whose assigned port is occupied
 *
 * Descriptors absent from the registry, and descriptors whose port probes as
 * available, are left out. Result order follows the catalog.
 *
 * An occupied port is taken to mean the expected service holds it; the
 * listener's identity is not verified.
 */
std::vector<RunningService> resolveServices(
    const PortRegistry& registry,
    const ServiceCatalog& catalog,
    const ProbeFn& probe);

} // namespace fdr::status
