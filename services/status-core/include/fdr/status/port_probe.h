#pragma once

/**
 * @file port_probe.h
 * @brief TCP port occupancy probe
 *
 * @date 2026-10-18
 */

#include <netinet/in.h>

#include <functional>

namespace fdr::status {

inline constexpr int DEFAULT_PROBE_TIMEOUT_MS = 1000;

/// Probe signature used by the resolver; returns true when the port is free
using ProbeFn = std::function<bool(int port)>;

/**
 * @brief IPv4 loopback address for port, built without a name lookup
 */
sockaddr_in loopbackEndpoint(int port);

/**
 * @brief Check whether anything accepts TCP connections on localhost:port
 *
 * Connects to 127.0.0.1 directly (no resolver call) with a non-blocking
 * connect bounded by poll() against a hard deadline, so the call never
 * outlives timeoutMs.
 *
 * @return true  if the port is available (refused, timed out, or the probe
 *               itself failed: socket exhaustion, bad port)
 *         false if a listener accepted the connection
 */
bool probePort(int port, int timeoutMs = DEFAULT_PROBE_TIMEOUT_MS);

/**
 * @brief Bind probePort to a fixed timeout
 */
ProbeFn makeTcpProbe(int timeoutMs = DEFAULT_PROBE_TIMEOUT_MS);

} // namespace fdr::status
