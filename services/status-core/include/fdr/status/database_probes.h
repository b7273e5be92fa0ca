#pragma once

/**
 * @file database_probes.h
 * @brief Connectivity probes for the primary and fallback databases
 *
 * @date 2026-10-18
 */

#include "fdr/status/types.h"

#include <json/json.h>

#include <string>

namespace fdr::status {

/// Outcome of one database probe
struct ProbeResult {
    HealthVerdict verdict = HealthVerdict::Unknown;
    Json::Value detail{Json::objectValue};
};

/**
 * @brief One database connectivity strategy
 *
 * Connection and query failures are reported through ProbeResult. A probe
 * that cannot run at all throws fdr::common::CapabilityException.
 */
class IDatabaseProbe {
public:
    virtual ~IDatabaseProbe() = default;

    /// Key of this probe's sub-result in the database report
    virtual std::string name() const = 0;

    virtual ProbeResult probe() = 0;
};

struct PostgresConfig {
    std::string host;
    int port = 5432;
    std::string database;
    std::string user;
    std::string password;
    int connectTimeoutSec = 5;

    /// libpq keyword/value connection string
    std::string connectionString() const;
};

/**
 * @brief PostgreSQL probe (PQconnectdb + SELECT 1)
 *
 * @throws fdr::common::CapabilityException when no host is configured or
 *         libpq cannot allocate a connection
 */
class PostgresProbe : public IDatabaseProbe {
public:
    explicit PostgresProbe(PostgresConfig config);

    std::string name() const override { return "postgresql"; }
    ProbeResult probe() override;

private:
    PostgresConfig config_;
};

/**
 * @brief SQLite probe
 *
 * Creates the parent directory when missing, opens (or creates) the database
 * file and runs SELECT 1.
 */
class SqliteProbe : public IDatabaseProbe {
public:
    explicit SqliteProbe(std::string path, int busyTimeoutSec = 5);

    std::string name() const override { return "sqlite"; }
    ProbeResult probe() override;

private:
    std::string path_;
    int busyTimeoutSec_;
};

} // namespace fdr::status
