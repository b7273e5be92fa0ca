/**
 * @file database_probes.cpp
 * @brief libpq and sqlite3 connectivity probes
 */

#include "fdr/status/database_probes.h"
#include "exceptions.h"

#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <filesystem>
#include <memory>

namespace fdr::status {

namespace {

/// Quote a libpq connection string value
std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

struct PgConnDeleter {
    void operator()(PGconn* conn) const {
        if (conn) PQfinish(conn);
    }
};

struct PgResultDeleter {
    void operator()(PGresult* res) const {
        if (res) PQclear(res);
    }
};

struct SqliteDeleter {
    void operator()(sqlite3* db) const {
        if (db) sqlite3_close(db);
    }
};

} // namespace

// --- PostgresProbe ---

std::string PostgresConfig::connectionString() const {
    return "host=" + quoteConnValue(host) +
           " port=" + std::to_string(port) +
           " dbname=" + quoteConnValue(database) +
           " user=" + quoteConnValue(user) +
           " password=" + quoteConnValue(password) +
           " connect_timeout=" + std::to_string(connectTimeoutSec);
}

PostgresProbe::PostgresProbe(PostgresConfig config) : config_(std::move(config)) {}

ProbeResult PostgresProbe::probe() {
    ProbeResult result;
    result.detail["type"] = "postgresql";

    if (config_.host.empty()) {
        throw fdr::common::CapabilityException("PostgreSQL connection not configured");
    }

    std::unique_ptr<PGconn, PgConnDeleter> conn(PQconnectdb(config_.connectionString().c_str()));
    if (!conn) {
        throw fdr::common::CapabilityException("libpq could not allocate a connection");
    }

    if (PQstatus(conn.get()) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn.get());
        spdlog::debug("[DatabaseProbe] PostgreSQL connection failed: {}", error);
        result.verdict = HealthVerdict::Unhealthy;
        result.detail["error"] = error;
        return result;
    }

    std::unique_ptr<PGresult, PgResultDeleter> res(PQexec(conn.get(), "SELECT 1"));
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        std::string error = PQerrorMessage(conn.get());
        spdlog::debug("[DatabaseProbe] PostgreSQL query failed: {}", error);
        result.verdict = HealthVerdict::Unhealthy;
        result.detail["error"] = error;
        return result;
    }

    result.verdict = HealthVerdict::Healthy;
    result.detail["host"] = config_.host;
    result.detail["database"] = config_.database;
    return result;
}

// --- SqliteProbe ---

SqliteProbe::SqliteProbe(std::string path, int busyTimeoutSec)
    : path_(std::move(path)), busyTimeoutSec_(busyTimeoutSec) {}

ProbeResult SqliteProbe::probe() {
    ProbeResult result;
    result.detail["type"] = "sqlite";
    result.detail["path"] = path_;

    std::error_code ec;
    std::filesystem::path dbPath(path_);
    if (dbPath.has_parent_path()) {
        std::filesystem::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            spdlog::debug("[DatabaseProbe] Cannot create {}: {}", dbPath.parent_path().string(), ec.message());
        }
    }

    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path_.c_str(), &raw);
    std::unique_ptr<sqlite3, SqliteDeleter> db(raw);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc);
        spdlog::debug("[DatabaseProbe] Cannot open SQLite database {}: {}", path_, error);
        result.verdict = HealthVerdict::Unhealthy;
        result.detail["error"] = error;
        return result;
    }

    sqlite3_busy_timeout(db.get(), busyTimeoutSec_ * 1000);

    char* errMsg = nullptr;
    rc = sqlite3_exec(db.get(), "SELECT 1", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        spdlog::debug("[DatabaseProbe] SQLite query failed: {}", error);
        result.verdict = HealthVerdict::Unhealthy;
        result.detail["error"] = error;
        return result;
    }

    auto size = std::filesystem::file_size(dbPath, ec);
    result.verdict = HealthVerdict::Healthy;
    result.detail["size"] = static_cast<Json::UInt64>(ec ? 0 : size);
    return result;
}

} // namespace fdr::status
