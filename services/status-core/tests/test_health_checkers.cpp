/**
 * @file test_health_checkers.cpp
 * @brief Unit tests for component health checkers
 */

#include <gtest/gtest.h>
#include <fdr/status/database_probes.h>
#include <fdr/status/external_services.h>
#include <fdr/status/health_checkers.h>
#include "exceptions.h"

#include "test_helpers.h"

#include <chrono>
#include <cmath>
#include <limits>

using namespace fdr::status;

namespace {

class FakeMetricsSource : public ISystemMetricsSource {
public:
    FakeMetricsSource(double cpu, double memory, double disk) {
        snapshot_.cpu.usagePercent = cpu;
        snapshot_.cpu.load1min = 0.5;
        snapshot_.cpu.load5min = 0.25;
        snapshot_.cpu.load15min = 0.125;
        snapshot_.memory.usagePercent = memory;
        snapshot_.memory.totalBytes = 1000;
        snapshot_.memory.usedBytes = 600;
        snapshot_.memory.availableBytes = 400;
        snapshot_.disk.usagePercent = disk;
        snapshot_.disk.totalBytes = 2000;
        snapshot_.disk.usedBytes = 500;
        snapshot_.disk.freeBytes = 1500;
    }

    SystemSnapshot collect() override { return snapshot_; }

private:
    SystemSnapshot snapshot_;
};

class FakeDatabaseProbe : public IDatabaseProbe {
public:
    FakeDatabaseProbe(std::string name, HealthVerdict verdict)
        : name_(std::move(name)), verdict_(verdict) {}

    std::string name() const override { return name_; }

    ProbeResult probe() override {
        ++calls;
        ProbeResult result;
        result.verdict = verdict_;
        result.detail["type"] = name_;
        return result;
    }

    int calls = 0;

private:
    std::string name_;
    HealthVerdict verdict_;
};

} // namespace

// --- classify ---

TEST(ClassifyTest, ThresholdsAreExclusive) {
    ResourceThresholds t{70.0, 90.0};
    EXPECT_EQ(classify(0.0, t), HealthVerdict::Healthy);
    EXPECT_EQ(classify(70.0, t), HealthVerdict::Healthy);
    EXPECT_EQ(classify(70.1, t), HealthVerdict::Warning);
    EXPECT_EQ(classify(90.0, t), HealthVerdict::Warning);
    EXPECT_EQ(classify(90.1, t), HealthVerdict::Unhealthy);
}

TEST(ValidateThresholdsTest, DefaultsAreAccepted) {
    EXPECT_NO_THROW(validateThresholds(HealthThresholds{}));
}

TEST(ValidateThresholdsTest, RejectsNonFiniteValues) {
    HealthThresholds nanCritical;
    nanCritical.cpu.criticalPercent = std::nan("");
    EXPECT_THROW(validateThresholds(nanCritical), fdr::common::ConfigException);

    HealthThresholds nanWarning;
    nanWarning.memory.warningPercent = std::nan("");
    EXPECT_THROW(validateThresholds(nanWarning), fdr::common::ConfigException);

    HealthThresholds infinite;
    infinite.disk.criticalPercent = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validateThresholds(infinite), fdr::common::ConfigException);
}

TEST(ValidateThresholdsTest, RejectsMisorderedOrOutOfRangePairs) {
    HealthThresholds inverted;
    inverted.cpu = {90.0, 70.0};
    EXPECT_THROW(validateThresholds(inverted), fdr::common::ConfigException);

    HealthThresholds equal;
    equal.disk = {90.0, 90.0};
    EXPECT_THROW(validateThresholds(equal), fdr::common::ConfigException);

    HealthThresholds negative;
    negative.memory = {-1.0, 90.0};
    EXPECT_THROW(validateThresholds(negative), fdr::common::ConfigException);

    HealthThresholds aboveHundred;
    aboveHundred.cpu = {70.0, 101.0};
    EXPECT_THROW(validateThresholds(aboveHundred), fdr::common::ConfigException);
}

TEST(ClassifyTest, DefaultThresholds) {
    HealthThresholds t;
    EXPECT_DOUBLE_EQ(t.cpu.warningPercent, 70.0);
    EXPECT_DOUBLE_EQ(t.cpu.criticalPercent, 90.0);
    EXPECT_DOUBLE_EQ(t.memory.warningPercent, 70.0);
    EXPECT_DOUBLE_EQ(t.memory.criticalPercent, 90.0);
    EXPECT_DOUBLE_EQ(t.disk.warningPercent, 85.0);
    EXPECT_DOUBLE_EQ(t.disk.criticalPercent, 95.0);
}

// --- SystemHealthChecker ---

TEST(SystemHealthCheckerTest, AllBelowWarningIsHealthy) {
    SystemHealthChecker checker(std::make_shared<FakeMetricsSource>(10, 20, 30), HealthThresholds{});
    auto report = checker.check();

    EXPECT_EQ(report.name, "system");
    EXPECT_EQ(report.verdict, HealthVerdict::Healthy);
    EXPECT_DOUBLE_EQ(report.detail["cpu_percent"].asDouble(), 10.0);
    EXPECT_EQ(report.detail["memory_available"].asUInt64(), 400u);
    EXPECT_EQ(report.detail["disk_free"].asUInt64(), 1500u);
    ASSERT_EQ(report.detail["load_average"].size(), 3u);
    EXPECT_DOUBLE_EQ(report.detail["load_average"][0].asDouble(), 0.5);
}

TEST(SystemHealthCheckerTest, WorstResourceWins) {
    SystemHealthChecker warning(std::make_shared<FakeMetricsSource>(75, 20, 30), HealthThresholds{});
    EXPECT_EQ(warning.check().verdict, HealthVerdict::Warning);

    SystemHealthChecker unhealthy(std::make_shared<FakeMetricsSource>(75, 20, 96), HealthThresholds{});
    EXPECT_EQ(unhealthy.check().verdict, HealthVerdict::Unhealthy);
}

TEST(SystemHealthCheckerTest, EachResourceUsesItsOwnThresholds) {
    // 80% is a warning for CPU but healthy for disk
    SystemHealthChecker diskOnly(std::make_shared<FakeMetricsSource>(10, 10, 80), HealthThresholds{});
    EXPECT_EQ(diskOnly.check().verdict, HealthVerdict::Healthy);

    SystemHealthChecker cpuOnly(std::make_shared<FakeMetricsSource>(80, 10, 10), HealthThresholds{});
    EXPECT_EQ(cpuOnly.check().verdict, HealthVerdict::Warning);
}

// --- DiskHealthChecker / MemoryHealthChecker ---

TEST(ResourceHealthCheckerTest, DiskReportsBytes) {
    DiskHealthChecker checker(std::make_shared<FakeMetricsSource>(0, 0, 90), ResourceThresholds{85, 95});
    auto report = checker.check();

    EXPECT_EQ(report.name, "disk");
    EXPECT_EQ(report.verdict, HealthVerdict::Warning);
    EXPECT_EQ(report.detail["total_bytes"].asUInt64(), 2000u);
    EXPECT_EQ(report.detail["free_bytes"].asUInt64(), 1500u);
}

TEST(ResourceHealthCheckerTest, MemoryClassification) {
    MemoryHealthChecker checker(std::make_shared<FakeMetricsSource>(0, 91, 0), ResourceThresholds{70, 90});
    auto report = checker.check();

    EXPECT_EQ(report.name, "memory");
    EXPECT_EQ(report.verdict, HealthVerdict::Unhealthy);
    EXPECT_EQ(report.detail["available_bytes"].asUInt64(), 400u);
}

// --- DatabaseHealthChecker ---

TEST(DatabaseHealthCheckerTest, HealthyPrimaryIsHealthy) {
    auto primary = std::make_shared<FakeDatabaseProbe>("postgresql", HealthVerdict::Healthy);
    auto fallback = std::make_shared<FakeDatabaseProbe>("sqlite", HealthVerdict::Unhealthy);
    DatabaseHealthChecker checker({primary, fallback});

    auto report = checker.check();

    EXPECT_EQ(report.name, "database");
    EXPECT_EQ(report.verdict, HealthVerdict::Healthy);
    EXPECT_EQ(report.detail["postgresql"]["status"].asString(), "healthy");
    EXPECT_EQ(report.detail["sqlite"]["status"].asString(), "unhealthy");
}

TEST(DatabaseHealthCheckerTest, HealthyFallbackIsHealthy) {
    auto primary = std::make_shared<FakeDatabaseProbe>("postgresql", HealthVerdict::Unhealthy);
    auto fallback = std::make_shared<FakeDatabaseProbe>("sqlite", HealthVerdict::Healthy);
    DatabaseHealthChecker checker({primary, fallback});

    EXPECT_EQ(checker.check().verdict, HealthVerdict::Healthy);
    EXPECT_EQ(primary->calls, 1);
    EXPECT_EQ(fallback->calls, 1);
}

TEST(DatabaseHealthCheckerTest, BothFailingIsUnhealthy) {
    DatabaseHealthChecker checker({
        std::make_shared<FakeDatabaseProbe>("postgresql", HealthVerdict::Unavailable),
        std::make_shared<FakeDatabaseProbe>("sqlite", HealthVerdict::Unhealthy),
    });
    EXPECT_EQ(checker.check().verdict, HealthVerdict::Unhealthy);
}

TEST(DatabaseHealthCheckerTest, NothingRunnableIsUnavailable) {
    DatabaseHealthChecker checker({
        std::make_shared<FakeDatabaseProbe>("postgresql", HealthVerdict::Unavailable),
        std::make_shared<FakeDatabaseProbe>("sqlite", HealthVerdict::Unavailable),
    });
    EXPECT_EQ(checker.check().verdict, HealthVerdict::Unavailable);
}

// --- Real probes ---

TEST(DatabaseProbeTest, PostgresWithoutHostCannotRun) {
    PostgresConfig config;
    config.host = "";
    PostgresProbe probe(config);

    EXPECT_THROW(probe.probe(), fdr::common::CapabilityException);
}

TEST(DatabaseHealthCheckerTest, UnconfiguredPostgresIsUnavailableAndFallbackDecides) {
    PostgresConfig config;
    config.host = "";
    DatabaseHealthChecker checker({
        std::make_shared<PostgresProbe>(config),
        std::make_shared<FakeDatabaseProbe>("sqlite", HealthVerdict::Healthy),
    });

    auto report = checker.check();

    EXPECT_EQ(report.verdict, HealthVerdict::Healthy);
    EXPECT_EQ(report.detail["postgresql"]["status"].asString(), "unavailable");
    EXPECT_EQ(report.detail["postgresql"]["type"].asString(), "postgresql");
    EXPECT_EQ(report.detail["postgresql"]["error"].asString(), "PostgreSQL connection not configured");
}

TEST(DatabaseHealthCheckerTest, UnconfiguredPostgresAloneIsUnavailable) {
    PostgresConfig config;
    config.host = "";
    DatabaseHealthChecker checker({std::make_shared<PostgresProbe>(config)});

    EXPECT_EQ(checker.check().verdict, HealthVerdict::Unavailable);
}

TEST(DatabaseProbeTest, PostgresRefusedConnectionIsUnhealthy) {
    PostgresConfig config;
    config.host = "127.0.0.1";
    config.port = test::releasedPort();
    config.database = "fdr";
    config.user = "fdr";
    config.connectTimeoutSec = 2;
    PostgresProbe probe(config);

    auto result = probe.probe();
    EXPECT_EQ(result.verdict, HealthVerdict::Unhealthy);
    EXPECT_TRUE(result.detail.isMember("error"));
}

TEST(DatabaseProbeTest, ConnectionStringQuotesValues) {
    PostgresConfig config;
    config.host = "db";
    config.password = "it's secret";
    std::string conn = config.connectionString();

    EXPECT_NE(conn.find("host='db'"), std::string::npos);
    EXPECT_NE(conn.find("password='it\\'s secret'"), std::string::npos);
    EXPECT_NE(conn.find("connect_timeout=5"), std::string::npos);
}

TEST(DatabaseProbeTest, SqliteCreatesDatabaseAndParentDirectory) {
    test::TempDir dir;
    auto dbPath = dir.path() / "data" / "nested" / "research.db";

    SqliteProbe probe(dbPath.string());
    auto result = probe.probe();

    EXPECT_EQ(result.verdict, HealthVerdict::Healthy);
    EXPECT_EQ(result.detail["type"].asString(), "sqlite");
    EXPECT_EQ(result.detail["path"].asString(), dbPath.string());
    EXPECT_TRUE(std::filesystem::exists(dbPath));
}

TEST(DatabaseProbeTest, SqliteUnopenablePathIsUnhealthy) {
    test::TempDir dir;
    // Parent "directory" is a regular file, so the database cannot be created
    auto blocker = dir.writeFile("blocker", "not a directory");
    SqliteProbe probe((blocker / "research.db").string());

    auto result = probe.probe();
    EXPECT_EQ(result.verdict, HealthVerdict::Unhealthy);
    EXPECT_TRUE(result.detail.isMember("error"));
}

// --- ExternalServicesChecker ---

TEST(ExternalServicesCheckerTest, MissingCredentialsAreUnknownWithoutNetwork) {
    std::vector<ExternalDependency> deps = {
        {"openrouter", "http://192.0.2.1/", std::nullopt},
        {"exa", "http://192.0.2.1/", std::nullopt},
    };
    ExternalServicesChecker checker(deps, 5);

    auto start = std::chrono::steady_clock::now();
    auto report = checker.check();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(report.name, "services");
    EXPECT_EQ(report.verdict, HealthVerdict::Unknown);
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));

    const Json::Value& api = report.detail["api_services"];
    EXPECT_EQ(api["openrouter"]["status"].asString(), "unknown");
    EXPECT_EQ(api["openrouter"]["note"].asString(), "API key required for testing");
    EXPECT_EQ(api["exa"]["status"].asString(), "unknown");
}

TEST(ExternalServicesCheckerTest, UnreachableDependencyWithCredentialIsUnhealthy) {
    std::string url = "http://127.0.0.1:" + std::to_string(test::releasedPort()) + "/";
    ExternalServicesChecker checker({
        {"tavily", url, std::string("key")},
        {"jina", url, std::nullopt},
    }, 2);

    auto report = checker.check();

    EXPECT_EQ(report.detail["api_services"]["tavily"]["status"].asString(), "unhealthy");
    EXPECT_EQ(report.detail["api_services"]["jina"]["status"].asString(), "unknown");
    EXPECT_EQ(report.verdict, HealthVerdict::Unhealthy);
}

TEST(ExternalServicesCheckerTest, DefaultDependencyList) {
    auto deps = defaultExternalDependencies();
    ASSERT_EQ(deps.size(), 6u);
    EXPECT_EQ(deps[0].name, "openrouter");
    EXPECT_EQ(deps[1].name, "serpapi");
    EXPECT_EQ(deps[2].name, "jina");
    EXPECT_EQ(deps[3].name, "firecrawl");
    EXPECT_EQ(deps[4].name, "tavily");
    EXPECT_EQ(deps[5].name, "exa");
    EXPECT_EQ(apiKeyVariable("firecrawl"), "FIRECRAWL_API_KEY");
}
