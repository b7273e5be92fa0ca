/**
 * @file test_health_aggregator.cpp
 * @brief Unit tests for verdict precedence and checker execution
 */

#include <gtest/gtest.h>
#include <fdr/status/health_aggregator.h>

#include "exceptions.h"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace fdr::status;

namespace {

class FixedChecker : public IHealthChecker {
public:
    FixedChecker(std::string name, HealthVerdict verdict,
                 std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : name_(std::move(name)), verdict_(verdict), delay_(delay) {}

    std::string name() const override { return name_; }

    ComponentReport check() override {
        std::this_thread::sleep_for(delay_);
        ComponentReport report;
        report.name = name_;
        report.verdict = verdict_;
        report.timestamp = std::chrono::system_clock::now();
        return report;
    }

private:
    std::string name_;
    HealthVerdict verdict_;
    std::chrono::milliseconds delay_;
};

class ThrowingChecker : public IHealthChecker {
public:
    std::string name() const override { return "broken"; }
    ComponentReport check() override { throw std::runtime_error("disk exploded"); }
};

class MissingCapabilityChecker : public IHealthChecker {
public:
    std::string name() const override { return "optional"; }
    ComponentReport check() override {
        throw fdr::common::CapabilityException("driver not installed");
    }
};

} // namespace

class HealthAggregatorTest : public ::testing::Test {
protected:
    static ComponentReport report(const std::string& name, HealthVerdict verdict) {
        ComponentReport r;
        r.name = name;
        r.verdict = verdict;
        return r;
    }
};

TEST_F(HealthAggregatorTest, EmptyInputIsUnknown) {
    EXPECT_EQ(aggregateVerdict({}), HealthVerdict::Unknown);
}

TEST_F(HealthAggregatorTest, AllHealthyIsHealthy) {
    EXPECT_EQ(aggregateVerdict({HealthVerdict::Healthy, HealthVerdict::Healthy}), HealthVerdict::Healthy);
}

TEST_F(HealthAggregatorTest, WarningBeatsHealthy) {
    EXPECT_EQ(aggregateVerdict({HealthVerdict::Healthy, HealthVerdict::Warning}), HealthVerdict::Warning);
}

TEST_F(HealthAggregatorTest, UnhealthyBeatsEverything) {
    EXPECT_EQ(aggregateVerdict({HealthVerdict::Warning, HealthVerdict::Unhealthy, HealthVerdict::Healthy}),
              HealthVerdict::Unhealthy);
    EXPECT_EQ(aggregateVerdict({HealthVerdict::Unhealthy, HealthVerdict::Unknown}),
              HealthVerdict::Unhealthy);
}

TEST_F(HealthAggregatorTest, UnavailableAndUnknownDoNotVote) {
    EXPECT_EQ(aggregateVerdict({HealthVerdict::Healthy, HealthVerdict::Unavailable, HealthVerdict::Unknown}),
              HealthVerdict::Healthy);
    EXPECT_EQ(aggregateVerdict({HealthVerdict::Unavailable, HealthVerdict::Unknown}),
              HealthVerdict::Unknown);
}

TEST_F(HealthAggregatorTest, OrderDoesNotMatter) {
    std::vector<HealthVerdict> a = {HealthVerdict::Warning, HealthVerdict::Healthy, HealthVerdict::Unavailable};
    std::vector<HealthVerdict> b = {HealthVerdict::Unavailable, HealthVerdict::Healthy, HealthVerdict::Warning};
    EXPECT_EQ(aggregateVerdict(a), aggregateVerdict(b));
}

TEST_F(HealthAggregatorTest, AggregatePreservesComponentOrder) {
    auto result = aggregate({
        report("database", HealthVerdict::Healthy),
        report("system", HealthVerdict::Warning),
        report("services", HealthVerdict::Unknown),
    });

    EXPECT_EQ(result.overallVerdict, HealthVerdict::Warning);
    ASSERT_EQ(result.components.size(), 3u);
    EXPECT_EQ(result.components[0].name, "database");
    EXPECT_EQ(result.components[1].name, "system");
    EXPECT_EQ(result.components[2].name, "services");
}

TEST_F(HealthAggregatorTest, RunCheckerConvertsExceptionToUnhealthy) {
    ThrowingChecker checker;
    auto result = runChecker(checker);

    EXPECT_EQ(result.name, "broken");
    EXPECT_EQ(result.verdict, HealthVerdict::Unhealthy);
    EXPECT_EQ(result.detail["error"].asString(), "disk exploded");
}

TEST_F(HealthAggregatorTest, RunCheckerConvertsCapabilityExceptionToUnavailable) {
    MissingCapabilityChecker checker;
    auto result = runChecker(checker);

    EXPECT_EQ(result.verdict, HealthVerdict::Unavailable);
    EXPECT_NE(result.detail["error"].asString().find("driver not installed"), std::string::npos);
}

TEST_F(HealthAggregatorTest, RunCheckersKeepsCheckerOrderRegardlessOfCompletion) {
    std::vector<std::shared_ptr<IHealthChecker>> checkers = {
        std::make_shared<FixedChecker>("slow", HealthVerdict::Healthy, std::chrono::milliseconds(150)),
        std::make_shared<ThrowingChecker>(),
        std::make_shared<FixedChecker>("fast", HealthVerdict::Warning),
    };

    auto reports = runCheckers(checkers);

    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports[0].name, "slow");
    EXPECT_EQ(reports[1].name, "broken");
    EXPECT_EQ(reports[1].verdict, HealthVerdict::Unhealthy);
    EXPECT_EQ(reports[2].name, "fast");
    EXPECT_EQ(aggregate(reports).overallVerdict, HealthVerdict::Unhealthy);
}

TEST_F(HealthAggregatorTest, RunCheckersRunsConcurrently) {
    std::vector<std::shared_ptr<IHealthChecker>> checkers;
    for (int i = 0; i < 4; ++i) {
        checkers.push_back(std::make_shared<FixedChecker>(
            "c" + std::to_string(i), HealthVerdict::Healthy, std::chrono::milliseconds(200)));
    }

    auto start = std::chrono::steady_clock::now();
    auto reports = runCheckers(checkers);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(reports.size(), 4u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(700));
}

TEST_F(HealthAggregatorTest, VerdictStringsRoundTrip) {
    for (auto verdict : {HealthVerdict::Healthy, HealthVerdict::Warning, HealthVerdict::Unhealthy,
                         HealthVerdict::Unavailable, HealthVerdict::Unknown}) {
        EXPECT_EQ(verdictFromString(toString(verdict)), verdict);
    }
    EXPECT_EQ(verdictFromString("UP"), HealthVerdict::Unknown);
}
