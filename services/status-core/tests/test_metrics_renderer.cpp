/**
 * @file test_metrics_renderer.cpp
 * @brief Unit tests for Prometheus exposition output
 */

#include <gtest/gtest.h>
#include <fdr/status/metrics_renderer.h>

#include <sstream>
#include <vector>

using namespace fdr::status;

class MetricsRendererTest : public ::testing::Test {
protected:
    SystemSnapshot snapshot() const {
        SystemSnapshot s;
        s.cpu.usagePercent = 12.5;
        s.memory.usagePercent = 40.0;
        s.disk.usagePercent = 55.25;
        return s;
    }

    static AggregateReport reportWith(HealthVerdict verdict) {
        AggregateReport report;
        report.overallVerdict = verdict;
        return report;
    }

    static std::vector<std::string> lines(const std::string& text) {
        std::vector<std::string> out;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            out.push_back(line);
        }
        return out;
    }

    static int countPrefix(const std::vector<std::string>& all, const std::string& prefix) {
        int count = 0;
        for (const auto& line : all) {
            if (line.rfind(prefix, 0) == 0) ++count;
        }
        return count;
    }
};

TEST_F(MetricsRendererTest, FixedBlockOrder) {
    auto out = lines(renderMetrics(reportWith(HealthVerdict::Healthy), snapshot(), 42.0));

    ASSERT_EQ(out.size(), 20u);
    EXPECT_EQ(out[0], "# HELP fdr_cpu_usage_percent CPU usage percentage");
    EXPECT_EQ(out[1], "# TYPE fdr_cpu_usage_percent gauge");
    EXPECT_EQ(out[2], "fdr_cpu_usage_percent 12.50");
    EXPECT_EQ(out[3], "");
    EXPECT_EQ(out[5], "# TYPE fdr_memory_usage_percent gauge");
    EXPECT_EQ(out[6], "fdr_memory_usage_percent 40.00");
    EXPECT_EQ(out[9], "# TYPE fdr_disk_usage_percent gauge");
    EXPECT_EQ(out[10], "fdr_disk_usage_percent 55.25");
    EXPECT_EQ(out[13], "# TYPE fdr_uptime_seconds counter");
    EXPECT_EQ(out[14], "fdr_uptime_seconds 42.00");
    EXPECT_EQ(out[17], "# TYPE fdr_health_status gauge");
    EXPECT_EQ(out[18], "fdr_health_status 1");
    EXPECT_EQ(out[19], "");
}

TEST_F(MetricsRendererTest, ExactlyOneHealthStatusSample) {
    auto out = lines(renderMetrics(reportWith(HealthVerdict::Healthy), snapshot(), 1.0));
    EXPECT_EQ(countPrefix(out, "fdr_health_status "), 1);
}

TEST_F(MetricsRendererTest, HealthStatusIsOneOnlyWhenHealthy) {
    for (auto verdict : {HealthVerdict::Warning, HealthVerdict::Unhealthy,
                         HealthVerdict::Unavailable, HealthVerdict::Unknown}) {
        auto text = renderMetrics(reportWith(verdict), snapshot(), 1.0);
        EXPECT_NE(text.find("fdr_health_status 0\n"), std::string::npos) << toString(verdict);
    }
}

TEST_F(MetricsRendererTest, EveryMetricHasHelpAndType) {
    auto out = lines(renderMetrics(reportWith(HealthVerdict::Healthy), snapshot(), 1.0));
    EXPECT_EQ(countPrefix(out, "# HELP "), 5);
    EXPECT_EQ(countPrefix(out, "# TYPE "), 5);
}

TEST_F(MetricsRendererTest, ContentType) {
    EXPECT_STREQ(METRICS_CONTENT_TYPE, "text/plain; version=0.0.4");
}
