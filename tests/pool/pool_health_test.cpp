// StreamHub - Real-time event fan-out server
// Tests for pool health evaluation

#include <gtest/gtest.h>

#include "streamhub/pool/pool_health.hpp"

namespace streamhub {
namespace pool {
namespace test {

TEST(PoolHealthTest, EmptyPoolPasses) {
    HealthReport report = evaluateHealth(PoolStats{});
    EXPECT_EQ(report.status, HealthStatus::Pass);
    EXPECT_EQ(report.estimatedMemoryBytes, 0u);
}

TEST(PoolHealthTest, ThresholdsClassifyLoad) {
    PoolStats stats;
    stats.totalConnections = 4999;
    EXPECT_EQ(evaluateHealth(stats).status, HealthStatus::Pass);

    stats.totalConnections = 5000;
    EXPECT_EQ(evaluateHealth(stats).status, HealthStatus::Warn);

    stats.totalConnections = 9000;
    HealthReport report = evaluateHealth(stats);
    EXPECT_EQ(report.status, HealthStatus::Fail);
    EXPECT_EQ(report.estimatedMemoryBytes, 9000u * 2048u);
}

TEST(PoolHealthTest, CongestionDowngradesPassToWarn) {
    PoolStats stats;
    stats.totalConnections = 10;
    stats.congestedConnections = 2;

    HealthReport report = evaluateHealth(stats);
    EXPECT_EQ(report.status, HealthStatus::Warn);
    EXPECT_EQ(report.congestedConnections, 2u);
}

TEST(PoolHealthTest, ReportSummarizesTenantsAndSubscriptions) {
    PoolStats stats;
    stats.totalConnections = 3;
    stats.connectionsByTenant = {{"acme", 2}, {"globex", 1}};
    stats.channelSubscriptions = {{"acme:alerts", 2}, {"globex:system", 1}};

    HealthThresholds thresholds;
    thresholds.warnConnections = 2;
    HealthReport report = evaluateHealth(stats, thresholds);

    EXPECT_EQ(report.status, HealthStatus::Warn);
    EXPECT_EQ(report.tenants, 2u);
    EXPECT_EQ(report.channelSubscriptions, 3u);

    core::JsonValue json = report.toJson();
    EXPECT_EQ(json["status"].getString(), "warn");
    EXPECT_EQ(json["details"]["tenants"].getInt(), 2);
}

} // namespace test
} // namespace pool
} // namespace streamhub
