// StreamHub - Real-time event fan-out server
// Pool Health Implementation

#include "streamhub/pool/pool_health.hpp"

namespace streamhub {
namespace pool {

const char* healthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Pass: return "pass";
        case HealthStatus::Warn: return "warn";
        case HealthStatus::Fail: return "fail";
        default: return "fail";
    }
}

HealthReport evaluateHealth(const PoolStats& stats, const HealthThresholds& thresholds) {
    HealthReport report;
    report.totalConnections = stats.totalConnections;
    report.congestedConnections = stats.congestedConnections;
    report.tenants = stats.connectionsByTenant.size();
    for (const auto& entry : stats.channelSubscriptions) {
        report.channelSubscriptions += entry.second;
    }
    report.estimatedMemoryBytes = stats.totalConnections * thresholds.bytesPerConnection;

    if (stats.totalConnections >= thresholds.criticalConnections) {
        report.status = HealthStatus::Fail;
        report.message = "Connection count critical: " +
                         std::to_string(stats.totalConnections);
    } else if (stats.totalConnections >= thresholds.warnConnections) {
        report.status = HealthStatus::Warn;
        report.message = "Connection count high: " + std::to_string(stats.totalConnections);
    } else if (stats.congestedConnections > 0) {
        report.status = HealthStatus::Warn;
        report.message = std::to_string(stats.congestedConnections) +
                         " connections congested";
    } else {
        report.status = HealthStatus::Pass;
        report.message = "Connection pool healthy";
    }

    return report;
}

core::JsonValue HealthReport::toJson() const {
    core::JsonValue details = core::JsonValue::object();
    details.set("totalConnections", static_cast<unsigned long long>(totalConnections));
    details.set("congestedConnections", static_cast<unsigned long long>(congestedConnections));
    details.set("tenants", static_cast<unsigned long long>(tenants));
    details.set("channelSubscriptions", static_cast<unsigned long long>(channelSubscriptions));
    details.set("estimatedMemoryBytes", static_cast<unsigned long long>(estimatedMemoryBytes));

    core::JsonValue json = core::JsonValue::object();
    json.set("status", healthStatusToString(status));
    json.set("message", message);
    json.set("details", std::move(details));
    return json;
}

} // namespace pool
} // namespace streamhub
