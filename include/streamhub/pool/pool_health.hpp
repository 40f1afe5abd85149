// StreamHub - Real-time event fan-out server
// Pool Health - pass / warn / fail evaluation over pool statistics

#ifndef STREAMHUB_POOL_POOL_HEALTH_HPP
#define STREAMHUB_POOL_POOL_HEALTH_HPP

#include "streamhub/core/json_value.hpp"
#include "streamhub/pool/connection_pool.hpp"

#include <cstddef>
#include <string>

namespace streamhub {
namespace pool {

enum class HealthStatus {
    Pass,
    Warn,
    Fail
};

const char* healthStatusToString(HealthStatus status);

/**
 * @brief Connection counts at which the pool is reported degraded.
 */
struct HealthThresholds {
    size_t warnConnections = 5000;
    size_t criticalConnections = 9000;
    size_t bytesPerConnection = 2048;  ///< Memory estimate per session
};

struct HealthReport {
    HealthStatus status = HealthStatus::Pass;
    std::string message;
    size_t totalConnections = 0;
    size_t congestedConnections = 0;
    size_t tenants = 0;
    size_t channelSubscriptions = 0;  ///< Sum over all channels
    size_t estimatedMemoryBytes = 0;

    core::JsonValue toJson() const;
};

/**
 * @brief Classify pool load.
 *
 * Fail at or above criticalConnections, warn at or above warnConnections.
 * A pass with any congested connection is downgraded to warn.
 */
HealthReport evaluateHealth(const PoolStats& stats,
                            const HealthThresholds& thresholds = HealthThresholds{});

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_POOL_HEALTH_HPP
