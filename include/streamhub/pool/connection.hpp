// StreamHub - Real-time event fan-out server
// Connection - state of one streaming session inside the pool

#ifndef STREAMHUB_POOL_CONNECTION_HPP
#define STREAMHUB_POOL_CONNECTION_HPP

#include "streamhub/core/types.hpp"
#include "streamhub/pal/transport.hpp"
#include "streamhub/pool/message_queue.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace streamhub {
namespace pool {

/**
 * @brief Mutable per-session state. Owned exclusively by ConnectionPool and
 * only touched under its lock.
 */
struct Connection {
    core::ConnectionId id;
    core::UserId userId;
    core::TenantId tenantId;
    std::set<core::ChannelName> channels;

    core::SystemClock::time_point createdAt;
    core::TimePoint lastActivityAt;

    uint64_t messagesSent = 0;
    uint64_t bytesWritten = 0;

    MessageQueue pending;
    bool isWritable = true;

    core::Metadata metadata;
    std::shared_ptr<pal::ITransport> transport;

    Connection(size_t queueCapacity, double retentionRatio)
        : pending(queueCapacity, retentionRatio) {}

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
};

/**
 * @brief Read-only copy of a connection's observable state.
 */
struct ConnectionInfo {
    core::ConnectionId id;
    core::UserId userId;
    core::TenantId tenantId;
    std::set<core::ChannelName> channels;
    core::SystemClock::time_point createdAt;
    core::TimePoint lastActivityAt;
    uint64_t messagesSent = 0;
    uint64_t bytesWritten = 0;
    size_t pendingMessages = 0;
    bool isWritable = true;
    core::Metadata metadata;
    std::string transport;  ///< ITransport::describe()
};

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_CONNECTION_HPP
