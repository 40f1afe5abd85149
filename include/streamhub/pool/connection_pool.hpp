// StreamHub - Real-time event fan-out server
// Connection Pool
//
// Owns every streaming session of the process and delivers server events
// to them. Responsibilities:
// - Admission under total, per-tenant and per-user limits
// - Tenant-scoped channel subscriptions and user / tenant indexes
// - Publish to one connection, a channel, a user or a tenant
// - Transport backpressure: bounded per-connection queue with a priority
//   drop policy, flushed in order when the transport drains
// - Periodic keepalive pings and inactivity sweep
// - Aggregate statistics and a typed observation stream

#ifndef STREAMHUB_POOL_CONNECTION_POOL_HPP
#define STREAMHUB_POOL_CONNECTION_POOL_HPP

#include "streamhub/core/config_manager.hpp"
#include "streamhub/core/error_codes.hpp"
#include "streamhub/core/json_value.hpp"
#include "streamhub/core/result.hpp"
#include "streamhub/core/structured_logger.hpp"
#include "streamhub/core/types.hpp"
#include "streamhub/pal/timer_pal.hpp"
#include "streamhub/pal/transport.hpp"
#include "streamhub/pool/connection.hpp"
#include "streamhub/pool/message.hpp"
#include "streamhub/pool/pool_events.hpp"
#include "streamhub/pool/subscription_index.hpp"
#include "streamhub/pool/write_latency_tracker.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace streamhub {
namespace pool {

// =============================================================================
// Request and Statistics Types
// =============================================================================

/**
 * @brief Everything needed to admit one streaming session.
 */
struct AddConnectionRequest {
    std::shared_ptr<pal::ITransport> transport;
    core::UserId userId;
    core::TenantId tenantId;
    std::optional<std::vector<core::ChannelName>> channels;  ///< Defaults to PoolConfig::defaultChannels
    core::Metadata metadata;
};

/**
 * @brief Point-in-time pool statistics.
 *
 * Derived view only; admission and drop decisions never read it.
 */
struct PoolStats {
    size_t totalConnections = 0;
    size_t activeConnections = 0;     ///< Currently writable
    size_t congestedConnections = 0;  ///< Queue depth >= backpressureThreshold
    size_t peakConnections = 0;

    std::map<core::TenantId, size_t> connectionsByTenant;
    std::map<core::UserId, size_t> connectionsByUser;
    std::map<std::string, size_t> channelSubscriptions;  ///< Keyed "tenant:channel"

    uint64_t totalMessagesSent = 0;
    uint64_t totalBytesWritten = 0;
    uint64_t droppedMessages = 0;
    uint64_t rejectedConnections = 0;

    double averageWriteLatencyMs = 0.0;  ///< Over the last 1000 writes
    size_t latencySampleCount = 0;
};

// =============================================================================
// Connection Pool Interface
// =============================================================================

/**
 * @brief Interface for the connection pool.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /**
     * @brief Admit a session.
     *
     * Limits are checked in order: total, tenant, user. On success the
     * session is indexed, a "connected" event is written to it and then
     * connection_added is emitted, so listeners see the message_sent of
     * that write first. A failed write reports connection_added ahead of
     * connection_error and connection_removed.
     *
     * @return The new connection id, or an Error with PoolFull,
     *         TenantConnectionLimitReached, UserConnectionLimitReached,
     *         PoolShutDown, InvalidArgument or WriteFailed
     */
    virtual core::Result<core::ConnectionId, core::Error> addConnection(
        AddConnectionRequest request) = 0;

    /**
     * @brief Remove a session. No-op for unknown ids.
     *
     * @return true if a connection was removed
     */
    virtual bool removeConnection(const core::ConnectionId& id, RemovalReason reason) = 0;

    /**
     * @return false for unknown connections or empty channel names
     */
    virtual bool subscribe(const core::ConnectionId& id, const core::ChannelName& channel) = 0;
    virtual bool unsubscribe(const core::ConnectionId& id, const core::ChannelName& channel) = 0;

    // -------------------------------------------------------------------------
    // Publishing
    // -------------------------------------------------------------------------

    /**
     * @brief Deliver (or queue) a prepared message to one connection.
     *
     * @return true if written or queued; false if unknown, dropped or the
     *         write failed
     */
    virtual bool sendMessage(const core::ConnectionId& id, const MessagePtr& message) = 0;

    virtual bool sendToConnection(
        const core::ConnectionId& id,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    /**
     * @brief Publish to every subscriber of @p channel within @p tenantId.
     * @return Number of subscribers the message was written or queued for
     */
    virtual size_t broadcast(
        const core::TenantId& tenantId,
        const core::ChannelName& channel,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    virtual size_t broadcastToUser(
        const core::UserId& userId,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    virtual size_t broadcastToTenant(
        const core::TenantId& tenantId,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Record a keepalive acknowledgement from the client.
     */
    virtual bool recordActivity(const core::ConnectionId& id) = 0;

    virtual PoolStats getStats() const = 0;
    virtual std::optional<ConnectionInfo> getConnectionInfo(const core::ConnectionId& id) const = 0;
    virtual bool isUserConnected(const core::UserId& userId) const = 0;
    virtual size_t getUserConnectionCount(const core::UserId& userId) const = 0;
    virtual size_t getTenantConnectionCount(const core::TenantId& tenantId) const = 0;
    virtual size_t getChannelSubscriberCount(
        const core::TenantId& tenantId, const core::ChannelName& channel) const = 0;
    virtual size_t connectionCount() const = 0;

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    virtual ListenerId addEventListener(PoolEventListener listener) = 0;
    virtual bool removeEventListener(ListenerId id) = 0;

    // -------------------------------------------------------------------------
    // Maintenance
    // -------------------------------------------------------------------------

    /**
     * @brief Write a low-priority ping to every writable connection.
     * @return Number of pings written
     */
    virtual size_t sendKeepalives() = 0;

    /**
     * @brief Remove connections idle longer than connectionTimeout.
     * @return Number of connections removed
     */
    virtual size_t sweepStaleConnections() = 0;

    /**
     * @brief Stop the timers and remove every connection. Idempotent.
     */
    virtual void shutdown() = 0;
    virtual bool isShutdown() const = 0;
};

// =============================================================================
// Connection Pool Implementation
// =============================================================================

/**
 * @brief In-memory connection pool.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - A single mutex serializes every mutation (admission, publish, drop,
 *   drain, removal, timer work)
 * - Event listeners are invoked after the mutex is released, in the
 *   order the events occurred
 * - Transports must not call back into the pool from inside write()
 *   or close()
 *
 * The keepalive and sweep timers are started by the constructor and
 * cancelled by shutdown(), which the destructor calls.
 */
class ConnectionPool : public IConnectionPool {
public:
    /**
     * @param config Pool limits and intervals
     * @param timerPal Timer source for the periodic tasks and "now"
     * @param logger Optional structured logger
     */
    ConnectionPool(
        core::PoolConfig config,
        std::shared_ptr<pal::ITimerPAL> timerPal,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    ~ConnectionPool() override;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    core::Result<core::ConnectionId, core::Error> addConnection(
        AddConnectionRequest request) override;
    bool removeConnection(const core::ConnectionId& id, RemovalReason reason) override;
    bool subscribe(const core::ConnectionId& id, const core::ChannelName& channel) override;
    bool unsubscribe(const core::ConnectionId& id, const core::ChannelName& channel) override;

    bool sendMessage(const core::ConnectionId& id, const MessagePtr& message) override;
    bool sendToConnection(
        const core::ConnectionId& id,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    size_t broadcast(
        const core::TenantId& tenantId,
        const core::ChannelName& channel,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    size_t broadcastToUser(
        const core::UserId& userId,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    size_t broadcastToTenant(
        const core::TenantId& tenantId,
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;

    /**
     * @brief Build a message with a fresh id, stamped with the pool clock.
     */
    MessagePtr createMessage(
        std::optional<std::string> event,
        core::JsonValue data,
        core::Priority priority = core::Priority::Normal,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    bool recordActivity(const core::ConnectionId& id) override;

    PoolStats getStats() const override;
    std::optional<ConnectionInfo> getConnectionInfo(const core::ConnectionId& id) const override;
    bool isUserConnected(const core::UserId& userId) const override;
    size_t getUserConnectionCount(const core::UserId& userId) const override;
    size_t getTenantConnectionCount(const core::TenantId& tenantId) const override;
    size_t getChannelSubscriberCount(
        const core::TenantId& tenantId, const core::ChannelName& channel) const override;
    size_t connectionCount() const override;

    ListenerId addEventListener(PoolEventListener listener) override;
    bool removeEventListener(ListenerId id) override;

    size_t sendKeepalives() override;
    size_t sweepStaleConnections() override;
    void shutdown() override;
    bool isShutdown() const override;

    /**
     * @brief true while both periodic timers are scheduled.
     */
    bool timersRunning() const;

    const core::PoolConfig& config() const { return config_; }

private:
    enum class WriteOutcome {
        Sent,
        SentWithBackpressure,
        WouldBlock,
        Failed      ///< Connection has been removed
    };

    using ConnectionMap = std::unordered_map<core::ConnectionId, std::unique_ptr<Connection>>;

    core::Result<core::ConnectionId, core::Error> addConnectionLocked(
        AddConnectionRequest& request, std::vector<PoolEvent>& events);
    core::Error rejectLocked(
        const AddConnectionRequest& request,
        core::ErrorCode code,
        const std::string& message,
        bool emitPoolFull,
        std::vector<PoolEvent>& events);

    bool removeConnectionLocked(
        core::ConnectionId id, RemovalReason reason, std::vector<PoolEvent>& events);

    bool sendLocked(
        Connection& connection, const MessagePtr& message, std::vector<PoolEvent>& events);
    bool enqueueLocked(
        Connection& connection, const MessagePtr& message, std::vector<PoolEvent>& events);
    size_t fanOutLocked(
        const std::vector<core::ConnectionId>& ids,
        const MessagePtr& message,
        std::vector<PoolEvent>& events);
    WriteOutcome writeLocked(
        Connection& connection, const Message& message, std::vector<PoolEvent>& events);
    void flushLocked(const core::ConnectionId& id, std::vector<PoolEvent>& events);
    void dropLocked(
        const Connection& connection,
        const Message& message,
        DropReason reason,
        std::vector<PoolEvent>& events);

    void handleDrain(const core::ConnectionId& id);
    void startTimers();
    void cancelTimers();

    void logConnectionEvent(core::ConnectionEventType type, const Connection& connection,
                            const std::string& reason = "");

    PoolEvent makeEvent(PoolEventType type, const Connection& connection) const;

    core::PoolConfig config_;
    std::shared_ptr<pal::ITimerPAL> timerPal_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    ConnectionMap connections_;
    SubscriptionIndex index_;
    WriteLatencyTracker latency_;
    IdGenerator idGenerator_;

    size_t peakConnections_ = 0;
    uint64_t totalMessagesSent_ = 0;
    uint64_t totalBytesWritten_ = 0;
    uint64_t droppedMessages_ = 0;
    uint64_t rejectedConnections_ = 0;

    PoolEventBus eventBus_;

    pal::TimerHandle keepaliveTimer_ = pal::INVALID_TIMER_HANDLE;
    pal::TimerHandle sweepTimer_ = pal::INVALID_TIMER_HANDLE;
    std::atomic<bool> shutdown_{false};
};

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_CONNECTION_POOL_HPP
