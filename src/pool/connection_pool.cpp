// StreamHub - Real-time event fan-out server
// Connection Pool Implementation

#include "streamhub/pool/connection_pool.hpp"
#include "streamhub/pool/sse_formatter.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <utility>

namespace streamhub {
namespace pool {

namespace {

constexpr const char* LOG_CATEGORY = "Pool";

} // anonymous namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

ConnectionPool::ConnectionPool(
    core::PoolConfig config,
    std::shared_ptr<pal::ITimerPAL> timerPal,
    std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , timerPal_(std::move(timerPal))
    , logger_(std::move(logger))
{
    if (!MessageQueue::isValidRetentionRatio(config_.dropRetentionRatio)) {
        double fallback = core::PoolConfig{}.dropRetentionRatio;
        if (logger_) {
            logger_->warning("dropRetentionRatio " + std::to_string(config_.dropRetentionRatio) +
                             " is outside (0, 1]; using " + std::to_string(fallback),
                             LOG_CATEGORY);
        }
        config_.dropRetentionRatio = fallback;
    }
    startTimers();
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

void ConnectionPool::startTimers() {
    if (!timerPal_) {
        if (logger_) {
            logger_->error("No timer source; keepalive and sweep disabled", LOG_CATEGORY);
        }
        return;
    }

    auto keepalive = timerPal_->scheduleRepeating(config_.pingInterval, [this]() {
        if (!shutdown_.load()) {
            sendKeepalives();
        }
    });
    if (keepalive.isSuccess()) {
        keepaliveTimer_ = keepalive.value();
    } else if (logger_) {
        logger_->error("Failed to start keepalive timer: " + keepalive.error().message,
                       LOG_CATEGORY);
    }

    auto sweep = timerPal_->scheduleRepeating(config_.cleanupInterval, [this]() {
        if (!shutdown_.load()) {
            sweepStaleConnections();
        }
    });
    if (sweep.isSuccess()) {
        sweepTimer_ = sweep.value();
    } else if (logger_) {
        logger_->error("Failed to start sweep timer: " + sweep.error().message, LOG_CATEGORY);
    }
}

void ConnectionPool::cancelTimers() {
    if (!timerPal_) {
        return;
    }

    for (pal::TimerHandle handle : {keepaliveTimer_, sweepTimer_}) {
        if (handle == pal::INVALID_TIMER_HANDLE) {
            continue;
        }
        auto result = timerPal_->cancelTimer(handle);
        if (result.isError() && logger_) {
            logger_->debug("Timer cancel failed: " + result.error().message, LOG_CATEGORY);
        }
    }
}

// =============================================================================
// Admission
// =============================================================================

core::Result<core::ConnectionId, core::Error> ConnectionPool::addConnection(
    AddConnectionRequest request)
{
    std::vector<PoolEvent> events;
    core::Result<core::ConnectionId, core::Error> result = [&]() {
        std::lock_guard<std::mutex> lock(mutex_);
        return addConnectionLocked(request, events);
    }();

    eventBus_.publishAll(events);
    return result;
}

core::Result<core::ConnectionId, core::Error> ConnectionPool::addConnectionLocked(
    AddConnectionRequest& request, std::vector<PoolEvent>& events)
{
    using ResultType = core::Result<core::ConnectionId, core::Error>;

    if (shutdown_.load()) {
        return ResultType::error(core::Error{
            core::ErrorCode::PoolShutDown, "Pool is shut down"});
    }

    if (!request.transport) {
        return ResultType::error(core::Error{
            core::ErrorCode::InvalidArgument, "Transport is required"});
    }
    if (request.userId.empty() || request.tenantId.empty()) {
        return ResultType::error(core::Error{
            core::ErrorCode::InvalidArgument, "User and tenant ids are required"});
    }

    if (connections_.size() >= config_.maxTotalConnections) {
        return ResultType::error(rejectLocked(
            request, core::ErrorCode::PoolFull,
            "Maximum total connections (" + std::to_string(config_.maxTotalConnections) +
                ") reached",
            true, events));
    }

    if (index_.tenantConnectionCount(request.tenantId) >= config_.maxConnectionsPerTenant) {
        return ResultType::error(rejectLocked(
            request, core::ErrorCode::TenantConnectionLimitReached,
            "Maximum connections for tenant (" +
                std::to_string(config_.maxConnectionsPerTenant) + ") reached",
            true, events));
    }

    if (index_.userConnectionCount(request.userId) >= config_.maxConnectionsPerUser) {
        return ResultType::error(rejectLocked(
            request, core::ErrorCode::UserConnectionLimitReached,
            "Maximum connections for user (" +
                std::to_string(config_.maxConnectionsPerUser) + ") reached",
            false, events));
    }

    auto connection = std::make_unique<Connection>(
        config_.maxMessageQueueSize, config_.dropRetentionRatio);
    connection->id = idGenerator_.nextConnectionId();
    connection->userId = request.userId;
    connection->tenantId = request.tenantId;
    connection->createdAt = core::SystemClock::now();
    connection->lastActivityAt = timerPal_ ? timerPal_->now() : core::SteadyClock::now();
    connection->metadata = std::move(request.metadata);
    connection->transport = std::move(request.transport);

    const std::vector<core::ChannelName>& requested =
        request.channels.has_value() ? *request.channels : config_.defaultChannels;
    for (const auto& channel : requested) {
        if (!channel.empty()) {
            connection->channels.insert(channel);
        }
    }

    const core::ConnectionId id = connection->id;
    Connection& conn = *connection;
    connections_.emplace(id, std::move(connection));

    index_.addOwner(id, conn.userId, conn.tenantId);
    for (const auto& channel : conn.channels) {
        index_.subscribe(core::ChannelKey(conn.tenantId, channel), id);
    }
    peakConnections_ = std::max(peakConnections_, connections_.size());

    logConnectionEvent(core::ConnectionEventType::Admitted, conn);

    conn.transport->setDrainCallback([this, id]() {
        handleDrain(id);
    });

    core::JsonValue channels = core::JsonValue::array();
    for (const auto& channel : conn.channels) {
        channels.push(channel);
    }
    core::JsonValue data = core::JsonValue::object();
    data.set("connectionId", id);
    data.set("channels", std::move(channels));
    data.set("timestamp", core::formatIso8601(core::SystemClock::now()));

    MessagePtr connected = makeMessage(
        idGenerator_.nextMessageId(), std::string("connected"), std::move(data),
        core::Priority::High, conn.lastActivityAt);

    // connection_added follows the connected write; a failed write still
    // reports the admission ahead of its removal.
    PoolEvent added = makeEvent(PoolEventType::ConnectionAdded, conn);
    const size_t addedAt = events.size();

    WriteOutcome outcome = writeLocked(conn, *connected, events);
    if (outcome == WriteOutcome::Failed) {
        events.insert(events.begin() + static_cast<std::ptrdiff_t>(addedAt), std::move(added));
        return ResultType::error(core::Error{
            core::ErrorCode::WriteFailed, "Initial write failed", id});
    }
    if (outcome == WriteOutcome::WouldBlock) {
        enqueueLocked(conn, connected, events);
    }

    events.push_back(std::move(added));
    return ResultType::success(id);
}

core::Error ConnectionPool::rejectLocked(
    const AddConnectionRequest& request,
    core::ErrorCode code,
    const std::string& message,
    bool emitPoolFull,
    std::vector<PoolEvent>& events)
{
    ++rejectedConnections_;

    if (emitPoolFull) {
        PoolEvent event(PoolEventType::PoolFull);
        event.tenantId = request.tenantId;
        event.userId = request.userId;
        event.errorMessage = message;
        events.push_back(std::move(event));
    }

    if (logger_) {
        core::LogContext context;
        context.tenantId = request.tenantId;
        context.userId = request.userId;
        context.reason = message;
        context.errorCode = static_cast<int32_t>(code);
        logger_->logConnectionEvent(core::ConnectionEventType::Rejected, context);
    }

    return core::Error{code, message, request.tenantId};
}

// =============================================================================
// Removal
// =============================================================================

bool ConnectionPool::removeConnection(const core::ConnectionId& id, RemovalReason reason) {
    std::vector<PoolEvent> events;
    bool removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = removeConnectionLocked(id, reason, events);
    }

    eventBus_.publishAll(events);
    return removed;
}

bool ConnectionPool::removeConnectionLocked(
    core::ConnectionId id, RemovalReason reason, std::vector<PoolEvent>& events)
{
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }

    Connection& conn = *it->second;

    for (const auto& channel : conn.channels) {
        index_.unsubscribe(core::ChannelKey(conn.tenantId, channel), id);
    }
    index_.removeOwner(id, conn.userId, conn.tenantId);

    size_t discarded = conn.pending.clear();
    if (discarded > 0 && logger_) {
        logger_->debug("Discarded " + std::to_string(discarded) +
                       " queued messages for " + id, LOG_CATEGORY);
    }

    if (conn.transport) {
        conn.transport->setDrainCallback(nullptr);
        try {
            auto closed = conn.transport->close();
            if (closed.isError() && logger_) {
                logger_->debug("Close failed for " + id + ": " + closed.error().message,
                               LOG_CATEGORY);
            }
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->debug("Close threw for " + id + ": " + e.what(), LOG_CATEGORY);
            }
        }
    }

    PoolEvent event = makeEvent(PoolEventType::ConnectionRemoved, conn);
    event.removalReason = reason;
    logConnectionEvent(core::ConnectionEventType::Removed, conn, removalReasonToString(reason));

    connections_.erase(it);
    events.push_back(std::move(event));
    return true;
}

// =============================================================================
// Subscriptions
// =============================================================================

bool ConnectionPool::subscribe(const core::ConnectionId& id, const core::ChannelName& channel) {
    if (channel.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }

    Connection& conn = *it->second;
    conn.channels.insert(channel);
    index_.subscribe(core::ChannelKey(conn.tenantId, channel), id);
    return true;
}

bool ConnectionPool::unsubscribe(const core::ConnectionId& id, const core::ChannelName& channel) {
    if (channel.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }

    Connection& conn = *it->second;
    conn.channels.erase(channel);
    index_.unsubscribe(core::ChannelKey(conn.tenantId, channel), id);
    return true;
}

// =============================================================================
// Publishing
// =============================================================================

MessagePtr ConnectionPool::createMessage(
    std::optional<std::string> event,
    core::JsonValue data,
    core::Priority priority,
    std::optional<std::chrono::milliseconds> ttl)
{
    core::TimePoint now = timerPal_ ? timerPal_->now() : core::SteadyClock::now();
    return makeMessage(idGenerator_.nextMessageId(), std::move(event), std::move(data),
                       priority, now, ttl);
}

bool ConnectionPool::sendMessage(const core::ConnectionId& id, const MessagePtr& message) {
    if (!message) {
        return false;
    }

    std::vector<PoolEvent> events;
    bool delivered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            delivered = sendLocked(*it->second, message, events);
        }
    }

    eventBus_.publishAll(events);
    return delivered;
}

bool ConnectionPool::sendToConnection(
    const core::ConnectionId& id,
    std::optional<std::string> event,
    core::JsonValue data,
    core::Priority priority,
    std::optional<std::chrono::milliseconds> ttl)
{
    return sendMessage(id, createMessage(std::move(event), std::move(data), priority, ttl));
}

size_t ConnectionPool::broadcast(
    const core::TenantId& tenantId,
    const core::ChannelName& channel,
    std::optional<std::string> event,
    core::JsonValue data,
    core::Priority priority,
    std::optional<std::chrono::milliseconds> ttl)
{
    std::vector<PoolEvent> events;
    size_t sent = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto subscribers = index_.channelSubscribers(core::ChannelKey(tenantId, channel));
        if (subscribers.empty()) {
            return 0;
        }
        MessagePtr message = createMessage(std::move(event), std::move(data), priority, ttl);
        sent = fanOutLocked(subscribers, message, events);
    }

    eventBus_.publishAll(events);
    return sent;
}

size_t ConnectionPool::broadcastToUser(
    const core::UserId& userId,
    std::optional<std::string> event,
    core::JsonValue data,
    core::Priority priority,
    std::optional<std::chrono::milliseconds> ttl)
{
    std::vector<PoolEvent> events;
    size_t sent = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto targets = index_.userConnections(userId);
        if (targets.empty()) {
            return 0;
        }
        MessagePtr message = createMessage(std::move(event), std::move(data), priority, ttl);
        sent = fanOutLocked(targets, message, events);
    }

    eventBus_.publishAll(events);
    return sent;
}

size_t ConnectionPool::broadcastToTenant(
    const core::TenantId& tenantId,
    std::optional<std::string> event,
    core::JsonValue data,
    core::Priority priority,
    std::optional<std::chrono::milliseconds> ttl)
{
    std::vector<PoolEvent> events;
    size_t sent = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto targets = index_.tenantConnections(tenantId);
        if (targets.empty()) {
            return 0;
        }
        MessagePtr message = createMessage(std::move(event), std::move(data), priority, ttl);
        sent = fanOutLocked(targets, message, events);
    }

    eventBus_.publishAll(events);
    return sent;
}

size_t ConnectionPool::fanOutLocked(
    const std::vector<core::ConnectionId>& ids,
    const MessagePtr& message,
    std::vector<PoolEvent>& events)
{
    size_t sent = 0;
    for (const auto& id : ids) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            continue;
        }
        if (sendLocked(*it->second, message, events)) {
            ++sent;
        }
    }
    return sent;
}

bool ConnectionPool::sendLocked(
    Connection& connection, const MessagePtr& message, std::vector<PoolEvent>& events)
{
    core::TimePoint now = timerPal_ ? timerPal_->now() : core::SteadyClock::now();
    if (message->isExpired(now)) {
        dropLocked(connection, *message, DropReason::Expired, events);
        return false;
    }

    if (!connection.isWritable) {
        return enqueueLocked(connection, message, events);
    }

    switch (writeLocked(connection, *message, events)) {
        case WriteOutcome::Sent:
        case WriteOutcome::SentWithBackpressure:
            return true;
        case WriteOutcome::WouldBlock:
            return enqueueLocked(connection, message, events);
        case WriteOutcome::Failed:
        default:
            return false;
    }
}

bool ConnectionPool::enqueueLocked(
    Connection& connection, const MessagePtr& message, std::vector<PoolEvent>& events)
{
    if (connection.pending.isFull()) {
        auto evicted = connection.pending.applyDropPolicy();
        for (const auto& dropped : evicted) {
            dropLocked(connection, *dropped, DropReason::Evicted, events);
        }
        if (!evicted.empty() && logger_) {
            logger_->debug("Drop policy evicted " + std::to_string(evicted.size()) +
                           " messages from " + connection.id, LOG_CATEGORY);
        }
    }

    if (connection.pending.push(message)) {
        return true;
    }

    dropLocked(connection, *message, DropReason::QueueFull, events);
    return false;
}

void ConnectionPool::dropLocked(
    const Connection& connection,
    const Message& message,
    DropReason reason,
    std::vector<PoolEvent>& events)
{
    ++droppedMessages_;

    PoolEvent event = makeEvent(PoolEventType::MessageDropped, connection);
    event.messageId = message.id;
    event.dropReason = reason;
    events.push_back(std::move(event));
}

ConnectionPool::WriteOutcome ConnectionPool::writeLocked(
    Connection& connection, const Message& message, std::vector<PoolEvent>& events)
{
    const std::string frame = SseFormatter::format(message);

    std::optional<pal::WriteStatus> status;
    std::string failure;
    auto started = core::SteadyClock::now();
    try {
        auto result = connection.transport->write(frame);
        if (result.isSuccess()) {
            status = result.value();
        } else {
            failure = result.error().message;
        }
    } catch (const std::exception& e) {
        failure = std::string("Transport threw: ") + e.what();
    }
    auto elapsed = core::SteadyClock::now() - started;

    if (!status.has_value()) {
        PoolEvent event = makeEvent(PoolEventType::ConnectionError, connection);
        event.messageId = message.id;
        event.errorMessage = failure;
        events.push_back(std::move(event));

        if (logger_) {
            core::LogContext context;
            context.connectionId = connection.id;
            context.tenantId = connection.tenantId;
            context.userId = connection.userId;
            context.errorCode = static_cast<int32_t>(core::ErrorCode::WriteFailed);
            logger_->errorWithContext("Write failed: " + failure, context, LOG_CATEGORY);
        }

        removeConnectionLocked(connection.id, RemovalReason::WriteError, events);
        return WriteOutcome::Failed;
    }

    if (*status == pal::WriteStatus::WouldBlock) {
        connection.isWritable = false;
        events.push_back(makeEvent(PoolEventType::Backpressure, connection));
        logConnectionEvent(core::ConnectionEventType::Backpressure, connection,
                           pal::writeStatusToString(*status));
        return WriteOutcome::WouldBlock;
    }

    latency_.record(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()));

    connection.messagesSent++;
    connection.bytesWritten += frame.size();
    connection.lastActivityAt = timerPal_ ? timerPal_->now() : core::SteadyClock::now();
    totalMessagesSent_++;
    totalBytesWritten_ += frame.size();

    PoolEvent sent = makeEvent(PoolEventType::MessageSent, connection);
    sent.messageId = message.id;
    events.push_back(std::move(sent));

    if (*status == pal::WriteStatus::AcceptedWithBackpressure) {
        connection.isWritable = false;
        events.push_back(makeEvent(PoolEventType::Backpressure, connection));
        logConnectionEvent(core::ConnectionEventType::Backpressure, connection,
                           pal::writeStatusToString(*status));
        return WriteOutcome::SentWithBackpressure;
    }

    return WriteOutcome::Sent;
}

// =============================================================================
// Drain
// =============================================================================

void ConnectionPool::handleDrain(const core::ConnectionId& id) {
    std::vector<PoolEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load()) {
            return;
        }

        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }

        Connection& conn = *it->second;
        conn.isWritable = true;
        events.push_back(makeEvent(PoolEventType::Drained, conn));
        logConnectionEvent(core::ConnectionEventType::Drained, conn);

        flushLocked(id, events);
    }

    eventBus_.publishAll(events);
}

void ConnectionPool::flushLocked(const core::ConnectionId& id, std::vector<PoolEvent>& events) {
    while (true) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }

        Connection& conn = *it->second;
        if (!conn.isWritable) {
            return;
        }

        MessagePtr message = conn.pending.popFront();
        if (!message) {
            return;
        }

        core::TimePoint now = timerPal_ ? timerPal_->now() : core::SteadyClock::now();
        if (message->isExpired(now)) {
            dropLocked(conn, *message, DropReason::Expired, events);
            continue;
        }

        WriteOutcome outcome = writeLocked(conn, *message, events);
        if (outcome == WriteOutcome::WouldBlock) {
            conn.pending.pushFront(std::move(message));
            return;
        }
        if (outcome == WriteOutcome::Failed) {
            return;
        }
    }
}

// =============================================================================
// Queries
// =============================================================================

bool ConnectionPool::recordActivity(const core::ConnectionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }
    it->second->lastActivityAt = timerPal_ ? timerPal_->now() : core::SteadyClock::now();
    return true;
}

PoolStats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    stats.totalConnections = connections_.size();
    for (const auto& entry : connections_) {
        const Connection& conn = *entry.second;
        if (conn.isWritable) {
            stats.activeConnections++;
        }
        if (conn.pending.size() >= config_.backpressureThreshold) {
            stats.congestedConnections++;
        }
    }
    stats.peakConnections = peakConnections_;

    stats.connectionsByTenant = index_.tenantCounts();
    stats.connectionsByUser = index_.userCounts();
    for (const auto& entry : index_.channelCounts()) {
        stats.channelSubscriptions[entry.first.toString()] = entry.second;
    }

    stats.totalMessagesSent = totalMessagesSent_;
    stats.totalBytesWritten = totalBytesWritten_;
    stats.droppedMessages = droppedMessages_;
    stats.rejectedConnections = rejectedConnections_;
    stats.averageWriteLatencyMs = latency_.averageMillis();
    stats.latencySampleCount = latency_.sampleCount();
    return stats;
}

std::optional<ConnectionInfo> ConnectionPool::getConnectionInfo(
    const core::ConnectionId& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return std::nullopt;
    }

    const Connection& conn = *it->second;
    ConnectionInfo info;
    info.id = conn.id;
    info.userId = conn.userId;
    info.tenantId = conn.tenantId;
    info.channels = conn.channels;
    info.createdAt = conn.createdAt;
    info.lastActivityAt = conn.lastActivityAt;
    info.messagesSent = conn.messagesSent;
    info.bytesWritten = conn.bytesWritten;
    info.pendingMessages = conn.pending.size();
    info.isWritable = conn.isWritable;
    info.metadata = conn.metadata;
    info.transport = conn.transport ? conn.transport->describe() : std::string();
    return info;
}

bool ConnectionPool::isUserConnected(const core::UserId& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.userConnectionCount(userId) > 0;
}

size_t ConnectionPool::getUserConnectionCount(const core::UserId& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.userConnectionCount(userId);
}

size_t ConnectionPool::getTenantConnectionCount(const core::TenantId& tenantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.tenantConnectionCount(tenantId);
}

size_t ConnectionPool::getChannelSubscriberCount(
    const core::TenantId& tenantId, const core::ChannelName& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.channelSubscriberCount(core::ChannelKey(tenantId, channel));
}

size_t ConnectionPool::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

// =============================================================================
// Observation
// =============================================================================

ListenerId ConnectionPool::addEventListener(PoolEventListener listener) {
    return eventBus_.addListener(std::move(listener));
}

bool ConnectionPool::removeEventListener(ListenerId id) {
    return eventBus_.removeListener(id);
}

// =============================================================================
// Maintenance
// =============================================================================

size_t ConnectionPool::sendKeepalives() {
    std::vector<PoolEvent> events;
    size_t pinged = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load() || connections_.empty()) {
            return 0;
        }

        std::vector<core::ConnectionId> targets;
        targets.reserve(connections_.size());
        for (const auto& entry : connections_) {
            if (entry.second->isWritable) {
                targets.push_back(entry.first);
            }
        }

        core::JsonValue data = core::JsonValue::object();
        data.set("timestamp", core::formatIso8601(core::SystemClock::now()));
        MessagePtr ping = createMessage(std::string("ping"), std::move(data),
                                        core::Priority::Low);

        for (const auto& id : targets) {
            auto it = connections_.find(id);
            if (it == connections_.end() || !it->second->isWritable) {
                continue;
            }
            WriteOutcome outcome = writeLocked(*it->second, *ping, events);
            if (outcome == WriteOutcome::Sent || outcome == WriteOutcome::SentWithBackpressure) {
                ++pinged;
            }
        }

        if (logger_) {
            logger_->debug("Keepalive sent to " + std::to_string(pinged) + " of " +
                           std::to_string(targets.size()) + " writable connections",
                           LOG_CATEGORY);
        }
    }

    eventBus_.publishAll(events);
    return pinged;
}

size_t ConnectionPool::sweepStaleConnections() {
    std::vector<PoolEvent> events;
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load()) {
            return 0;
        }

        core::TimePoint now = timerPal_ ? timerPal_->now() : core::SteadyClock::now();
        std::vector<core::ConnectionId> stale;
        for (const auto& entry : connections_) {
            if (now - entry.second->lastActivityAt > config_.connectionTimeout) {
                stale.push_back(entry.first);
            }
        }

        for (const auto& id : stale) {
            if (removeConnectionLocked(id, RemovalReason::Timeout, events)) {
                ++removed;
            }
        }

        if (removed > 0 && logger_) {
            logger_->debug("Sweep removed " + std::to_string(removed) +
                           " stale connections", LOG_CATEGORY);
        }
    }

    eventBus_.publishAll(events);
    return removed;
}

void ConnectionPool::shutdown() {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true)) {
        return;
    }

    // Cancel outside the lock: cancellation waits for a running callback,
    // which may itself be waiting for the lock.
    cancelTimers();

    std::vector<PoolEvent> events;
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::ConnectionId> ids;
        ids.reserve(connections_.size());
        for (const auto& entry : connections_) {
            ids.push_back(entry.first);
        }
        for (const auto& id : ids) {
            if (removeConnectionLocked(id, RemovalReason::Shutdown, events)) {
                ++removed;
            }
        }
        index_.clear();
    }

    if (logger_) {
        logger_->info("Pool shut down, closed " + std::to_string(removed) + " connections",
                      LOG_CATEGORY);
    }

    eventBus_.publishAll(events);
}

bool ConnectionPool::isShutdown() const {
    return shutdown_.load();
}

bool ConnectionPool::timersRunning() const {
    return !shutdown_.load() &&
           keepaliveTimer_ != pal::INVALID_TIMER_HANDLE &&
           sweepTimer_ != pal::INVALID_TIMER_HANDLE;
}

// =============================================================================
// Helpers
// =============================================================================

PoolEvent ConnectionPool::makeEvent(PoolEventType type, const Connection& connection) const {
    PoolEvent event(type);
    event.connectionId = connection.id;
    event.userId = connection.userId;
    event.tenantId = connection.tenantId;
    return event;
}

void ConnectionPool::logConnectionEvent(
    core::ConnectionEventType type,
    const Connection& connection,
    const std::string& reason)
{
    if (!logger_) {
        return;
    }

    core::LogContext context;
    context.connectionId = connection.id;
    context.tenantId = connection.tenantId;
    context.userId = connection.userId;
    context.reason = reason;
    logger_->logConnectionEvent(type, context);
}

} // namespace pool
} // namespace streamhub
