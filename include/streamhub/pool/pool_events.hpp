// StreamHub - Real-time event fan-out server
// Pool Events - typed observation stream of the connection pool
//
// Every state change of interest (admission, removal, delivery, drop,
// capacity rejection, backpressure) is published as a PoolEvent to any
// number of listeners.

#ifndef STREAMHUB_POOL_POOL_EVENTS_HPP
#define STREAMHUB_POOL_POOL_EVENTS_HPP

#include "streamhub/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace streamhub {
namespace pool {

// =============================================================================
// Event Types
// =============================================================================

enum class PoolEventType {
    ConnectionAdded,
    ConnectionRemoved,   ///< removalReason set
    ConnectionError,     ///< errorMessage set; a removal follows
    MessageSent,
    MessageDropped,      ///< dropReason set
    PoolFull,            ///< Admission refused by the total or tenant cap
    Backpressure,        ///< Transport stopped accepting writes
    Drained              ///< Transport accepts writes again
};

/**
 * @brief Why a connection left the pool.
 */
enum class RemovalReason {
    ClientClosed,
    Error,
    WriteError,
    Timeout,
    Shutdown
};

/**
 * @brief Why a message was not delivered.
 */
enum class DropReason {
    QueueFull,   ///< No room even after the drop policy ran
    Evicted,     ///< Removed from the queue by the drop policy
    Expired      ///< Expiry passed before delivery
};

/**
 * @brief Wire names: "connection_added", "connection_removed", ...
 */
const char* poolEventTypeToString(PoolEventType type);

/**
 * @brief Wire names: "client_closed", "error", "write_error", "timeout", "shutdown".
 */
const char* removalReasonToString(RemovalReason reason);

/**
 * @brief Wire names: "queue_full", "evicted", "expired".
 */
const char* dropReasonToString(DropReason reason);

// =============================================================================
// Event
// =============================================================================

/**
 * @brief One observation.
 *
 * Fields irrelevant to the event type are left empty.
 */
struct PoolEvent {
    PoolEventType type;
    core::ConnectionId connectionId;
    core::UserId userId;
    core::TenantId tenantId;
    core::MessageId messageId;
    RemovalReason removalReason = RemovalReason::Error;
    DropReason dropReason = DropReason::QueueFull;
    std::string errorMessage;
    std::chrono::steady_clock::time_point timestamp;

    explicit PoolEvent(PoolEventType t)
        : type(t), timestamp(std::chrono::steady_clock::now()) {}
};

using PoolEventListener = std::function<void(const PoolEvent&)>;

/**
 * @brief Listener registration id; 0 is never issued.
 */
using ListenerId = uint64_t;

// =============================================================================
// Event Bus
// =============================================================================

/**
 * @brief Fire-and-forget fan-out of pool events to registered listeners.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Listeners are invoked outside the internal lock, in registration
 *   order, so a listener may add or remove listeners
 */
class PoolEventBus {
public:
    PoolEventBus() = default;

    PoolEventBus(const PoolEventBus&) = delete;
    PoolEventBus& operator=(const PoolEventBus&) = delete;

    ListenerId addListener(PoolEventListener listener);

    /**
     * @return true if the listener was registered
     */
    bool removeListener(ListenerId id);

    void publish(const PoolEvent& event) const;
    void publishAll(const std::vector<PoolEvent>& events) const;

    size_t listenerCount() const;

private:
    mutable std::mutex mutex_;
    ListenerId nextId_ = 1;
    std::vector<std::pair<ListenerId, PoolEventListener>> listeners_;
};

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_POOL_EVENTS_HPP
