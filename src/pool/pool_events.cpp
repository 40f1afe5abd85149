// StreamHub - Real-time event fan-out server
// Pool Events Implementation

#include "streamhub/pool/pool_events.hpp"

#include <algorithm>

namespace streamhub {
namespace pool {

const char* poolEventTypeToString(PoolEventType type) {
    switch (type) {
        case PoolEventType::ConnectionAdded: return "connection_added";
        case PoolEventType::ConnectionRemoved: return "connection_removed";
        case PoolEventType::ConnectionError: return "connection_error";
        case PoolEventType::MessageSent: return "message_sent";
        case PoolEventType::MessageDropped: return "message_dropped";
        case PoolEventType::PoolFull: return "pool_full";
        case PoolEventType::Backpressure: return "backpressure";
        case PoolEventType::Drained: return "drained";
        default: return "unknown";
    }
}

const char* removalReasonToString(RemovalReason reason) {
    switch (reason) {
        case RemovalReason::ClientClosed: return "client_closed";
        case RemovalReason::Error: return "error";
        case RemovalReason::WriteError: return "write_error";
        case RemovalReason::Timeout: return "timeout";
        case RemovalReason::Shutdown: return "shutdown";
        default: return "error";
    }
}

const char* dropReasonToString(DropReason reason) {
    switch (reason) {
        case DropReason::QueueFull: return "queue_full";
        case DropReason::Evicted: return "evicted";
        case DropReason::Expired: return "expired";
        default: return "queue_full";
    }
}

ListenerId PoolEventBus::addListener(PoolEventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = nextId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool PoolEventBus::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
        [id](const std::pair<ListenerId, PoolEventListener>& entry) {
            return entry.first == id;
        });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void PoolEventBus::publish(const PoolEvent& event) const {
    std::vector<std::pair<ListenerId, PoolEventListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }

    for (const auto& entry : listeners) {
        if (entry.second) {
            entry.second(event);
        }
    }
}

void PoolEventBus::publishAll(const std::vector<PoolEvent>& events) const {
    for (const auto& event : events) {
        publish(event);
    }
}

size_t PoolEventBus::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

} // namespace pool
} // namespace streamhub
