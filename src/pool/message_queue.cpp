// StreamHub - Real-time event fan-out server
// Message Queue Implementation

#include "streamhub/pool/message_queue.hpp"

#include <algorithm>
#include <cmath>

namespace streamhub {
namespace pool {

MessageQueue::MessageQueue(size_t capacity, double retentionRatio)
    : capacity_(capacity)
    , retentionRatio_(isValidRetentionRatio(retentionRatio) ? retentionRatio : 1.0)
{
}

bool MessageQueue::push(MessagePtr message) {
    if (isFull()) {
        return false;
    }
    queue_.push_back(std::move(message));
    return true;
}

void MessageQueue::pushFront(MessagePtr message) {
    queue_.push_front(std::move(message));
}

MessagePtr MessageQueue::popFront() {
    if (queue_.empty()) {
        return nullptr;
    }
    MessagePtr front = std::move(queue_.front());
    queue_.pop_front();
    return front;
}

size_t MessageQueue::retainCount() const {
    double kept = std::floor(static_cast<double>(capacity_) * retentionRatio_);
    if (kept < 0.0) {
        return 0;
    }
    return std::min(capacity_, static_cast<size_t>(kept));
}

std::vector<MessagePtr> MessageQueue::applyDropPolicy() {
    std::stable_sort(queue_.begin(), queue_.end(),
        [](const MessagePtr& a, const MessagePtr& b) {
            return static_cast<uint8_t>(a->priority) < static_cast<uint8_t>(b->priority);
        });

    std::vector<MessagePtr> dropped;
    size_t keep = retainCount();
    if (queue_.size() > keep) {
        dropped.assign(std::make_move_iterator(queue_.begin() + static_cast<std::ptrdiff_t>(keep)),
                       std::make_move_iterator(queue_.end()));
        queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(keep), queue_.end());
    }
    return dropped;
}

size_t MessageQueue::clear() {
    size_t discarded = queue_.size();
    queue_.clear();
    return discarded;
}

std::vector<MessagePtr> MessageQueue::snapshot() const {
    return std::vector<MessagePtr>(queue_.begin(), queue_.end());
}

} // namespace pool
} // namespace streamhub
