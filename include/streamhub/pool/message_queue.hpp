// StreamHub - Real-time event fan-out server
// Message Queue - bounded per-connection outbound queue
//
// Responsibilities:
// - Hold messages that could not be written while the transport was
//   congested, in delivery order
// - Apply the priority drop policy when full

#ifndef STREAMHUB_POOL_MESSAGE_QUEUE_HPP
#define STREAMHUB_POOL_MESSAGE_QUEUE_HPP

#include "streamhub/pool/message.hpp"

#include <cstddef>
#include <deque>
#include <vector>

namespace streamhub {
namespace pool {

/**
 * @brief Bounded FIFO of shared messages with a priority drop policy.
 *
 * Not internally synchronized; the owning pool serializes access.
 *
 * @invariant size() <= capacity() after every operation
 */
class MessageQueue {
public:
    /**
     * @param capacity Maximum number of pending messages (> 0)
     * @param retentionRatio Share of capacity kept by applyDropPolicy(), in (0, 1].
     *        Any other value (NaN included) is treated as 1.
     */
    MessageQueue(size_t capacity, double retentionRatio);

    static bool isValidRetentionRatio(double ratio) {
        return ratio > 0.0 && ratio <= 1.0;
    }

    /**
     * @brief Append a message.
     * @return false (and nothing changes) when the queue is full
     */
    bool push(MessagePtr message);

    /**
     * @brief Put a message back at the head, e.g. after a write was refused.
     *
     * The message was popped from this queue, so room is available.
     */
    void pushFront(MessagePtr message);

    /**
     * @brief Remove and return the head, or nullptr when empty.
     */
    MessagePtr popFront();

    /**
     * @brief Drop low-priority entries until retainCount() remain.
     *
     * Entries are stably ordered by priority (high first, enqueue order
     * within a priority) and the tail beyond retainCount() is removed.
     *
     * @return The removed messages
     */
    std::vector<MessagePtr> applyDropPolicy();

    /**
     * @brief Discard every pending message.
     * @return Number of messages discarded
     */
    size_t clear();

    size_t size() const { return queue_.size(); }
    bool empty() const { return queue_.empty(); }
    size_t capacity() const { return capacity_; }
    bool isFull() const { return queue_.size() >= capacity_; }
    bool hasRoom() const { return queue_.size() < capacity_; }

    /**
     * @brief floor(capacity * retentionRatio).
     */
    size_t retainCount() const;

    /**
     * @brief Pending messages in delivery order.
     */
    std::vector<MessagePtr> snapshot() const;

private:
    size_t capacity_;
    double retentionRatio_;
    std::deque<MessagePtr> queue_;
};

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_MESSAGE_QUEUE_HPP
