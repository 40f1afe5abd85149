// StreamHub - Real-time event fan-out server
// Message - immutable unit of outbound data
//
// A Message is created once per publish call and shared by reference with
// every recipient queue, so fan-out never copies the payload.

#ifndef STREAMHUB_POOL_MESSAGE_HPP
#define STREAMHUB_POOL_MESSAGE_HPP

#include "streamhub/core/json_value.hpp"
#include "streamhub/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace streamhub {
namespace pool {

/**
 * @brief One outbound event.
 *
 * @invariant A message whose expiry has passed is never delivered.
 */
struct Message {
    core::MessageId id;
    std::optional<std::string> event;        ///< SSE "event:" label
    core::JsonValue data;                    ///< Opaque payload
    core::Priority priority = core::Priority::Normal;
    core::SystemClock::time_point enqueuedAt;
    std::optional<core::TimePoint> expiry;   ///< Monotonic deadline

    bool isExpired(core::TimePoint now) const {
        return expiry.has_value() && now >= *expiry;
    }
};

using MessagePtr = std::shared_ptr<const Message>;

/**
 * @brief Generates connection and message identifiers.
 *
 * Format: "conn_<epoch-ms>_<16 hex>" and "msg_<epoch-ms>_<8 hex>". The
 * millisecond prefix orders ids roughly by creation; the random suffix
 * breaks ties.
 *
 * Thread Safety: all methods are thread-safe.
 */
class IdGenerator {
public:
    IdGenerator();

    core::ConnectionId nextConnectionId();
    core::MessageId nextMessageId();

private:
    std::string randomHex(size_t digits);

    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/**
 * @brief Assemble a message.
 *
 * @param ttl Optional time-to-live; sets expiry to @p now + ttl
 */
MessagePtr makeMessage(
    core::MessageId id,
    std::optional<std::string> event,
    core::JsonValue data,
    core::Priority priority,
    core::TimePoint now,
    std::optional<std::chrono::milliseconds> ttl = std::nullopt
);

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_MESSAGE_HPP
