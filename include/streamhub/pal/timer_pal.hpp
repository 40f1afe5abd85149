// StreamHub - Real-time event fan-out server
// Platform Abstraction Layer - Timer Interface
//
// Scheduling of one-shot and repeating callbacks plus a monotonic clock.
// The connection pool drives its keepalive and sweep tasks through this
// interface, and reads "now" from it for activity tracking.

#ifndef STREAMHUB_PAL_TIMER_PAL_HPP
#define STREAMHUB_PAL_TIMER_PAL_HPP

#include "streamhub/core/result.hpp"
#include "streamhub/pal/pal_types.hpp"

#include <chrono>
#include <cstdint>

namespace streamhub {
namespace pal {

/**
 * @brief Abstract interface for timer operations.
 *
 * ## Thread Safety
 * - Scheduling and cancellation are thread-safe
 * - Callbacks run on a timer thread (implementation-defined)
 * - Callbacks must be short-lived to avoid delaying other timers
 *
 * @invariant Timer handles are valid until cancelled or (for one-shot) fired
 * @invariant now() returns monotonically increasing values
 */
class ITimerPAL {
public:
    virtual ~ITimerPAL() = default;

    /**
     * @brief Schedule a callback to run once after @p delay.
     *
     * @return TimerHandle for cancellation, or TimerError on failure
     */
    virtual core::Result<TimerHandle, TimerError> scheduleOnce(
        std::chrono::milliseconds delay,
        TimerCallback callback
    ) = 0;

    /**
     * @brief Schedule a callback to run every @p interval.
     *
     * The first invocation occurs after one interval has elapsed.
     *
     * @code
     * auto result = timerPal->scheduleRepeating(config.pingInterval, [this]() {
     *     sendKeepalives();
     * });
     * if (result.isError()) {
     *     logger->error("Failed to start keepalive timer: " + result.error().message);
     * }
     * @endcode
     */
    virtual core::Result<TimerHandle, TimerError> scheduleRepeating(
        std::chrono::milliseconds interval,
        TimerCallback callback
    ) = 0;

    /**
     * @brief Cancel a scheduled timer.
     *
     * If the callback is currently executing on another thread, this call
     * waits for it to complete, so the callback never runs after
     * cancelTimer() returns.
     *
     * Error conditions:
     * - InvalidHandle: Timer handle is not valid
     * - AlreadyCancelled: Timer was already cancelled
     */
    virtual core::Result<void, TimerError> cancelTimer(TimerHandle handle) = 0;

    /**
     * @brief Current monotonic time.
     */
    virtual std::chrono::steady_clock::time_point now() const = 0;

    /**
     * @brief Monotonic time in milliseconds since an unspecified epoch.
     */
    virtual uint64_t getMonotonicMillis() const = 0;
};

} // namespace pal
} // namespace streamhub

#endif // STREAMHUB_PAL_TIMER_PAL_HPP
