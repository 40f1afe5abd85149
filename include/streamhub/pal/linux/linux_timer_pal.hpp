// StreamHub - Real-time event fan-out server
// Linux Timer PAL Implementation
//
// Uses timerfd + epoll on a dedicated dispatch thread.

#ifndef STREAMHUB_PAL_LINUX_LINUX_TIMER_PAL_HPP
#define STREAMHUB_PAL_LINUX_LINUX_TIMER_PAL_HPP

#include "streamhub/core/result.hpp"
#include "streamhub/pal/pal_types.hpp"
#include "streamhub/pal/timer_pal.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#if defined(__linux__)

namespace streamhub {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of ITimerPAL using timerfd.
 *
 * This implementation uses:
 * - timerfd_create / timerfd_settime per timer
 * - epoll to wait on all timers and a wake eventfd
 * - clock_gettime(CLOCK_MONOTONIC) for time measurement
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Callbacks are dispatched one at a time on the timer thread
 * - cancelTimer() called from another thread blocks until an in-flight
 *   callback of the same timer has returned; called from inside a
 *   callback it returns immediately
 */
class LinuxTimerPAL : public ITimerPAL {
public:
    /**
     * @brief Creates the epoll set and starts the timer thread.
     */
    LinuxTimerPAL();

    /**
     * @brief Stops the timer thread and closes every timer.
     */
    ~LinuxTimerPAL() override;

    LinuxTimerPAL(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL& operator=(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL(LinuxTimerPAL&&) = delete;
    LinuxTimerPAL& operator=(LinuxTimerPAL&&) = delete;

    // =========================================================================
    // ITimerPAL Implementation
    // =========================================================================

    core::Result<TimerHandle, TimerError> scheduleOnce(
        std::chrono::milliseconds delay,
        TimerCallback callback
    ) override;

    core::Result<TimerHandle, TimerError> scheduleRepeating(
        std::chrono::milliseconds interval,
        TimerCallback callback
    ) override;

    core::Result<void, TimerError> cancelTimer(TimerHandle handle) override;

    std::chrono::steady_clock::time_point now() const override;

    uint64_t getMonotonicMillis() const override;

    /**
     * @brief Number of timers currently scheduled.
     */
    size_t activeTimerCount() const;

private:
    struct TimerInfo {
        int timerFd;
        TimerCallback callback;
        bool repeating;
        std::chrono::milliseconds interval;
    };

    core::Result<TimerHandle, TimerError> createTimer(
        std::chrono::milliseconds delay,
        std::chrono::milliseconds interval,
        TimerCallback callback,
        bool repeating
    );

    TimerHandle generateHandle();
    void timerThreadFunc();
    void dispatchExpiration(int fd);
    void wakeTimerThread();

    std::atomic<uint64_t> nextHandle_{1};
    mutable std::mutex timersMutex_;
    std::condition_variable callbackDone_;
    std::unordered_map<uint64_t, std::unique_ptr<TimerInfo>> timers_;
    std::unordered_map<int, uint64_t> fdToHandle_;
    uint64_t runningHandle_{0};  // Timer whose callback is executing, 0 if none

    int epollFd_{-1};
    int wakeEventFd_{-1};

    std::thread timerThread_;
    std::thread::id timerThreadId_;
    std::atomic<bool> shutdown_{false};
};

} // namespace linux
} // namespace pal
} // namespace streamhub

#endif // defined(__linux__)
#endif // STREAMHUB_PAL_LINUX_LINUX_TIMER_PAL_HPP
