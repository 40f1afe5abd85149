// StreamHub - Real-time event fan-out server
// Platform Abstraction Layer - Common Types
//
// Handles, errors and callbacks shared by the timer and logging PAL
// interfaces.

#ifndef STREAMHUB_PAL_PAL_TYPES_HPP
#define STREAMHUB_PAL_PAL_TYPES_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace streamhub {

// Forward declarations
namespace core {
template<typename T, typename E> class Result;
}

namespace pal {

// =============================================================================
// Handle Types
// =============================================================================

/**
 * @brief Platform-independent timer handle.
 */
struct TimerHandle {
    uint64_t value;

    bool operator==(const TimerHandle& other) const { return value == other.value; }
    bool operator!=(const TimerHandle& other) const { return value != other.value; }
};

constexpr TimerHandle INVALID_TIMER_HANDLE{0};

// =============================================================================
// Error Codes
// =============================================================================

/**
 * @brief Timer operation error codes.
 */
enum class TimerErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    CreationFailed = 100,
    InvalidHandle = 101,
    CancellationFailed = 102,
    AlreadyCancelled = 103,
};

/**
 * @brief Log levels for the logging PAL.
 *
 * Ordered from most verbose (Trace) to least verbose (Critical).
 */
enum class LogLevel : uint32_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6         ///< Disable all logging
};

// =============================================================================
// Error Structures
// =============================================================================

/**
 * @brief Detailed timer error information.
 */
struct TimerError {
    TimerErrorCode code;
    std::string message;

    TimerError(TimerErrorCode c = TimerErrorCode::Unknown,
               std::string msg = "")
        : code(c)
        , message(std::move(msg)) {}
};

/**
 * @brief Source location attached to a log record.
 */
struct LogContext {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
    std::string threadName;
};

// =============================================================================
// Callback Types
// =============================================================================

/**
 * @brief Callback for timer expiration.
 */
using TimerCallback = std::function<void()>;

class ILogSink;

} // namespace pal
} // namespace streamhub

#endif // STREAMHUB_PAL_PAL_TYPES_HPP
