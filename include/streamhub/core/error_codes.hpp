// StreamHub - Real-time event fan-out server
// Common error codes and Error structure

#ifndef STREAMHUB_CORE_ERROR_CODES_HPP
#define STREAMHUB_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace streamhub {
namespace core {

/**
 * @brief Error codes shared by every StreamHub layer.
 *
 * Grouped by range so that log consumers can classify a numeric code
 * without the enum definition.
 */
enum class ErrorCode : uint32_t {
    // General errors (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    NotFound = 4,
    AlreadyExists = 5,

    // Admission errors (100-199)
    PoolFull = 100,
    TenantConnectionLimitReached = 101,
    UserConnectionLimitReached = 102,
    PoolShutDown = 103,

    // Transport errors (200-299)
    TransportError = 200,
    WriteFailed = 201,
    TransportClosed = 202,
    CloseFailed = 203,

    // Delivery errors (300-399)
    QueueFull = 300,
    MessageExpired = 301,

    // Scheduling errors (400-499)
    TimerError = 400,
    TimerScheduleFailed = 401,

    // Configuration errors (600-699)
    ConfigError = 600,
    ConfigInvalid = 601,
    ConfigNotFound = 602,
    ConfigParseError = 603,
};

/**
 * @brief Convert error code to human-readable string.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::PoolFull: return "Pool full";
        case ErrorCode::TenantConnectionLimitReached: return "Tenant connection limit reached";
        case ErrorCode::UserConnectionLimitReached: return "User connection limit reached";
        case ErrorCode::PoolShutDown: return "Pool shut down";
        case ErrorCode::TransportError: return "Transport error";
        case ErrorCode::WriteFailed: return "Write failed";
        case ErrorCode::TransportClosed: return "Transport closed";
        case ErrorCode::CloseFailed: return "Close failed";
        case ErrorCode::QueueFull: return "Queue full";
        case ErrorCode::MessageExpired: return "Message expired";
        case ErrorCode::TimerError: return "Timer error";
        case ErrorCode::TimerScheduleFailed: return "Timer schedule failed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::ConfigInvalid: return "Configuration invalid";
        case ErrorCode::ConfigNotFound: return "Configuration not found";
        case ErrorCode::ConfigParseError: return "Configuration parse error";
        default: return "Unknown error code";
    }
}

/**
 * @brief Error code plus message and optional context (e.g. the
 * operation or connection that failed).
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    /**
     * @brief Render as "<code text>: <message> [<context>]".
     */
    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace streamhub

#endif // STREAMHUB_CORE_ERROR_CODES_HPP
