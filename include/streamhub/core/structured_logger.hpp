// StreamHub - Real-time event fan-out server
// Structured Logging Component
//
// Provides level-filtered logging in plain text or one-line JSON, with
// connection-pool context (connection id, tenant, user, channel, reason).
// Records fan out to registered sinks and, optionally, to the platform log.

#ifndef STREAMHUB_CORE_STRUCTURED_LOGGER_HPP
#define STREAMHUB_CORE_STRUCTURED_LOGGER_HPP

#include "streamhub/core/types.hpp"
#include "streamhub/pal/log_pal.hpp"
#include "streamhub/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace streamhub {
namespace core {

/**
 * @brief Configurable log levels.
 *
 * Messages below the configured level are filtered out.
 */
enum class LogLevelConfig {
    Debug = 0,    ///< Per-message detail (drops, keepalive rounds)
    Info = 1,     ///< Admissions, removals, lifecycle
    Warning = 2,  ///< Rejections and backpressure
    Error = 3     ///< Transport failures
};

std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Convert string to log level (case-insensitive).
 * @return Corresponding level, Info for unknown names
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief Strict variant of stringToLogLevel for configuration input.
 * @return The level, or std::nullopt for unknown names
 */
std::optional<LogLevelConfig> parseLogLevelString(const std::string& str);

/**
 * @brief Connection lifecycle events logged by the pool.
 */
enum class ConnectionEventType {
    Admitted,      ///< Connection added to the pool
    Rejected,      ///< Admission refused by a capacity limit
    Removed,       ///< Connection removed (reason in context)
    Backpressure,  ///< Transport stopped accepting writes
    Drained        ///< Transport accepts writes again
};

std::string connectionEventTypeToString(ConnectionEventType eventType);

/**
 * @brief Context attached to connection events and contextual errors.
 *
 * Empty fields are omitted from the output.
 */
struct LogContext {
    std::string connectionId;
    std::string tenantId;
    std::string userId;
    std::string channel;
    std::string reason;       ///< Removal or rejection reason
    int32_t errorCode = 0;    ///< Numeric core::ErrorCode, 0 when absent

    LogContext() = default;
};

/**
 * @brief Structured logger with JSON format support.
 *
 * ## Thread Safety
 * All methods are thread-safe. Records from different threads may
 * interleave but are never torn.
 *
 * ## Usage Example
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->setLevel(LogLevelConfig::Info);
 * logger->setJsonFormat(true);
 * logger->addSink(consoleSink);
 *
 * LogContext ctx;
 * ctx.connectionId = id;
 * ctx.tenantId = "acme";
 * ctx.userId = "u-17";
 * logger->logConnectionEvent(ConnectionEventType::Admitted, ctx);
 * @endcode
 */
class StructuredLogger {
public:
    /**
     * @brief Creates a logger at Info level with plain-text output.
     */
    StructuredLogger();

    /**
     * @brief Flushes all sinks.
     */
    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    /**
     * @brief Check whether a record at @p level would be emitted.
     */
    bool isEnabled(LogLevelConfig level) const;

    /**
     * @brief Enable or disable JSON structured format.
     *
     * JSON records carry timestamp, level, category, message and any
     * non-empty context fields.
     */
    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    // =========================================================================
    // Basic Logging Methods
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "StreamHub");
    void info(const std::string& message, const std::string& category = "StreamHub");
    void warning(const std::string& message, const std::string& category = "StreamHub");
    void error(const std::string& message, const std::string& category = "StreamHub");

    // =========================================================================
    // Contextual Logging
    // =========================================================================

    /**
     * @brief Log a connection lifecycle event.
     *
     * Admitted, Removed and Drained are logged at Info; Rejected and
     * Backpressure at Warning.
     */
    void logConnectionEvent(ConnectionEventType eventType, const LogContext& context);

    /**
     * @brief Log an error with context fields.
     */
    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "StreamHub"
    );

    // =========================================================================
    // Sink Management
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);

    /**
     * @brief Forward every emitted record to a platform log as well.
     *
     * Pass nullptr to detach.
     */
    void setPlatformLog(std::shared_ptr<pal::ILogPAL> platformLog);

    void flush();

private:
    void log(LogLevelConfig level,
             const std::string& message,
             const std::string& category,
             const LogContext* context = nullptr);

    void dispatch(LogLevelConfig level,
                  const std::string& formatted,
                  const std::string& category);

    std::string formatJson(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    ) const;

    std::string formatPlainText(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    ) const;

    static pal::LogLevel toPalLogLevel(LogLevelConfig level);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
    std::shared_ptr<pal::ILogPAL> platformLog_;
};

} // namespace core
} // namespace streamhub

#endif // STREAMHUB_CORE_STRUCTURED_LOGGER_HPP
