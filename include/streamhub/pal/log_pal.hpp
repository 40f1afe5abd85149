// StreamHub - Real-time event fan-out server
// Platform Abstraction Layer - Logging Interface
//
// Abstracts the platform log facility (syslog / stderr on Linux) and the
// sinks that structured log records are written to.

#ifndef STREAMHUB_PAL_LOG_PAL_HPP
#define STREAMHUB_PAL_LOG_PAL_HPP

#include "streamhub/pal/pal_types.hpp"

#include <memory>
#include <string>

namespace streamhub {
namespace pal {

/**
 * @brief Interface for log output sinks.
 *
 * Sinks receive fully formatted records and write them to their
 * destination (console, capture buffer in tests, ...).
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log record.
     *
     * @param level Severity of the record
     * @param message Formatted record
     * @param category Log category (e.g. "Pool", "Connection")
     * @param context Source location
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    virtual void flush() = 0;

    /**
     * @brief Sink name for debugging.
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Abstract interface for platform-specific logging.
 *
 * ## Thread Safety
 * - All methods are thread-safe
 * - Sinks must handle concurrent write calls
 *
 * @invariant Messages below minLevel are not processed
 * @invariant All registered sinks receive qualifying messages
 */
class ILogPAL {
public:
    virtual ~ILogPAL() = default;

    /**
     * @brief Log a message.
     *
     * Returns immediately when @p level is below the minimum level.
     *
     * @code
     * logPal->log(LogLevel::Info, "Listening on 0.0.0.0:8080", "Server",
     *             STREAMHUB_LOG_CONTEXT());
     * @endcode
     */
    virtual void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    virtual void setMinLevel(LogLevel level) = 0;
    virtual LogLevel getMinLevel() const = 0;

    /**
     * @brief Flush all log sinks.
     */
    virtual void flush() = 0;

    /**
     * @brief Register an additional sink. Ownership is shared.
     */
    virtual void addSink(std::shared_ptr<ILogSink> sink) = 0;

    /**
     * @brief Unregister a sink. No effect when the sink is not registered.
     */
    virtual void removeSink(std::shared_ptr<ILogSink> sink) = 0;
};

// =============================================================================
// Convenience Macros for Logging
// =============================================================================

/**
 * Shortcuts with automatic source location capture.
 *
 * Usage:
 *   STREAMHUB_LOG_INFO(logPal, "Server", "Listening on port " + std::to_string(port));
 */

#define STREAMHUB_LOG_CONTEXT() \
    ::streamhub::pal::LogContext{__FILE__, __LINE__, __FUNCTION__, {}}

#define STREAMHUB_LOG(logger, level, category, message) \
    do { \
        if ((logger) != nullptr) { \
            (logger)->log((level), (message), (category), STREAMHUB_LOG_CONTEXT()); \
        } \
    } while (0)

#define STREAMHUB_LOG_DEBUG(logger, category, message) \
    STREAMHUB_LOG(logger, ::streamhub::pal::LogLevel::Debug, category, message)

#define STREAMHUB_LOG_INFO(logger, category, message) \
    STREAMHUB_LOG(logger, ::streamhub::pal::LogLevel::Info, category, message)

#define STREAMHUB_LOG_WARNING(logger, category, message) \
    STREAMHUB_LOG(logger, ::streamhub::pal::LogLevel::Warning, category, message)

#define STREAMHUB_LOG_ERROR(logger, category, message) \
    STREAMHUB_LOG(logger, ::streamhub::pal::LogLevel::Error, category, message)

} // namespace pal
} // namespace streamhub

#endif // STREAMHUB_PAL_LOG_PAL_HPP
