// StreamHub - Real-time event fan-out server
// Linux Log PAL Implementation
//
// Routes log records to syslog and/or stderr and to registered sinks.

#ifndef STREAMHUB_PAL_LINUX_LINUX_LOG_PAL_HPP
#define STREAMHUB_PAL_LINUX_LINUX_LOG_PAL_HPP

#include "streamhub/pal/log_pal.hpp"
#include "streamhub/pal/pal_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if defined(__linux__)

namespace streamhub {
namespace pal {
namespace linux {

/**
 * @brief Output selection for LinuxLogPAL.
 */
struct LinuxLogOptions {
    std::string ident = "streamhub";  ///< syslog identity
    bool enableSyslog = true;
    bool enableStderr = true;
    bool decorateStderr = true;       ///< Prefix stderr lines with level and category
};

/**
 * @brief Linux implementation of ILogPAL.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Sink management uses mutex for protection
 * - syslog(3) is thread-safe
 */
class LinuxLogPAL : public ILogPAL {
public:
    /**
     * @brief Opens syslog with the configured ident when syslog is enabled.
     */
    explicit LinuxLogPAL(LinuxLogOptions options = LinuxLogOptions{});

    /**
     * @brief Flushes all sinks and closes syslog.
     */
    ~LinuxLogPAL() override;

    LinuxLogPAL(const LinuxLogPAL&) = delete;
    LinuxLogPAL& operator=(const LinuxLogPAL&) = delete;
    LinuxLogPAL(LinuxLogPAL&&) = delete;
    LinuxLogPAL& operator=(LinuxLogPAL&&) = delete;

    // =========================================================================
    // ILogPAL Implementation
    // =========================================================================

    void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override;

    void setMinLevel(LogLevel level) override;
    LogLevel getMinLevel() const override;
    void flush() override;
    void addSink(std::shared_ptr<ILogSink> sink) override;
    void removeSink(std::shared_ptr<ILogSink> sink) override;

    const LinuxLogOptions& options() const { return options_; }

private:
    void logToPlatform(
        LogLevel level,
        const std::string& message,
        const std::string& category
    );

    int toSyslogPriority(LogLevel level) const;

    LinuxLogOptions options_;
    std::atomic<LogLevel> minLevel_{LogLevel::Debug};
    mutable std::mutex sinksMutex_;
    std::mutex stderrMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;

    bool syslogOpened_{false};
};

} // namespace linux
} // namespace pal
} // namespace streamhub

#endif // defined(__linux__)
#endif // STREAMHUB_PAL_LINUX_LINUX_LOG_PAL_HPP
