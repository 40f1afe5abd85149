// StreamHub - Real-time event fan-out server
// Linux Log PAL Implementation

#include "streamhub/pal/linux/linux_log_pal.hpp"

#if defined(__linux__)

#include <syslog.h>

#include <algorithm>
#include <cstdio>

namespace streamhub {
namespace pal {
namespace linux {

namespace {

const char* levelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "";
}

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxLogPAL::LinuxLogPAL(LinuxLogOptions options)
    : options_(std::move(options))
{
    if (options_.enableSyslog) {
        // openlog keeps the pointer, so ident must outlive the connection.
        openlog(options_.ident.c_str(), LOG_PID | LOG_NDELAY, LOG_USER);
        syslogOpened_ = true;
    }
}

LinuxLogPAL::~LinuxLogPAL() {
    flush();

    if (syslogOpened_) {
        closelog();
        syslogOpened_ = false;
    }
}

// =============================================================================
// Logging Operations
// =============================================================================

void LinuxLogPAL::log(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& context
) {
    if (static_cast<uint32_t>(level) < static_cast<uint32_t>(minLevel_.load()) ||
        level == LogLevel::Off) {
        return;
    }

    logToPlatform(level, message, category);

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(level, message, category, context);
    }
}

void LinuxLogPAL::logToPlatform(
    LogLevel level,
    const std::string& message,
    const std::string& category
) {
    if (syslogOpened_) {
        syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());
    }

    if (options_.enableStderr) {
        std::lock_guard<std::mutex> lock(stderrMutex_);
        if (options_.decorateStderr) {
            std::fprintf(stderr, "[%s] [%s] %s\n",
                         levelLabel(level), category.c_str(), message.c_str());
        } else {
            std::fprintf(stderr, "%s\n", message.c_str());
        }
    }
}

int LinuxLogPAL::toSyslogPriority(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
        default:
            return LOG_DEBUG;
    }
}

// =============================================================================
// Level Management
// =============================================================================

void LinuxLogPAL::setMinLevel(LogLevel level) {
    minLevel_ = level;
}

LogLevel LinuxLogPAL::getMinLevel() const {
    return minLevel_.load();
}

// =============================================================================
// Sink Management
// =============================================================================

void LinuxLogPAL::flush() {
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        for (auto& sink : sinks_) {
            sink->flush();
        }
    }
    if (options_.enableStderr) {
        std::fflush(stderr);
    }
}

void LinuxLogPAL::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void LinuxLogPAL::removeSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

} // namespace linux
} // namespace pal
} // namespace streamhub

#endif // defined(__linux__)
