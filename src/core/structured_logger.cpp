// StreamHub - Real-time event fan-out server
// Structured Logging Component Implementation

#include "streamhub/core/structured_logger.hpp"
#include "streamhub/core/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace streamhub {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return "debug";
        case LogLevelConfig::Info:
            return "info";
        case LogLevelConfig::Warning:
            return "warning";
        case LogLevelConfig::Error:
            return "error";
        default:
            return "info";
    }
}

std::optional<LogLevelConfig> parseLogLevelString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevelConfig::Debug;
    } else if (lower == "info") {
        return LogLevelConfig::Info;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevelConfig::Warning;
    } else if (lower == "error") {
        return LogLevelConfig::Error;
    }
    return std::nullopt;
}

LogLevelConfig stringToLogLevel(const std::string& str) {
    return parseLogLevelString(str).value_or(LogLevelConfig::Info);
}

std::string connectionEventTypeToString(ConnectionEventType eventType) {
    switch (eventType) {
        case ConnectionEventType::Admitted:
            return "admitted";
        case ConnectionEventType::Rejected:
            return "rejected";
        case ConnectionEventType::Removed:
            return "removed";
        case ConnectionEventType::Backpressure:
            return "backpressure";
        case ConnectionEventType::Drained:
            return "drained";
        default:
            return "unknown";
    }
}

namespace {

void appendJsonContext(std::ostringstream& oss, const LogContext& context) {
    auto field = [&oss](const char* name, const std::string& value) {
        if (!value.empty()) {
            oss << ",\"" << name << "\":\"" << escapeJsonString(value) << "\"";
        }
    };
    field("connection_id", context.connectionId);
    field("tenant_id", context.tenantId);
    field("user_id", context.userId);
    field("channel", context.channel);
    field("reason", context.reason);
    if (context.errorCode != 0) {
        oss << ",\"error_code\":" << context.errorCode;
    }
}

void appendPlainContext(std::ostringstream& oss, const LogContext& context) {
    auto field = [&oss](const char* name, const std::string& value) {
        if (!value.empty()) {
            oss << " " << name << "=" << value;
        }
    };
    field("connection", context.connectionId);
    field("tenant", context.tenantId);
    field("user", context.userId);
    field("channel", context.channel);
    field("reason", context.reason);
    if (context.errorCode != 0) {
        oss << " code=" << context.errorCode;
    }
}

} // anonymous namespace

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

bool StructuredLogger::isEnabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category);
}

void StructuredLogger::logConnectionEvent(
    ConnectionEventType eventType,
    const LogContext& context)
{
    LogLevelConfig level = LogLevelConfig::Info;
    if (eventType == ConnectionEventType::Rejected ||
        eventType == ConnectionEventType::Backpressure) {
        level = LogLevelConfig::Warning;
    }

    log(level, "Connection " + connectionEventTypeToString(eventType), "Connection", &context);
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    log(LogLevelConfig::Error, message, category, &context);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

void StructuredLogger::setPlatformLog(std::shared_ptr<pal::ILogPAL> platformLog) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    platformLog_ = std::move(platformLog);
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
    if (platformLog_) {
        platformLog_->flush();
    }
}

void StructuredLogger::log(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    if (!isEnabled(level)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(level, message, category, context)
        : formatPlainText(level, message, category, context);

    dispatch(level, formatted, category);
}

void StructuredLogger::dispatch(
    LogLevelConfig level,
    const std::string& formatted,
    const std::string& category)
{
    pal::LogContext palContext;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->write(toPalLogLevel(level), formatted, category, palContext);
        }
    }
    if (platformLog_) {
        platformLog_->log(toPalLogLevel(level), formatted, category, palContext);
    }
}

std::string StructuredLogger::formatJson(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << formatIso8601(SystemClock::now()) << "\"";
    oss << ",\"level\":\"" << logLevelToString(level) << "\"";
    oss << ",\"category\":\"" << escapeJsonString(category) << "\"";
    oss << ",\"message\":\"" << escapeJsonString(message) << "\"";
    if (context) {
        appendJsonContext(oss, *context);
    }
    oss << "}";
    return oss.str();
}

std::string StructuredLogger::formatPlainText(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    std::ostringstream oss;
    oss << "[" << formatIso8601(SystemClock::now()) << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;
    if (context) {
        appendPlainContext(oss, *context);
    }
    return oss.str();
}

pal::LogLevel StructuredLogger::toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return pal::LogLevel::Debug;
        case LogLevelConfig::Info:
            return pal::LogLevel::Info;
        case LogLevelConfig::Warning:
            return pal::LogLevel::Warning;
        case LogLevelConfig::Error:
            return pal::LogLevel::Error;
        default:
            return pal::LogLevel::Info;
    }
}

} // namespace core
} // namespace streamhub
