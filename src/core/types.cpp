// StreamHub - Real-time event fan-out server
// Common type helpers

#include "streamhub/core/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace streamhub {
namespace core {

const char* priorityToString(Priority priority) {
    switch (priority) {
        case Priority::High: return "high";
        case Priority::Normal: return "normal";
        case Priority::Low: return "low";
        default: return "normal";
    }
}

std::optional<Priority> stringToPriority(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "high") {
        return Priority::High;
    } else if (lower == "normal") {
        return Priority::Normal;
    } else if (lower == "low") {
        return Priority::Low;
    }
    return std::nullopt;
}

std::string formatIso8601(SystemClock::time_point time) {
    auto timeT = SystemClock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
    }

    std::tm tmBuf;
#if defined(_WIN32)
    gmtime_s(&tmBuf, &timeT);
#else
    gmtime_r(&timeT, &tmBuf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    oss << "Z";
    return oss.str();
}

int64_t epochMillis(SystemClock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count();
}

} // namespace core
} // namespace streamhub
