// StreamHub - Real-time event fan-out server
// Common type definitions

#ifndef STREAMHUB_CORE_TYPES_HPP
#define STREAMHUB_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace streamhub {
namespace core {

// Identifiers are opaque strings chosen by the pool (connections, messages)
// or by the admitting collaborator (users, tenants, channels).
using ConnectionId = std::string;
using MessageId = std::string;
using UserId = std::string;
using TenantId = std::string;
using ChannelName = std::string;

/**
 * @brief Opaque key/value bag attached to a connection at admission.
 */
using Metadata = std::map<std::string, std::string>;

/**
 * @brief Channel identity: a channel name is only meaningful within a tenant.
 */
struct ChannelKey {
    TenantId tenantId;
    ChannelName channel;

    ChannelKey() = default;
    ChannelKey(TenantId t, ChannelName c)
        : tenantId(std::move(t)), channel(std::move(c)) {}

    /**
     * @brief Render as "tenant:channel".
     */
    [[nodiscard]] std::string toString() const {
        return tenantId + ":" + channel;
    }

    bool operator==(const ChannelKey& other) const {
        return tenantId == other.tenantId && channel == other.channel;
    }

    bool operator!=(const ChannelKey& other) const {
        return !(*this == other);
    }

    bool operator<(const ChannelKey& other) const {
        if (tenantId != other.tenantId) return tenantId < other.tenantId;
        return channel < other.channel;
    }
};

/**
 * @brief Delivery priority. Lower numeric value survives the drop policy first.
 */
enum class Priority : uint8_t {
    High = 0,
    Normal = 1,
    Low = 2
};

/**
 * @brief Convert priority to its wire/config name ("high", "normal", "low").
 */
const char* priorityToString(Priority priority);

/**
 * @brief Parse a priority name (case-insensitive).
 * @return The priority, or std::nullopt for unknown names
 */
std::optional<Priority> stringToPriority(const std::string& str);

/**
 * @brief Time utilities.
 */
using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = SteadyClock::time_point;
using Duration = std::chrono::milliseconds;

/**
 * @brief Format a wall-clock time as ISO 8601 UTC with milliseconds,
 * e.g. "2024-05-01T12:00:00.000Z".
 */
std::string formatIso8601(SystemClock::time_point time);

/**
 * @brief Milliseconds since the Unix epoch.
 */
int64_t epochMillis(SystemClock::time_point time);

} // namespace core

using core::ConnectionId;
using core::MessageId;
using core::UserId;
using core::TenantId;
using core::ChannelName;
using core::ChannelKey;
using core::Priority;

} // namespace streamhub

namespace std {
template<>
struct hash<streamhub::ChannelKey> {
    size_t operator()(const streamhub::ChannelKey& key) const {
        size_t h1 = hash<string>{}(key.tenantId);
        size_t h2 = hash<string>{}(key.channel);
        return h1 ^ (h2 << 1);
    }
};
} // namespace std

#endif // STREAMHUB_CORE_TYPES_HPP
