// StreamHub - Real-time event fan-out server
// Subscription Index - user, tenant and channel membership
//
// The three derived indexes of the connection pool. Every entry is erased
// when its last member leaves, so churny tenants and channels do not leave
// empty sets behind.

#ifndef STREAMHUB_POOL_SUBSCRIPTION_INDEX_HPP
#define STREAMHUB_POOL_SUBSCRIPTION_INDEX_HPP

#include "streamhub/core/types.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <unordered_map>
#include <vector>

namespace streamhub {
namespace pool {

/**
 * @brief Membership indexes keyed by user, tenant and (tenant, channel).
 *
 * Not internally synchronized; the owning pool serializes access. Lookups
 * return copies so callers may mutate the index while iterating.
 *
 * @invariant No index holds an empty member set
 */
class SubscriptionIndex {
public:
    using IdSet = std::set<core::ConnectionId>;

    // -------------------------------------------------------------------------
    // Ownership (user / tenant)
    // -------------------------------------------------------------------------

    void addOwner(const core::ConnectionId& id,
                  const core::UserId& userId,
                  const core::TenantId& tenantId);

    void removeOwner(const core::ConnectionId& id,
                     const core::UserId& userId,
                     const core::TenantId& tenantId);

    // -------------------------------------------------------------------------
    // Channels
    // -------------------------------------------------------------------------

    /**
     * @return true if the connection was not yet subscribed
     */
    bool subscribe(const core::ChannelKey& key, const core::ConnectionId& id);

    /**
     * @return true if the connection was subscribed
     */
    bool unsubscribe(const core::ChannelKey& key, const core::ConnectionId& id);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    std::vector<core::ConnectionId> userConnections(const core::UserId& userId) const;
    std::vector<core::ConnectionId> tenantConnections(const core::TenantId& tenantId) const;
    std::vector<core::ConnectionId> channelSubscribers(const core::ChannelKey& key) const;

    size_t userConnectionCount(const core::UserId& userId) const;
    size_t tenantConnectionCount(const core::TenantId& tenantId) const;
    size_t channelSubscriberCount(const core::ChannelKey& key) const;

    bool hasChannel(const core::ChannelKey& key) const;

    size_t userCount() const { return byUser_.size(); }
    size_t tenantCount() const { return byTenant_.size(); }
    size_t channelCount() const { return byChannel_.size(); }

    /**
     * @brief Member counts per key, for statistics.
     */
    std::map<core::UserId, size_t> userCounts() const;
    std::map<core::TenantId, size_t> tenantCounts() const;
    std::map<core::ChannelKey, size_t> channelCounts() const;

    bool empty() const {
        return byUser_.empty() && byTenant_.empty() && byChannel_.empty();
    }

    void clear();

private:
    std::unordered_map<core::UserId, IdSet> byUser_;
    std::unordered_map<core::TenantId, IdSet> byTenant_;
    std::unordered_map<core::ChannelKey, IdSet> byChannel_;
};

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_SUBSCRIPTION_INDEX_HPP
