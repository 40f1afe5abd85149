// StreamHub - Real-time event fan-out server
// Subscription Index Implementation

#include "streamhub/pool/subscription_index.hpp"

namespace streamhub {
namespace pool {

namespace {

template<typename Map, typename Key>
bool eraseMember(Map& index, const Key& key, const core::ConnectionId& id) {
    auto it = index.find(key);
    if (it == index.end()) {
        return false;
    }
    bool erased = it->second.erase(id) > 0;
    if (it->second.empty()) {
        index.erase(it);
    }
    return erased;
}

template<typename Map, typename Key>
std::vector<core::ConnectionId> members(const Map& index, const Key& key) {
    auto it = index.find(key);
    if (it == index.end()) {
        return {};
    }
    return std::vector<core::ConnectionId>(it->second.begin(), it->second.end());
}

template<typename Map, typename Key>
size_t memberCount(const Map& index, const Key& key) {
    auto it = index.find(key);
    return it == index.end() ? 0 : it->second.size();
}

template<typename Map>
std::map<typename Map::key_type, size_t> counts(const Map& index) {
    std::map<typename Map::key_type, size_t> result;
    for (const auto& entry : index) {
        result[entry.first] = entry.second.size();
    }
    return result;
}

} // anonymous namespace

void SubscriptionIndex::addOwner(const core::ConnectionId& id,
                                 const core::UserId& userId,
                                 const core::TenantId& tenantId) {
    byUser_[userId].insert(id);
    byTenant_[tenantId].insert(id);
}

void SubscriptionIndex::removeOwner(const core::ConnectionId& id,
                                    const core::UserId& userId,
                                    const core::TenantId& tenantId) {
    eraseMember(byUser_, userId, id);
    eraseMember(byTenant_, tenantId, id);
}

bool SubscriptionIndex::subscribe(const core::ChannelKey& key, const core::ConnectionId& id) {
    return byChannel_[key].insert(id).second;
}

bool SubscriptionIndex::unsubscribe(const core::ChannelKey& key, const core::ConnectionId& id) {
    return eraseMember(byChannel_, key, id);
}

std::vector<core::ConnectionId> SubscriptionIndex::userConnections(const core::UserId& userId) const {
    return members(byUser_, userId);
}

std::vector<core::ConnectionId> SubscriptionIndex::tenantConnections(const core::TenantId& tenantId) const {
    return members(byTenant_, tenantId);
}

std::vector<core::ConnectionId> SubscriptionIndex::channelSubscribers(const core::ChannelKey& key) const {
    return members(byChannel_, key);
}

size_t SubscriptionIndex::userConnectionCount(const core::UserId& userId) const {
    return memberCount(byUser_, userId);
}

size_t SubscriptionIndex::tenantConnectionCount(const core::TenantId& tenantId) const {
    return memberCount(byTenant_, tenantId);
}

size_t SubscriptionIndex::channelSubscriberCount(const core::ChannelKey& key) const {
    return memberCount(byChannel_, key);
}

bool SubscriptionIndex::hasChannel(const core::ChannelKey& key) const {
    return byChannel_.find(key) != byChannel_.end();
}

std::map<core::UserId, size_t> SubscriptionIndex::userCounts() const {
    return counts(byUser_);
}

std::map<core::TenantId, size_t> SubscriptionIndex::tenantCounts() const {
    return counts(byTenant_);
}

std::map<core::ChannelKey, size_t> SubscriptionIndex::channelCounts() const {
    return counts(byChannel_);
}

void SubscriptionIndex::clear() {
    byUser_.clear();
    byTenant_.clear();
    byChannel_.clear();
}

} // namespace pool
} // namespace streamhub
