// StreamHub - Real-time event fan-out server
// Tests for user / tenant / channel indexes

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "streamhub/pool/subscription_index.hpp"

namespace streamhub {
namespace pool {
namespace test {

class SubscriptionIndexTest : public ::testing::Test {
protected:
    SubscriptionIndex index_;
};

TEST_F(SubscriptionIndexTest, OwnersAreIndexedByUserAndTenant) {
    index_.addOwner("c1", "alice", "acme");
    index_.addOwner("c2", "alice", "acme");
    index_.addOwner("c3", "bob", "globex");

    EXPECT_EQ(index_.userConnectionCount("alice"), 2u);
    EXPECT_EQ(index_.tenantConnectionCount("acme"), 2u);
    EXPECT_EQ(index_.tenantConnectionCount("globex"), 1u);
    EXPECT_EQ(index_.userCount(), 2u);
    EXPECT_EQ(index_.tenantCount(), 2u);

    auto alice = index_.userConnections("alice");
    std::sort(alice.begin(), alice.end());
    EXPECT_EQ(alice, (std::vector<ConnectionId>{"c1", "c2"}));
}

TEST_F(SubscriptionIndexTest, RemovingLastOwnerErasesEntries) {
    index_.addOwner("c1", "alice", "acme");
    index_.removeOwner("c1", "alice", "acme");

    EXPECT_EQ(index_.userCount(), 0u);
    EXPECT_EQ(index_.tenantCount(), 0u);
    EXPECT_TRUE(index_.empty());
    EXPECT_TRUE(index_.userConnections("alice").empty());
}

TEST_F(SubscriptionIndexTest, ChannelsAreScopedByTenant) {
    ChannelKey acme("acme", "alerts");
    ChannelKey globex("globex", "alerts");

    EXPECT_TRUE(index_.subscribe(acme, "c1"));
    EXPECT_FALSE(index_.subscribe(acme, "c1"));
    EXPECT_TRUE(index_.subscribe(globex, "c2"));

    EXPECT_EQ(index_.channelSubscriberCount(acme), 1u);
    EXPECT_EQ(index_.channelSubscribers(globex), (std::vector<ConnectionId>{"c2"}));
    EXPECT_EQ(index_.channelCount(), 2u);
}

TEST_F(SubscriptionIndexTest, UnsubscribingLastMemberErasesChannel) {
    ChannelKey key("acme", "alerts");
    index_.subscribe(key, "c1");
    index_.subscribe(key, "c2");

    EXPECT_TRUE(index_.unsubscribe(key, "c1"));
    EXPECT_TRUE(index_.hasChannel(key));
    EXPECT_TRUE(index_.unsubscribe(key, "c2"));
    EXPECT_FALSE(index_.hasChannel(key));
    EXPECT_FALSE(index_.unsubscribe(key, "c2"));
    EXPECT_EQ(index_.channelCount(), 0u);
}

TEST_F(SubscriptionIndexTest, CountMapsReflectMembership) {
    index_.addOwner("c1", "alice", "acme");
    index_.addOwner("c2", "bob", "acme");
    index_.subscribe(ChannelKey("acme", "alerts"), "c1");
    index_.subscribe(ChannelKey("acme", "alerts"), "c2");

    EXPECT_EQ(index_.tenantCounts().at("acme"), 2u);
    EXPECT_EQ(index_.userCounts().at("bob"), 1u);
    EXPECT_EQ(index_.channelCounts().at(ChannelKey("acme", "alerts")), 2u);

    index_.clear();
    EXPECT_TRUE(index_.empty());
}

} // namespace test
} // namespace pool
} // namespace streamhub
