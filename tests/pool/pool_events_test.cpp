// StreamHub - Real-time event fan-out server
// Tests for pool event names and the event bus

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "streamhub/pool/pool_events.hpp"

namespace streamhub {
namespace pool {
namespace test {

TEST(PoolEventsTest, WireNames) {
    EXPECT_STREQ(poolEventTypeToString(PoolEventType::ConnectionAdded), "connection_added");
    EXPECT_STREQ(poolEventTypeToString(PoolEventType::ConnectionRemoved), "connection_removed");
    EXPECT_STREQ(poolEventTypeToString(PoolEventType::MessageDropped), "message_dropped");
    EXPECT_STREQ(poolEventTypeToString(PoolEventType::PoolFull), "pool_full");
    EXPECT_STREQ(poolEventTypeToString(PoolEventType::Backpressure), "backpressure");

    EXPECT_STREQ(removalReasonToString(RemovalReason::ClientClosed), "client_closed");
    EXPECT_STREQ(removalReasonToString(RemovalReason::WriteError), "write_error");
    EXPECT_STREQ(removalReasonToString(RemovalReason::Timeout), "timeout");
    EXPECT_STREQ(removalReasonToString(RemovalReason::Shutdown), "shutdown");

    EXPECT_STREQ(dropReasonToString(DropReason::QueueFull), "queue_full");
    EXPECT_STREQ(dropReasonToString(DropReason::Expired), "expired");
}

TEST(PoolEventBusTest, DeliversToAllListenersInRegistrationOrder) {
    PoolEventBus bus;
    std::vector<std::string> calls;
    bus.addListener([&calls](const PoolEvent& e) { calls.push_back("a:" + e.connectionId); });
    bus.addListener([&calls](const PoolEvent& e) { calls.push_back("b:" + e.connectionId); });

    PoolEvent event(PoolEventType::ConnectionAdded);
    event.connectionId = "c1";
    bus.publish(event);

    EXPECT_EQ(calls, (std::vector<std::string>{"a:c1", "b:c1"}));
    EXPECT_EQ(bus.listenerCount(), 2u);
}

TEST(PoolEventBusTest, RemovedListenerIsNotCalled) {
    PoolEventBus bus;
    int calls = 0;
    ListenerId id = bus.addListener([&calls](const PoolEvent&) { ++calls; });
    EXPECT_NE(id, 0u);

    EXPECT_TRUE(bus.removeListener(id));
    EXPECT_FALSE(bus.removeListener(id));
    bus.publish(PoolEvent(PoolEventType::Drained));
    EXPECT_EQ(calls, 0);
}

TEST(PoolEventBusTest, ListenerMayUnregisterItselfDuringPublish) {
    PoolEventBus bus;
    int calls = 0;
    ListenerId id = 0;
    id = bus.addListener([&](const PoolEvent&) {
        ++calls;
        bus.removeListener(id);
    });

    bus.publishAll({PoolEvent(PoolEventType::MessageSent), PoolEvent(PoolEventType::MessageSent)});
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.listenerCount(), 0u);
}

} // namespace test
} // namespace pool
} // namespace streamhub
