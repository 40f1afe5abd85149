// StreamHub - Real-time event fan-out server
// Tests for messages and id generation

#include <gtest/gtest.h>
#include <set>
#include <string>

#include "streamhub/pool/message.hpp"

namespace streamhub {
namespace pool {
namespace test {

TEST(IdGeneratorTest, ConnectionIdFormat) {
    IdGenerator generator;
    std::string id = generator.nextConnectionId();

    ASSERT_EQ(id.rfind("conn_", 0), 0u);
    size_t separator = id.rfind('_');
    EXPECT_GT(separator, 5u);
    EXPECT_EQ(id.size() - separator - 1, 16u);
    EXPECT_EQ(id.find_first_not_of("0123456789", 5), separator);
}

TEST(IdGeneratorTest, MessageIdFormat) {
    IdGenerator generator;
    std::string id = generator.nextMessageId();

    ASSERT_EQ(id.rfind("msg_", 0), 0u);
    size_t separator = id.rfind('_');
    EXPECT_EQ(id.size() - separator - 1, 8u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef", separator + 1), std::string::npos);
}

TEST(IdGeneratorTest, IdsAreUnique) {
    IdGenerator generator;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(generator.nextConnectionId()).second);
    }
}

TEST(MessageTest, TtlSetsExpiry) {
    auto now = core::SteadyClock::now();
    MessagePtr message = makeMessage("m1", std::string("e"), core::JsonValue(1),
                                     core::Priority::High, now, std::chrono::milliseconds(50));

    ASSERT_TRUE(message->expiry.has_value());
    EXPECT_FALSE(message->isExpired(now));
    EXPECT_TRUE(message->isExpired(now + std::chrono::milliseconds(50)));
    EXPECT_EQ(message->priority, core::Priority::High);
}

TEST(MessageTest, NoTtlNeverExpires) {
    auto now = core::SteadyClock::now();
    MessagePtr message = makeMessage("m1", std::nullopt, core::JsonValue(), core::Priority::Low, now);

    EXPECT_FALSE(message->expiry.has_value());
    EXPECT_FALSE(message->isExpired(now + std::chrono::hours(24)));
}

} // namespace test
} // namespace pool
} // namespace streamhub
