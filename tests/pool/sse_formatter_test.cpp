// StreamHub - Real-time event fan-out server
// Tests for SSE wire framing

#include <gtest/gtest.h>
#include <string>

#include "streamhub/pool/sse_formatter.hpp"

namespace streamhub {
namespace pool {
namespace test {

namespace {

Message messageWith(std::string id, std::optional<std::string> event, core::JsonValue data) {
    Message message;
    message.id = std::move(id);
    message.event = std::move(event);
    message.data = std::move(data);
    return message;
}

} // anonymous namespace

TEST(SseFormatterTest, FormatsIdEventAndJsonData) {
    core::JsonValue data = core::JsonValue::object();
    data.set("a", 1);
    data.set("b", core::JsonValue::array({"x", true}));

    std::string frame = SseFormatter::format(messageWith("msg_1", std::string("update"), data));

    EXPECT_EQ(frame, "id: msg_1\nevent: update\ndata: {\"a\":1,\"b\":[\"x\",true]}\n\n");
}

TEST(SseFormatterTest, OmitsMissingIdAndEvent) {
    std::string frame = SseFormatter::format(messageWith("", std::nullopt, core::JsonValue(42)));
    EXPECT_EQ(frame, "data: 42\n\n");
}

TEST(SseFormatterTest, EmptyEventLabelIsOmitted) {
    std::string frame = SseFormatter::format(
        messageWith("msg_1", std::string(""), core::JsonValue("hi")));
    EXPECT_EQ(frame, "id: msg_1\ndata: hi\n\n");
}

TEST(SseFormatterTest, StringPayloadIsWrittenRaw) {
    std::string frame = SseFormatter::format(
        messageWith("m", std::nullopt, core::JsonValue("hello world")));
    EXPECT_EQ(frame, "id: m\ndata: hello world\n\n");
}

TEST(SseFormatterTest, MultilinePayloadGetsOneDataLinePerLine) {
    std::string frame = SseFormatter::format(
        messageWith("m", std::string("log"), core::JsonValue("line1\nline2\n")));
    EXPECT_EQ(frame, "id: m\nevent: log\ndata: line1\ndata: line2\ndata: \n\n");
}

TEST(SseFormatterTest, NullAndEmptyPayloads) {
    EXPECT_EQ(SseFormatter::format(messageWith("", std::nullopt, core::JsonValue())),
              "data: null\n\n");
    EXPECT_EQ(SseFormatter::format(messageWith("", std::nullopt, core::JsonValue(""))),
              "data: \n\n");
}

TEST(SseFormatterTest, ResponseHeadAdvertisesEventStream) {
    std::string head = SseFormatter::httpResponseHead();

    EXPECT_EQ(head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(head.find("Content-Type: text/event-stream\r\n"), std::string::npos);
    EXPECT_NE(head.find("Cache-Control: no-cache, no-store, must-revalidate\r\n"),
              std::string::npos);
    EXPECT_NE(head.find("X-Accel-Buffering: no\r\n"), std::string::npos);
    EXPECT_EQ(head.substr(head.size() - 4), "\r\n\r\n");
}

} // namespace test
} // namespace pool
} // namespace streamhub
