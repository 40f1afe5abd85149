// StreamHub - Real-time event fan-out server
// Message and IdGenerator Implementation

#include "streamhub/pool/message.hpp"

namespace streamhub {
namespace pool {

IdGenerator::IdGenerator()
    : engine_(std::random_device{}())
{
}

std::string IdGenerator::randomHex(size_t digits) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digits);

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t bits = engine_();
    for (size_t i = 0; i < digits; ++i) {
        if (i > 0 && i % 16 == 0) {
            bits = engine_();
        }
        out += hex[bits & 0xF];
        bits >>= 4;
    }
    return out;
}

core::ConnectionId IdGenerator::nextConnectionId() {
    return "conn_" + std::to_string(core::epochMillis(core::SystemClock::now())) +
           "_" + randomHex(16);
}

core::MessageId IdGenerator::nextMessageId() {
    return "msg_" + std::to_string(core::epochMillis(core::SystemClock::now())) +
           "_" + randomHex(8);
}

MessagePtr makeMessage(
    core::MessageId id,
    std::optional<std::string> event,
    core::JsonValue data,
    core::Priority priority,
    core::TimePoint now,
    std::optional<std::chrono::milliseconds> ttl)
{
    auto message = std::make_shared<Message>();
    message->id = std::move(id);
    message->event = std::move(event);
    message->data = std::move(data);
    message->priority = priority;
    message->enqueuedAt = core::SystemClock::now();
    if (ttl.has_value()) {
        message->expiry = now + *ttl;
    }
    return message;
}

} // namespace pool
} // namespace streamhub
