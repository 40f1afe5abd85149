// StreamHub - Real-time event fan-out server
// SSE Formatter Implementation

#include "streamhub/pool/sse_formatter.hpp"

namespace streamhub {
namespace pool {

std::string SseFormatter::renderData(const core::JsonValue& data) {
    if (data.isString()) {
        return data.stringRef();
    }
    return data.serialize();
}

std::string SseFormatter::format(const Message& message) {
    std::string frame;

    if (!message.id.empty()) {
        frame += "id: ";
        frame += message.id;
        frame += '\n';
    }

    if (message.event.has_value() && !message.event->empty()) {
        frame += "event: ";
        frame += *message.event;
        frame += '\n';
    }

    std::string payload = renderData(message.data);
    size_t start = 0;
    while (true) {
        size_t newline = payload.find('\n', start);
        frame += "data: ";
        if (newline == std::string::npos) {
            frame.append(payload, start, std::string::npos);
            frame += '\n';
            break;
        }
        frame.append(payload, start, newline - start);
        frame += '\n';
        start = newline + 1;
    }

    frame += '\n';
    return frame;
}

std::string SseFormatter::httpResponseHead() {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: text/event-stream\r\n"
           "Cache-Control: no-cache, no-store, must-revalidate\r\n"
           "Connection: keep-alive\r\n"
           "X-Accel-Buffering: no\r\n"
           "Access-Control-Allow-Origin: *\r\n"
           "\r\n";
}

} // namespace pool
} // namespace streamhub
