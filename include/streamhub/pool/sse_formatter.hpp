// StreamHub - Real-time event fan-out server
// SSE Formatter - wire framing for delivered messages
//
// Each message renders as optional "id:" and "event:" lines, one "data:"
// line per payload line, and a terminating blank line.

#ifndef STREAMHUB_POOL_SSE_FORMATTER_HPP
#define STREAMHUB_POOL_SSE_FORMATTER_HPP

#include "streamhub/pool/message.hpp"

#include <string>

namespace streamhub {
namespace pool {

/**
 * @brief Stateless text/event-stream framing.
 *
 * @code
 * // id: msg_1\nevent: alert\ndata: {"level":"high"}\n\n
 * std::string frame = SseFormatter::format(*message);
 * @endcode
 */
class SseFormatter {
public:
    /**
     * @brief Render a message frame.
     */
    static std::string format(const Message& message);

    /**
     * @brief Payload text before line splitting: strings verbatim, every
     * other value as compact JSON.
     */
    static std::string renderData(const core::JsonValue& data);

    /**
     * @brief HTTP/1.1 response head that opens a streaming session.
     */
    static std::string httpResponseHead();
};

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_SSE_FORMATTER_HPP
