// StreamHub - Real-time event fan-out server
// Platform Abstraction Layer - Streaming Transport Interface
//
// The byte sink behind one streaming session. The pool writes framed
// events into it and learns about backpressure from the write result and
// from the drain continuation. Implementations: LinuxSocketTransport for
// real sockets, in-memory doubles for tests.

#ifndef STREAMHUB_PAL_TRANSPORT_HPP
#define STREAMHUB_PAL_TRANSPORT_HPP

#include "streamhub/core/result.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace streamhub {
namespace pal {

/**
 * @brief Outcome of a successful write call.
 */
enum class WriteStatus {
    Accepted,                  ///< All bytes taken; more writes may follow
    AcceptedWithBackpressure,  ///< All bytes taken and buffered; wait for drain
    WouldBlock                 ///< Nothing taken; retry after drain
};

inline const char* writeStatusToString(WriteStatus status) {
    switch (status) {
        case WriteStatus::Accepted: return "accepted";
        case WriteStatus::AcceptedWithBackpressure: return "accepted_with_backpressure";
        case WriteStatus::WouldBlock: return "would_block";
        default: return "unknown";
    }
}

/**
 * @brief Hard transport failure.
 */
struct TransportError {
    enum class Code {
        WriteFailed,   ///< The write could not be performed
        Closed,        ///< The peer or the owner closed the transport
        CloseFailed    ///< Releasing the transport failed
    };

    Code code = Code::WriteFailed;
    std::string message;
    int32_t systemErrorCode = 0;  ///< errno, when one applies

    TransportError() = default;
    TransportError(Code c, std::string msg, int32_t sysErr = 0)
        : code(c), message(std::move(msg)), systemErrorCode(sysErr) {}
};

/**
 * @brief Continuation invoked once the transport can accept data again.
 */
using DrainCallback = std::function<void()>;

/**
 * @brief One streaming session's outbound byte channel.
 *
 * ## Contract
 * - write() never blocks.
 * - After AcceptedWithBackpressure or WouldBlock, the drain callback fires
 *   once the transport is writable again.
 * - The drain callback is never invoked from inside write() or close(); it
 *   runs on the thread that services the transport's I/O.
 * - After close(), write() returns TransportError::Code::Closed.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual core::Result<WriteStatus, TransportError> write(const std::string& bytes) = 0;

    /**
     * @brief Register (or, with nullptr, clear) the drain continuation.
     */
    virtual void setDrainCallback(DrainCallback callback) = 0;

    /**
     * @brief Close the transport. Subsequent calls are no-ops.
     */
    virtual core::Result<void, TransportError> close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Short human-readable identity for logs (e.g. "fd=12 10.0.0.4:51512").
     */
    virtual std::string describe() const = 0;
};

} // namespace pal
} // namespace streamhub

#endif // STREAMHUB_PAL_TRANSPORT_HPP
