// StreamHub - Real-time event fan-out server
// Linux Socket Transport
//
// ITransport over a non-blocking stream socket. Bytes the kernel does not
// take immediately are buffered; the owning event loop calls onWritable()
// when the socket reports EPOLLOUT, which flushes the buffer and fires the
// drain continuation once it is empty.

#ifndef STREAMHUB_PAL_LINUX_LINUX_SOCKET_TRANSPORT_HPP
#define STREAMHUB_PAL_LINUX_LINUX_SOCKET_TRANSPORT_HPP

#include "streamhub/core/result.hpp"
#include "streamhub/pal/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#if defined(__linux__)

namespace streamhub {
namespace pal {
namespace linux {

/**
 * @brief How an epoll readiness mask ends a socket session.
 */
enum class SocketHangup {
    None,        ///< Socket still usable
    PeerClosed,  ///< Orderly close or half-close by the peer
    SocketError  ///< Pending socket error (EPOLLERR)
};

/**
 * @brief Non-blocking socket implementation of ITransport.
 *
 * Write results:
 * - Accepted: the kernel took every byte
 * - AcceptedWithBackpressure: the remainder of a short write was buffered
 * - WouldBlock: earlier output is still buffered; nothing was taken
 *
 * close() shuts the socket down in both directions; the descriptor itself
 * is released by the destructor, so an event loop may keep using the fd
 * number as a key until it drops its reference.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - The drain callback runs on the thread calling onWritable(), outside
 *   the internal lock
 */
class LinuxSocketTransport : public ITransport {
public:
    /**
     * @param fd Connected socket; must already be O_NONBLOCK. Ownership is taken.
     * @param peer Peer description used by describe()
     */
    explicit LinuxSocketTransport(int fd, std::string peer = "");

    ~LinuxSocketTransport() override;

    LinuxSocketTransport(const LinuxSocketTransport&) = delete;
    LinuxSocketTransport& operator=(const LinuxSocketTransport&) = delete;

    // =========================================================================
    // ITransport Implementation
    // =========================================================================

    core::Result<WriteStatus, TransportError> write(const std::string& bytes) override;
    void setDrainCallback(DrainCallback callback) override;
    core::Result<void, TransportError> close() override;
    bool isOpen() const override;
    std::string describe() const override;

    // =========================================================================
    // Event Loop Integration
    // =========================================================================

    /**
     * @brief Flush buffered output after the socket became writable.
     *
     * Fires the drain callback when the buffer empties after a write
     * reported backpressure.
     */
    core::Result<void, TransportError> onWritable();

    /**
     * @brief True while buffered bytes wait for the socket (register EPOLLOUT).
     */
    bool hasPendingOutput() const;

    size_t pendingBytes() const;

    /**
     * @brief Classify an epoll event mask. EPOLLERR wins over a hangup.
     */
    static SocketHangup classifyEvents(uint32_t epollEvents);

    /**
     * @brief Read and clear the pending SO_ERROR value; 0 when none.
     */
    int takeSocketError() const;

    int fd() const { return fd_; }

private:
    /**
     * @brief Send as much of [data, data+len) as the kernel accepts.
     * @return Bytes sent; 0 on EAGAIN
     */
    core::Result<size_t, TransportError> sendSomeLocked(const char* data, size_t len);

    mutable std::mutex mutex_;
    int fd_;
    std::string peer_;
    std::string pending_;
    bool open_ = true;
    bool drainPending_ = false;
    DrainCallback drainCallback_;
};

} // namespace linux
} // namespace pal
} // namespace streamhub

#endif // defined(__linux__)
#endif // STREAMHUB_PAL_LINUX_LINUX_SOCKET_TRANSPORT_HPP
