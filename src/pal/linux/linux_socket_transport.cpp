// StreamHub - Real-time event fan-out server
// Linux Socket Transport Implementation

#include "streamhub/pal/linux/linux_socket_transport.hpp"

#if defined(__linux__)

#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace streamhub {
namespace pal {
namespace linux {

namespace {

TransportError mapSendError(int err) {
    switch (err) {
        case EPIPE:
        case ECONNRESET:
        case ENOTCONN:
            return TransportError{TransportError::Code::Closed,
                                  "Connection closed by peer: " + std::string(std::strerror(err)),
                                  err};
        default:
            return TransportError{TransportError::Code::WriteFailed,
                                  "send failed: " + std::string(std::strerror(err)),
                                  err};
    }
}

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxSocketTransport::LinuxSocketTransport(int fd, std::string peer)
    : fd_(fd)
    , peer_(std::move(peer))
    , open_(fd >= 0)
{
}

LinuxSocketTransport::~LinuxSocketTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// =============================================================================
// ITransport Implementation
// =============================================================================

core::Result<size_t, TransportError> LinuxSocketTransport::sendSomeLocked(
    const char* data, size_t len)
{
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        int err = (n < 0) ? errno : EPIPE;
        return core::Result<size_t, TransportError>::error(mapSendError(err));
    }
    return core::Result<size_t, TransportError>::success(sent);
}

core::Result<WriteStatus, TransportError> LinuxSocketTransport::write(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!open_) {
        return core::Result<WriteStatus, TransportError>::error(
            TransportError{TransportError::Code::Closed, "Transport is closed"});
    }

    if (!pending_.empty()) {
        drainPending_ = true;
        return core::Result<WriteStatus, TransportError>::success(WriteStatus::WouldBlock);
    }

    auto sent = sendSomeLocked(bytes.data(), bytes.size());
    if (sent.isError()) {
        if (sent.error().code == TransportError::Code::Closed) {
            open_ = false;
        }
        return core::Result<WriteStatus, TransportError>::error(sent.error());
    }

    if (sent.value() == bytes.size()) {
        return core::Result<WriteStatus, TransportError>::success(WriteStatus::Accepted);
    }

    pending_.assign(bytes, sent.value(), std::string::npos);
    drainPending_ = true;
    return core::Result<WriteStatus, TransportError>::success(
        WriteStatus::AcceptedWithBackpressure);
}

void LinuxSocketTransport::setDrainCallback(DrainCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    drainCallback_ = std::move(callback);
}

core::Result<void, TransportError> LinuxSocketTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!open_) {
        return core::Result<void, TransportError>::success();
    }
    open_ = false;
    pending_.clear();
    drainPending_ = false;

    if (::shutdown(fd_, SHUT_RDWR) < 0 && errno != ENOTCONN) {
        int err = errno;
        return core::Result<void, TransportError>::error(
            TransportError{TransportError::Code::CloseFailed,
                           "shutdown failed: " + std::string(std::strerror(err)),
                           err});
    }
    return core::Result<void, TransportError>::success();
}

bool LinuxSocketTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::string LinuxSocketTransport::describe() const {
    std::string description = "fd=" + std::to_string(fd_);
    if (!peer_.empty()) {
        description += " " + peer_;
    }
    return description;
}

// =============================================================================
// Event Loop Integration
// =============================================================================

core::Result<void, TransportError> LinuxSocketTransport::onWritable() {
    DrainCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return core::Result<void, TransportError>::success();
        }

        if (!pending_.empty()) {
            auto sent = sendSomeLocked(pending_.data(), pending_.size());
            if (sent.isError()) {
                if (sent.error().code == TransportError::Code::Closed) {
                    open_ = false;
                }
                return core::Result<void, TransportError>::error(sent.error());
            }
            pending_.erase(0, sent.value());
        }

        if (!pending_.empty() || !drainPending_) {
            return core::Result<void, TransportError>::success();
        }

        drainPending_ = false;
        callback = drainCallback_;
    }

    if (callback) {
        callback();
    }
    return core::Result<void, TransportError>::success();
}

bool LinuxSocketTransport::hasPendingOutput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_.empty();
}

size_t LinuxSocketTransport::pendingBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

SocketHangup LinuxSocketTransport::classifyEvents(uint32_t epollEvents) {
    if (epollEvents & EPOLLERR) {
        return SocketHangup::SocketError;
    }
    if (epollEvents & (EPOLLHUP | EPOLLRDHUP)) {
        return SocketHangup::PeerClosed;
    }
    return SocketHangup::None;
}

int LinuxSocketTransport::takeSocketError() const {
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return errno;
    }
    return err;
}

} // namespace linux
} // namespace pal
} // namespace streamhub

#endif // defined(__linux__)
