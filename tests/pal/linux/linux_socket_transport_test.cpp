// StreamHub - Real-time event fan-out server
// Tests for Linux Socket Transport

#include <gtest/gtest.h>
#include "streamhub/pal/transport.hpp"

#include <string>

#if defined(__linux__)
#include "streamhub/pal/linux/linux_socket_transport.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace streamhub {
namespace pal {
namespace test {

#if defined(__linux__)

// =============================================================================
// Fixture: non-blocking socketpair, transport owns fds_[0]
// =============================================================================

class LinuxSocketTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds_), 0);

        int small = 4096;
        ::setsockopt(fds_[0], SOL_SOCKET, SO_SNDBUF, &small, sizeof(small));
        ::setsockopt(fds_[1], SOL_SOCKET, SO_RCVBUF, &small, sizeof(small));

        transport_ = std::make_unique<linux::LinuxSocketTransport>(fds_[0], "unix:test");
    }

    void TearDown() override {
        transport_.reset();
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
        }
    }

    std::string readPeer() {
        std::string out;
        char buffer[65536];
        while (true) {
            ssize_t n = ::read(fds_[1], buffer, sizeof(buffer));
            if (n <= 0) {
                break;
            }
            out.append(buffer, static_cast<size_t>(n));
        }
        return out;
    }

    // Writes until the kernel buffer is full and the transport starts buffering.
    void fillUntilBackpressure() {
        std::string chunk(8192, 'x');
        for (int i = 0; i < 1000; ++i) {
            auto result = transport_->write(chunk);
            ASSERT_TRUE(result.isSuccess());
            if (result.value() != WriteStatus::Accepted) {
                ASSERT_EQ(result.value(), WriteStatus::AcceptedWithBackpressure);
                return;
            }
        }
        FAIL() << "socket never applied backpressure";
    }

    int fds_[2] = {-1, -1};
    std::unique_ptr<linux::LinuxSocketTransport> transport_;
};

// =============================================================================
// Write Tests
// =============================================================================

TEST_F(LinuxSocketTransportTest, SmallWriteIsAcceptedAndReadable) {
    auto result = transport_->write("event: ping\ndata: {}\n\n");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), WriteStatus::Accepted);
    EXPECT_FALSE(transport_->hasPendingOutput());

    EXPECT_EQ(readPeer(), "event: ping\ndata: {}\n\n");
}

TEST_F(LinuxSocketTransportTest, FullKernelBufferBuffersRemainder) {
    ASSERT_NO_FATAL_FAILURE(fillUntilBackpressure());
    EXPECT_TRUE(transport_->hasPendingOutput());
    EXPECT_GT(transport_->pendingBytes(), 0u);

    auto blocked = transport_->write("data: later\n\n");
    ASSERT_TRUE(blocked.isSuccess());
    EXPECT_EQ(blocked.value(), WriteStatus::WouldBlock);
}

TEST_F(LinuxSocketTransportTest, DrainFiresOnceBufferEmpties) {
    int drains = 0;
    transport_->setDrainCallback([&drains] { drains++; });

    ASSERT_NO_FATAL_FAILURE(fillUntilBackpressure());

    for (int i = 0; i < 1000 && transport_->hasPendingOutput(); ++i) {
        readPeer();
        ASSERT_TRUE(transport_->onWritable().isSuccess());
    }
    EXPECT_FALSE(transport_->hasPendingOutput());
    EXPECT_EQ(drains, 1);

    ASSERT_TRUE(transport_->onWritable().isSuccess());
    EXPECT_EQ(drains, 1);

    auto result = transport_->write("data: resumed\n\n");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), WriteStatus::Accepted);
}

TEST_F(LinuxSocketTransportTest, WritableWithoutBackpressureDoesNotDrain) {
    int drains = 0;
    transport_->setDrainCallback([&drains] { drains++; });

    ASSERT_TRUE(transport_->write("data: 1\n\n").isSuccess());
    ASSERT_TRUE(transport_->onWritable().isSuccess());
    EXPECT_EQ(drains, 0);
}

// =============================================================================
// Failure and Close Tests
// =============================================================================

TEST_F(LinuxSocketTransportTest, PeerCloseIsReportedAsClosed) {
    ::close(fds_[1]);
    fds_[1] = -1;

    auto result = transport_->write("data: gone\n\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, TransportError::Code::Closed);
    EXPECT_FALSE(transport_->isOpen());
}

TEST_F(LinuxSocketTransportTest, CloseIsIdempotentAndRejectsWrites) {
    EXPECT_TRUE(transport_->isOpen());
    EXPECT_TRUE(transport_->close().isSuccess());
    EXPECT_TRUE(transport_->close().isSuccess());
    EXPECT_FALSE(transport_->isOpen());

    auto result = transport_->write("data: late\n\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, TransportError::Code::Closed);
}

TEST_F(LinuxSocketTransportTest, DescribeNamesDescriptorAndPeer) {
    std::string description = transport_->describe();
    EXPECT_NE(description.find("fd=" + std::to_string(fds_[0])), std::string::npos);
    EXPECT_NE(description.find("unix:test"), std::string::npos);
}

TEST_F(LinuxSocketTransportTest, ClassifyEventsPrefersSocketError) {
    using linux::LinuxSocketTransport;
    using linux::SocketHangup;

    EXPECT_EQ(LinuxSocketTransport::classifyEvents(EPOLLIN | EPOLLOUT), SocketHangup::None);
    EXPECT_EQ(LinuxSocketTransport::classifyEvents(EPOLLIN | EPOLLRDHUP), SocketHangup::PeerClosed);
    EXPECT_EQ(LinuxSocketTransport::classifyEvents(EPOLLHUP), SocketHangup::PeerClosed);
    EXPECT_EQ(LinuxSocketTransport::classifyEvents(EPOLLERR | EPOLLHUP | EPOLLRDHUP),
              SocketHangup::SocketError);
}

TEST_F(LinuxSocketTransportTest, HealthySocketHasNoPendingError) {
    EXPECT_EQ(transport_->takeSocketError(), 0);
}

#endif // defined(__linux__)

} // namespace test
} // namespace pal
} // namespace streamhub
