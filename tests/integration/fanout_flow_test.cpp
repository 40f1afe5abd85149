// StreamHub - Real-time event fan-out server
// Integration tests: connection pool over real Linux sockets
//
// Tests cover:
// - Admission writes the "connected" frame to the socket
// - Channel broadcast reaches only subscribers of the same tenant
// - Kernel backpressure queues messages; drain flushes them in order
// - Peer close removes the session on the next write
// - A socket error surfaces as EPOLLERR and removes with reason "error"
// - Keepalive and shutdown through the timer and transport layers

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "streamhub/core/json_value.hpp"
#include "streamhub/core/structured_logger.hpp"
#include "streamhub/pool/connection_pool.hpp"

#include "support/manual_timer_pal.hpp"

#if defined(__linux__)
#include "streamhub/pal/linux/linux_socket_transport.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#endif

namespace streamhub {
namespace integration {
namespace test {

#if defined(__linux__)

using core::JsonValue;
using pal::linux::LinuxSocketTransport;
using pool::AddConnectionRequest;
using pool::ConnectionPool;
using pool::PoolEvent;
using pool::PoolEventType;
using pool::RemovalReason;
using streamhub::test::ManualTimerPAL;

/**
 * @brief One client session: the pool-side transport and the peer socket.
 */
struct Session {
    std::shared_ptr<LinuxSocketTransport> transport;
    int peerFd = -1;
    core::ConnectionId id;

    std::string read() const {
        std::string out;
        char buffer[65536];
        while (true) {
            ssize_t n = ::read(peerFd, buffer, sizeof(buffer));
            if (n <= 0) {
                break;
            }
            out.append(buffer, static_cast<size_t>(n));
        }
        return out;
    }

    // True once the pool side has shut the socket down.
    bool peerSeesEof() const {
        char byte;
        ssize_t n = ::read(peerFd, &byte, 1);
        return n == 0;
    }
};

// =============================================================================
// Test Fixtures
// =============================================================================

class FanoutFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.maxConnectionsPerUser = 3;
        config_.maxConnectionsPerTenant = 10;
        config_.maxTotalConnections = 20;
        config_.pingInterval = std::chrono::milliseconds(30000);
        config_.cleanupInterval = std::chrono::milliseconds(60000);
        config_.connectionTimeout = std::chrono::milliseconds(120000);
        config_.maxMessageQueueSize = 50;
        config_.backpressureThreshold = 10;

        timer_ = std::make_shared<ManualTimerPAL>();
        logger_ = std::make_shared<core::StructuredLogger>();
        logger_->setLevel(core::LogLevelConfig::Error);

        pool_ = std::make_unique<ConnectionPool>(config_, timer_, logger_);
        pool_->addEventListener([this](const PoolEvent& event) {
            std::lock_guard<std::mutex> lock(eventsMutex_);
            events_.push_back(event);
        });
    }

    void TearDown() override {
        pool_.reset();
        for (auto& session : sessions_) {
            if (session->peerFd >= 0) {
                ::close(session->peerFd);
            }
        }
    }

    Session& open(const std::string& user, const std::string& tenant,
                  std::vector<core::ChannelName> channels, int sendBuffer = 0) {
        int fds[2];
        EXPECT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);
        if (sendBuffer > 0) {
            ::setsockopt(fds[0], SOL_SOCKET, SO_SNDBUF, &sendBuffer, sizeof(sendBuffer));
            ::setsockopt(fds[1], SOL_SOCKET, SO_RCVBUF, &sendBuffer, sizeof(sendBuffer));
        }

        auto session = std::make_unique<Session>();
        session->transport = std::make_shared<LinuxSocketTransport>(fds[0], user + "@socketpair");
        session->peerFd = fds[1];

        AddConnectionRequest request;
        request.transport = session->transport;
        request.userId = user;
        request.tenantId = tenant;
        request.channels = std::move(channels);
        auto result = pool_->addConnection(std::move(request));
        EXPECT_TRUE(result.isSuccess());
        if (result.isSuccess()) {
            session->id = result.value();
        }

        sessions_.push_back(std::move(session));
        return *sessions_.back();
    }

    size_t countEvents(PoolEventType type) {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        size_t count = 0;
        for (const auto& event : events_) {
            if (event.type == type) count++;
        }
        return count;
    }

    static size_t countOccurrences(const std::string& haystack, const std::string& needle) {
        size_t count = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            count++;
        }
        return count;
    }

    core::PoolConfig config_;
    std::shared_ptr<ManualTimerPAL> timer_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::unique_ptr<ConnectionPool> pool_;
    std::vector<std::unique_ptr<Session>> sessions_;

    std::mutex eventsMutex_;
    std::vector<PoolEvent> events_;
};

// =============================================================================
// Admission and Fan-out
// =============================================================================

TEST_F(FanoutFlowTest, AdmissionWritesConnectedFrame) {
    Session& session = open("alice", "acme", {"system", "orders"});

    std::string received = session.read();
    EXPECT_EQ(received.rfind("id: ", 0), 0u);
    EXPECT_NE(received.find("event: connected\n"), std::string::npos);
    EXPECT_NE(received.find("\"connectionId\":\"" + session.id + "\""), std::string::npos);
    EXPECT_NE(received.find("\"orders\""), std::string::npos);
    EXPECT_EQ(received.substr(received.size() - 2), "\n\n");

    auto info = pool_->getConnectionInfo(session.id);
    ASSERT_TRUE(info.has_value());
    EXPECT_NE(info->transport.find("alice@socketpair"), std::string::npos);
}

TEST_F(FanoutFlowTest, BroadcastReachesSubscribersOfSameTenantOnly) {
    Session& alice = open("alice", "acme", {"orders"});
    Session& bob = open("bob", "acme", {"orders"});
    Session& carol = open("carol", "acme", {"system"});
    Session& mallory = open("mallory", "globex", {"orders"});
    alice.read();
    bob.read();
    carol.read();
    mallory.read();

    JsonValue data = JsonValue::object();
    data.set("orderId", JsonValue(42));
    size_t delivered = pool_->broadcast("acme", "orders", std::string("order.created"), data);

    EXPECT_EQ(delivered, 2u);
    EXPECT_NE(alice.read().find("event: order.created\ndata: {\"orderId\":42}\n\n"),
              std::string::npos);
    EXPECT_NE(bob.read().find("order.created"), std::string::npos);
    EXPECT_TRUE(carol.read().empty());
    EXPECT_TRUE(mallory.read().empty());
}

TEST_F(FanoutFlowTest, BroadcastToUserCoversEveryTabOfThatUser) {
    Session& tab1 = open("alice", "acme", {"system"});
    Session& tab2 = open("alice", "acme", {"system"});
    Session& other = open("bob", "acme", {"system"});
    tab1.read();
    tab2.read();
    other.read();

    EXPECT_EQ(pool_->broadcastToUser("alice", std::string("notice"), JsonValue("hello")), 2u);
    EXPECT_NE(tab1.read().find("data: hello\n"), std::string::npos);
    EXPECT_NE(tab2.read().find("data: hello\n"), std::string::npos);
    EXPECT_TRUE(other.read().empty());
}

// =============================================================================
// Backpressure and Drain
// =============================================================================

TEST_F(FanoutFlowTest, KernelBackpressureQueuesAndDrainFlushesInOrder) {
    Session& slow = open("slow", "acme", {"feed"}, 4096);
    slow.read();

    std::string payload(4000, 'p');
    int sent = 0;
    while (pool_->getConnectionInfo(slow.id)->isWritable && sent < 1000) {
        ASSERT_EQ(pool_->broadcast("acme", "feed", std::string("bulk"), JsonValue(payload)), 1u);
        sent++;
    }
    ASSERT_FALSE(pool_->getConnectionInfo(slow.id)->isWritable);
    EXPECT_GE(countEvents(PoolEventType::Backpressure), 1u);

    for (int i = 0; i < 3; ++i) {
        JsonValue data = JsonValue::object();
        data.set("seq", JsonValue(i));
        pool_->broadcast("acme", "feed", std::string("queued"), data);
    }
    EXPECT_EQ(pool_->getConnectionInfo(slow.id)->pendingMessages, 3u);

    std::string received;
    for (int i = 0; i < 1000 && (slow.transport->hasPendingOutput() ||
                                 pool_->getConnectionInfo(slow.id)->pendingMessages > 0); ++i) {
        received += slow.read();
        ASSERT_TRUE(slow.transport->onWritable().isSuccess());
    }
    received += slow.read();

    auto info = pool_->getConnectionInfo(slow.id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pendingMessages, 0u);
    EXPECT_GE(countEvents(PoolEventType::Drained), 1u);

    size_t first = received.find("{\"seq\":0}");
    size_t second = received.find("{\"seq\":1}");
    size_t third = received.find("{\"seq\":2}");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    ASSERT_NE(third, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
    EXPECT_EQ(countOccurrences(received, "event: bulk\n"), static_cast<size_t>(sent));
}

// =============================================================================
// Failure, Keepalive and Shutdown
// =============================================================================

TEST_F(FanoutFlowTest, PeerCloseRemovesSessionOnNextWrite) {
    Session& gone = open("gone", "acme", {"system"});
    Session& stays = open("stays", "acme", {"system"});
    ::close(gone.peerFd);
    gone.peerFd = -1;

    size_t delivered = pool_->broadcastToTenant("acme", std::string("notice"), JsonValue("x"));

    EXPECT_EQ(delivered, 1u);
    EXPECT_FALSE(pool_->getConnectionInfo(gone.id).has_value());
    EXPECT_TRUE(pool_->getConnectionInfo(stays.id).has_value());
    EXPECT_EQ(countEvents(PoolEventType::ConnectionError), 1u);
    EXPECT_EQ(pool_->getTenantConnectionCount("acme"), 1u);
}

TEST_F(FanoutFlowTest, SocketErrorRemovesSessionWithErrorReason) {
    Session& broken = open("broken", "acme", {"system"});

    // Closing the peer with the connected frame still unread resets the socket.
    ::close(broken.peerFd);
    broken.peerFd = -1;

    int epollFd = ::epoll_create1(EPOLL_CLOEXEC);
    ASSERT_GE(epollFd, 0);
    epoll_event registration{};
    registration.events = EPOLLIN | EPOLLRDHUP;
    registration.data.fd = broken.transport->fd();
    ASSERT_EQ(::epoll_ctl(epollFd, EPOLL_CTL_ADD, broken.transport->fd(), &registration), 0);

    epoll_event ready{};
    int n = ::epoll_wait(epollFd, &ready, 1, 1000);
    ::close(epollFd);
    ASSERT_EQ(n, 1);

    auto hangup = LinuxSocketTransport::classifyEvents(ready.events);
    ASSERT_EQ(hangup, pal::linux::SocketHangup::SocketError);
    EXPECT_EQ(broken.transport->takeSocketError(), ECONNRESET);

    pool_->removeConnection(broken.id, RemovalReason::Error);

    std::lock_guard<std::mutex> lock(eventsMutex_);
    std::vector<PoolEvent> removed;
    for (const auto& event : events_) {
        if (event.type == PoolEventType::ConnectionRemoved) {
            removed.push_back(event);
        }
    }
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].connectionId, broken.id);
    EXPECT_EQ(removed[0].removalReason, RemovalReason::Error);
    EXPECT_FALSE(broken.transport->isOpen());
}

TEST_F(FanoutFlowTest, KeepaliveTimerWritesPingFrames) {
    Session& session = open("alice", "acme", {"system"});
    session.read();

    timer_->advance(std::chrono::milliseconds(30000));

    std::string received = session.read();
    EXPECT_NE(received.find("event: ping\n"), std::string::npos);
    EXPECT_NE(received.find("\"timestamp\""), std::string::npos);
}

TEST_F(FanoutFlowTest, ShutdownClosesEverySocket) {
    Session& a = open("alice", "acme", {"system"});
    Session& b = open("bob", "globex", {"system"});
    a.read();
    b.read();

    pool_->shutdown();

    EXPECT_EQ(pool_->connectionCount(), 0u);
    EXPECT_FALSE(a.transport->isOpen());
    EXPECT_FALSE(b.transport->isOpen());
    EXPECT_TRUE(a.peerSeesEof());
    EXPECT_TRUE(b.peerSeesEof());
    EXPECT_EQ(countEvents(PoolEventType::ConnectionRemoved), 2u);
}

#endif // defined(__linux__)

} // namespace test
} // namespace integration
} // namespace streamhub
