// StreamHub - Real-time event fan-out server
// Example SSE server
//
// Single-threaded epoll loop serving:
//   GET /events?user=U&tenant=T&channels=a,b   streaming session
//   GET /publish?tenant=T&channel=C&event=E&data=D[&user=U][&priority=P][&ttl=MS]
//   GET /stats
//   GET /health
//
// Keepalive and sweep run on the timer PAL thread; the pool serializes them
// with the loop.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "streamhub/core/config_manager.hpp"
#include "streamhub/core/json_value.hpp"
#include "streamhub/core/structured_logger.hpp"
#include "streamhub/pal/linux/linux_log_pal.hpp"
#include "streamhub/pal/linux/linux_socket_transport.hpp"
#include "streamhub/pal/linux/linux_timer_pal.hpp"
#include "streamhub/pool/connection_pool.hpp"
#include "streamhub/pool/pool_health.hpp"
#include "streamhub/pool/sse_formatter.hpp"

namespace {

using namespace streamhub;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

constexpr size_t MAX_REQUEST_BYTES = 8192;
constexpr int MAX_EVENTS = 64;
const char* LOG_CATEGORY = "Server";

void printUsage(const char* programName) {
    std::cout << "StreamHub SSE Server\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     Configuration file (.json, .yaml, .yml)\n"
              << "  -p, --port PORT       Listening port (overrides configuration)\n"
              << "  -h, --help            Show this help\n"
              << "\nExample:\n"
              << "  curl -N 'http://localhost:8080/events?user=alice&tenant=acme&channels=orders'\n"
              << "  curl 'http://localhost:8080/publish?tenant=acme&channel=orders&event=created&data={\"id\":1}'\n"
              << std::endl;
}

// =============================================================================
// HTTP helpers
// =============================================================================

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string urlDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   hexValue(in[i + 1]) >= 0 && hexValue(in[i + 2]) >= 0) {
            out += static_cast<char>(hexValue(in[i + 1]) * 16 + hexValue(in[i + 2]));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

bool parseRequest(const std::string& head, HttpRequest& request) {
    size_t lineEnd = head.find("\r\n");
    std::istringstream line(head.substr(0, lineEnd));
    std::string target;
    std::string version;
    if (!(line >> request.method >> target >> version)) {
        return false;
    }

    size_t question = target.find('?');
    request.path = target.substr(0, question);
    if (question == std::string::npos) {
        return true;
    }

    std::istringstream params(target.substr(question + 1));
    std::string pair;
    while (std::getline(params, pair, '&')) {
        size_t eq = pair.find('=');
        std::string key = urlDecode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
        request.query[key] = value;
    }
    return true;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 503: return "Service Unavailable";
        default: return "Internal Server Error";
    }
}

// Small responses on a socket we are about to close; a short write is not retried.
bool sendResponse(int fd, int status, const core::JsonValue& body) {
    std::string payload = body.serialize();
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << statusText(status) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << payload.size() << "\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Connection: close\r\n\r\n"
        << payload;
    std::string response = out.str();
    ssize_t n = ::send(fd, response.data(), response.size(), MSG_NOSIGNAL);
    return n == static_cast<ssize_t>(response.size());
}

core::JsonValue errorBody(const std::string& message) {
    core::JsonValue body = core::JsonValue::object();
    body.set("error", core::JsonValue(message));
    return body;
}

core::JsonValue statsToJson(const pool::PoolStats& stats) {
    auto counts = [](const std::map<std::string, size_t>& values) {
        core::JsonValue obj = core::JsonValue::object();
        for (const auto& entry : values) {
            obj.set(entry.first, core::JsonValue(static_cast<uint64_t>(entry.second)));
        }
        return obj;
    };

    core::JsonValue json = core::JsonValue::object();
    json.set("totalConnections", core::JsonValue(static_cast<uint64_t>(stats.totalConnections)));
    json.set("activeConnections", core::JsonValue(static_cast<uint64_t>(stats.activeConnections)));
    json.set("congestedConnections", core::JsonValue(static_cast<uint64_t>(stats.congestedConnections)));
    json.set("peakConnections", core::JsonValue(static_cast<uint64_t>(stats.peakConnections)));
    json.set("connectionsByTenant", counts(stats.connectionsByTenant));
    json.set("connectionsByUser", counts(stats.connectionsByUser));
    json.set("channelSubscriptions", counts(stats.channelSubscriptions));
    json.set("totalMessagesSent", core::JsonValue(stats.totalMessagesSent));
    json.set("totalBytesWritten", core::JsonValue(stats.totalBytesWritten));
    json.set("droppedMessages", core::JsonValue(stats.droppedMessages));
    json.set("rejectedConnections", core::JsonValue(stats.rejectedConnections));
    json.set("averageWriteLatencyMs", core::JsonValue(stats.averageWriteLatencyMs));
    return json;
}

// =============================================================================
// Streaming response transport
// =============================================================================

/**
 * @brief Prefixes the first frame with the streaming HTTP response head.
 *
 * Admission writes the "connected" frame, so the head goes out only once
 * the pool has accepted the session. A rejected session never sees it and
 * gets a 503 instead.
 */
class SseResponseTransport : public pal::ITransport {
public:
    explicit SseResponseTransport(std::shared_ptr<pal::linux::LinuxSocketTransport> socket)
        : socket_(std::move(socket)) {}

    core::Result<pal::WriteStatus, pal::TransportError> write(const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (headSent_) {
            return socket_->write(bytes);
        }
        auto result = socket_->write(pool::SseFormatter::httpResponseHead() + bytes);
        if (result.isSuccess() && result.value() != pal::WriteStatus::WouldBlock) {
            headSent_ = true;
        }
        return result;
    }

    void setDrainCallback(pal::DrainCallback callback) override {
        socket_->setDrainCallback(std::move(callback));
    }

    core::Result<void, pal::TransportError> close() override { return socket_->close(); }
    bool isOpen() const override { return socket_->isOpen(); }
    std::string describe() const override { return socket_->describe(); }

private:
    std::shared_ptr<pal::linux::LinuxSocketTransport> socket_;
    std::mutex mutex_;
    bool headSent_ = false;
};

// =============================================================================
// Server
// =============================================================================

class SseServer {
public:
    SseServer(const core::Configuration& config,
              std::shared_ptr<pool::ConnectionPool> pool,
              std::shared_ptr<core::StructuredLogger> logger)
        : config_(config)
        , pool_(std::move(pool))
        , logger_(std::move(logger))
    {
        listenerId_ = pool_->addEventListener([this](const pool::PoolEvent& event) {
            if (event.type == pool::PoolEventType::ConnectionRemoved) {
                std::lock_guard<std::mutex> lock(removedMutex_);
                removed_.push_back(event.connectionId);
            }
        });
    }

    ~SseServer() {
        pool_->removeEventListener(listenerId_);
        for (auto& entry : clients_) {
            if (!entry.second.socket) {
                ::close(entry.first);
            }
        }
        if (listenFd_ >= 0) ::close(listenFd_);
        if (epollFd_ >= 0) ::close(epollFd_);
    }

    SseServer(const SseServer&) = delete;
    SseServer& operator=(const SseServer&) = delete;

    core::Result<void, core::Error> start();
    void run();

private:
    struct Client {
        std::string peer;
        std::string request;
        std::shared_ptr<pal::linux::LinuxSocketTransport> socket;  ///< Set once streaming
        core::ConnectionId connectionId;
    };

    void acceptClients();
    void handleReadable(int fd);
    void handleRequest(int fd, Client& client, const HttpRequest& request);
    void openStream(int fd, Client& client, const HttpRequest& request);
    void publish(int fd, const HttpRequest& request);
    void respond(int fd, int status, const core::JsonValue& body);
    void closeClient(int fd);
    void reapRemovedConnections();

    core::Configuration config_;
    std::shared_ptr<pool::ConnectionPool> pool_;
    std::shared_ptr<core::StructuredLogger> logger_;

    int listenFd_ = -1;
    int epollFd_ = -1;
    std::unordered_map<int, Client> clients_;
    std::unordered_map<core::ConnectionId, int> streams_;

    pool::ListenerId listenerId_ = 0;
    std::mutex removedMutex_;
    std::vector<core::ConnectionId> removed_;
};

core::Result<void, core::Error> SseServer::start() {
    using VoidResult = core::Result<void, core::Error>;

    listenFd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listenFd_ < 0) {
        return VoidResult::error(core::Error(core::ErrorCode::Unknown,
            std::string("socket failed: ") + std::strerror(errno)));
    }

    int opt = 1;
    ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.server.port);
    if (::inet_pton(AF_INET, config_.server.bindAddress.c_str(), &addr.sin_addr) != 1) {
        return VoidResult::error(core::Error(core::ErrorCode::InvalidArgument,
            "Invalid bind address", config_.server.bindAddress));
    }

    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(listenFd_, static_cast<int>(config_.server.backlog)) < 0) {
        return VoidResult::error(core::Error(core::ErrorCode::Unknown,
            std::string("bind/listen failed: ") + std::strerror(errno),
            config_.server.bindAddress + ":" + std::to_string(config_.server.port)));
    }

    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        return VoidResult::error(core::Error(core::ErrorCode::Unknown,
            std::string("epoll_create1 failed: ") + std::strerror(errno)));
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = listenFd_;
    if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, listenFd_, &ev) < 0) {
        return VoidResult::error(core::Error(core::ErrorCode::Unknown,
            std::string("epoll_ctl failed: ") + std::strerror(errno)));
    }

    logger_->info("Listening on " + config_.server.bindAddress + ":" +
                  std::to_string(config_.server.port), LOG_CATEGORY);
    return VoidResult::success();
}

void SseServer::run() {
    epoll_event events[MAX_EVENTS];

    while (g_running) {
        int n = ::epoll_wait(epollFd_, events, MAX_EVENTS, 200);
        if (n < 0 && errno != EINTR) {
            logger_->error(std::string("epoll_wait failed: ") + std::strerror(errno), LOG_CATEGORY);
            break;
        }

        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            if (fd == listenFd_) {
                acceptClients();
                continue;
            }

            auto it = clients_.find(fd);
            if (it == clients_.end()) {
                continue;
            }

            auto hangup = pal::linux::LinuxSocketTransport::classifyEvents(events[i].events);
            if (hangup != pal::linux::SocketHangup::None) {
                if (it->second.connectionId.empty()) {
                    closeClient(fd);
                    continue;
                }
                auto reason = pool::RemovalReason::ClientClosed;
                if (hangup == pal::linux::SocketHangup::SocketError) {
                    reason = pool::RemovalReason::Error;
                    int err = it->second.socket ? it->second.socket->takeSocketError() : 0;
                    logger_->debug("Socket error on fd " + std::to_string(fd) + ": " +
                                   std::strerror(err), LOG_CATEGORY);
                }
                pool_->removeConnection(it->second.connectionId, reason);
                continue;
            }

            if ((events[i].events & EPOLLOUT) && it->second.socket) {
                auto flushed = it->second.socket->onWritable();
                if (flushed.isError()) {
                    pool_->removeConnection(it->second.connectionId,
                                            pool::RemovalReason::WriteError);
                    continue;
                }
            }

            if (events[i].events & EPOLLIN) {
                handleReadable(fd);
            }
        }

        reapRemovedConnections();
    }
}

void SseServer::acceptClients() {
    while (true) {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        int fd = ::accept4(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logger_->warning(std::string("accept failed: ") + std::strerror(errno),
                                 LOG_CATEGORY);
            }
            return;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));

        Client client;
        client.peer = std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
        clients_.emplace(fd, std::move(client));

        epoll_event ev{};
        ev.events = EPOLLIN | EPOLLRDHUP;
        ev.data.fd = fd;
        ::epoll_ctl(epollFd_, EPOLL_CTL_ADD, fd, &ev);
    }
}

void SseServer::handleReadable(int fd) {
    Client& client = clients_.at(fd);
    char buffer[4096];

    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            // Streaming clients only ever send keepalive acknowledgements.
            if (!client.connectionId.empty()) {
                pool_->recordActivity(client.connectionId);
                continue;
            }
            client.request.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            if (!client.connectionId.empty()) {
                pool_->removeConnection(client.connectionId, pool::RemovalReason::ClientClosed);
            } else {
                closeClient(fd);
            }
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            if (!client.connectionId.empty()) {
                pool_->removeConnection(client.connectionId, pool::RemovalReason::Error);
            } else {
                closeClient(fd);
            }
            return;
        }
        break;
    }

    if (!client.connectionId.empty()) {
        return;
    }

    size_t headEnd = client.request.find("\r\n\r\n");
    if (headEnd == std::string::npos) {
        if (client.request.size() > MAX_REQUEST_BYTES) {
            respond(fd, 400, errorBody("Request head too large"));
            closeClient(fd);
        }
        return;
    }

    HttpRequest request;
    if (!parseRequest(client.request.substr(0, headEnd), request)) {
        respond(fd, 400, errorBody("Malformed request line"));
        closeClient(fd);
        return;
    }
    handleRequest(fd, client, request);
}

void SseServer::handleRequest(int fd, Client& client, const HttpRequest& request) {
    if (request.method != "GET") {
        respond(fd, 405, errorBody("Only GET is supported"));
        closeClient(fd);
        return;
    }

    if (request.path == "/events") {
        openStream(fd, client, request);
        return;
    }

    if (request.path == "/publish") {
        publish(fd, request);
    } else if (request.path == "/stats") {
        respond(fd, 200, statsToJson(pool_->getStats()));
    } else if (request.path == "/health") {
        pool::HealthReport report = pool::evaluateHealth(pool_->getStats());
        respond(fd, report.status == pool::HealthStatus::Fail ? 503 : 200, report.toJson());
    } else {
        respond(fd, 404, errorBody("Unknown path " + request.path));
    }
    closeClient(fd);
}

void SseServer::openStream(int fd, Client& client, const HttpRequest& request) {
    auto socket = std::make_shared<pal::linux::LinuxSocketTransport>(fd, client.peer);

    pool::AddConnectionRequest add;
    add.transport = std::make_shared<SseResponseTransport>(socket);
    auto user = request.query.find("user");
    auto tenant = request.query.find("tenant");
    add.userId = user != request.query.end() ? user->second : "";
    add.tenantId = tenant != request.query.end() ? tenant->second : "";
    auto channels = request.query.find("channels");
    if (channels != request.query.end()) {
        add.channels = splitList(channels->second);
    }
    add.metadata["remoteAddress"] = client.peer;

    // From here the transport owns the descriptor.
    client.socket = socket;

    auto result = pool_->addConnection(std::move(add));
    if (result.isError()) {
        const core::Error& error = result.error();
        int status = error.code == core::ErrorCode::InvalidArgument ? 400 : 503;
        respond(fd, status, errorBody(error.toString()));
        closeClient(fd);
        return;
    }

    client.connectionId = result.value();
    streams_[client.connectionId] = fd;

    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET;
    ev.data.fd = fd;
    ::epoll_ctl(epollFd_, EPOLL_CTL_MOD, fd, &ev);
}

void SseServer::publish(int fd, const HttpRequest& request) {
    auto param = [&request](const char* name) -> std::string {
        auto it = request.query.find(name);
        return it != request.query.end() ? it->second : "";
    };

    std::string tenant = param("tenant");
    std::string channel = param("channel");
    std::string user = param("user");
    if (user.empty() && (tenant.empty() || channel.empty())) {
        respond(fd, 400, errorBody("tenant and channel are required"));
        return;
    }

    std::optional<std::string> event;
    if (!param("event").empty()) {
        event = param("event");
    }

    std::string rawData = param("data");
    auto parsed = core::parseJson(rawData);
    core::JsonValue data = parsed.isSuccess() ? parsed.value() : core::JsonValue(rawData);

    core::Priority priority = core::Priority::Normal;
    if (!param("priority").empty()) {
        auto requested = core::stringToPriority(param("priority"));
        if (!requested) {
            respond(fd, 400, errorBody("priority must be high, normal or low"));
            return;
        }
        priority = *requested;
    }

    std::optional<std::chrono::milliseconds> ttl;
    if (!param("ttl").empty()) {
        char* end = nullptr;
        long millis = std::strtol(param("ttl").c_str(), &end, 10);
        if (end == nullptr || *end != '\0' || millis <= 0) {
            respond(fd, 400, errorBody("ttl must be a positive number of milliseconds"));
            return;
        }
        ttl = std::chrono::milliseconds(millis);
    }

    size_t recipients = user.empty()
        ? pool_->broadcast(tenant, channel, event, std::move(data), priority, ttl)
        : pool_->broadcastToUser(user, event, std::move(data), priority, ttl);

    core::JsonValue body = core::JsonValue::object();
    body.set("recipients", core::JsonValue(static_cast<uint64_t>(recipients)));
    respond(fd, 200, body);
}

void SseServer::respond(int fd, int status, const core::JsonValue& body) {
    if (!sendResponse(fd, status, body)) {
        logger_->debug("Response " + std::to_string(status) + " not fully written to fd " +
                       std::to_string(fd), LOG_CATEGORY);
    }
}

void SseServer::closeClient(int fd) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) {
        return;
    }

    ::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
    if (!it->second.connectionId.empty()) {
        streams_.erase(it->second.connectionId);
    }
    if (!it->second.socket) {
        ::close(fd);
    }
    // Otherwise the transport closes the descriptor when the last owner releases it.
    clients_.erase(it);
}

void SseServer::reapRemovedConnections() {
    std::vector<core::ConnectionId> removed;
    {
        std::lock_guard<std::mutex> lock(removedMutex_);
        removed.swap(removed_);
    }

    for (const auto& id : removed) {
        auto it = streams_.find(id);
        if (it != streams_.end()) {
            closeClient(it->second);
        }
    }
}

} // anonymous namespace

// =============================================================================
// Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    std::string configPath;
    long portOverride = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            portOverride = std::strtol(argv[++i], nullptr, 10);
            if (portOverride <= 0 || portOverride > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    // Configuration messages are buffered until the logger exists.
    std::vector<std::string> configLog;
    core::ConfigManager configManager;
    configManager.setLogCallback([&configLog](const std::string& message) {
        configLog.push_back(message);
    });

    auto loaded = configPath.empty() ? configManager.loadDefaults()
                                     : configManager.loadFromFile(configPath);
    if (loaded.isError()) {
        std::cerr << "Failed to load configuration: " << loaded.error().message;
        if (loaded.error().line > 0) {
            std::cerr << " (line " << loaded.error().line << ")";
        }
        std::cerr << std::endl;
        return 1;
    }
    configManager.applyEnvironmentOverrides();

    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    core::Configuration config = configManager.getConfig();
    if (portOverride > 0) {
        config.server.port = static_cast<uint16_t>(portOverride);
    }

    pal::linux::LinuxLogOptions logOptions;
    logOptions.enableSyslog = config.logging.enableSyslog;
    logOptions.enableStderr = config.logging.enableConsole;
    logOptions.decorateStderr = false;

    auto logger = std::make_shared<core::StructuredLogger>();
    logger->setLevel(config.logging.level);
    logger->setJsonFormat(config.logging.json);
    logger->setPlatformLog(std::make_shared<pal::linux::LinuxLogPAL>(logOptions));
    for (const auto& line : configLog) {
        logger->info(line, "Config");
    }

    auto timerPal = std::make_shared<pal::linux::LinuxTimerPAL>();
    auto connectionPool = std::make_shared<pool::ConnectionPool>(config.pool, timerPal, logger);
    if (!connectionPool->timersRunning()) {
        logger->warning("Keepalive or sweep timer unavailable", LOG_CATEGORY);
    }

    {
        SseServer server(config, connectionPool, logger);
        auto started = server.start();
        if (started.isError()) {
            logger->error("Failed to start: " + started.error().toString(), LOG_CATEGORY);
            return 1;
        }

        server.run();

        logger->info("Shutting down", LOG_CATEGORY);
        connectionPool->shutdown();
    }

    logger->info("Server stopped", LOG_CATEGORY);
    logger->flush();
    return 0;
}
