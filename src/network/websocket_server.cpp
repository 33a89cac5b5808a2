/**
 * @file websocket_server.cpp
 * @brief WebSocket listener with one thread per connection
 */

#include "websocket_server.h"
#include "rey/core/rey_logger.h"

#include <cerrno>
#include <cstring>
#include <exception>
#include <utility>

// Socket/network
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rey {
namespace net {

static const char* LOG_TAG = "WebSocket";

static constexpr int ACCEPT_POLL_MS = 200;
static constexpr int LISTEN_BACKLOG = 64;

WebSocketServer::WebSocketServer(UpgradeFilter filter, ConnectionHandler handler)
    : filter_(std::move(filter))
    , handler_(std::move(handler)) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

ErrorCode WebSocketServer::start(const std::string& host, int port) {
    if (running_) {
        return ErrorCode::InvalidState;
    }

    struct addrinfo hints = {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* result = nullptr;
    const char* node = host.empty() ? nullptr : host.c_str();
    int gai_err = getaddrinfo(node, std::to_string(port).c_str(), &hints, &result);
    if (gai_err != 0) {
        REY_LOG_ERROR(LOG_TAG, "Failed to resolve %s (%s)", host.c_str(), gai_strerror(gai_err));
        return ErrorCode::TransportError;
    }

    listen_fd_ = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (listen_fd_ < 0) {
        REY_LOG_ERROR(LOG_TAG, "Failed to create socket: %s", strerror(errno));
        freeaddrinfo(result);
        return ErrorCode::TransportError;
    }

    int flag = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));

    if (bind(listen_fd_, result->ai_addr, result->ai_addrlen) < 0 ||
        listen(listen_fd_, LISTEN_BACKLOG) < 0) {
        REY_LOG_ERROR(LOG_TAG, "Failed to bind %s:%d: %s", host.c_str(), port, strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        freeaddrinfo(result);
        return ErrorCode::TransportError;
    }
    freeaddrinfo(result);

    struct sockaddr_in bound = {};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    running_ = true;
    accept_thread_ = std::thread(&WebSocketServer::accept_loop, this);
    REY_LOG_INFO(LOG_TAG, "Listening on ws://%s:%d", host.c_str(), bound_port_);
    return ErrorCode::Ok;
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    for (const auto& connection : connections_) {
        connection->send_close(1001, "Server shutting down");
        connection->shutdown();
    }
    idle_cv_.wait(lock, [this] { return active_threads_ == 0; });
    REY_LOG_INFO(LOG_TAG, "Stopped");
}

size_t WebSocketServer::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void WebSocketServer::accept_loop() {
    while (running_) {
        struct pollfd pfd = {listen_fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ret <= 0) {
            continue;
        }

        struct sockaddr_in peer = {};
        socklen_t peer_len = sizeof(peer);
        int fd = accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&peer), &peer_len);
        if (fd < 0) {
            if (running_) {
                REY_LOG_WARNING(LOG_TAG, "accept failed: %s", strerror(errno));
            }
            continue;
        }

        // Disable Nagle for low latency
        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

        char addr[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &peer.sin_addr, addr, sizeof(addr));
        REY_LOG_DEBUG(LOG_TAG, "Connection from %s:%d", addr, ntohs(peer.sin_port));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++active_threads_;
        }
        std::thread(&WebSocketServer::serve_connection, this, fd).detach();
    }
}

void WebSocketServer::serve_connection(int fd) {
    UpgradeRequest request;
    ErrorCode rc = read_upgrade_request(fd, request);

    std::shared_ptr<WebSocketConnection> connection;
    if (rc != ErrorCode::Ok) {
        REY_LOG_DEBUG(LOG_TAG, "Handshake failed: %s", error_message(rc));
        if (rc == ErrorCode::HandshakeFailed) {
            send_http_error(fd, 400, "");
        }
        ::close(fd);
    } else if (!request.is_websocket_upgrade()) {
        send_http_error(fd, 426, "WebSocket upgrade required");
        ::close(fd);
    } else {
        const int status = filter_ ? filter_(request) : 101;
        if (status != 101) {
            REY_LOG_WARNING(LOG_TAG, "Rejected upgrade for %s (%d)", request.path.c_str(),
                            status);
            send_http_error(fd, status, "");
            ::close(fd);
        } else if (!send_upgrade_response(fd, request)) {
            ::close(fd);
        } else {
            // From here the connection owns the descriptor
            connection = std::make_shared<WebSocketConnection>(fd);
        }
    }

    if (connection) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connections_.insert(connection);
        }
        try {
            handler_(connection, request);
        } catch (const std::exception& e) {
            REY_LOG_ERROR(LOG_TAG, "Connection handler error: %s", e.what());
        }
        connection->shutdown();
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.erase(connection);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --active_threads_;
    idle_cv_.notify_all();
}

}  // namespace net
}  // namespace rey
