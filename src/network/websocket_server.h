/**
 * @file websocket_server.h
 * @brief Internal: WebSocket listener with one thread per connection
 */

#ifndef REY_NETWORK_WEBSOCKET_SERVER_INTERNAL_H
#define REY_NETWORK_WEBSOCKET_SERVER_INTERNAL_H

#include "websocket.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace rey {
namespace net {

/**
 * Decide whether an upgrade request may proceed. Return 101 to accept, or the
 * HTTP status to answer with (401, 404, ...).
 */
using UpgradeFilter = std::function<int(const UpgradeRequest&)>;

/// Runs on the connection's own thread until the connection ends.
using ConnectionHandler =
    std::function<void(const std::shared_ptr<WebSocketConnection>&, const UpgradeRequest&)>;

class WebSocketServer {
public:
    WebSocketServer(UpgradeFilter filter, ConnectionHandler handler);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// Bind and start accepting. Port 0 picks a free port (see port()).
    ErrorCode start(const std::string& host, int port);

    /// Stop accepting, shut down open connections and wait for their threads.
    void stop();

    bool is_running() const { return running_.load(); }
    int port() const { return bound_port_; }
    size_t connection_count() const;

private:
    void accept_loop();
    void serve_connection(int fd);

    UpgradeFilter filter_;
    ConnectionHandler handler_;

    int listen_fd_ = -1;
    int bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::set<std::shared_ptr<WebSocketConnection>> connections_;
    size_t active_threads_ = 0;
};

}  // namespace net
}  // namespace rey

#endif  // REY_NETWORK_WEBSOCKET_SERVER_INTERNAL_H
