/**
 * @file rey_voice_server.h
 * @brief Rey Voice Server - Server lifecycle
 *
 * Two listeners share one session registry:
 *   - WebSocket  ws://host:port/voice         one VoiceSession per connection
 *   - HTTP       http://host:http_port/...    /health, /inbox (cpp-httplib)
 */

#ifndef REY_VOICE_SERVER_H
#define REY_VOICE_SERVER_H

#include "rey/core/rey_error.h"
#include "rey/session/rey_session.h"
#include "rey/session/rey_session_registry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace rey {

namespace net {
class WebSocketServer;
class WebSocketConnection;
struct UpgradeRequest;
}  // namespace net

/// Builds the exclusively-owned collaborators for a new session.
using ComponentFactory = std::function<SessionComponents()>;

struct VoiceServerConfig {
    std::string host = "0.0.0.0";
    int port = 8765;       // WebSocket, 0 = any free port
    int http_port = 8766;  // HTTP API, 0 = any free port
    std::string auth_token;
    std::string voice_path = "/voice";
    SessionConfig session;
};

class VoiceServer {
public:
    VoiceServer(const VoiceServerConfig& config, ComponentFactory factory);
    ~VoiceServer();

    VoiceServer(const VoiceServer&) = delete;
    VoiceServer& operator=(const VoiceServer&) = delete;

    /**
     * @brief Bind both listeners and start serving
     *
     * @return ErrorCode::Ok, or TransportError when a port cannot be bound
     */
    ErrorCode start();

    /// Stop both listeners and close every session.
    void stop();

    /// Block until stop() is called.
    void wait();

    bool is_running() const { return running_.load(); }
    int port() const;
    int http_port() const { return bound_http_port_; }
    int64_t uptime_seconds() const;

    SessionRegistry& registry() { return registry_; }

private:
    void setup_routes();
    void setup_cors();
    int filter_upgrade(const net::UpgradeRequest& request) const;
    void handle_connection(const std::shared_ptr<net::WebSocketConnection>& connection,
                           const net::UpgradeRequest& request);
    void http_thread_main();

    VoiceServerConfig config_;
    ComponentFactory factory_;

    SessionRegistry registry_;
    Broadcaster broadcaster_;

    std::unique_ptr<net::WebSocketServer> ws_server_;
    std::unique_ptr<httplib::Server> http_server_;
    std::thread http_thread_;
    int bound_http_port_ = 0;

    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point start_time_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace rey

#endif  // REY_VOICE_SERVER_H
