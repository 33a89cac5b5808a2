/**
 * @file voice_server.cpp
 * @brief Server lifecycle: WebSocket voice endpoint and HTTP API
 */

#include "rey/server/rey_voice_server.h"
#include "rey/audio/rey_audio.h"
#include "rey/core/rey_logger.h"
#include "rey/server/rey_inbox.h"

#include "../network/websocket.h"
#include "../network/websocket_server.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <utility>

namespace rey {

static const char* LOG_TAG = "Server";

VoiceServer::VoiceServer(const VoiceServerConfig& config, ComponentFactory factory)
    : config_(config)
    , factory_(std::move(factory))
    , broadcaster_(registry_) {
}

VoiceServer::~VoiceServer() {
    stop();
}

int VoiceServer::port() const {
    return ws_server_ ? ws_server_->port() : 0;
}

int64_t VoiceServer::uptime_seconds() const {
    if (!running_) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() -
                                                            start_time_)
        .count();
}

ErrorCode VoiceServer::start() {
    if (running_) {
        return ErrorCode::InvalidState;
    }

    // HTTP API: bind first so a port conflict fails start() synchronously
    http_server_ = std::make_unique<httplib::Server>();
    setup_cors();
    setup_routes();

    if (config_.http_port == 0) {
        bound_http_port_ = http_server_->bind_to_any_port(config_.host);
        if (bound_http_port_ <= 0) {
            REY_LOG_ERROR(LOG_TAG, "Failed to bind HTTP API on %s", config_.host.c_str());
            http_server_.reset();
            return ErrorCode::TransportError;
        }
    } else {
        if (!http_server_->bind_to_port(config_.host, config_.http_port)) {
            REY_LOG_ERROR(LOG_TAG, "Failed to bind HTTP API on %s:%d", config_.host.c_str(),
                          config_.http_port);
            http_server_.reset();
            return ErrorCode::TransportError;
        }
        bound_http_port_ = config_.http_port;
    }

    // WebSocket voice endpoint
    ws_server_ = std::make_unique<net::WebSocketServer>(
        [this](const net::UpgradeRequest& request) { return filter_upgrade(request); },
        [this](const std::shared_ptr<net::WebSocketConnection>& connection,
               const net::UpgradeRequest& request) { handle_connection(connection, request); });

    const ErrorCode rc = ws_server_->start(config_.host, config_.port);
    if (rc != ErrorCode::Ok) {
        ws_server_.reset();
        http_server_.reset();
        return rc;
    }

    start_time_ = std::chrono::steady_clock::now();
    running_ = true;
    http_thread_ = std::thread(&VoiceServer::http_thread_main, this);

    REY_LOG_INFO(LOG_TAG, "Rey Voice Server started");
    REY_LOG_INFO(LOG_TAG, "  Voice:  ws://%s:%d%s%s", config_.host.c_str(), port(),
                 config_.voice_path.c_str(), config_.auth_token.empty() ? "" : "?token=...");
    REY_LOG_INFO(LOG_TAG, "  HTTP:   http://%s:%d (/health, /inbox)", config_.host.c_str(),
                 bound_http_port_);
    return ErrorCode::Ok;
}

void VoiceServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    REY_LOG_INFO(LOG_TAG, "Stopping server...");

    if (http_server_) {
        http_server_->stop();
    }
    if (http_thread_.joinable()) {
        http_thread_.join();
    }

    // Closing the connections ends every reader loop; each one unregisters
    // and closes its session on the way out.
    if (ws_server_) {
        ws_server_->stop();
    }

    // Anything left (e.g. a handler that never got to register) is closed here
    for (const auto& session : registry_.snapshot()) {
        registry_.remove(session->id());
        session->close();
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    REY_LOG_INFO(LOG_TAG, "Server stopped");
}

void VoiceServer::wait() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait(lock, [this] { return !running_.load(); });
}

void VoiceServer::http_thread_main() {
    REY_LOG_DEBUG(LOG_TAG, "HTTP thread starting on %s:%d", config_.host.c_str(),
                  bound_http_port_);
    if (!http_server_->listen_after_bind()) {
        if (running_) {
            REY_LOG_ERROR(LOG_TAG, "HTTP listen failed on %s:%d", config_.host.c_str(),
                          bound_http_port_);
        }
    }
    REY_LOG_DEBUG(LOG_TAG, "HTTP thread exiting");
}

// =============================================================================
// WebSocket
// =============================================================================

int VoiceServer::filter_upgrade(const net::UpgradeRequest& request) const {
    if (request.path != config_.voice_path) {
        return 404;
    }
    if (!config_.auth_token.empty() &&
        !credentials_match(request.query_param("token"), config_.auth_token)) {
        REY_LOG_WARNING(LOG_TAG, "Unauthorized connection attempt");
        return 401;
    }
    return 101;
}

void VoiceServer::handle_connection(const std::shared_ptr<net::WebSocketConnection>& connection,
                                    const net::UpgradeRequest& /*request*/) {
    SessionComponents components;
    try {
        if (factory_) {
            components = factory_();
        }
    } catch (const std::exception& e) {
        REY_LOG_ERROR(LOG_TAG, "Failed to initialize session: %s", e.what());
        connection->send_close(1011, "Initialization failed");
        return;
    }

    auto session = std::make_shared<VoiceSession>(VoiceSession::generate_id(), connection,
                                                  std::move(components), config_.session);
    ScopedSessionRegistration registration(registry_, session);
    REY_LOG_INFO(LOG_TAG, "Client connected (session %s, active: %zu)", session->id().c_str(),
                 registry_.size());

    session->start();

    net::WsMessage message;
    while (running_) {
        const ErrorCode rc = connection->read_message(message);
        if (rc != ErrorCode::Ok) {
            if (rc == ErrorCode::ConnectionClosed) {
                REY_LOG_INFO(LOG_TAG, "Client disconnected (session %s)", session->id().c_str());
            } else {
                REY_LOG_WARNING(LOG_TAG, "Connection lost (session %s): %s",
                                session->id().c_str(), error_message(rc));
            }
            break;
        }

        if (message.opcode == net::WsOpcode::Binary) {
            session->handle_audio(decode_pcm16(message.payload));
        } else {
            session->handle_control(message.payload);
        }
    }
}

// =============================================================================
// HTTP API
// =============================================================================

void VoiceServer::setup_routes() {
    // GET /health
    http_server_->Get("/health", [this](const httplib::Request& /*req*/, httplib::Response& res) {
        nlohmann::json body = {{"status", "ok"},
                               {"clients", registry_.size()},
                               {"uptime_seconds", uptime_seconds()}};
        res.set_content(body.dump(), "application/json");
    });

    // POST /inbox
    http_server_->Post("/inbox", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            const InboxResponse result =
                handle_inbox(req.get_header_value("Authorization"), req.body,
                             config_.auth_token, registry_, broadcaster_);
            res.status = result.status;
            res.set_content(result.body, "application/json");
        } catch (const std::exception& e) {
            REY_LOG_ERROR(LOG_TAG, "Error handling inbox: %s", e.what());
            res.status = 500;
            res.set_content("{\"error\": \"Internal server error\"}", "application/json");
        }
    });

    // Root endpoint - info
    http_server_->Get("/", [this](const httplib::Request& /*req*/, httplib::Response& res) {
        nlohmann::json info;
        info["name"] = "Rey Voice Server";
        info["version"] = "1.0.0";
        info["clients"] = registry_.size();
        info["endpoints"] = {
            "WS   " + config_.voice_path,
            "GET  /health",
            "POST /inbox",
        };
        res.set_content(info.dump(2), "application/json");
    });
}

void VoiceServer::setup_cors() {
    http_server_->set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");

        // Handle preflight
        if (req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }

        return httplib::Server::HandlerResponse::Unhandled;
    });
}

}  // namespace rey
