/**
 * @file websocket.h
 * @brief Internal: RFC 6455 server-side WebSocket framing over a POSIX socket
 */

#ifndef REY_NETWORK_WEBSOCKET_INTERNAL_H
#define REY_NETWORK_WEBSOCKET_INTERNAL_H

#include "rey/core/rey_error.h"
#include "rey/session/rey_session.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rey {
namespace net {

static constexpr size_t WS_MAX_PAYLOAD = 1024 * 1024;  // 1 MB per message
static constexpr const char* WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

struct WsMessage {
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

// =============================================================================
// Handshake
// =============================================================================

struct UpgradeRequest {
    std::string method;
    std::string path;                           // without query string
    std::map<std::string, std::string> query;   // decoded query parameters
    std::map<std::string, std::string> headers; // lower-case names

    std::string header(const std::string& name) const;
    std::string query_param(const std::string& name) const;
    bool is_websocket_upgrade() const;
};

/// base64(SHA1(key + GUID)).
std::string compute_accept_key(const std::string& client_key);

/// Parse the request line and headers of an HTTP/1.1 request.
bool parse_upgrade_request(const std::string& raw, UpgradeRequest& out);

/**
 * Read the HTTP upgrade request from @p fd.
 *
 * @return Ok, TransportError (timeout/closed) or HandshakeFailed (malformed)
 */
ErrorCode read_upgrade_request(int fd, UpgradeRequest& out, int timeout_ms = 5000);

/// Answer with 101 Switching Protocols.
bool send_upgrade_response(int fd, const UpgradeRequest& request);

/// Answer with a plain HTTP error (e.g. 401, 404) and no upgrade.
bool send_http_error(int fd, int status, const std::string& reason);

// =============================================================================
// Framing
// =============================================================================

/**
 * Build one final frame. Server frames are unmasked; @p mask_key is only used
 * when non-null (client role, tests).
 */
std::vector<uint8_t> encode_frame(WsOpcode opcode, const uint8_t* data, size_t size,
                                  const uint8_t* mask_key = nullptr);

/**
 * One accepted WebSocket connection. Reads happen on a single thread; writes
 * may come from any thread and are serialized.
 */
class WebSocketConnection : public SessionSink {
public:
    explicit WebSocketConnection(int fd);
    ~WebSocketConnection() override;

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    /**
     * Read the next data message (text or binary), reassembling fragments.
     * Pings are answered and pongs ignored along the way.
     *
     * @return Ok, ConnectionClosed (close frame or EOF) or TransportError
     */
    ErrorCode read_message(WsMessage& out);

    bool send_text(const std::string& message) override;
    bool send_binary(const std::vector<uint8_t>& data) override;
    bool send_close(uint16_t code, const std::string& reason = "");

    /// Unblock a pending read and stop further sends.
    void shutdown();

    bool is_open() const { return open_.load(); }
    int fd() const { return fd_; }

private:
    bool send_frame(WsOpcode opcode, const uint8_t* data, size_t size);
    bool recv_exact(uint8_t* buf, size_t len, bool idle_wait);

    int fd_;
    std::atomic<bool> open_{true};
    std::atomic<bool> close_sent_{false};
    std::mutex write_mutex_;
};

}  // namespace net
}  // namespace rey

#endif  // REY_NETWORK_WEBSOCKET_INTERNAL_H
