/**
 * @file websocket.cpp
 * @brief RFC 6455 server-side WebSocket framing over a POSIX socket
 */

#include "websocket.h"
#include "rey/core/rey_logger.h"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

// Socket/network
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rey {
namespace net {

static const char* LOG_TAG = "WebSocket";

static constexpr int IDLE_POLL_MS = 200;       // re-check open_ while idle
static constexpr int FRAME_TIMEOUT_MS = 10000; // max stall inside one frame

// =============================================================================
// Helpers
// =============================================================================

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    return s.substr(begin, s.find_last_not_of(" \t\r\n") - begin + 1);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 &&
            hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

bool send_all(int fd, const void* buf, size_t len) {
    size_t total = 0;
    auto* p = static_cast<const uint8_t*>(buf);
    while (total < len) {
        ssize_t n = send(fd, p + total, len - total, MSG_NOSIGNAL);
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

const char* status_reason(int status) {
    switch (status) {
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 426: return "Upgrade Required";
        default: return "Error";
    }
}

}  // namespace

// =============================================================================
// Handshake
// =============================================================================

std::string UpgradeRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

std::string UpgradeRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    return it != query.end() ? it->second : "";
}

bool UpgradeRequest::is_websocket_upgrade() const {
    return method == "GET" && to_lower(header("upgrade")) == "websocket" &&
           to_lower(header("connection")).find("upgrade") != std::string::npos &&
           !header("sec-websocket-key").empty();
}

std::string compute_accept_key(const std::string& client_key) {
    const std::string input = client_key + WS_GUID;

    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);

    // 20 bytes -> 28 base64 chars + NUL
    unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
    const int len = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
    return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(len));
}

bool parse_upgrade_request(const std::string& raw, UpgradeRequest& out) {
    std::istringstream stream(raw);
    std::string line;
    if (!std::getline(stream, line)) {
        return false;
    }

    std::istringstream request_line(trim(line));
    std::string target;
    std::string version;
    if (!(request_line >> out.method >> target >> version) ||
        version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }

    const size_t qpos = target.find('?');
    out.path = target.substr(0, qpos);
    if (qpos != std::string::npos) {
        std::istringstream query(target.substr(qpos + 1));
        std::string pair;
        while (std::getline(query, pair, '&')) {
            if (pair.empty()) continue;
            const size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                out.query[url_decode(pair)] = "";
            } else {
                out.query[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
    }

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            return false;
        }
        out.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

ErrorCode read_upgrade_request(int fd, UpgradeRequest& out, int timeout_ms) {
    static constexpr size_t MAX_REQUEST_SIZE = 8192;

    std::string request;
    char buf[512];
    int waited_ms = 0;
    while (request.find("\r\n\r\n") == std::string::npos) {
        if (request.size() > MAX_REQUEST_SIZE) {
            return ErrorCode::HandshakeFailed;
        }
        struct pollfd pfd = {fd, POLLIN, 0};
        int ret = poll(&pfd, 1, IDLE_POLL_MS);
        if (ret < 0) {
            return ErrorCode::TransportError;
        }
        if (ret == 0) {
            waited_ms += IDLE_POLL_MS;
            if (waited_ms >= timeout_ms) {
                return ErrorCode::TransportError;
            }
            continue;
        }
        // Peek so bytes after the header block stay in the socket
        ssize_t n = recv(fd, buf, sizeof(buf), MSG_PEEK);
        if (n <= 0) {
            return ErrorCode::TransportError;
        }
        std::string chunk(buf, static_cast<size_t>(n));
        const size_t already = request.size();
        std::string combined = request + chunk;
        size_t end = combined.find("\r\n\r\n");
        size_t take = static_cast<size_t>(n);
        if (end != std::string::npos) {
            take = end + 4 - already;
        }
        n = recv(fd, buf, take, 0);
        if (n <= 0) {
            return ErrorCode::TransportError;
        }
        request.append(buf, static_cast<size_t>(n));
    }

    if (!parse_upgrade_request(request, out)) {
        return ErrorCode::HandshakeFailed;
    }
    return ErrorCode::Ok;
}

bool send_upgrade_response(int fd, const UpgradeRequest& request) {
    std::ostringstream res;
    res << "HTTP/1.1 101 Switching Protocols\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Accept: " << compute_accept_key(request.header("sec-websocket-key"))
        << "\r\n"
        << "\r\n";
    const std::string s = res.str();
    return send_all(fd, s.data(), s.size());
}

bool send_http_error(int fd, int status, const std::string& reason) {
    const std::string body = reason.empty() ? status_reason(status) : reason;
    std::ostringstream res;
    res << "HTTP/1.1 " << status << " " << status_reason(status) << "\r\n"
        << "Content-Type: text/plain\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    const std::string s = res.str();
    return send_all(fd, s.data(), s.size());
}

// =============================================================================
// Framing
// =============================================================================

std::vector<uint8_t> encode_frame(WsOpcode opcode, const uint8_t* data, size_t size,
                                  const uint8_t* mask_key) {
    std::vector<uint8_t> frame;
    frame.reserve(size + 14);

    // FIN + opcode
    frame.push_back(static_cast<uint8_t>(0x80 | static_cast<uint8_t>(opcode)));

    const uint8_t mask_bit = mask_key ? 0x80 : 0x00;
    if (size <= 125) {
        frame.push_back(static_cast<uint8_t>(mask_bit | size));
    } else if (size <= 65535) {
        frame.push_back(mask_bit | 126);
        frame.push_back(static_cast<uint8_t>((size >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(size & 0xFF));
    } else {
        frame.push_back(mask_bit | 127);
        for (int i = 7; i >= 0; i--) {
            frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(size) >> (8 * i)) & 0xFF));
        }
    }

    if (mask_key) {
        frame.insert(frame.end(), mask_key, mask_key + 4);
        for (size_t i = 0; i < size; i++) {
            frame.push_back(static_cast<uint8_t>(data[i] ^ mask_key[i % 4]));
        }
    } else if (size > 0) {
        frame.insert(frame.end(), data, data + size);
    }
    return frame;
}

WebSocketConnection::WebSocketConnection(int fd)
    : fd_(fd) {
}

WebSocketConnection::~WebSocketConnection() {
    shutdown();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void WebSocketConnection::shutdown() {
    if (open_.exchange(false) && fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

bool WebSocketConnection::recv_exact(uint8_t* buf, size_t len, bool idle_wait) {
    size_t total = 0;
    int stalled_ms = 0;
    while (total < len) {
        if (!open_) return false;
        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, IDLE_POLL_MS);
        if (ret < 0) return false;
        if (ret == 0) {
            // Between frames a client may stay silent indefinitely
            if (idle_wait && total == 0) continue;
            stalled_ms += IDLE_POLL_MS;
            if (stalled_ms >= FRAME_TIMEOUT_MS) return false;
            continue;
        }
        ssize_t n = recv(fd_, buf + total, len - total, 0);
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
        stalled_ms = 0;
    }
    return true;
}

ErrorCode WebSocketConnection::read_message(WsMessage& out) {
    out.payload.clear();
    bool in_fragmented = false;

    while (true) {
        uint8_t header[2];
        if (!recv_exact(header, 2, !in_fragmented)) {
            return open_ ? ErrorCode::ConnectionClosed : ErrorCode::TransportError;
        }

        const bool fin = (header[0] & 0x80) != 0;
        const auto opcode = static_cast<WsOpcode>(header[0] & 0x0F);
        const bool masked = (header[1] & 0x80) != 0;
        uint64_t payload_len = header[1] & 0x7F;

        if (payload_len == 126) {
            uint8_t ext[2];
            if (!recv_exact(ext, 2, false)) return ErrorCode::TransportError;
            payload_len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
        } else if (payload_len == 127) {
            uint8_t ext[8];
            if (!recv_exact(ext, 8, false)) return ErrorCode::TransportError;
            payload_len = 0;
            for (int i = 0; i < 8; i++) {
                payload_len = (payload_len << 8) | ext[i];
            }
        }

        // Clients must mask every frame
        if (!masked) {
            REY_LOG_WARNING(LOG_TAG, "Unmasked client frame, closing");
            send_close(1002, "Protocol error");
            return ErrorCode::TransportError;
        }

        if (payload_len > WS_MAX_PAYLOAD || out.payload.size() + payload_len > WS_MAX_PAYLOAD) {
            REY_LOG_WARNING(LOG_TAG, "Message too large (%llu bytes), closing",
                            static_cast<unsigned long long>(payload_len));
            send_close(1009, "Message too big");
            return ErrorCode::TransportError;
        }

        uint8_t mask_key[4] = {};
        if (!recv_exact(mask_key, 4, false)) return ErrorCode::TransportError;

        std::string payload(static_cast<size_t>(payload_len), '\0');
        if (payload_len > 0) {
            if (!recv_exact(reinterpret_cast<uint8_t*>(&payload[0]), payload.size(), false)) {
                return ErrorCode::TransportError;
            }
            for (size_t i = 0; i < payload.size(); i++) {
                payload[i] = static_cast<char>(payload[i] ^ mask_key[i % 4]);
            }
        }

        switch (opcode) {
            case WsOpcode::Ping: {
                std::lock_guard<std::mutex> lock(write_mutex_);
                const auto frame = encode_frame(WsOpcode::Pong,
                                                reinterpret_cast<const uint8_t*>(payload.data()),
                                                std::min<size_t>(payload.size(), 125));
                if (!send_all(fd_, frame.data(), frame.size())) {
                    return ErrorCode::TransportError;
                }
                continue;
            }
            case WsOpcode::Pong:
                continue;
            case WsOpcode::Close: {
                uint16_t code = 1000;
                if (payload.size() >= 2) {
                    code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                                 static_cast<uint8_t>(payload[1]));
                }
                REY_LOG_DEBUG(LOG_TAG, "Client closed connection (code=%u)", code);
                send_close(code);
                return ErrorCode::ConnectionClosed;
            }
            case WsOpcode::Text:
            case WsOpcode::Binary:
                if (in_fragmented) {
                    send_close(1002, "Expected continuation frame");
                    return ErrorCode::TransportError;
                }
                out.opcode = opcode;
                out.payload = std::move(payload);
                if (fin) {
                    return ErrorCode::Ok;
                }
                in_fragmented = true;
                continue;
            case WsOpcode::Continuation:
                if (!in_fragmented) {
                    send_close(1002, "Unexpected continuation frame");
                    return ErrorCode::TransportError;
                }
                out.payload += payload;
                if (fin) {
                    return ErrorCode::Ok;
                }
                continue;
            default:
                send_close(1002, "Unknown opcode");
                return ErrorCode::TransportError;
        }
    }
}

bool WebSocketConnection::send_frame(WsOpcode opcode, const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_ || fd_ < 0) {
        return false;
    }
    const auto frame = encode_frame(opcode, data, size);
    if (!send_all(fd_, frame.data(), frame.size())) {
        REY_LOG_DEBUG(LOG_TAG, "Send failed on fd %d", fd_);
        return false;
    }
    return true;
}

bool WebSocketConnection::send_text(const std::string& message) {
    return send_frame(WsOpcode::Text, reinterpret_cast<const uint8_t*>(message.data()),
                      message.size());
}

bool WebSocketConnection::send_binary(const std::vector<uint8_t>& data) {
    return send_frame(WsOpcode::Binary, data.data(), data.size());
}

bool WebSocketConnection::send_close(uint16_t code, const std::string& reason) {
    if (close_sent_.exchange(true)) {
        return true;
    }
    std::string payload;
    payload += static_cast<char>((code >> 8) & 0xFF);
    payload += static_cast<char>(code & 0xFF);
    payload += reason.substr(0, 123);
    return send_frame(WsOpcode::Close, reinterpret_cast<const uint8_t*>(payload.data()),
                      payload.size());
}

}  // namespace net
}  // namespace rey
