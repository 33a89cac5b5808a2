/**
 * @file rey_chat_backend.h
 * @brief Rey Voice Server - Conversational backend contract
 *
 * A backend is stateless from the server's point of view and may be shared by
 * all sessions. Conversation memory, if any, lives in the backend and is keyed
 * by ChatRequest::user_key.
 */

#ifndef REY_CHAT_BACKEND_H
#define REY_CHAT_BACKEND_H

#include "rey/core/rey_error.h"

#include <string>
#include <utility>

namespace rey {

struct ChatRequest {
    std::string system_prompt;
    std::string user_text;
    std::string user_key;
};

struct BackendReply {
    bool success = false;
    std::string text;
    std::string error;
    ErrorCode code = ErrorCode::Ok;
    int status_code = 0;  // HTTP status, 0 when no response was received

    static BackendReply ok(std::string reply_text) {
        BackendReply reply;
        reply.success = true;
        reply.text = std::move(reply_text);
        return reply;
    }

    static BackendReply failure(ErrorCode error_code, std::string cause, int status = 0) {
        BackendReply reply;
        reply.code = error_code;
        reply.error = std::move(cause);
        reply.status_code = status;
        return reply;
    }
};

class ChatBackend {
public:
    virtual ~ChatBackend() = default;

    /// Blocking request. Must be safe to call from several threads at once.
    virtual BackendReply chat(const ChatRequest& request) = 0;
};

}  // namespace rey

#endif  // REY_CHAT_BACKEND_H
