/**
 * @file openclaw_backend.h
 * @brief Internal: OpenClaw gateway chat backend (OpenAI-style chat completions)
 */

#ifndef REY_NETWORK_OPENCLAW_BACKEND_INTERNAL_H
#define REY_NETWORK_OPENCLAW_BACKEND_INTERNAL_H

#include "rey/backend/rey_chat_backend.h"

#include <chrono>
#include <string>

namespace rey {
namespace net {

struct OpenClawBackendConfig {
    std::string gateway_url = "http://127.0.0.1:18789";
    std::string token;
    std::string agent_id = "main";
    std::string model;  // empty = "openclaw"
    std::chrono::seconds timeout{60};
};

/// Request body for POST /v1/chat/completions.
std::string build_chat_request_body(const ChatRequest& request, const std::string& model);

/// Extract choices[0].message.content from a completion response.
BackendReply parse_chat_response(int status, const std::string& body);

class OpenClawBackend : public ChatBackend {
public:
    explicit OpenClawBackend(const OpenClawBackendConfig& config);

    BackendReply chat(const ChatRequest& request) override;

private:
    OpenClawBackendConfig config_;
};

}  // namespace net
}  // namespace rey

#endif  // REY_NETWORK_OPENCLAW_BACKEND_INTERNAL_H
