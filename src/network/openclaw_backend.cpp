/**
 * @file openclaw_backend.cpp
 * @brief OpenClaw gateway chat backend
 */

#include "openclaw_backend.h"
#include "http_endpoint.h"
#include "rey/core/rey_logger.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace rey {
namespace net {

static const char* LOG_TAG = "OpenClaw";

std::string build_chat_request_body(const ChatRequest& request, const std::string& model) {
    nlohmann::json body;
    body["model"] = model.empty() ? "openclaw" : model;
    body["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", request.system_prompt}},
        {{"role", "user"}, {"content", request.user_text}},
    });
    body["user"] = request.user_key;
    body["stream"] = false;
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

BackendReply parse_chat_response(int status, const std::string& body) {
    if (status < 200 || status >= 300) {
        std::string detail = body.substr(0, 200);
        return BackendReply::failure(ErrorCode::BackendError,
                                     "Gateway returned HTTP " + std::to_string(status) +
                                         (detail.empty() ? "" : ": " + detail),
                                     status);
    }

    try {
        const nlohmann::json j = nlohmann::json::parse(body);
        const auto& content = j.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) {
            return BackendReply::failure(ErrorCode::BackendBadResponse,
                                         "Reply content is not a string", status);
        }
        BackendReply reply = BackendReply::ok(content.get<std::string>());
        reply.status_code = status;
        return reply;
    } catch (const nlohmann::json::exception& e) {
        return BackendReply::failure(ErrorCode::BackendBadResponse,
                                     std::string("Malformed gateway reply: ") + e.what(), status);
    }
}

OpenClawBackend::OpenClawBackend(const OpenClawBackendConfig& config)
    : config_(config) {
}

BackendReply OpenClawBackend::chat(const ChatRequest& request) {
    HttpEndpoint endpoint;
    if (!parse_http_endpoint(config_.gateway_url, endpoint)) {
        return BackendReply::failure(ErrorCode::BackendError,
                                     "Invalid gateway URL: " + config_.gateway_url);
    }

    httplib::Client client(endpoint.scheme_host_port);
    const auto timeout = static_cast<time_t>(config_.timeout.count());
    client.set_connection_timeout(timeout, 0);
    client.set_read_timeout(timeout, 0);
    client.set_write_timeout(timeout, 0);

    httplib::Headers headers = {
        {"x-openclaw-agent-id", config_.agent_id},
    };
    if (!config_.token.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.token);
    }

    const std::string path = endpoint.path_prefix + "/v1/chat/completions";
    REY_LOG_DEBUG(LOG_TAG, "POST %s%s", endpoint.scheme_host_port.c_str(), path.c_str());

    auto res = client.Post(path, headers, build_chat_request_body(request, config_.model),
                           "application/json");
    if (!res) {
        const std::string cause = "Gateway request failed: " + httplib::to_string(res.error());
        REY_LOG_ERROR(LOG_TAG, "%s", cause.c_str());
        return BackendReply::failure(ErrorCode::BackendError, cause);
    }

    return parse_chat_response(res->status, res->body);
}

}  // namespace net
}  // namespace rey
