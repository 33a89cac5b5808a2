/**
 * @file inbox.cpp
 * @brief /inbox request handling
 */

#include "rey/server/rey_inbox.h"
#include "rey/core/rey_logger.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace rey {

static const char* LOG_TAG = "Inbox";

bool credentials_match(const std::string& provided, const std::string& expected) {
    unsigned char diff = provided.size() == expected.size() ? 0 : 1;
    for (size_t i = 0; i < expected.size(); ++i) {
        const unsigned char p = i < provided.size() ? static_cast<unsigned char>(provided[i]) : 0;
        diff |= static_cast<unsigned char>(p ^ static_cast<unsigned char>(expected[i]));
    }
    return diff == 0;
}

bool authorize_bearer(const std::string& authorization, const std::string& expected_token) {
    if (expected_token.empty()) {
        return true;
    }
    static const std::string prefix = "Bearer ";
    if (authorization.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return credentials_match(authorization.substr(prefix.size()), expected_token);
}

ErrorCode parse_notification(const std::string& body, Notification& out,
                             std::string& out_error) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        out_error = std::string("Invalid JSON: ") + e.what();
        return ErrorCode::InvalidJson;
    }

    if (!j.is_object()) {
        out_error = "Body must be a JSON object";
        return ErrorCode::InvalidArgument;
    }
    if (!j.contains("message") || !j["message"].is_string()) {
        out_error = "Field 'message' (string) is required";
        return ErrorCode::InvalidArgument;
    }

    Notification n;
    n.message = j["message"].get<std::string>();

    if (j.contains("title") && !j["title"].is_null()) {
        if (!j["title"].is_string()) {
            out_error = "Field 'title' must be a string";
            return ErrorCode::InvalidArgument;
        }
        n.title = j["title"].get<std::string>();
    }
    if (j.contains("priority") && !j["priority"].is_null()) {
        if (!j["priority"].is_string()) {
            out_error = "Field 'priority' must be a string";
            return ErrorCode::InvalidArgument;
        }
        n.priority = j["priority"].get<std::string>();
    }
    if (j.contains("speak") && !j["speak"].is_null()) {
        if (!j["speak"].is_boolean()) {
            out_error = "Field 'speak' must be a boolean";
            return ErrorCode::InvalidArgument;
        }
        n.speak = j["speak"].get<bool>();
    }

    out = std::move(n);
    return ErrorCode::Ok;
}

InboxResponse handle_inbox(const std::string& authorization, const std::string& body,
                           const std::string& expected_token, SessionRegistry& registry,
                           Broadcaster& broadcaster) {
    InboxResponse response;

    if (!authorize_bearer(authorization, expected_token)) {
        REY_LOG_WARNING(LOG_TAG, "Rejected unauthorized inbox request");
        response.status = 401;
        response.body = nlohmann::json{{"error", "Unauthorized"}}.dump();
        return response;
    }

    Notification notification;
    std::string error;
    const ErrorCode rc = parse_notification(body, notification, error);
    if (rc != ErrorCode::Ok) {
        response.status = 400;
        response.body = nlohmann::json{{"error", error},
                                       {"code", error_value(rc)},
                                       {"category", error_category(rc)}}
                            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        return response;
    }

    if (registry.size() == 0) {
        REY_LOG_WARNING(LOG_TAG, "Inbox message received but no clients connected");
        response.body = nlohmann::json{{"status", "queued"},
                                       {"clients", 0},
                                       {"note", "No clients connected"}}
                            .dump();
        return response;
    }

    REY_LOG_INFO(LOG_TAG, "Inbox message from %s",
                 notification.title.empty() ? "unknown" : notification.title.c_str());

    const BroadcastResult result = broadcaster.broadcast(notification);
    response.body = nlohmann::json{{"status", "delivered"},
                                   {"clients", result.delivered},
                                   {"failed", result.failed},
                                   {"spoken", result.spoken}}
                        .dump();
    return response;
}

}  // namespace rey
