/**
 * @file rey_inbox.h
 * @brief Rey Voice Server - /inbox request handling
 *
 * Transport-independent part of the notification endpoint: credential check,
 * body validation and fan-out. The HTTP layer only maps the result onto a
 * response.
 */

#ifndef REY_INBOX_H
#define REY_INBOX_H

#include "rey/session/rey_session.h"
#include "rey/session/rey_session_registry.h"

#include <string>

namespace rey {

/// Compare credentials without an early exit on the first mismatch.
bool credentials_match(const std::string& provided, const std::string& expected);

/**
 * Check an "Authorization: Bearer <token>" header value.
 * Always true when @p expected_token is empty (auth disabled).
 */
bool authorize_bearer(const std::string& authorization, const std::string& expected_token);

/**
 * Parse an /inbox body: {"message": str, "title"?: str, "priority"?: str, "speak"?: bool}.
 *
 * @return ErrorCode::Ok, InvalidJson or InvalidArgument; @p out_error names the problem
 */
ErrorCode parse_notification(const std::string& body, Notification& out,
                             std::string& out_error);

struct InboxResponse {
    int status = 200;
    std::string body;
};

/**
 * Full /inbox handling. Credentials are checked before the body is parsed
 * and before any session is touched.
 */
InboxResponse handle_inbox(const std::string& authorization, const std::string& body,
                           const std::string& expected_token, SessionRegistry& registry,
                           Broadcaster& broadcaster);

}  // namespace rey

#endif  // REY_INBOX_H
