/**
 * @file session_registry.cpp
 * @brief Connected session registry and notification fan-out
 */

#include "rey/session/rey_session_registry.h"
#include "rey/core/rey_logger.h"

#include <exception>
#include <utility>

namespace rey {

static const char* LOG_TAG = "Registry";

// =============================================================================
// SessionRegistry
// =============================================================================

void SessionRegistry::add(const std::shared_ptr<VoiceSession>& session) {
    if (!session) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session->id()] = session;
    REY_LOG_INFO(LOG_TAG, "Session %s added (active: %zu)", session->id().c_str(),
                 sessions_.size());
}

void SessionRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(id) > 0) {
        REY_LOG_INFO(LOG_TAG, "Session %s removed (active: %zu)", id.c_str(), sessions_.size());
    }
}

std::shared_ptr<VoiceSession> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<VoiceSession>> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<VoiceSession>> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// =============================================================================
// ScopedSessionRegistration
// =============================================================================

ScopedSessionRegistration::ScopedSessionRegistration(SessionRegistry& registry,
                                                     std::shared_ptr<VoiceSession> session)
    : registry_(registry)
    , session_(std::move(session)) {
    registry_.add(session_);
}

ScopedSessionRegistration::~ScopedSessionRegistration() {
    if (session_) {
        registry_.remove(session_->id());
        session_->close();
    }
}

// =============================================================================
// Broadcaster
// =============================================================================

BroadcastResult Broadcaster::broadcast(const Notification& notification) {
    BroadcastResult result;

    for (const auto& session : registry_.snapshot()) {
        try {
            const NotificationOutcome outcome = session->deliver_notification(notification);
            if (!outcome.delivered) {
                ++result.failed;
                continue;
            }
            ++result.delivered;
            if (outcome.spoken) {
                ++result.spoken;
            }
        } catch (const std::exception& e) {
            REY_LOG_ERROR(LOG_TAG, "Failed to deliver to %s: %s", session->id().c_str(),
                          e.what());
            ++result.failed;
        }
    }

    REY_LOG_INFO(LOG_TAG, "Notification delivered=%d failed=%d spoken=%d", result.delivered,
                 result.failed, result.spoken);
    return result;
}

}  // namespace rey
