/**
 * @file rey_session_registry.h
 * @brief Rey Voice Server - Connected session registry and notification fan-out
 */

#ifndef REY_SESSION_REGISTRY_H
#define REY_SESSION_REGISTRY_H

#include "rey/session/rey_session.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rey {

class SessionRegistry {
public:
    void add(const std::shared_ptr<VoiceSession>& session);
    void remove(const std::string& id);
    std::shared_ptr<VoiceSession> find(const std::string& id) const;

    /// Copy of the current sessions; safe to iterate without the lock.
    std::vector<std::shared_ptr<VoiceSession>> snapshot() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<VoiceSession>> sessions_;
};

/**
 * Registers a session for the lifetime of its connection. On destruction the
 * session is removed and closed, whichever way the connection ends.
 */
class ScopedSessionRegistration {
public:
    ScopedSessionRegistration(SessionRegistry& registry, std::shared_ptr<VoiceSession> session);
    ~ScopedSessionRegistration();

    ScopedSessionRegistration(const ScopedSessionRegistration&) = delete;
    ScopedSessionRegistration& operator=(const ScopedSessionRegistration&) = delete;

private:
    SessionRegistry& registry_;
    std::shared_ptr<VoiceSession> session_;
};

struct BroadcastResult {
    int delivered = 0;
    int failed = 0;
    int spoken = 0;
};

class Broadcaster {
public:
    explicit Broadcaster(SessionRegistry& registry) : registry_(registry) {}

    /// Deliver to every connected session. Per-session failures are counted.
    BroadcastResult broadcast(const Notification& notification);

private:
    SessionRegistry& registry_;
};

}  // namespace rey

#endif  // REY_SESSION_REGISTRY_H
