/**
 * @file rey_query_pipeline.h
 * @brief Rey Voice Server - Backend query with keepalive watchdog
 *
 * Runs a ChatBackend request on a worker thread while the caller waits and
 * emits a keepalive once per interval, so the client can tell a slow backend
 * from a dead connection.
 */

#ifndef REY_QUERY_PIPELINE_H
#define REY_QUERY_PIPELINE_H

#include "rey/backend/rey_chat_backend.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace rey {

/// Instruction sent with every voice query.
extern const char* const VOICE_SYSTEM_PROMPT;

/// Stable key letting the backend keep per-user memory across turns.
static constexpr const char* DEFAULT_USER_KEY = "voice-client";

struct QueryPipelineConfig {
    std::string system_prompt = VOICE_SYSTEM_PROMPT;
    std::string user_key = DEFAULT_USER_KEY;
    std::chrono::milliseconds keepalive_interval{5000};
    std::chrono::milliseconds cancel_poll{50};
};

class BackendQueryPipeline {
public:
    BackendQueryPipeline(std::shared_ptr<ChatBackend> backend, const QueryPipelineConfig& config);

    /**
     * Send @p text to the backend and wait for the reply.
     *
     * @param on_keepalive Called once per full keepalive interval while the
     *                     request is outstanding, never after it resolves
     * @param cancelled Checked before the request is sent and polled while
     *                  waiting; when set the late result is discarded and
     *                  ErrorCode::Cancelled is returned
     */
    BackendReply run(const std::string& text, const std::function<void()>& on_keepalive,
                     const std::atomic<bool>& cancelled);

    const QueryPipelineConfig& config() const { return config_; }

private:
    std::shared_ptr<ChatBackend> backend_;
    QueryPipelineConfig config_;
};

}  // namespace rey

#endif  // REY_QUERY_PIPELINE_H
