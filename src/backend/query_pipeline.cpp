/**
 * @file query_pipeline.cpp
 * @brief Backend query with keepalive watchdog
 */

#include "rey/backend/rey_query_pipeline.h"
#include "rey/core/rey_logger.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace rey {

static const char* LOG_TAG = "Backend";

const char* const VOICE_SYSTEM_PROMPT =
    "You are responding via voice (text-to-speech). Optimize your responses:\n"
    "\n"
    "- Be concise and conversational - this will be spoken aloud\n"
    "- NO markdown formatting (no **, ##, -, bullets, etc.)\n"
    "- NO lists - use natural flowing sentences instead\n"
    "- Abbreviate where natural: \"3 PM\" not \"3:00 PM\", \"tomorrow\" not "
    "\"Tuesday, February 10th\"\n"
    "- For calendar events: just say the key info (time + brief description), skip full "
    "titles\n"
    "- For multiple items: summarize or mention count (\"you have 3 meetings\") rather "
    "than reading each\n"
    "- Numbers: say \"about 50\" not \"approximately 49.7\"\n"
    "- Keep responses under 2-3 sentences when possible\n"
    "- Sound natural, like talking to a friend";

namespace {

// Shared between the waiting caller and the detached request thread, which
// may outlive the call when it is cancelled.
struct PendingRequest {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    BackendReply reply;
};

}  // namespace

BackendQueryPipeline::BackendQueryPipeline(std::shared_ptr<ChatBackend> backend,
                                           const QueryPipelineConfig& config)
    : backend_(std::move(backend))
    , config_(config) {
}

BackendReply BackendQueryPipeline::run(const std::string& text,
                                       const std::function<void()>& on_keepalive,
                                       const std::atomic<bool>& cancelled) {
    if (!backend_) {
        return BackendReply::failure(ErrorCode::BackendError, "No backend configured");
    }
    if (cancelled.load()) {
        return BackendReply::failure(ErrorCode::Cancelled, "Cancelled");
    }

    ChatRequest request;
    request.system_prompt = config_.system_prompt;
    request.user_text = text;
    request.user_key = config_.user_key;

    auto pending = std::make_shared<PendingRequest>();
    std::shared_ptr<ChatBackend> backend = backend_;

    std::thread([pending, backend, request]() {
        BackendReply reply;
        try {
            reply = backend->chat(request);
        } catch (const std::exception& e) {
            reply = BackendReply::failure(ErrorCode::BackendError, e.what());
        }
        {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->reply = std::move(reply);
            pending->done = true;
        }
        pending->cv.notify_all();
    }).detach();

    using clock = std::chrono::steady_clock;
    const auto interval = config_.keepalive_interval;
    const auto poll = config_.cancel_poll.count() > 0 ? config_.cancel_poll
                                                      : std::chrono::milliseconds(50);
    auto next_keepalive = clock::now() + interval;
    int keepalives = 0;

    std::unique_lock<std::mutex> lock(pending->mutex);
    while (!pending->done) {
        if (cancelled.load()) {
            REY_LOG_DEBUG(LOG_TAG, "Query cancelled, dropping late result");
            return BackendReply::failure(ErrorCode::Cancelled, "Cancelled");
        }

        const auto now = clock::now();
        if (interval.count() > 0 && now >= next_keepalive) {
            // Sent with the lock held: the request thread cannot publish its
            // reply until the keepalive is out, so none follows resolution.
            ++keepalives;
            if (on_keepalive) {
                on_keepalive();
            }
            // Counted from the end of the send so a slow sink cannot starve the reply
            next_keepalive = clock::now() + interval;
            continue;
        }

        auto wake_at = now + poll;
        if (interval.count() > 0 && next_keepalive < wake_at) {
            wake_at = next_keepalive;
        }
        pending->cv.wait_until(lock, wake_at, [&pending] { return pending->done; });
    }

    BackendReply reply = std::move(pending->reply);
    lock.unlock();

    if (keepalives > 0) {
        REY_LOG_DEBUG(LOG_TAG, "Reply after %d keepalive(s)", keepalives);
    }
    if (!reply.success) {
        if (reply.code == ErrorCode::Ok) {
            reply.code = ErrorCode::BackendError;
        }
        REY_LOG_ERROR(LOG_TAG, "Query failed: %s", reply.error.c_str());
    }
    return reply;
}

}  // namespace rey
