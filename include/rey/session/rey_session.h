/**
 * @file rey_session.h
 * @brief Rey Voice Server - Per-connection voice session
 *
 * One VoiceSession per WebSocket client. The connection's reader thread feeds
 * audio frames and control messages; a turn worker thread handles
 * transcription, the backend query and synthesis for a finished utterance.
 *
 * State machine:
 *
 *   WaitingForWake --(wake word / explicit trigger)--> Listening
 *   Listening --(end of speech / timeout / stop)--> Processing
 *   Processing --(reply)--> Speaking --(audio sent)--> WaitingForWake
 *   Processing --(quiet / empty transcript / backend error)--> WaitingForWake
 *
 * Every return to WaitingForWake clears the turn buffer and re-engages the
 * wake-word cooldown.
 */

#ifndef REY_SESSION_H
#define REY_SESSION_H

#include "rey/audio/rey_audio.h"
#include "rey/backend/rey_chat_backend.h"
#include "rey/backend/rey_query_pipeline.h"
#include "rey/core/rey_error.h"
#include "rey/stt/rey_transcriber.h"
#include "rey/tts/rey_synthesis.h"
#include "rey/turn/rey_turn_detector.h"
#include "rey/wakeword/rey_wake_gate.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rey {

// =============================================================================
// Types
// =============================================================================

enum class SessionState { WaitingForWake, Listening, Processing, Speaking };

/// Wire name: "waiting", "listening", "processing", "speaking".
const char* session_state_name(SessionState state);

/**
 * Outgoing message channel of one client. Implementations serialize writes;
 * the reader thread, the turn worker and the broadcaster may all send.
 */
class SessionSink {
public:
    virtual ~SessionSink() = default;

    /// Returns false when the connection is gone.
    virtual bool send_text(const std::string& message) = 0;
    virtual bool send_binary(const std::vector<uint8_t>& data) = 0;
};

/// Collaborators exclusively owned by one session, plus the shared backend.
struct SessionComponents {
    std::unique_ptr<WakeWordClassifier> classifier;
    std::unique_ptr<Transcriber> transcriber;
    std::unique_ptr<SynthesisChain> synthesis;
    std::shared_ptr<ChatBackend> backend;
};

struct SessionConfig {
    TurnDetectorConfig turn;
    WakeGateConfig wake;
    QueryPipelineConfig query;

    // Explicit frame-count thresholds override the ones derived from `turn`
    bool use_explicit_thresholds = false;
    TurnThresholds thresholds;

    // Utterances quieter than this skip transcription
    float quiet_rms_threshold = 0.01f;

    // Transcripts shorter than this (after trimming) are discarded
    size_t min_transcript_chars = 2;

    std::chrono::milliseconds turn_settle{3000};
    std::chrono::milliseconds quiet_settle{1500};

    // Length of the reply preview sent with state=speaking
    size_t preview_chars = 50;
};

/// Out-of-band message pushed through /inbox.
struct Notification {
    std::string title;
    std::string message;
    std::string priority = "normal";
    bool speak = true;

    /// "<title>: <message>", or the message alone without a title.
    std::string announcement() const;
};

struct NotificationOutcome {
    bool delivered = false;
    bool spoken = false;
};

// =============================================================================
// Voice Session
// =============================================================================

class VoiceSession {
public:
    VoiceSession(std::string id, std::shared_ptr<SessionSink> sink, SessionComponents components,
                 const SessionConfig& config);
    ~VoiceSession();

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    static std::string generate_id();

    const std::string& id() const { return id_; }

    /// Announce readiness to the client.
    void start();

    /**
     * Feed decoded audio of any length. It is cut into frames of
     * `turn.frame_samples`; a partial tail waits for the next call. Frames
     * are dropped while a turn is in flight.
     */
    void handle_audio(const AudioFrame& chunk);

    /// Handle one JSON control message. Malformed or unknown messages are ignored.
    void handle_control(const std::string& message);

    /**
     * Push a notification to the client; when requested and the session is
     * idle, speak it as well.
     */
    NotificationOutcome deliver_notification(const Notification& notification);

    /// Cancel in-flight work, wake any wait, join the worker, drop buffers.
    void close();

    SessionState state() const;
    size_t buffered_frames() const;
    bool cooldown_active() const;
    bool is_closed() const { return cancelled_.load(); }

    /// Block until no turn is in flight and the session waits for the wake word.
    bool wait_until_idle(std::chrono::milliseconds timeout);

private:
    void process_frame_locked(const AudioFrame& frame);
    void start_listening_locked(const char* reason);
    void finalize_turn_locked(const char* reason);
    void run_turn(std::vector<float> utterance);
    void finish_turn(const std::string& message, std::chrono::milliseconds settle, bool notify);

    bool send_json_text(const std::string& payload);
    void send_state(SessionState state, const std::string& message);
    void send_error(ErrorCode code, const std::string& cause);

    std::string id_;
    std::shared_ptr<SessionSink> sink_;
    SessionConfig config_;

    std::unique_ptr<Transcriber> transcriber_;
    std::unique_ptr<SynthesisChain> synthesis_;
    BackendQueryPipeline pipeline_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SessionState state_ = SessionState::WaitingForWake;
    std::vector<AudioFrame> frames_;
    std::vector<float> pending_samples_;
    TurnDetector detector_;
    WakeGate wake_gate_;
    bool worker_running_ = false;
    std::thread worker_;

    std::atomic<bool> cancelled_{false};
};

}  // namespace rey

#endif  // REY_SESSION_H
