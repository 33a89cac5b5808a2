/**
 * @file voice_session.cpp
 * @brief Per-connection voice session
 */

#include "rey/session/rey_session.h"
#include "rey/core/rey_logger.h"
#include "response_expression.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <exception>
#include <random>
#include <sstream>
#include <utility>

namespace rey {

static const char* LOG_TAG = "Session";

// =============================================================================
// HELPERS
// =============================================================================

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::WaitingForWake: return "waiting";
        case SessionState::Listening: return "listening";
        case SessionState::Processing: return "processing";
        case SessionState::Speaking: return "speaking";
    }
    return "unknown";
}

std::string Notification::announcement() const {
    if (title.empty()) {
        return message;
    }
    return title + ": " + message;
}

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string preview(const std::string& text, size_t max_bytes) {
    return truncate_utf8(text, max_bytes) + "...";
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

// Replace invalid UTF-8 instead of throwing; transcripts and replies come
// from external services.
std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

// =============================================================================
// LIFECYCLE
// =============================================================================

VoiceSession::VoiceSession(std::string id, std::shared_ptr<SessionSink> sink,
                           SessionComponents components, const SessionConfig& config)
    : id_(std::move(id))
    , sink_(std::move(sink))
    , config_(config)
    , transcriber_(std::move(components.transcriber))
    , synthesis_(std::move(components.synthesis))
    , pipeline_(std::move(components.backend), config.query)
    , detector_(config.use_explicit_thresholds ? TurnDetector(config.turn, config.thresholds)
                                               : TurnDetector(config.turn))
    , wake_gate_(std::move(components.classifier), config.wake) {
    if (transcriber_) {
        transcriber_->set_abort_flag(&cancelled_);
    }
}

VoiceSession::~VoiceSession() {
    close();
}

std::string VoiceSession::generate_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream ss;
    ss << std::hex << rng();
    return ss.str();
}

void VoiceSession::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    send_state(SessionState::WaitingForWake, "Ready");
}

void VoiceSession::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
    pending_samples_.clear();
    detector_.reset();
}

SessionState VoiceSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t VoiceSession::buffered_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

bool VoiceSession::cooldown_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wake_gate_.cooldown_active();
}

bool VoiceSession::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return !worker_running_ && state_ == SessionState::WaitingForWake;
    });
}

// =============================================================================
// INPUT
// =============================================================================

void VoiceSession::handle_audio(const AudioFrame& chunk) {
    if (chunk.empty() || cancelled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const size_t frame_samples = config_.turn.frame_samples;
    if (frame_samples == 0) {
        process_frame_locked(chunk);
        return;
    }

    // Thresholds count fixed-length frames, so cut whatever the client sent
    // and keep the tail for the next chunk.
    std::vector<float> samples;
    samples.swap(pending_samples_);
    samples.insert(samples.end(), chunk.begin(), chunk.end());
    size_t offset = 0;
    while (samples.size() - offset >= frame_samples) {
        AudioFrame frame(samples.begin() + offset, samples.begin() + offset + frame_samples);
        offset += frame_samples;
        process_frame_locked(frame);
    }

    // A turn that ended inside this chunk drops the rest of it
    if (state_ == SessionState::WaitingForWake || state_ == SessionState::Listening) {
        pending_samples_.assign(samples.begin() + offset, samples.end());
    }
}

void VoiceSession::process_frame_locked(const AudioFrame& frame) {
    switch (state_) {
        case SessionState::WaitingForWake:
            if (wake_gate_.process(frame)) {
                start_listening_locked("wake word");
            }
            break;

        case SessionState::Listening: {
            frames_.push_back(frame);
            const TurnEvent event = detector_.process(frame, frames_.size());
            if (event != TurnEvent::None) {
                finalize_turn_locked(turn_event_name(event));
            }
            break;
        }

        case SessionState::Processing:
        case SessionState::Speaking:
            // Dropped: the client must not talk over a turn in flight
            break;
    }
}

void VoiceSession::handle_control(const std::string& message) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(message);
    } catch (const nlohmann::json::parse_error& e) {
        REY_LOG_WARNING(LOG_TAG, "[%s] Ignoring malformed control message: %s", id_.c_str(),
                        e.what());
        return;
    }

    if (!msg.is_object() || !msg.contains("type") || !msg["type"].is_string()) {
        REY_LOG_WARNING(LOG_TAG, "[%s] Ignoring control message without type", id_.c_str());
        return;
    }
    const std::string type = msg["type"].get<std::string>();

    if (type == "ping") {
        send_json_text(dump({{"type", "pong"}}));
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return;
    }

    if (type == "start-listening" || type == "push_to_talk_start") {
        if (state_ == SessionState::WaitingForWake) {
            start_listening_locked("push to talk");
        }
    } else if (type == "wake-trigger" || type == "push_to_wake") {
        if (state_ == SessionState::WaitingForWake) {
            start_listening_locked("push to wake");
        }
    } else if (type == "stop-listening" || type == "push_to_talk_stop") {
        if (state_ == SessionState::Listening) {
            finalize_turn_locked("push to talk stop");
        }
    } else if (type == "push_to_talk") {
        if (state_ == SessionState::WaitingForWake) {
            start_listening_locked("push to talk");
        } else if (state_ == SessionState::Listening) {
            finalize_turn_locked("push to talk");
        }
    } else {
        REY_LOG_DEBUG(LOG_TAG, "[%s] Unknown control message type: %s", id_.c_str(),
                      type.c_str());
    }
}

// =============================================================================
// TURN
// =============================================================================

void VoiceSession::start_listening_locked(const char* reason) {
    REY_LOG_INFO(LOG_TAG, "[%s] Listening (%s)", id_.c_str(), reason);
    wake_gate_.reset();
    frames_.clear();
    detector_.reset();
    state_ = SessionState::Listening;
    send_state(SessionState::Listening, "I'm listening...");
}

void VoiceSession::finalize_turn_locked(const char* reason) {
    REY_LOG_INFO(LOG_TAG, "[%s] Turn finished (%s, %zu frames)", id_.c_str(), reason,
                 frames_.size());

    state_ = SessionState::Processing;
    std::vector<float> utterance = concat_frames(frames_);
    frames_.clear();
    pending_samples_.clear();
    detector_.reset();
    send_state(SessionState::Processing, "Thinking...");

    // The previous worker has already left finish_turn (state was
    // WaitingForWake), so this join does not need the lock.
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_running_ = true;
    worker_ = std::thread(&VoiceSession::run_turn, this, std::move(utterance));
}

void VoiceSession::run_turn(std::vector<float> utterance) {
    const auto turn_start = std::chrono::steady_clock::now();
    double stt_sec = 0.0;
    double llm_sec = 0.0;
    double tts_sec = 0.0;

    try {
        const float rms = compute_rms(utterance.data(), utterance.size());
        if (rms < config_.quiet_rms_threshold) {
            REY_LOG_INFO(LOG_TAG, "[%s] Audio too quiet (rms=%.4f), skipping transcription",
                         id_.c_str(), rms);
            finish_turn(error_message(ErrorCode::AudioTooQuiet), config_.quiet_settle, true);
            return;
        }

        // Transcribe
        std::string text;
        auto t0 = std::chrono::steady_clock::now();
        if (!transcriber_ || !transcriber_->is_ready()) {
            REY_LOG_WARNING(LOG_TAG, "[%s] %s", id_.c_str(),
                            error_message(ErrorCode::TranscriberUnavailable));
        } else if (!transcriber_->transcribe(utterance, config_.turn.sample_rate, text)) {
            REY_LOG_WARNING(LOG_TAG, "[%s] Transcription failed", id_.c_str());
            text.clear();
        }
        stt_sec = seconds_since(t0);
        if (cancelled_) {
            finish_turn("", std::chrono::milliseconds(0), false);
            return;
        }
        text = trim(text);

        if (text.size() < config_.min_transcript_chars) {
            finish_turn(error_message(ErrorCode::EmptyOrShortTranscript), config_.turn_settle,
                        true);
            return;
        }
        REY_LOG_INFO(LOG_TAG, "[%s] User: %s", id_.c_str(), text.c_str());

        // Query backend
        t0 = std::chrono::steady_clock::now();
        BackendReply reply = pipeline_.run(
            text,
            [this] { send_json_text(dump({{"type", "keepalive"}, {"status", "thinking"}})); },
            cancelled_);
        llm_sec = seconds_since(t0);
        if (cancelled_) {
            finish_turn("", std::chrono::milliseconds(0), false);
            return;
        }

        if (!reply.success) {
            if (reply.code != ErrorCode::Cancelled) {
                send_error(reply.code, reply.error);
            }
            finish_turn("", config_.turn_settle, true);
            return;
        }
        REY_LOG_INFO(LOG_TAG, "[%s] Rey: %s", id_.c_str(), reply.text.c_str());

        nlohmann::json response = {{"type", "response"},
                                    {"user_text", text},
                                    {"rey_text", reply.text},
                                    {"expression", session::detect_expression(reply.text)}};
        send_json_text(dump(response));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                worker_running_ = false;
                cv_.notify_all();
                return;
            }
            state_ = SessionState::Speaking;
            send_state(SessionState::Speaking, preview(reply.text, config_.preview_chars));
        }

        // Synthesize
        t0 = std::chrono::steady_clock::now();
        std::vector<uint8_t> audio;
        if (synthesis_) {
            audio = synthesis_->synthesize(reply.text, nullptr, &cancelled_);
        }
        tts_sec = seconds_since(t0);
        if (!audio.empty() && !cancelled_) {
            sink_->send_binary(audio);
        }

        REY_LOG_INFO(LOG_TAG, "[%s] Timing: STT=%.2fs | LLM=%.2fs | TTS=%.2fs | Total=%.2fs",
                     id_.c_str(), stt_sec, llm_sec, tts_sec, seconds_since(turn_start));
        finish_turn("", config_.turn_settle, true);
    } catch (const std::exception& e) {
        REY_LOG_ERROR(LOG_TAG, "[%s] Error processing speech: %s", id_.c_str(), e.what());
        send_error(ErrorCode::BackendError, e.what());
        finish_turn("", config_.turn_settle, true);
    }
}

void VoiceSession::finish_turn(const std::string& message, std::chrono::milliseconds settle,
                               bool notify) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool on_worker = std::this_thread::get_id() == worker_.get_id();
    frames_.clear();
    detector_.reset();
    wake_gate_.engage_cooldown();

    // Let the reply finish playing and clear the client's mic before the
    // wake word is armed again.
    if (settle.count() > 0) {
        cv_.wait_for(lock, settle, [this] { return cancelled_.load(); });
    }

    if (!cancelled_) {
        wake_gate_.engage_cooldown();
        state_ = SessionState::WaitingForWake;
        if (notify) {
            send_state(SessionState::WaitingForWake, message);
        }
    }

    if (on_worker) {
        worker_running_ = false;
    }
    cv_.notify_all();
}

// =============================================================================
// NOTIFICATIONS
// =============================================================================

NotificationOutcome VoiceSession::deliver_notification(const Notification& notification) {
    NotificationOutcome outcome;

    nlohmann::json msg = {{"type", "notification"},
                          {"title", notification.title.empty() ? nlohmann::json(nullptr)
                                                               : nlohmann::json(notification.title)},
                          {"message", notification.message},
                          {"priority", notification.priority},
                          {"speak", notification.speak}};
    if (!send_json_text(dump(msg))) {
        return outcome;
    }
    outcome.delivered = true;

    if (!notification.speak) {
        return outcome;
    }

    const std::string announcement = notification.announcement();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || state_ != SessionState::WaitingForWake) {
            return outcome;
        }
        state_ = SessionState::Speaking;
    }

    std::vector<uint8_t> audio;
    try {
        if (synthesis_) {
            audio = synthesis_->synthesize(announcement, nullptr, &cancelled_);
        }
    } catch (const std::exception& e) {
        REY_LOG_WARNING(LOG_TAG, "[%s] Announcement synthesis failed: %s", id_.c_str(), e.what());
        audio.clear();
    }

    if (audio.empty()) {
        finish_turn("", std::chrono::milliseconds(0), false);
        return outcome;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        send_state(SessionState::Speaking, preview(announcement, config_.preview_chars));
    }
    outcome.spoken = sink_->send_binary(audio);
    finish_turn("", std::chrono::milliseconds(0), true);
    return outcome;
}

// =============================================================================
// OUTPUT
// =============================================================================

bool VoiceSession::send_json_text(const std::string& payload) {
    if (!sink_->send_text(payload)) {
        REY_LOG_DEBUG(LOG_TAG, "[%s] Send failed", id_.c_str());
        return false;
    }
    return true;
}

void VoiceSession::send_state(SessionState state, const std::string& message) {
    nlohmann::json msg = {{"type", "state"}, {"state", session_state_name(state)}};
    msg["message"] = message;
    send_json_text(dump(msg));
}

void VoiceSession::send_error(ErrorCode code, const std::string& cause) {
    const ErrorModel model = make_error_model(code);
    nlohmann::json msg = {{"type", "error"},
                          {"message", cause.empty() ? std::string(model.message) : cause},
                          {"code", error_value(code)},
                          {"category", model.category}};
    send_json_text(dump(msg));
}

}  // namespace rey
