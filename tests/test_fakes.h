/**
 * @file test_fakes.h
 * @brief In-memory collaborators for session and pipeline tests
 */

#ifndef REY_TEST_FAKES_H
#define REY_TEST_FAKES_H

#include "rey/backend/rey_chat_backend.h"
#include "rey/session/rey_session.h"
#include "rey/stt/rey_transcriber.h"
#include "rey/tts/rey_synthesis.h"
#include "rey/wakeword/rey_wake_classifier.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace rey {
namespace test {

// =============================================================================
// Audio
// =============================================================================

inline AudioFrame silent_frame(size_t samples = DEFAULT_FRAME_SAMPLES) {
    return AudioFrame(samples, 0.0f);
}

inline AudioFrame loud_frame(size_t samples = DEFAULT_FRAME_SAMPLES, float amplitude = 0.5f) {
    AudioFrame frame(samples);
    for (size_t i = 0; i < samples; ++i) {
        frame[i] = (i % 2 == 0) ? amplitude : -amplitude;
    }
    return frame;
}

// =============================================================================
// Sink
// =============================================================================

/// Records everything a session sends. Optionally fails every send.
class RecordingSink : public SessionSink {
public:
    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            return false;
        }
        texts_.push_back(text);
        cv_.notify_all();
        return true;
    }

    bool send_binary(const std::vector<uint8_t>& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            return false;
        }
        binaries_.push_back(data);
        cv_.notify_all();
        return true;
    }

    void set_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    std::vector<nlohmann::json> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (const auto& t : texts_) {
            out.push_back(nlohmann::json::parse(t));
        }
        return out;
    }

    std::vector<nlohmann::json> messages_of_type(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (const auto& m : messages()) {
            if (m.value("type", "") == type) {
                out.push_back(m);
            }
        }
        return out;
    }

    /// Sequence of "state" values, e.g. {"waiting", "listening", ...}.
    std::vector<std::string> states() const {
        std::vector<std::string> out;
        for (const auto& m : messages_of_type("state")) {
            out.push_back(m["state"].get<std::string>());
        }
        return out;
    }

    size_t binary_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return binaries_.size();
    }

    size_t text_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_.size();
    }

    /// Wait until a message of @p type has been sent at least @p count times.
    bool wait_for_type(const std::string& type, size_t count = 1,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (messages_of_type(type).size() >= count) {
                return true;
            }
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(10));
        }
        return messages_of_type(type).size() >= count;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> texts_;
    std::vector<std::vector<uint8_t>> binaries_;
    bool fail_ = false;
};

// =============================================================================
// Wake word classifier
// =============================================================================

struct ClassifierCounters {
    std::atomic<int> predictions{0};
    std::atomic<int> resets{0};
};

/// Scores a frame high when it is loud.
class LoudnessClassifier : public WakeWordClassifier {
public:
    explicit LoudnessClassifier(std::shared_ptr<ClassifierCounters> counters = nullptr,
                                bool ready = true)
        : counters_(counters ? std::move(counters) : std::make_shared<ClassifierCounters>())
        , ready_(ready) {}

    bool is_ready() const override { return ready_; }

    void reset() override { ++counters_->resets; }

    WakeScores predict(const AudioFrame& frame) override {
        ++counters_->predictions;
        return {{"hey_rey", compute_rms(frame) > 0.1f ? 0.9f : 0.01f}};
    }

private:
    std::shared_ptr<ClassifierCounters> counters_;
    bool ready_;
};

// =============================================================================
// Transcriber
// =============================================================================

class FixedTranscriber : public Transcriber {
public:
    explicit FixedTranscriber(std::string text, bool ok = true)
        : text_(std::move(text)), ok_(ok) {}

    bool is_ready() const override { return true; }

    bool transcribe(const std::vector<float>& samples, int /*sample_rate*/,
                    std::string& out_text) override {
        last_samples_ = samples.size();
        out_text = ok_ ? text_ : "";
        return ok_;
    }

    size_t last_samples() const { return last_samples_; }

private:
    std::string text_;
    bool ok_;
    size_t last_samples_ = 0;
};

/// Spins until the session's abort flag is set or @p limit passes.
class StallingTranscriber : public Transcriber {
public:
    explicit StallingTranscriber(std::chrono::milliseconds limit) : limit_(limit) {}

    bool is_ready() const override { return true; }

    bool transcribe(const std::vector<float>& /*samples*/, int /*sample_rate*/,
                    std::string& out_text) override {
        started = true;
        const auto deadline = std::chrono::steady_clock::now() + limit_;
        while (!abort_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        aborted = abort_requested();
        out_text = aborted ? "" : "finished anyway";
        return !aborted;
    }

    std::atomic<bool> started{false};
    std::atomic<bool> aborted{false};

private:
    std::chrono::milliseconds limit_;
};

// =============================================================================
// Backend
// =============================================================================

class ScriptedBackend : public ChatBackend {
public:
    explicit ScriptedBackend(BackendReply reply,
                             std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : reply_(std::move(reply)), delay_(delay) {}

    BackendReply chat(const ChatRequest& request) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_request_ = request;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (throw_) {
            throw std::runtime_error("backend exploded");
        }
        return reply_;
    }

    void set_throw(bool value) { throw_ = value; }

    ChatRequest last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

    std::atomic<int> calls{0};

private:
    BackendReply reply_;
    std::chrono::milliseconds delay_;
    std::atomic<bool> throw_{false};
    mutable std::mutex mutex_;
    ChatRequest last_request_;
};

// =============================================================================
// Synthesis
// =============================================================================

struct ProviderCounters {
    std::atomic<int> calls{0};
    std::mutex mutex;
    std::string last_text;
};

class FakeProvider : public SynthesisProvider {
public:
    enum class Mode { Audio, Empty, Throw };

    FakeProvider(const char* name, Mode mode, std::shared_ptr<ProviderCounters> counters,
                 bool configured = true, size_t max_length = 0,
                 std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : name_(name)
        , mode_(mode)
        , counters_(std::move(counters))
        , configured_(configured)
        , max_length_(max_length)
        , delay_(delay) {}

    const char* name() const override { return name_; }
    bool is_configured() const override { return configured_; }
    size_t max_text_length() const override { return max_length_; }

    std::vector<uint8_t> synthesize(const std::string& text) override {
        ++counters_->calls;
        {
            std::lock_guard<std::mutex> lock(counters_->mutex);
            counters_->last_text = text;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        switch (mode_) {
            case Mode::Audio: return {0x49, 0x44, 0x33};
            case Mode::Empty: return {};
            case Mode::Throw: throw std::runtime_error("provider down");
        }
        return {};
    }

private:
    const char* name_;
    Mode mode_;
    std::shared_ptr<ProviderCounters> counters_;
    bool configured_;
    size_t max_length_;
    std::chrono::milliseconds delay_;
};

inline std::unique_ptr<SynthesisChain> audio_chain() {
    auto chain = std::make_unique<SynthesisChain>();
    chain->add_provider(std::make_unique<FakeProvider>("Fake", FakeProvider::Mode::Audio,
                                                       std::make_shared<ProviderCounters>()));
    return chain;
}

// =============================================================================
// Session config
// =============================================================================

/// Small thresholds and short settle delays so turns complete quickly.
inline SessionConfig fast_session_config() {
    SessionConfig config;
    config.use_explicit_thresholds = true;
    config.thresholds.min_speech_frames = 5;
    config.thresholds.end_of_turn_frames = 30;
    config.thresholds.max_listen_frames = 1000;
    config.turn_settle = std::chrono::milliseconds(20);
    config.quiet_settle = std::chrono::milliseconds(20);
    config.wake.cooldown_sec = 2.0;
    config.query.keepalive_interval = std::chrono::milliseconds(5000);
    config.query.cancel_poll = std::chrono::milliseconds(5);
    return config;
}

}  // namespace test
}  // namespace rey

#endif  // REY_TEST_FAKES_H
