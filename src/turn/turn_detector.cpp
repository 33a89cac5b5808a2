/**
 * @file turn_detector.cpp
 * @brief End-of-turn detection
 */

#include "rey/turn/rey_turn_detector.h"
#include "rey/core/rey_logger.h"

#include <cmath>

namespace rey {

static const char* LOG_TAG = "Turn";

TurnThresholds TurnThresholds::from_config(const TurnDetectorConfig& config) {
    TurnThresholds t;
    if (config.frame_samples == 0 || config.sample_rate <= 0) {
        return t;
    }

    const double frames_per_sec =
        static_cast<double>(config.sample_rate) / static_cast<double>(config.frame_samples);

    t.min_speech_frames = static_cast<size_t>(std::floor(frames_per_sec * config.min_speech_sec));
    t.end_of_turn_frames =
        static_cast<size_t>(std::floor(frames_per_sec * config.silence_duration_sec));
    t.max_listen_frames = static_cast<size_t>(std::floor(frames_per_sec * config.max_listen_sec));
    return t;
}

const char* turn_event_name(TurnEvent event) {
    switch (event) {
        case TurnEvent::None: return "none";
        case TurnEvent::EndOfSpeech: return "end_of_speech";
        case TurnEvent::Timeout: return "timeout";
    }
    return "unknown";
}

TurnDetector::TurnDetector()
    : TurnDetector(TurnDetectorConfig{}) {
}

TurnDetector::TurnDetector(const TurnDetectorConfig& config)
    : config_(config)
    , thresholds_(TurnThresholds::from_config(config)) {
}

TurnDetector::TurnDetector(const TurnDetectorConfig& config, const TurnThresholds& thresholds)
    : config_(config)
    , thresholds_(thresholds) {
}

bool TurnDetector::is_silent(const AudioFrame& frame) const {
    return compute_rms(frame) < config_.silence_rms_threshold;
}

TurnEvent TurnDetector::process(const AudioFrame& frame, size_t buffered_frames) {
    if (fired_) {
        return TurnEvent::None;
    }

    // Silence only counts once enough audio is buffered, so a short pause
    // right after the wake word does not end the turn.
    if (buffered_frames > thresholds_.min_speech_frames && is_silent(frame)) {
        ++silence_run_;
        if (silence_run_ > thresholds_.end_of_turn_frames) {
            fired_ = true;
            REY_LOG_DEBUG(LOG_TAG, "End of speech after %zu silent frames (%zu buffered)",
                          silence_run_, buffered_frames);
            return TurnEvent::EndOfSpeech;
        }
    } else {
        silence_run_ = 0;
    }

    if (buffered_frames > thresholds_.max_listen_frames) {
        fired_ = true;
        REY_LOG_DEBUG(LOG_TAG, "Listening timeout (%zu frames buffered)", buffered_frames);
        return TurnEvent::Timeout;
    }

    return TurnEvent::None;
}

void TurnDetector::reset() {
    silence_run_ = 0;
    fired_ = false;
}

}  // namespace rey
