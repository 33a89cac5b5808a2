/**
 * @file rey_turn_detector.h
 * @brief Rey Voice Server - End-of-turn detection
 *
 * Classifies frames as silence by RMS amplitude and tracks the run of
 * consecutive silent frames while a turn is being captured. Thresholds are
 * frame counts derived from durations and the frame period.
 */

#ifndef REY_TURN_DETECTOR_H
#define REY_TURN_DETECTOR_H

#include "rey/audio/rey_audio.h"

#include <cstddef>

namespace rey {

// =============================================================================
// Configuration
// =============================================================================

struct TurnDetectorConfig {
    int sample_rate = DEFAULT_SAMPLE_RATE;
    size_t frame_samples = DEFAULT_FRAME_SAMPLES;

    // A frame is silent when its RMS is below this
    float silence_rms_threshold = 0.005f;

    // Silence needed after speech to end the turn
    double silence_duration_sec = 2.0;

    // Audio that must be buffered before silence counts
    double min_speech_sec = 1.0;

    // Hard cap on listening time
    double max_listen_sec = 15.0;
};

/// Frame-count thresholds. Comparisons are strict ("exceeds").
struct TurnThresholds {
    size_t min_speech_frames = 0;
    size_t end_of_turn_frames = 0;
    size_t max_listen_frames = 0;

    static TurnThresholds from_config(const TurnDetectorConfig& config);
};

enum class TurnEvent {
    None,
    EndOfSpeech,  // silence run exceeded the end-of-turn threshold
    Timeout       // buffered audio exceeded the hard listening cap
};

const char* turn_event_name(TurnEvent event);

// =============================================================================
// Turn Detector
// =============================================================================

class TurnDetector {
public:
    TurnDetector();
    explicit TurnDetector(const TurnDetectorConfig& config);
    TurnDetector(const TurnDetectorConfig& config, const TurnThresholds& thresholds);

    bool is_silent(const AudioFrame& frame) const;

    /**
     * Feed one frame captured while listening.
     *
     * @param frame The frame just appended to the turn buffer
     * @param buffered_frames Number of frames in the buffer, including @p frame
     * @return At most one event. Once an event fires the detector stays
     *         latched and returns None until reset().
     */
    TurnEvent process(const AudioFrame& frame, size_t buffered_frames);

    void reset();

    size_t silence_run() const { return silence_run_; }
    bool fired() const { return fired_; }
    const TurnThresholds& thresholds() const { return thresholds_; }
    const TurnDetectorConfig& config() const { return config_; }

private:
    TurnDetectorConfig config_;
    TurnThresholds thresholds_;
    size_t silence_run_ = 0;
    bool fired_ = false;
};

}  // namespace rey

#endif  // REY_TURN_DETECTOR_H
