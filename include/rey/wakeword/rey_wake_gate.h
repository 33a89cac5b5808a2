/**
 * @file rey_wake_gate.h
 * @brief Rey Voice Server - Wake gate with post-turn cooldown
 *
 * Wraps a WakeWordClassifier. After every turn the gate suppresses detection
 * for a cooldown period so the tail of the synthesized reply (or the user's
 * last words) cannot re-trigger the wake word.
 */

#ifndef REY_WAKE_GATE_H
#define REY_WAKE_GATE_H

#include "rey/wakeword/rey_wake_classifier.h"

#include <cstddef>
#include <memory>
#include <string>

namespace rey {

struct WakeGateConfig {
    float threshold = 0.5f;
    double cooldown_sec = 2.0;
    int sample_rate = DEFAULT_SAMPLE_RATE;
};

class WakeGate {
public:
    WakeGate(std::unique_ptr<WakeWordClassifier> classifier, const WakeGateConfig& config);

    /**
     * Feed one frame while waiting for the wake word.
     *
     * @return true when any label scores above the threshold and no cooldown
     *         is active. Frames inside the cooldown are counted down and
     *         never reach the classifier.
     */
    bool process(const AudioFrame& frame);

    /// Reset the classifier and start a full cooldown period.
    void engage_cooldown();

    /// Reset the classifier only.
    void reset();

    bool cooldown_active() const { return cooldown_remaining_ > 0; }
    size_t cooldown_remaining() const { return cooldown_remaining_; }
    size_t cooldown_samples() const;

    /// Label and score of the last detection.
    const std::string& last_label() const { return last_label_; }
    float last_score() const { return last_score_; }

    bool has_classifier() const { return classifier_ != nullptr; }
    const WakeGateConfig& config() const { return config_; }

private:
    std::unique_ptr<WakeWordClassifier> classifier_;
    WakeGateConfig config_;
    size_t cooldown_remaining_ = 0;
    bool unavailable_logged_ = false;
    std::string last_label_;
    float last_score_ = 0.0f;
};

}  // namespace rey

#endif  // REY_WAKE_GATE_H
