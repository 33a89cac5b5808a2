/**
 * @file wake_gate.cpp
 * @brief Wake gate with post-turn cooldown
 */

#include "rey/wakeword/rey_wake_gate.h"
#include "rey/core/rey_error.h"
#include "rey/core/rey_logger.h"

#include <utility>

namespace rey {

static const char* LOG_TAG = "WakeGate";

WakeGate::WakeGate(std::unique_ptr<WakeWordClassifier> classifier, const WakeGateConfig& config)
    : classifier_(std::move(classifier))
    , config_(config) {
}

size_t WakeGate::cooldown_samples() const {
    if (config_.cooldown_sec <= 0.0 || config_.sample_rate <= 0) {
        return 0;
    }
    return static_cast<size_t>(config_.cooldown_sec * config_.sample_rate);
}

bool WakeGate::process(const AudioFrame& frame) {
    if (!classifier_ || !classifier_->is_ready()) {
        if (!unavailable_logged_) {
            REY_LOG_WARNING(LOG_TAG, "%s (%d), wake word detection disabled",
                            error_message(ErrorCode::ClassifierUnavailable),
                            error_value(ErrorCode::ClassifierUnavailable));
            unavailable_logged_ = true;
        }
        return false;
    }

    if (cooldown_remaining_ > 0) {
        cooldown_remaining_ =
            frame.size() >= cooldown_remaining_ ? 0 : cooldown_remaining_ - frame.size();
        return false;
    }

    const WakeScores scores = classifier_->predict(frame);
    for (const auto& entry : scores) {
        if (entry.second > config_.threshold) {
            last_label_ = entry.first;
            last_score_ = entry.second;
            REY_LOG_INFO(LOG_TAG, "Wake word '%s' detected (score=%.3f, threshold=%.3f)",
                         entry.first.c_str(), entry.second, config_.threshold);
            return true;
        }
    }
    return false;
}

void WakeGate::engage_cooldown() {
    if (classifier_) {
        classifier_->reset();
    }
    cooldown_remaining_ = cooldown_samples();
    REY_LOG_DEBUG(LOG_TAG, "Cooldown engaged (%zu samples)", cooldown_remaining_);
}

void WakeGate::reset() {
    if (classifier_) {
        classifier_->reset();
    }
}

}  // namespace rey
