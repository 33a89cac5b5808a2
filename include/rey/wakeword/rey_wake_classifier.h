/**
 * @file rey_wake_classifier.h
 * @brief Rey Voice Server - Wake word classifier contract
 *
 * Implemented by the ONNX openWakeWord backend (backends/onnx). A classifier
 * instance is owned by exactly one session because it carries streaming state.
 */

#ifndef REY_WAKE_CLASSIFIER_H
#define REY_WAKE_CLASSIFIER_H

#include "rey/audio/rey_audio.h"

#include <map>
#include <string>

namespace rey {

/// Label -> score in [0, 1] for the frame just fed.
using WakeScores = std::map<std::string, float>;

class WakeWordClassifier {
public:
    virtual ~WakeWordClassifier() = default;

    /// True once all models are loaded and predict() can produce scores.
    virtual bool is_ready() const = 0;

    /// Drop all streaming state (buffered audio, features, embeddings).
    virtual void reset() = 0;

    /// Feed one frame and return the current score per wake word label.
    virtual WakeScores predict(const AudioFrame& frame) = 0;
};

}  // namespace rey

#endif  // REY_WAKE_CLASSIFIER_H
