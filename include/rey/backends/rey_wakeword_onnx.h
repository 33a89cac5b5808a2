/**
 * @file rey_wakeword_onnx.h
 * @brief ONNX backend for wake word detection using openWakeWord
 *
 * Three-stage pipeline:
 * 1. Audio -> Melspectrogram (melspectrogram.onnx)
 * 2. Melspectrogram -> Embeddings (embedding_model.onnx), 76-frame windows
 * 3. Embeddings -> Classification (wake word model, e.g. hey_jarvis_v0.1.onnx)
 *
 * Audio: 16 kHz mono float in [-1, 1]. Any frame size is accepted; samples
 * are accumulated to 1280-sample (80 ms) chunks internally.
 */

#ifndef REY_WAKEWORD_ONNX_H
#define REY_WAKEWORD_ONNX_H

#include "rey/core/rey_error.h"
#include "rey/wakeword/rey_wake_classifier.h"

#include <memory>
#include <string>

namespace rey {
namespace backends {
namespace onnx {

struct OnnxWakeConfig {
    std::string melspec_model_path;
    std::string embedding_model_path;
    std::string wake_model_path;
    /// Label reported in scores; defaults to the wake model file stem.
    std::string label;
    int num_threads = 1;
    bool enable_optimization = true;
};

class OnnxWakeClassifier : public WakeWordClassifier {
public:
    OnnxWakeClassifier();
    ~OnnxWakeClassifier() override;

    /**
     * @brief Load all three models
     *
     * @return ErrorCode::Ok, or ClassifierUnavailable if any model fails to load
     */
    ErrorCode load(const OnnxWakeConfig& config);

    bool is_ready() const override;
    void reset() override;
    WakeScores predict(const AudioFrame& frame) override;

    const std::string& label() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Label derived from a model path: "models/hey_jarvis_v0.1.onnx" -> "hey_jarvis_v0.1".
std::string wake_label_from_path(const std::string& path);

}  // namespace onnx
}  // namespace backends
}  // namespace rey

#endif  // REY_WAKEWORD_ONNX_H
