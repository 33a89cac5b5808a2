/**
 * @file rey_stt_whispercpp.h
 * @brief whisper.cpp speech-to-text backend
 */

#ifndef REY_STT_WHISPERCPP_H
#define REY_STT_WHISPERCPP_H

#include "rey/core/rey_error.h"
#include "rey/stt/rey_transcriber.h"

#include <string>

struct whisper_context;

namespace rey {
namespace backends {
namespace whispercpp {

struct WhisperConfig {
    std::string model_path;
    std::string language = "en";
    int beam_size = 5;
    int num_threads = 4;
};

class WhisperTranscriber : public Transcriber {
public:
    WhisperTranscriber() = default;
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    ErrorCode load(const WhisperConfig& config);

    bool is_ready() const override { return ctx_ != nullptr; }
    bool transcribe(const std::vector<float>& samples, int sample_rate,
                    std::string& out_text) override;

private:
    WhisperConfig config_;
    whisper_context* ctx_ = nullptr;
};

}  // namespace whispercpp
}  // namespace backends
}  // namespace rey

#endif  // REY_STT_WHISPERCPP_H
