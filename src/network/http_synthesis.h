/**
 * @file http_synthesis.h
 * @brief Internal: cloud text-to-speech providers (ElevenLabs, OpenAI)
 */

#ifndef REY_NETWORK_HTTP_SYNTHESIS_INTERNAL_H
#define REY_NETWORK_HTTP_SYNTHESIS_INTERNAL_H

#include "rey/tts/rey_synthesis.h"

#include <chrono>
#include <memory>
#include <string>

namespace rey {
namespace net {

struct ElevenLabsConfig {
    std::string api_key;
    std::string voice_id;
    std::string base_url = "https://api.elevenlabs.io";
    std::string model_id = "eleven_turbo_v2_5";
    float stability = 0.5f;
    float similarity_boost = 0.75f;
    std::chrono::seconds timeout{30};
};

struct OpenAISpeechConfig {
    std::string api_key;
    std::string base_url = "https://api.openai.com";
    std::string model = "tts-1";
    std::string voice = "nova";
    std::string response_format = "mp3";
    std::chrono::seconds timeout{30};
};

class ElevenLabsProvider : public SynthesisProvider {
public:
    explicit ElevenLabsProvider(const ElevenLabsConfig& config) : config_(config) {}

    const char* name() const override { return "ElevenLabs"; }
    bool is_configured() const override;
    size_t max_text_length() const override { return 5000; }
    std::vector<uint8_t> synthesize(const std::string& text) override;

    std::string request_body(const std::string& text) const;

private:
    ElevenLabsConfig config_;
};

class OpenAISpeechProvider : public SynthesisProvider {
public:
    explicit OpenAISpeechProvider(const OpenAISpeechConfig& config) : config_(config) {}

    const char* name() const override { return "OpenAI"; }
    bool is_configured() const override { return !config_.api_key.empty(); }
    size_t max_text_length() const override { return 4096; }
    std::vector<uint8_t> synthesize(const std::string& text) override;

    std::string request_body(const std::string& text) const;

private:
    OpenAISpeechConfig config_;
};

/// ElevenLabs first, OpenAI second.
std::unique_ptr<SynthesisChain> make_cloud_synthesis_chain(const ElevenLabsConfig& elevenlabs,
                                                           const OpenAISpeechConfig& openai);

}  // namespace net
}  // namespace rey

#endif  // REY_NETWORK_HTTP_SYNTHESIS_INTERNAL_H
