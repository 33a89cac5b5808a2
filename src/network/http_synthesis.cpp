/**
 * @file http_synthesis.cpp
 * @brief Cloud text-to-speech providers (ElevenLabs, OpenAI)
 */

#include "http_synthesis.h"
#include "http_endpoint.h"
#include "rey/core/rey_logger.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace rey {
namespace net {

static const char* LOG_TAG = "TTS";

namespace {

std::vector<uint8_t> post_for_audio(const char* provider, const std::string& base_url,
                                    const std::string& path, const httplib::Headers& headers,
                                    const std::string& body, std::chrono::seconds timeout) {
    HttpEndpoint endpoint;
    if (!parse_http_endpoint(base_url, endpoint)) {
        REY_LOG_ERROR(LOG_TAG, "%s: invalid base URL %s", provider, base_url.c_str());
        return {};
    }

    httplib::Client client(endpoint.scheme_host_port);
    const auto seconds = static_cast<time_t>(timeout.count());
    client.set_connection_timeout(seconds, 0);
    client.set_read_timeout(seconds, 0);
    client.set_write_timeout(seconds, 0);

    auto res = client.Post(endpoint.path_prefix + path, headers, body, "application/json");
    if (!res) {
        REY_LOG_ERROR(LOG_TAG, "%s request failed: %s", provider,
                      httplib::to_string(res.error()).c_str());
        return {};
    }
    if (res->status < 200 || res->status >= 300) {
        REY_LOG_ERROR(LOG_TAG, "%s returned HTTP %d: %s", provider, res->status,
                      res->body.substr(0, 200).c_str());
        return {};
    }
    return std::vector<uint8_t>(res->body.begin(), res->body.end());
}

std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

// =============================================================================
// ElevenLabs
// =============================================================================

bool ElevenLabsProvider::is_configured() const {
    return !config_.api_key.empty() && !config_.voice_id.empty();
}

std::string ElevenLabsProvider::request_body(const std::string& text) const {
    nlohmann::json body = {
        {"text", text},
        {"model_id", config_.model_id},
        {"voice_settings",
         {{"stability", config_.stability}, {"similarity_boost", config_.similarity_boost}}},
    };
    return dump(body);
}

std::vector<uint8_t> ElevenLabsProvider::synthesize(const std::string& text) {
    httplib::Headers headers = {
        {"xi-api-key", config_.api_key},
        {"Accept", "audio/mpeg"},
    };
    return post_for_audio(name(), config_.base_url, "/v1/text-to-speech/" + config_.voice_id,
                          headers, request_body(text), config_.timeout);
}

// =============================================================================
// OpenAI
// =============================================================================

std::string OpenAISpeechProvider::request_body(const std::string& text) const {
    nlohmann::json body = {
        {"model", config_.model},
        {"input", text},
        {"voice", config_.voice},
        {"response_format", config_.response_format},
    };
    return dump(body);
}

std::vector<uint8_t> OpenAISpeechProvider::synthesize(const std::string& text) {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + config_.api_key},
    };
    return post_for_audio(name(), config_.base_url, "/v1/audio/speech", headers,
                          request_body(text), config_.timeout);
}

std::unique_ptr<SynthesisChain> make_cloud_synthesis_chain(const ElevenLabsConfig& elevenlabs,
                                                           const OpenAISpeechConfig& openai) {
    auto chain = std::make_unique<SynthesisChain>();
    chain->add_provider(std::make_unique<ElevenLabsProvider>(elevenlabs));
    chain->add_provider(std::make_unique<OpenAISpeechProvider>(openai));
    return chain;
}

}  // namespace net
}  // namespace rey
