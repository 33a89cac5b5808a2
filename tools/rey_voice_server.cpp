// =============================================================================
// Rey Voice Server - Main Entry Point
// =============================================================================
// Voice front end for an OpenClaw agent. Clients stream 16 kHz PCM over
// WebSocket; the server gates on a wake word, detects the end of the turn,
// transcribes, asks the agent, and streams synthesized speech back.
//
// Usage: ./rey-voice-server [options]      (see --help)
//
// Controls:
//   Ctrl+C                   Stop the server
// =============================================================================

#include "rey/config/rey_config.h"
#include "rey/core/rey_logger.h"
#include "rey/server/rey_voice_server.h"

#include "../src/network/http_synthesis.h"
#include "../src/network/openclaw_backend.h"

#ifdef REY_HAS_ONNX
#include "rey/backends/rey_wakeword_onnx.h"
#endif
#ifdef REY_HAS_WHISPERCPP
#include "rey/backends/rey_stt_whispercpp.h"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// =============================================================================
// Global State
// =============================================================================

std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

// =============================================================================
// Session components
// =============================================================================

static rey::SessionComponents build_components(const rey::ServerConfig& config,
                                               const std::shared_ptr<rey::ChatBackend>& backend) {
    rey::SessionComponents components;
    components.backend = backend;

#ifdef REY_HAS_ONNX
    {
        rey::backends::onnx::OnnxWakeConfig wake_config;
        wake_config.melspec_model_path = config.melspec_model_path();
        wake_config.embedding_model_path = config.embedding_model_path();
        wake_config.wake_model_path = config.wake_model_path();
        wake_config.label = config.wake_word;

        auto classifier = std::make_unique<rey::backends::onnx::OnnxWakeClassifier>();
        // A classifier that fails to load stays in place; the wake gate reports it
        if (classifier->load(wake_config) != rey::ErrorCode::Ok) {
            REY_LOG_WARNING("Main", "Wake word models unavailable in %s", config.model_dir.c_str());
        }
        components.classifier = std::move(classifier);
    }
#endif

#ifdef REY_HAS_WHISPERCPP
    {
        rey::backends::whispercpp::WhisperConfig stt_config;
        stt_config.model_path = config.whisper_model_path();
        stt_config.num_threads = config.inference_threads;

        auto transcriber = std::make_unique<rey::backends::whispercpp::WhisperTranscriber>();
        if (transcriber->load(stt_config) == rey::ErrorCode::Ok) {
            components.transcriber = std::move(transcriber);
        } else {
            REY_LOG_WARNING("Main", "Whisper model unavailable: %s",
                            stt_config.model_path.c_str());
        }
    }
#endif

    rey::net::ElevenLabsConfig elevenlabs;
    elevenlabs.api_key = config.elevenlabs_api_key;
    elevenlabs.voice_id = config.elevenlabs_voice_id;
    elevenlabs.timeout = config.synthesis_timeout;

    rey::net::OpenAISpeechConfig openai;
    openai.api_key = config.openai_api_key;
    openai.timeout = config.synthesis_timeout;

    components.synthesis = rey::net::make_cloud_synthesis_chain(elevenlabs, openai);
    return components;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    rey::ServerConfig config;
    std::string error;
    if (rey::load_server_config(argc, argv, config, error) != rey::ErrorCode::Ok) {
        std::cerr << "ERROR: " << error << "\n\n";
        rey::print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        rey::print_usage(argv[0]);
        return 0;
    }

    rey::Logger::instance().setMinLevel(config.log_level);

    // Install signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "========================================\n"
              << "    Rey Voice Server\n"
              << "========================================\n"
              << std::endl;

    std::cout << "Configuration:\n"
              << "  Gateway:    " << config.gateway_url << " (agent " << config.agent_id << ")\n"
              << "  Wake word:  " << config.wake_word << " (threshold "
              << config.session.wake.threshold << ")\n"
              << "  Whisper:    " << config.whisper_model << "\n"
              << "  Models:     " << config.model_dir << "\n"
              << "  Auth:       " << (config.auth_token.empty() ? "disabled" : "token") << "\n";
#ifndef REY_HAS_ONNX
    std::cout << "  WARNING: built without ONNX Runtime, wake word detection unavailable\n";
#endif
#ifndef REY_HAS_WHISPERCPP
    std::cout << "  WARNING: built without whisper.cpp, transcription unavailable\n";
#endif
    if (config.elevenlabs_api_key.empty() && config.openai_api_key.empty()) {
        std::cout << "  WARNING: no TTS provider configured, replies will be text only\n";
    }
    std::cout << std::endl;

    // One gateway client shared by every session
    rey::net::OpenClawBackendConfig backend_config;
    backend_config.gateway_url = config.gateway_url;
    backend_config.token = config.gateway_token;
    backend_config.agent_id = config.agent_id;
    backend_config.model = config.backend_model;
    backend_config.timeout = config.backend_timeout;
    std::shared_ptr<rey::ChatBackend> backend =
        std::make_shared<rey::net::OpenClawBackend>(backend_config);

    rey::VoiceServerConfig server_config;
    server_config.host = config.host;
    server_config.port = config.port;
    server_config.http_port = config.http_port;
    server_config.auth_token = config.auth_token;
    server_config.session = config.session;

    rey::VoiceServer server(server_config,
                            [&config, backend]() { return build_components(config, backend); });

    if (server.start() != rey::ErrorCode::Ok) {
        std::cerr << "ERROR: Failed to start server on " << config.host << ":" << config.port
                  << " / " << config.http_port << std::endl;
        return 1;
    }

    std::cout << "Listening. Press Ctrl+C to stop.\n" << std::endl;

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nStopping..." << std::endl;
    server.stop();

    std::cout << "Goodbye!" << std::endl;
    return 0;
}
