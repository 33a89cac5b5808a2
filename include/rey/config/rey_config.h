/**
 * @file rey_config.h
 * @brief Rey Voice Server - Server configuration
 *
 * Load order (later wins):
 *   1. compiled defaults
 *   2. optional .env file (KEY=VALUE; variables already in the environment win)
 *   3. environment variables
 *   4. command line flags
 */

#ifndef REY_CONFIG_H
#define REY_CONFIG_H

#include "rey/core/rey_error.h"
#include "rey/core/rey_logger.h"
#include "rey/session/rey_session.h"

#include <chrono>
#include <functional>
#include <string>

namespace rey {

// =============================================================================
// Defaults
// =============================================================================

static constexpr const char* DEFAULT_HOST = "0.0.0.0";
static constexpr int DEFAULT_WS_PORT = 8765;
static constexpr int DEFAULT_HTTP_PORT = 8766;
static constexpr const char* DEFAULT_GATEWAY_URL = "http://127.0.0.1:18789";
static constexpr const char* DEFAULT_AGENT_ID = "main";
static constexpr const char* DEFAULT_WAKE_WORD = "hey_jarvis";
static constexpr const char* DEFAULT_WHISPER_MODEL = "base.en";
static constexpr const char* DEFAULT_ELEVENLABS_VOICE_ID = "21m00Tcm4TlvDq8ikWAM";
static constexpr const char* DEFAULT_MODEL_DIR = "models";
static constexpr const char* DEFAULT_ENV_FILE = ".env";

// openWakeWord shared feature models
static constexpr const char* WAKEWORD_MELSPEC_FILE = "melspectrogram.onnx";
static constexpr const char* WAKEWORD_EMBEDDING_FILE = "embedding_model.onnx";

// =============================================================================
// ServerConfig
// =============================================================================

struct ServerConfig {
    // Network
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_WS_PORT;
    int http_port = DEFAULT_HTTP_PORT;
    std::string auth_token;  // empty = no authentication

    // OpenClaw gateway
    std::string gateway_url = DEFAULT_GATEWAY_URL;
    std::string gateway_token;
    std::string agent_id = DEFAULT_AGENT_ID;
    std::string backend_model;  // empty = "openclaw"
    std::chrono::seconds backend_timeout{60};

    // Models
    std::string model_dir = DEFAULT_MODEL_DIR;
    std::string wake_word = DEFAULT_WAKE_WORD;
    std::string whisper_model = DEFAULT_WHISPER_MODEL;
    int inference_threads = 4;

    // Speech synthesis
    std::string elevenlabs_api_key;
    std::string elevenlabs_voice_id = DEFAULT_ELEVENLABS_VOICE_ID;
    std::string openai_api_key;
    std::chrono::seconds synthesis_timeout{30};

    // Per-session behavior (turn detection, wake gate, settle delays, keepalive)
    SessionConfig session;

    LogLevel log_level = LogLevel::Info;
    std::string env_file = DEFAULT_ENV_FILE;
    bool show_help = false;

    /// Path of the wake word classifier model ("hey_jarvis" -> <dir>/hey_jarvis_v0.1.onnx).
    std::string wake_model_path() const;
    std::string melspec_model_path() const;
    std::string embedding_model_path() const;

    /// Path of the GGML Whisper model ("base.en" -> <dir>/ggml-base.en.bin).
    std::string whisper_model_path() const;
};

/// Returns the value of an environment variable, or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

/**
 * Parse one .env line. Blank lines and '#' comments yield false. Surrounding
 * quotes on the value are stripped and an optional "export " prefix is ignored.
 */
bool parse_env_line(const std::string& line, std::string& key, std::string& value);

/**
 * Load KEY=VALUE pairs from @p path into the process environment without
 * overriding variables that are already set.
 *
 * @return number of variables set, or -1 when the file cannot be opened
 */
int load_env_file(const std::string& path);

/// Apply environment variables on top of @p config.
ErrorCode apply_environment(ServerConfig& config, const EnvLookup& lookup, std::string& error);

/// Apply command line flags on top of @p config.
ErrorCode apply_command_line(ServerConfig& config, int argc, char* argv[], std::string& error);

/**
 * Full load: defaults, .env (path from --env-file when given), environment,
 * command line.
 */
ErrorCode load_server_config(int argc, char* argv[], ServerConfig& config, std::string& error);

void print_usage(const char* prog_name);

}  // namespace rey

#endif  // REY_CONFIG_H
