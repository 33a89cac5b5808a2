/**
 * @file server_config.cpp
 * @brief Server configuration: .env file, environment, command line
 */

#include "rey/config/rey_config.h"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace rey {

static const char* LOG_TAG = "Config";

// =============================================================================
// Model paths
// =============================================================================

namespace {

std::string join_path(const std::string& dir, const std::string& file) {
    if (dir.empty() || (!file.empty() && file[0] == '/')) {
        return file;
    }
    if (dir.back() == '/') {
        return dir + file;
    }
    return dir + "/" + file;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string ServerConfig::wake_model_path() const {
    if (ends_with(wake_word, ".onnx")) {
        return join_path(model_dir, wake_word);
    }
    return join_path(model_dir, wake_word + "_v0.1.onnx");
}

std::string ServerConfig::melspec_model_path() const {
    return join_path(model_dir, WAKEWORD_MELSPEC_FILE);
}

std::string ServerConfig::embedding_model_path() const {
    return join_path(model_dir, WAKEWORD_EMBEDDING_FILE);
}

std::string ServerConfig::whisper_model_path() const {
    if (ends_with(whisper_model, ".bin")) {
        return join_path(model_dir, whisper_model);
    }
    return join_path(model_dir, "ggml-" + whisper_model + ".bin");
}

// =============================================================================
// .env
// =============================================================================

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    const size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

}  // namespace

bool parse_env_line(const std::string& line, std::string& key, std::string& value) {
    std::string s = trim(line);
    if (s.empty() || s[0] == '#') {
        return false;
    }
    if (s.compare(0, 7, "export ") == 0) {
        s = trim(s.substr(7));
    }

    const size_t eq = s.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }

    key = trim(s.substr(0, eq));
    value = trim(s.substr(eq + 1));

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    } else {
        // Unquoted values may carry a trailing comment
        const size_t hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
    }
    return !key.empty();
}

int load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return -1;
    }

    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        std::string key;
        std::string value;
        if (!parse_env_line(line, key, value)) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++count;
        }
    }
    REY_LOG_DEBUG(LOG_TAG, "Loaded %d variable(s) from %s", count, path.c_str());
    return count;
}

// =============================================================================
// Environment
// =============================================================================

namespace {

bool parse_int(const std::string& text, int& out) {
    try {
        size_t pos = 0;
        const int value = std::stoi(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_float(const std::string& text, float& out) {
    try {
        size_t pos = 0;
        const float value = std::stof(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool valid_port(int port) {
    return port > 0 && port <= 65535;
}

}  // namespace

ErrorCode apply_environment(ServerConfig& config, const EnvLookup& lookup, std::string& error) {
    auto get = [&lookup](const char* name, std::string& out) {
        const char* value = lookup(name);
        if (value == nullptr) {
            return false;
        }
        out = value;
        return true;
    };

    std::string value;
    get("OPENCLAW_GATEWAY_URL", config.gateway_url);
    get("OPENCLAW_GATEWAY_TOKEN", config.gateway_token);
    get("OPENCLAW_AGENT_ID", config.agent_id);
    get("OPENCLAW_MODEL", config.backend_model);
    get("WAKE_WORD", config.wake_word);
    get("WHISPER_MODEL", config.whisper_model);
    get("ELEVENLABS_API_KEY", config.elevenlabs_api_key);
    get("OPENAI_API_KEY", config.openai_api_key);
    get("AUTH_TOKEN", config.auth_token);
    get("HOST", config.host);
    get("REY_MODEL_DIR", config.model_dir);

    if (get("ELEVENLABS_VOICE_ID", value) && !value.empty()) {
        config.elevenlabs_voice_id = value;
    }

    if (get("WAKE_WORD_THRESHOLD", value) &&
        !parse_float(value, config.session.wake.threshold)) {
        error = "WAKE_WORD_THRESHOLD is not a number: " + value;
        return ErrorCode::InvalidArgument;
    }
    if (get("PORT", value) && (!parse_int(value, config.port) || !valid_port(config.port))) {
        error = "PORT is not a valid port: " + value;
        return ErrorCode::InvalidArgument;
    }
    if (get("HTTP_PORT", value) &&
        (!parse_int(value, config.http_port) || !valid_port(config.http_port))) {
        error = "HTTP_PORT is not a valid port: " + value;
        return ErrorCode::InvalidArgument;
    }
    if (get("REY_LOG_LEVEL", value) && !parse_log_level(value, config.log_level)) {
        error = "REY_LOG_LEVEL is not a log level: " + value;
        return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Ok;
}

// =============================================================================
// Command line
// =============================================================================

ErrorCode apply_command_line(ServerConfig& config, int argc, char* argv[], std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            config.show_help = true;
        } else if (strcmp(arg, "--host") == 0 && has_value) {
            config.host = argv[++i];
        } else if (strcmp(arg, "--port") == 0 && has_value) {
            if (!parse_int(argv[++i], config.port) || !valid_port(config.port)) {
                error = std::string("Invalid --port: ") + argv[i];
                return ErrorCode::InvalidArgument;
            }
        } else if (strcmp(arg, "--http-port") == 0 && has_value) {
            if (!parse_int(argv[++i], config.http_port) || !valid_port(config.http_port)) {
                error = std::string("Invalid --http-port: ") + argv[i];
                return ErrorCode::InvalidArgument;
            }
        } else if (strcmp(arg, "--auth-token") == 0 && has_value) {
            config.auth_token = argv[++i];
        } else if (strcmp(arg, "--gateway-url") == 0 && has_value) {
            config.gateway_url = argv[++i];
        } else if (strcmp(arg, "--wake-word") == 0 && has_value) {
            config.wake_word = argv[++i];
        } else if (strcmp(arg, "--wake-threshold") == 0 && has_value) {
            if (!parse_float(argv[++i], config.session.wake.threshold)) {
                error = std::string("Invalid --wake-threshold: ") + argv[i];
                return ErrorCode::InvalidArgument;
            }
        } else if (strcmp(arg, "--model-dir") == 0 && has_value) {
            config.model_dir = argv[++i];
        } else if (strcmp(arg, "--env-file") == 0 && has_value) {
            config.env_file = argv[++i];
        } else if (strcmp(arg, "--log-level") == 0 && has_value) {
            if (!parse_log_level(argv[++i], config.log_level)) {
                error = std::string("Invalid --log-level: ") + argv[i];
                return ErrorCode::InvalidArgument;
            }
        } else {
            error = std::string("Unknown or incomplete option: ") + arg;
            return ErrorCode::InvalidArgument;
        }
    }

    if (config.session.wake.threshold < 0.0f || config.session.wake.threshold > 1.0f) {
        error = "Wake word threshold must be within 0.0-1.0";
        return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Ok;
}

ErrorCode load_server_config(int argc, char* argv[], ServerConfig& config, std::string& error) {
    // The .env path has to be known before the environment is read
    std::string env_file = config.env_file;
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "--env-file") == 0) {
            env_file = argv[i + 1];
        }
    }
    if (!env_file.empty() && load_env_file(env_file) < 0) {
        REY_LOG_DEBUG(LOG_TAG, "No env file at %s", env_file.c_str());
    }

    ErrorCode rc = apply_environment(
        config, [](const char* name) -> const char* { return std::getenv(name); }, error);
    if (rc != ErrorCode::Ok) {
        return rc;
    }
    return apply_command_line(config, argc, argv, error);
}

void print_usage(const char* prog_name) {
    std::cout << "Rey Voice Server\n"
              << "Wake word + speech-to-text -> OpenClaw -> text-to-speech over WebSocket\n\n"
              << "Usage: " << prog_name << " [options]\n\n"
              << "Options:\n"
              << "  --host <addr>            Bind address (default: 0.0.0.0, env HOST)\n"
              << "  --port <n>               WebSocket port (default: 8765, env PORT)\n"
              << "  --http-port <n>          HTTP API port (default: 8766, env HTTP_PORT)\n"
              << "  --auth-token <t>         Require this token (env AUTH_TOKEN)\n"
              << "  --gateway-url <url>      OpenClaw gateway (env OPENCLAW_GATEWAY_URL)\n"
              << "  --wake-word <name>       openWakeWord model name (default: hey_jarvis)\n"
              << "  --wake-threshold <f>     Wake word threshold 0.0-1.0 (default: 0.5)\n"
              << "  --model-dir <dir>        Model directory (default: models, env REY_MODEL_DIR)\n"
              << "  --env-file <path>        Environment file (default: .env)\n"
              << "  --log-level <level>      trace|debug|info|warning|error|fatal\n"
              << "  --help                   Show this help message\n\n"
              << "Endpoints:\n"
              << "  ws://<host>:<port>/voice[?token=...]   Voice stream\n"
              << "  GET  http://<host>:<http-port>/health   Health check\n"
              << "  POST http://<host>:<http-port>/inbox    Push a notification\n"
              << std::endl;
}

}  // namespace rey
