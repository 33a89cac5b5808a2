/**
 * @file stt_whispercpp.cpp
 * @brief whisper.cpp speech-to-text backend
 */

#include "rey/backends/rey_stt_whispercpp.h"
#include "rey/core/rey_logger.h"

#include <whisper.h>

namespace rey {
namespace backends {
namespace whispercpp {

static const char* LOG_TAG = "WhisperSTT";

static constexpr int WHISPER_SAMPLE_RATE_HZ = 16000;

static bool abort_requested_cb(void* user_data) {
    const auto* flag = static_cast<const std::atomic<bool>*>(user_data);
    return flag != nullptr && flag->load();
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    const size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

WhisperTranscriber::~WhisperTranscriber() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

ErrorCode WhisperTranscriber::load(const WhisperConfig& config) {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
    config_ = config;

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(config.model_path.c_str(), cparams);
    if (!ctx_) {
        REY_LOG_ERROR(LOG_TAG, "Failed to load whisper model: %s", config.model_path.c_str());
        return ErrorCode::TranscriberUnavailable;
    }

    REY_LOG_INFO(LOG_TAG, "Loaded whisper model: %s (multilingual=%d)", config.model_path.c_str(),
                 whisper_is_multilingual(ctx_));
    return ErrorCode::Ok;
}

bool WhisperTranscriber::transcribe(const std::vector<float>& samples, int sample_rate,
                                    std::string& out_text) {
    out_text.clear();
    if (!ctx_) {
        return false;
    }
    if (sample_rate != WHISPER_SAMPLE_RATE_HZ) {
        REY_LOG_ERROR(LOG_TAG, "Unsupported sample rate %d (expected %d)", sample_rate,
                      WHISPER_SAMPLE_RATE_HZ);
        return false;
    }
    if (samples.empty()) {
        return true;
    }
    if (abort_requested()) {
        return false;
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    params.beam_search.beam_size = config_.beam_size;
    params.language = config_.language.c_str();
    params.n_threads = config_.num_threads;
    params.translate = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    if (abort_flag_) {
        params.abort_callback = abort_requested_cb;
        params.abort_callback_user_data =
            const_cast<void*>(static_cast<const void*>(abort_flag_));
    }

    const int result =
        whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size()));
    if (result != 0) {
        if (abort_requested()) {
            REY_LOG_DEBUG(LOG_TAG, "Transcription aborted");
            return false;
        }
        REY_LOG_ERROR(LOG_TAG, "whisper_full failed: %d", result);
        return false;
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment = whisper_full_get_segment_text(ctx_, i);
        if (segment) {
            text += segment;
        }
    }

    out_text = trim(text);
    REY_LOG_DEBUG(LOG_TAG, "Transcribed %zu samples in %d segments", samples.size(), n_segments);
    return true;
}

}  // namespace whispercpp
}  // namespace backends
}  // namespace rey
