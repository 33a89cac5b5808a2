/**
 * @file synthesis_chain.cpp
 * @brief Text-to-speech provider chain
 */

#include "rey/tts/rey_synthesis.h"
#include "rey/core/rey_error.h"
#include "rey/core/rey_logger.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace rey {

static const char* LOG_TAG = "TTS";

namespace {

// Result slot shared with a detached provider call.
struct PendingSynthesis {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool failed = false;
    std::string error;
    std::vector<uint8_t> audio;
};

}  // namespace

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (max_bytes == 0 || text.size() <= max_bytes) {
        return text;
    }

    // Back off over continuation bytes (10xxxxxx) so the cut lands on a
    // sequence start.
    size_t end = max_bytes;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

void SynthesisChain::add_provider(std::unique_ptr<SynthesisProvider> provider) {
    if (provider) {
        providers_.push_back(std::move(provider));
    }
}

bool SynthesisChain::has_configured_provider() const {
    for (const auto& provider : providers_) {
        if (provider->is_configured()) {
            return true;
        }
    }
    return false;
}

std::vector<uint8_t> SynthesisChain::synthesize(const std::string& text,
                                                std::string* out_provider,
                                                const std::atomic<bool>* cancelled) {
    if (text.empty()) {
        return {};
    }

    for (const auto& provider : providers_) {
        if (!provider->is_configured()) {
            REY_LOG_DEBUG(LOG_TAG, "Skipping %s (not configured)", provider->name());
            continue;
        }

        const std::string input = truncate_utf8(text, provider->max_text_length());
        if (input.size() < text.size()) {
            REY_LOG_DEBUG(LOG_TAG, "%s: text truncated %zu -> %zu bytes", provider->name(),
                          text.size(), input.size());
        }

        if (cancelled && cancelled->load()) {
            REY_LOG_DEBUG(LOG_TAG, "Synthesis cancelled before %s", provider->name());
            return {};
        }

        std::vector<uint8_t> audio;
        if (cancelled == nullptr) {
            try {
                audio = provider->synthesize(input);
            } catch (const std::exception& e) {
                REY_LOG_WARNING(LOG_TAG, "%s failed: %s", provider->name(), e.what());
                continue;
            }
        } else {
            auto pending = std::make_shared<PendingSynthesis>();
            std::shared_ptr<SynthesisProvider> worker_provider = provider;
            std::thread([pending, worker_provider, input]() {
                std::vector<uint8_t> result;
                std::string error;
                bool failed = false;
                try {
                    result = worker_provider->synthesize(input);
                } catch (const std::exception& e) {
                    failed = true;
                    error = e.what();
                }
                {
                    std::lock_guard<std::mutex> lock(pending->mutex);
                    pending->audio = std::move(result);
                    pending->failed = failed;
                    pending->error = std::move(error);
                    pending->done = true;
                }
                pending->cv.notify_all();
            }).detach();

            std::unique_lock<std::mutex> lock(pending->mutex);
            while (!pending->done) {
                if (cancelled->load()) {
                    REY_LOG_DEBUG(LOG_TAG, "Synthesis cancelled during %s", provider->name());
                    return {};
                }
                pending->cv.wait_for(lock, cancel_poll_, [&pending] { return pending->done; });
            }
            if (pending->failed) {
                REY_LOG_WARNING(LOG_TAG, "%s failed: %s", provider->name(),
                                pending->error.c_str());
                continue;
            }
            audio = std::move(pending->audio);
        }

        if (!audio.empty()) {
            REY_LOG_INFO(LOG_TAG, "%s: %zu bytes", provider->name(), audio.size());
            if (out_provider) {
                *out_provider = provider->name();
            }
            return audio;
        }
        REY_LOG_WARNING(LOG_TAG, "%s returned no audio", provider->name());
    }

    REY_LOG_WARNING(LOG_TAG, "%s (%d), continuing text-only",
                    error_message(ErrorCode::SynthesisUnavailable),
                    error_value(ErrorCode::SynthesisUnavailable));
    return {};
}

}  // namespace rey
