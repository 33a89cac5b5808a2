/**
 * @file rey_transcriber.h
 * @brief Rey Voice Server - Speech-to-text contract
 *
 * Implemented by the whisper.cpp backend (backends/whispercpp).
 */

#ifndef REY_TRANSCRIBER_H
#define REY_TRANSCRIBER_H

#include <atomic>
#include <string>
#include <vector>

namespace rey {

class Transcriber {
public:
    virtual ~Transcriber() = default;

    virtual bool is_ready() const = 0;

    /**
     * Transcribe a complete utterance.
     *
     * @param samples Mono float samples in [-1, 1]
     * @param sample_rate Sample rate of @p samples
     * @param out_text Receives the trimmed transcript
     * @return false on failure; @p out_text is left empty
     */
    virtual bool transcribe(const std::vector<float>& samples, int sample_rate,
                            std::string& out_text) = 0;

    /// Backends that can stop mid-utterance poll @p flag and fail early once it is set.
    void set_abort_flag(const std::atomic<bool>* flag) { abort_flag_ = flag; }

protected:
    bool abort_requested() const { return abort_flag_ != nullptr && abort_flag_->load(); }

    const std::atomic<bool>* abort_flag_ = nullptr;
};

}  // namespace rey

#endif  // REY_TRANSCRIBER_H
