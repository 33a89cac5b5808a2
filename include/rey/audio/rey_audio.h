/**
 * @file rey_audio.h
 * @brief Rey Voice Server - Audio frame helpers
 *
 * Audio Requirements:
 * - Sample rate: 16000 Hz
 * - Format: signed 16-bit little-endian PCM on the wire, float [-1, 1] internally
 * - Channels: Mono
 * - Frame size: 512 samples (32ms) by default
 */

#ifndef REY_AUDIO_H
#define REY_AUDIO_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rey {

static constexpr int DEFAULT_SAMPLE_RATE = 16000;
static constexpr size_t DEFAULT_FRAME_SAMPLES = 512;

/// One frame of normalized mono samples. Immutable once buffered.
using AudioFrame = std::vector<float>;

/**
 * @brief Decode little-endian signed 16-bit PCM into normalized floats.
 *
 * A trailing odd byte is ignored.
 */
AudioFrame decode_pcm16(const uint8_t* data, size_t size);

inline AudioFrame decode_pcm16(const std::string& bytes) {
    return decode_pcm16(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

/**
 * @brief Root-mean-square amplitude of a block of samples (0 for empty input).
 */
float compute_rms(const float* samples, size_t count);

inline float compute_rms(const AudioFrame& frame) {
    return compute_rms(frame.data(), frame.size());
}

/**
 * @brief Concatenate buffered frames into one utterance.
 */
std::vector<float> concat_frames(const std::vector<AudioFrame>& frames);

/**
 * @brief Duration in seconds of @p num_samples at @p sample_rate.
 */
inline double samples_to_seconds(size_t num_samples, int sample_rate) {
    return sample_rate > 0 ? static_cast<double>(num_samples) / sample_rate : 0.0;
}

}  // namespace rey

#endif  // REY_AUDIO_H
