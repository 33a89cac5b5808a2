/**
 * @file rey_audio.cpp
 * @brief Audio frame helpers
 */

#include "rey/audio/rey_audio.h"

#include <cmath>

namespace rey {

AudioFrame decode_pcm16(const uint8_t* data, size_t size) {
    const size_t num_samples = size / 2;
    AudioFrame frame(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        const auto lo = static_cast<uint16_t>(data[2 * i]);
        const auto hi = static_cast<uint16_t>(data[2 * i + 1]);
        const auto sample = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        frame[i] = static_cast<float>(sample) / 32768.0f;
    }
    return frame;
}

// Four partial sums keep the loop vectorizable.
float compute_rms(const float* samples, size_t count) {
    if (count == 0 || samples == nullptr) {
        return 0.0f;
    }

    float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
    size_t i = 0;

    for (; i + 3 < count; i += 4) {
        s0 += samples[i] * samples[i];
        s1 += samples[i + 1] * samples[i + 1];
        s2 += samples[i + 2] * samples[i + 2];
        s3 += samples[i + 3] * samples[i + 3];
    }

    float sum_squares = (s0 + s1) + (s2 + s3);
    for (; i < count; ++i) {
        sum_squares += samples[i] * samples[i];
    }

    return std::sqrt(sum_squares / static_cast<float>(count));
}

std::vector<float> concat_frames(const std::vector<AudioFrame>& frames) {
    size_t total = 0;
    for (const auto& frame : frames) {
        total += frame.size();
    }

    std::vector<float> utterance;
    utterance.reserve(total);
    for (const auto& frame : frames) {
        utterance.insert(utterance.end(), frame.begin(), frame.end());
    }
    return utterance;
}

}  // namespace rey
