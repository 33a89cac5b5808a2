/**
 * @file test_audio.cpp
 * @brief Tests for PCM decoding and RMS
 */

#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "rey/audio/rey_audio.h"

using namespace rey;

TEST(Audio, DecodePcm16LittleEndian) {
    // 0x0000, 0x7FFF, 0x8000, 0xC000
    const uint8_t bytes[] = {0x00, 0x00, 0xFF, 0x7F, 0x00, 0x80, 0x00, 0xC0};
    AudioFrame frame = decode_pcm16(bytes, sizeof(bytes));

    ASSERT_EQ(frame.size(), 4u);
    EXPECT_FLOAT_EQ(frame[0], 0.0f);
    EXPECT_FLOAT_EQ(frame[1], 32767.0f / 32768.0f);
    EXPECT_FLOAT_EQ(frame[2], -1.0f);
    EXPECT_FLOAT_EQ(frame[3], -0.5f);
}

TEST(Audio, DecodePcm16DropsTrailingOddByte) {
    const std::string bytes("\x00\x40\x01", 3);
    AudioFrame frame = decode_pcm16(bytes);
    ASSERT_EQ(frame.size(), 1u);
    EXPECT_FLOAT_EQ(frame[0], 0.5f);
}

TEST(Audio, DecodeEmpty) {
    EXPECT_TRUE(decode_pcm16(std::string()).empty());
}

TEST(Audio, RmsOfEmptyIsZero) {
    EXPECT_EQ(compute_rms(nullptr, 0), 0.0f);
    EXPECT_EQ(compute_rms(AudioFrame{}), 0.0f);
}

TEST(Audio, RmsOfConstantAmplitude) {
    AudioFrame frame(513, -0.25f);  // odd length exercises the tail loop
    EXPECT_NEAR(compute_rms(frame), 0.25f, 1e-6f);
}

TEST(Audio, RmsOfSquareWave) {
    AudioFrame frame(512);
    for (size_t i = 0; i < frame.size(); ++i) {
        frame[i] = (i % 2 == 0) ? 1.0f : -1.0f;
    }
    EXPECT_NEAR(compute_rms(frame), 1.0f, 1e-6f);
}

TEST(Audio, ConcatFramesPreservesOrder) {
    std::vector<AudioFrame> frames = {{1.0f, 2.0f}, {}, {3.0f}};
    std::vector<float> out = concat_frames(frames);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], 1.0f);
    EXPECT_EQ(out[1], 2.0f);
    EXPECT_EQ(out[2], 3.0f);
}

TEST(Audio, SamplesToSeconds) {
    EXPECT_DOUBLE_EQ(samples_to_seconds(16000, 16000), 1.0);
    EXPECT_DOUBLE_EQ(samples_to_seconds(8000, 16000), 0.5);
    EXPECT_DOUBLE_EQ(samples_to_seconds(100, 0), 0.0);
}
