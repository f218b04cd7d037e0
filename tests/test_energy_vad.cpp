/**
 * @file test_energy_vad.cpp
 * @brief Tests for energy-based voice activity detection
 */

#include <gtest/gtest.h>

#include <vector>

#include "fake_engines.h"
#include "voxline/features/vad/energy_vad.h"

using namespace voxline;
using voxline_test::make_audio;

namespace {

// 30 ms at 16 kHz = 480 samples = 960 bytes
constexpr size_t kFrameBytes = 960;
constexpr int16_t kLoud = 3277;  // ~0.1 normalized

EnergyVadConfig test_config() {
    EnergyVadConfig config;
    config.voice_start_frames = 2;
    config.voice_end_frames = 3;
    return config;
}

}  // namespace

TEST(EnergyVad, FrameLengthFromConfig) {
    EnergyVad vad;
    EXPECT_EQ(vad.frame_length_samples(), 480u);
}

TEST(EnergyVad, CalculateRms) {
    std::vector<float> samples = {0.5f, -0.5f, 0.5f, -0.5f};
    EXPECT_FLOAT_EQ(EnergyVad::calculate_rms(samples.data(), samples.size()), 0.5f);
    EXPECT_FLOAT_EQ(EnergyVad::calculate_rms(nullptr, 0), 0.0f);
}

TEST(EnergyVad, SilenceNeverStartsSpeech) {
    EnergyVad vad(test_config());
    EXPECT_TRUE(vad.process(make_audio(kFrameBytes * 10, 0)).empty());
    EXPECT_FALSE(vad.is_speaking());
    EXPECT_FLOAT_EQ(vad.last_energy(), 0.0f);
}

TEST(EnergyVad, StartNeedsConsecutiveLoudFrames) {
    EnergyVad vad(test_config());
    EXPECT_TRUE(vad.process(make_audio(kFrameBytes, kLoud)).empty());
    EXPECT_FALSE(vad.is_speaking());

    auto transitions = vad.process(make_audio(kFrameBytes, kLoud));
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0], ControlKind::UtteranceStart);
    EXPECT_TRUE(vad.is_speaking());
    EXPECT_NEAR(vad.last_energy(), 0.1f, 1e-3f);
}

TEST(EnergyVad, SingleLoudFrameIsNoise) {
    EnergyVad vad(test_config());
    vad.process(make_audio(kFrameBytes, kLoud));
    EXPECT_TRUE(vad.process(make_audio(kFrameBytes, 0)).empty());
    EXPECT_TRUE(vad.process(make_audio(kFrameBytes, kLoud)).empty());
    EXPECT_FALSE(vad.is_speaking());
}

TEST(EnergyVad, EndAfterSilenceHangover) {
    EnergyVad vad(test_config());
    vad.process(make_audio(kFrameBytes * 2, kLoud));
    ASSERT_TRUE(vad.is_speaking());

    EXPECT_TRUE(vad.process(make_audio(kFrameBytes * 2, 0)).empty());
    auto transitions = vad.process(make_audio(kFrameBytes, 0));
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0], ControlKind::UtteranceEnd);
    EXPECT_FALSE(vad.is_speaking());
}

TEST(EnergyVad, TransitionsWithinOneChunkInOrder) {
    EnergyVad vad(test_config());
    std::vector<uint8_t> bytes = make_audio(kFrameBytes * 2, kLoud).samples;
    std::vector<uint8_t> quiet = make_audio(kFrameBytes * 3, 0).samples;
    bytes.insert(bytes.end(), quiet.begin(), quiet.end());

    AudioChunk chunk;
    chunk.samples = bytes;
    auto transitions = vad.process(chunk);
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0], ControlKind::UtteranceStart);
    EXPECT_EQ(transitions[1], ControlKind::UtteranceEnd);
}

TEST(EnergyVad, PartialFramesCarryOver) {
    EnergyVad vad(test_config());
    // Two loud frames delivered in three uneven pieces
    EXPECT_TRUE(vad.process(make_audio(700, kLoud)).empty());
    EXPECT_TRUE(vad.process(make_audio(700, kLoud)).empty());
    auto transitions = vad.process(make_audio(520, kLoud));
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0], ControlKind::UtteranceStart);
}

TEST(EnergyVad, FinishClosesOpenSpeech) {
    EnergyVad vad(test_config());
    EXPECT_TRUE(vad.finish().empty());

    vad.process(make_audio(kFrameBytes * 2, kLoud));
    auto transitions = vad.finish();
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0], ControlKind::UtteranceEnd);
    EXPECT_FALSE(vad.is_speaking());
}

TEST(EnergyVad, ResetForgetsState) {
    EnergyVad vad(test_config());
    vad.process(make_audio(kFrameBytes * 2, kLoud));
    vad.reset();
    EXPECT_FALSE(vad.is_speaking());
    EXPECT_TRUE(vad.process(make_audio(kFrameBytes, kLoud)).empty());
}
