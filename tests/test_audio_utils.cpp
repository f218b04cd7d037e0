/**
 * @file test_audio_utils.cpp
 * @brief Tests for PCM conversion and WAV helpers
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "voxline/core/audio_utils.h"

using namespace voxline;

TEST(AudioUtils, Pcm16BytesNormalizeToFloat) {
    // 0, 16384, -32768 little-endian
    std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x40, 0x00, 0x80};
    std::vector<float> samples = pcm16_bytes_to_float(bytes);
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_FLOAT_EQ(samples[0], 0.0f);
    EXPECT_FLOAT_EQ(samples[1], 0.5f);
    EXPECT_FLOAT_EQ(samples[2], -1.0f);
}

TEST(AudioUtils, TrailingOddByteIgnored) {
    std::vector<uint8_t> bytes = {0x00, 0x40, 0x7F};
    EXPECT_EQ(pcm16_bytes_to_float(bytes).size(), 1u);
}

TEST(AudioUtils, FloatToPcm16Clamps) {
    std::vector<int16_t> pcm = float_to_pcm16({2.0f, -2.0f, 0.0f});
    ASSERT_EQ(pcm.size(), 3u);
    EXPECT_EQ(pcm[0], 32767);
    EXPECT_EQ(pcm[1], -32767);
    EXPECT_EQ(pcm[2], 0);
}

TEST(AudioUtils, BuildWavHasHeader) {
    std::vector<uint8_t> pcm(320, 0);
    std::vector<uint8_t> wav = build_wav(pcm.data(), pcm.size(), 16000, 1);
    ASSERT_EQ(wav.size(), 44u + pcm.size());
    EXPECT_EQ(std::string(wav.begin(), wav.begin() + 4), "RIFF");
    EXPECT_EQ(std::string(wav.begin() + 8, wav.begin() + 12), "WAVE");

    WavData parsed;
    ASSERT_TRUE(parse_wav(wav, parsed));
    EXPECT_EQ(parsed.sample_rate, 16000);
    EXPECT_EQ(parsed.channels, 1);
    EXPECT_EQ(parsed.pcm.size(), pcm.size());
}

TEST(AudioUtils, ParseRejectsGarbage) {
    WavData parsed;
    EXPECT_FALSE(parse_wav(std::vector<uint8_t>(100, 0x11), parsed));
    EXPECT_FALSE(parse_wav({}, parsed));
}

TEST(AudioUtils, WavFileOnDisk) {
    std::string path = ::testing::TempDir() + "voxline_audio_utils.wav";
    std::vector<uint8_t> pcm = {0x01, 0x00, 0x02, 0x00, 0x03, 0x00};
    ASSERT_TRUE(write_wav_file(path, pcm, 24000, 1));

    WavData loaded;
    ASSERT_TRUE(read_wav_file(path, loaded));
    EXPECT_EQ(loaded.sample_rate, 24000);
    EXPECT_EQ(loaded.pcm, pcm);
    std::remove(path.c_str());
}
