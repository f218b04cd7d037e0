/**
 * @file audio_utils.h
 * @brief voxline - Audio format conversion utilities
 *
 * All raw audio on the frame bus is 16-bit signed little-endian PCM, stored as
 * bytes. Engines that expect normalized float audio get it through these
 * helpers.
 */

#ifndef VOXLINE_CORE_AUDIO_UTILS_H
#define VOXLINE_CORE_AUDIO_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voxline {

// 1 second of 16 kHz mono 16-bit audio
constexpr size_t BYTES_PER_SECOND_16K_MONO = 16000 * sizeof(int16_t);

/**
 * @brief Convert little-endian PCM16 bytes to float samples in [-1, 1).
 *
 * A trailing odd byte is ignored.
 */
std::vector<float> pcm16_bytes_to_float(const uint8_t* data, size_t size);

inline std::vector<float> pcm16_bytes_to_float(const std::vector<uint8_t>& bytes) {
    return pcm16_bytes_to_float(bytes.data(), bytes.size());
}

/**
 * @brief Serialize PCM16 samples as little-endian bytes.
 */
std::vector<uint8_t> pcm16_to_bytes(const int16_t* samples, size_t num_samples);

/**
 * @brief Convert float samples to PCM16 with clamping.
 */
std::vector<int16_t> float_to_pcm16(const std::vector<float>& samples);

/**
 * @brief Wrap PCM16 bytes in a 44-byte RIFF/WAVE header.
 */
std::vector<uint8_t> build_wav(const uint8_t* pcm_data, size_t pcm_size, int32_t sample_rate,
                               int16_t channels = 1);

struct WavData {
    std::vector<uint8_t> pcm;  // PCM16 little-endian bytes, interleaved
    int32_t sample_rate = 0;
    int16_t channels = 0;
};

/**
 * @brief Parse an in-memory 16-bit PCM WAV file.
 *
 * @return false if the buffer is not RIFF/WAVE PCM16
 */
bool parse_wav(const std::vector<uint8_t>& file_bytes, WavData& out);

bool read_wav_file(const std::string& path, WavData& out);
bool write_wav_file(const std::string& path, const std::vector<uint8_t>& pcm, int32_t sample_rate,
                    int16_t channels = 1);

}  // namespace voxline

#endif  // VOXLINE_CORE_AUDIO_UTILS_H
