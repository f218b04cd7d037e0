/**
 * @file audio_utils.cpp
 * @brief voxline - Audio format conversion utilities
 */

#include "voxline/core/audio_utils.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

#include "voxline/core/logger.h"

namespace voxline {

// WAV file constants
static constexpr size_t WAV_HEADER_SIZE = 44;
static constexpr uint16_t WAV_FORMAT_PCM = 1;
static constexpr uint16_t WAV_BITS_PER_SAMPLE_16 = 16;

static void write_uint16_le(uint8_t* buffer, uint16_t value) {
    buffer[0] = static_cast<uint8_t>(value & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

static void write_uint32_le(uint8_t* buffer, uint32_t value) {
    buffer[0] = static_cast<uint8_t>(value & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

static uint16_t read_uint16_le(const uint8_t* buffer) {
    return static_cast<uint16_t>(buffer[0] | (buffer[1] << 8));
}

static uint32_t read_uint32_le(const uint8_t* buffer) {
    return static_cast<uint32_t>(buffer[0]) | (static_cast<uint32_t>(buffer[1]) << 8) |
           (static_cast<uint32_t>(buffer[2]) << 16) | (static_cast<uint32_t>(buffer[3]) << 24);
}

std::vector<float> pcm16_bytes_to_float(const uint8_t* data, size_t size) {
    const size_t num_samples = size / sizeof(int16_t);
    std::vector<float> samples(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        const auto value = static_cast<int16_t>(read_uint16_le(data + i * 2));
        samples[i] = static_cast<float>(value) / 32768.0f;
    }
    return samples;
}

std::vector<uint8_t> pcm16_to_bytes(const int16_t* samples, size_t num_samples) {
    std::vector<uint8_t> bytes(num_samples * sizeof(int16_t));
    for (size_t i = 0; i < num_samples; ++i) {
        write_uint16_le(&bytes[i * 2], static_cast<uint16_t>(samples[i]));
    }
    return bytes;
}

std::vector<int16_t> float_to_pcm16(const std::vector<float>& samples) {
    std::vector<int16_t> pcm16(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
        pcm16[i] = static_cast<int16_t>(clamped * 32767.0f);
    }
    return pcm16;
}

std::vector<uint8_t> build_wav(const uint8_t* pcm_data, size_t pcm_size, int32_t sample_rate,
                               int16_t channels) {
    std::vector<uint8_t> wav(WAV_HEADER_SIZE + pcm_size);
    uint8_t* header = wav.data();
    const auto data_size = static_cast<uint32_t>(pcm_size);
    const auto num_channels = static_cast<uint16_t>(channels);

    std::memcpy(&header[0], "RIFF", 4);
    write_uint32_le(&header[4], data_size + WAV_HEADER_SIZE - 8);
    std::memcpy(&header[8], "WAVE", 4);

    // fmt chunk
    std::memcpy(&header[12], "fmt ", 4);
    write_uint32_le(&header[16], 16);
    write_uint16_le(&header[20], WAV_FORMAT_PCM);
    write_uint16_le(&header[22], num_channels);
    write_uint32_le(&header[24], static_cast<uint32_t>(sample_rate));
    write_uint32_le(&header[28],
                    static_cast<uint32_t>(sample_rate) * num_channels * (WAV_BITS_PER_SAMPLE_16 / 8));
    write_uint16_le(&header[32], static_cast<uint16_t>(num_channels * (WAV_BITS_PER_SAMPLE_16 / 8)));
    write_uint16_le(&header[34], WAV_BITS_PER_SAMPLE_16);

    // data chunk
    std::memcpy(&header[36], "data", 4);
    write_uint32_le(&header[40], data_size);

    if (pcm_size > 0) {
        std::memcpy(wav.data() + WAV_HEADER_SIZE, pcm_data, pcm_size);
    }
    return wav;
}

bool parse_wav(const std::vector<uint8_t>& bytes, WavData& out) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        VOXLINE_LOG_ERROR("Audio", "Not a RIFF/WAVE buffer");
        return false;
    }

    bool found_fmt = false;
    uint16_t audio_format = 0;
    uint16_t bits_per_sample = 0;
    size_t pos = 12;

    // Walk chunks; handles extended fmt chunks and LIST/fact chunks
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        const uint32_t chunk_size = read_uint32_le(chunk + 4);
        const size_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return false;
            }
            audio_format = read_uint16_le(bytes.data() + body);
            out.channels = static_cast<int16_t>(read_uint16_le(bytes.data() + body + 2));
            out.sample_rate = static_cast<int32_t>(read_uint32_le(bytes.data() + body + 4));
            bits_per_sample = read_uint16_le(bytes.data() + body + 14);
            found_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!found_fmt || audio_format != WAV_FORMAT_PCM ||
                bits_per_sample != WAV_BITS_PER_SAMPLE_16) {
                VOXLINE_LOG_ERROR("Audio", "Only 16-bit PCM WAV is supported (format=%u, bits=%u)",
                                  audio_format, bits_per_sample);
                return false;
            }
            const size_t available = std::min<size_t>(chunk_size, bytes.size() - body);
            out.pcm.assign(bytes.begin() + static_cast<std::ptrdiff_t>(body),
                           bytes.begin() + static_cast<std::ptrdiff_t>(body + available));
            return true;
        }
        pos = body + chunk_size + (chunk_size & 1);
    }
    return false;
}

bool read_wav_file(const std::string& path, WavData& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        VOXLINE_LOG_ERROR("Audio", "Cannot open %s", path.c_str());
        return false;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return parse_wav(bytes, out);
}

bool write_wav_file(const std::string& path, const std::vector<uint8_t>& pcm, int32_t sample_rate,
                    int16_t channels) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        VOXLINE_LOG_ERROR("Audio", "Cannot write %s", path.c_str());
        return false;
    }
    const auto wav = build_wav(pcm.data(), pcm.size(), sample_rate, channels);
    file.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
    return file.good();
}

}  // namespace voxline
