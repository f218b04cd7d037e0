// =============================================================================
// WavFileTransport - Implementation
// =============================================================================

#include "wav_file_transport.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include "voxline/core/logger.h"

namespace voxline_bot {

bool WavFileTransport::open_input(const std::string& path) {
    if (!voxline::read_wav_file(path, input_)) {
        last_error_ = "cannot read 16-bit PCM WAV file: " + path;
        return false;
    }
    if (input_.sample_rate != 16000 || input_.channels != 1) {
        VOXLINE_LOG_WARNING("Transport",
                            "Input is %d Hz / %d ch; byte thresholds assume 16 kHz mono",
                            input_.sample_rate, input_.channels);
    }
    return true;
}

size_t WavFileTransport::stream_into(voxline::PipelineRunner& runner, int chunk_ms, bool realtime,
                                     const std::atomic<bool>& running) {
    const size_t frame_bytes = sizeof(int16_t) * static_cast<size_t>(std::max<int16_t>(1, input_.channels));
    size_t chunk_bytes =
        static_cast<size_t>(input_.sample_rate) * static_cast<size_t>(chunk_ms) / 1000 * frame_bytes;
    chunk_bytes = std::max(chunk_bytes, frame_bytes);

    size_t accepted = 0;
    auto next_send = std::chrono::steady_clock::now();
    for (size_t offset = 0; offset < input_.pcm.size() && running.load(); offset += chunk_bytes) {
        size_t end = std::min(offset + chunk_bytes, input_.pcm.size());

        voxline::AudioChunk chunk;
        chunk.samples.assign(input_.pcm.begin() + static_cast<std::ptrdiff_t>(offset),
                             input_.pcm.begin() + static_cast<std::ptrdiff_t>(end));
        chunk.sample_rate = input_.sample_rate;
        chunk.channels = input_.channels;

        if (!runner.dispatch(voxline::InboundFrame{std::move(chunk)})) {
            break;
        }
        accepted++;

        if (realtime) {
            next_send += std::chrono::milliseconds(chunk_ms);
            std::this_thread::sleep_until(next_send);
        }
    }
    return accepted;
}

bool WavFileTransport::send_audio(const voxline::AudioChunk& chunk) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (output_sample_rate_ == 0) {
        output_sample_rate_ = chunk.sample_rate;
        output_channels_ = chunk.channels;
    } else if (chunk.sample_rate != output_sample_rate_ || chunk.channels != output_channels_) {
        VOXLINE_LOG_WARNING("Transport", "Dropping %d Hz chunk; output file is %d Hz",
                            chunk.sample_rate, output_sample_rate_);
        return true;
    }
    output_pcm_.insert(output_pcm_.end(), chunk.samples.begin(), chunk.samples.end());
    return true;
}

bool WavFileTransport::write_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    int32_t rate = output_sample_rate_ > 0 ? output_sample_rate_ : 24000;
    if (!voxline::write_wav_file(path, output_pcm_, rate, static_cast<int16_t>(output_channels_))) {
        last_error_ = "cannot write " + path;
        return false;
    }
    return true;
}

double WavFileTransport::input_duration_sec() const {
    if (input_.sample_rate <= 0 || input_.channels <= 0) {
        return 0.0;
    }
    return static_cast<double>(input_.pcm.size()) /
           (2.0 * input_.sample_rate * input_.channels);
}

double WavFileTransport::output_duration_sec() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (output_sample_rate_ <= 0 || output_channels_ <= 0) {
        return 0.0;
    }
    return static_cast<double>(output_pcm_.size()) /
           (2.0 * output_sample_rate_ * output_channels_);
}

}  // namespace voxline_bot
