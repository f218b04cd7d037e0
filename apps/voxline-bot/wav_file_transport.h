// =============================================================================
// WavFileTransport - feeds a WAV file into a session and records the replies
// =============================================================================

#ifndef VOXLINE_BOT_WAV_FILE_TRANSPORT_H
#define VOXLINE_BOT_WAV_FILE_TRANSPORT_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "voxline/core/audio_utils.h"
#include "voxline/pipeline/pipeline_runner.h"

namespace voxline_bot {

class WavFileTransport : public voxline::AudioTransport {
   public:
    WavFileTransport() = default;

    // Loads the input; false with last_error() on failure
    bool open_input(const std::string& path);

    /**
     * Push the input into the runner in chunk_ms pieces. With realtime set,
     * chunks are paced at playback speed. Stops early once running is cleared.
     *
     * @return number of chunks accepted by the runner
     */
    size_t stream_into(voxline::PipelineRunner& runner, int chunk_ms, bool realtime,
                       const std::atomic<bool>& running);

    // voxline::AudioTransport
    bool send_audio(const voxline::AudioChunk& chunk) override;

    bool write_output(const std::string& path);

    double input_duration_sec() const;
    double output_duration_sec() const;
    const std::string& last_error() const { return last_error_; }

   private:
    voxline::WavData input_;

    mutable std::mutex output_mutex_;
    std::vector<uint8_t> output_pcm_;
    int32_t output_sample_rate_ = 0;
    int32_t output_channels_ = 1;

    std::string last_error_;
};

}  // namespace voxline_bot

#endif  // VOXLINE_BOT_WAV_FILE_TRANSPORT_H
