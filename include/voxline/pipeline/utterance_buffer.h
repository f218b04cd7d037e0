/**
 * @file utterance_buffer.h
 * @brief voxline - Per-utterance audio accumulator
 *
 * Holds at most one in-progress utterance. Flush conditions, in order:
 *   1. an explicit UtteranceEnd control signal (voice-activity collaborator)
 *   2. the accumulated byte count reaching flush_threshold_bytes, only while
 *      no VAD signal is present (fallback policy)
 *
 * The byte-threshold flush is an approximation: it may split one spoken
 * sentence into several utterances mid-word.
 */

#ifndef VOXLINE_PIPELINE_UTTERANCE_BUFFER_H
#define VOXLINE_PIPELINE_UTTERANCE_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "voxline/core/audio_utils.h"
#include "voxline/pipeline/frame.h"

namespace voxline {

enum class UtteranceState {
    Open,
    Flushing,
    Closed,
};

const char* utterance_state_name(UtteranceState state);

/**
 * One continuous span of user speech. Returned by the buffer in the Flushing
 * state; closed by the consumer once its audio has been handed over.
 */
class Utterance {
   public:
    Utterance() = default;
    Utterance(int32_t sample_rate, int32_t channels)
        : sample_rate_(sample_rate), channels_(channels) {}

    // Rebuild a flushed utterance from the audio carried on the bus
    static Utterance from_audio(AudioChunk&& chunk);

    void append(const std::vector<uint8_t>& bytes);
    void mark_flushing() { state_ = UtteranceState::Flushing; }

    // Releases the audio; the utterance is done
    void close();

    // Moves the audio out for hand-over and closes the utterance
    AudioChunk release_audio();

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    size_t byte_count() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    UtteranceState state() const { return state_; }
    int32_t sample_rate() const { return sample_rate_; }
    int32_t channels() const { return channels_; }
    double duration_sec() const;

   private:
    std::vector<uint8_t> bytes_;
    UtteranceState state_ = UtteranceState::Open;
    int32_t sample_rate_ = 16000;
    int32_t channels_ = 1;
};

struct UtteranceBufferConfig {
    // ~1 second of 16 kHz mono 16-bit audio
    size_t flush_threshold_bytes = BYTES_PER_SECOND_16K_MONO;

    // Force-flush under VAD after this much audio (prevents unbounded buffering)
    size_t max_utterance_bytes = 60 * BYTES_PER_SECOND_16K_MONO;

    // Start in VAD mode; otherwise the first VAD signal switches modes
    bool vad_enabled = false;
};

class UtteranceBuffer {
   public:
    UtteranceBuffer();
    explicit UtteranceBuffer(const UtteranceBufferConfig& config);

    /**
     * Append a chunk to the open utterance, creating one if none is open.
     *
     * @return the completed utterance when a flush fires
     */
    std::optional<Utterance> accept(const AudioChunk& chunk);

    /**
     * Apply a voice-activity signal. UtteranceStart opens an utterance,
     * UtteranceEnd flushes it. Other kinds are ignored.
     */
    std::optional<Utterance> on_control(const ControlSignal& signal);

    // Flush whatever is buffered; no-op (nullopt) when empty
    std::optional<Utterance> flush();

    // Drop buffered audio without producing an utterance
    void reset();

    bool has_open_utterance() const { return open_.has_value(); }
    size_t buffered_bytes() const { return open_ ? open_->byte_count() : 0; }
    bool vad_mode() const { return vad_mode_; }
    const UtteranceBufferConfig& config() const { return config_; }

   private:
    UtteranceBufferConfig config_;
    std::optional<Utterance> open_;
    bool vad_mode_ = false;
};

}  // namespace voxline

#endif  // VOXLINE_PIPELINE_UTTERANCE_BUFFER_H
