/**
 * @file utterance_buffer.cpp
 * @brief voxline - Utterance buffer implementation
 */

#include "voxline/pipeline/utterance_buffer.h"

#include "voxline/core/logger.h"

namespace voxline {

const char* utterance_state_name(UtteranceState state) {
    switch (state) {
        case UtteranceState::Open:
            return "Open";
        case UtteranceState::Flushing:
            return "Flushing";
        case UtteranceState::Closed:
            return "Closed";
    }
    return "Unknown";
}

// =============================================================================
// Utterance
// =============================================================================

Utterance Utterance::from_audio(AudioChunk&& chunk) {
    Utterance utterance(chunk.sample_rate, chunk.channels);
    utterance.bytes_ = std::move(chunk.samples);
    utterance.state_ = UtteranceState::Flushing;
    return utterance;
}

AudioChunk Utterance::release_audio() {
    AudioChunk chunk;
    chunk.samples = std::move(bytes_);
    chunk.sample_rate = sample_rate_;
    chunk.channels = channels_;
    bytes_.clear();
    state_ = UtteranceState::Closed;
    return chunk;
}

void Utterance::append(const std::vector<uint8_t>& bytes) {
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
}

void Utterance::close() {
    bytes_.clear();
    bytes_.shrink_to_fit();
    state_ = UtteranceState::Closed;
}

double Utterance::duration_sec() const {
    const int64_t bytes_per_second =
        static_cast<int64_t>(sample_rate_) * channels_ * static_cast<int64_t>(sizeof(int16_t));
    if (bytes_per_second <= 0) {
        return 0.0;
    }
    return static_cast<double>(bytes_.size()) / static_cast<double>(bytes_per_second);
}

// =============================================================================
// UtteranceBuffer
// =============================================================================

UtteranceBuffer::UtteranceBuffer() : UtteranceBuffer(UtteranceBufferConfig{}) {}

UtteranceBuffer::UtteranceBuffer(const UtteranceBufferConfig& config)
    : config_(config), vad_mode_(config.vad_enabled) {}

std::optional<Utterance> UtteranceBuffer::accept(const AudioChunk& chunk) {
    if (chunk.samples.empty()) {
        return std::nullopt;
    }

    if (!open_) {
        if (vad_mode_) {
            // Silence between utterances
            return std::nullopt;
        }
        open_.emplace(chunk.sample_rate, chunk.channels);
    } else if (open_->empty()) {
        // Opened by UtteranceStart; take the format of the first chunk
        *open_ = Utterance(chunk.sample_rate, chunk.channels);
    }
    open_->append(chunk.samples);

    if (vad_mode_) {
        if (config_.max_utterance_bytes > 0 && open_->byte_count() >= config_.max_utterance_bytes) {
            VOXLINE_LOG_WARNING("VAD", "Utterance reached %zu bytes without UtteranceEnd, forcing flush",
                                open_->byte_count());
            return flush();
        }
        return std::nullopt;
    }

    if (config_.flush_threshold_bytes > 0 && open_->byte_count() >= config_.flush_threshold_bytes) {
        return flush();
    }
    return std::nullopt;
}

std::optional<Utterance> UtteranceBuffer::on_control(const ControlSignal& signal) {
    switch (signal.kind) {
        case ControlKind::UtteranceStart:
            if (!vad_mode_) {
                VOXLINE_LOG_DEBUG("VAD", "Voice activity signal seen, switching to VAD mode");
                vad_mode_ = true;
                // Audio buffered by the threshold policy preceded the speech
                open_.reset();
            }
            if (!open_) {
                open_.emplace();
            }
            return std::nullopt;
        case ControlKind::UtteranceEnd:
            vad_mode_ = true;
            return flush();
        default:
            return std::nullopt;
    }
}

std::optional<Utterance> UtteranceBuffer::flush() {
    if (!open_ || open_->empty()) {
        open_.reset();
        return std::nullopt;
    }

    Utterance done = std::move(*open_);
    open_.reset();
    done.mark_flushing();
    VOXLINE_LOG_DEBUG("VAD", "Flushing utterance: %zu bytes (%.2fs)", done.byte_count(),
                      done.duration_sec());
    return done;
}

void UtteranceBuffer::reset() {
    open_.reset();
}

}  // namespace voxline
