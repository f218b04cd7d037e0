/**
 * @file energy_vad.cpp
 * @brief voxline - Energy-based voice activity detection
 */

#include "voxline/features/vad/energy_vad.h"

#include <algorithm>
#include <cmath>

#include "voxline/core/audio_utils.h"
#include "voxline/core/logger.h"

namespace voxline {

EnergyVad::EnergyVad() : EnergyVad(EnergyVadConfig{}) {}

EnergyVad::EnergyVad(const EnergyVadConfig& config) : config_(config) {
    frame_length_samples_ = static_cast<size_t>(
        std::max(1.0f, config_.frame_length_sec * static_cast<float>(config_.sample_rate)));
    config_.voice_start_frames = std::max<int32_t>(1, config_.voice_start_frames);
    config_.voice_end_frames = std::max<int32_t>(1, config_.voice_end_frames);
    VOXLINE_LOG_DEBUG("VAD", "Energy VAD: %zu samples/frame, threshold %.4f, start %d, end %d",
                      frame_length_samples_, config_.energy_threshold, config_.voice_start_frames,
                      config_.voice_end_frames);
}

float EnergyVad::calculate_rms(const float* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return 0.0f;
    }
    float sum_squares = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        sum_squares += samples[i] * samples[i];
    }
    return std::sqrt(sum_squares / static_cast<float>(count));
}

bool EnergyVad::update_state(bool has_voice, ControlKind& out_kind) {
    if (has_voice) {
        consecutive_voice_frames_++;
        consecutive_silent_frames_ = 0;
        if (!is_speaking_ && consecutive_voice_frames_ >= config_.voice_start_frames) {
            is_speaking_ = true;
            VOXLINE_LOG_DEBUG("VAD", "Speech started (energy %.4f)", last_energy_);
            out_kind = ControlKind::UtteranceStart;
            return true;
        }
    } else {
        consecutive_silent_frames_++;
        consecutive_voice_frames_ = 0;
        if (is_speaking_ && consecutive_silent_frames_ >= config_.voice_end_frames) {
            is_speaking_ = false;
            VOXLINE_LOG_DEBUG("VAD", "Speech ended");
            out_kind = ControlKind::UtteranceEnd;
            return true;
        }
    }
    return false;
}

std::vector<ControlKind> EnergyVad::process(const AudioChunk& chunk) {
    std::vector<ControlKind> transitions;

    std::vector<float> samples = pcm16_bytes_to_float(chunk.samples);
    pending_.insert(pending_.end(), samples.begin(), samples.end());

    size_t offset = 0;
    while (pending_.size() - offset >= frame_length_samples_) {
        last_energy_ = calculate_rms(pending_.data() + offset, frame_length_samples_);
        offset += frame_length_samples_;

        ControlKind kind;
        if (update_state(last_energy_ > config_.energy_threshold, kind)) {
            transitions.push_back(kind);
        }
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
    return transitions;
}

std::vector<ControlKind> EnergyVad::finish() {
    std::vector<ControlKind> transitions;
    pending_.clear();
    if (is_speaking_) {
        is_speaking_ = false;
        transitions.push_back(ControlKind::UtteranceEnd);
    }
    consecutive_voice_frames_ = 0;
    consecutive_silent_frames_ = 0;
    return transitions;
}

void EnergyVad::reset() {
    pending_.clear();
    is_speaking_ = false;
    consecutive_voice_frames_ = 0;
    consecutive_silent_frames_ = 0;
    last_energy_ = 0.0f;
}

}  // namespace voxline
