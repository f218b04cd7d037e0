/**
 * @file energy_vad.h
 * @brief voxline - Energy-based voice activity detection
 *
 * Computes the RMS energy of fixed-length frames and applies hysteresis:
 * speech starts after voice_start_frames consecutive frames above the
 * threshold and ends after voice_end_frames consecutive frames below it.
 * Transitions are reported as UtteranceStart / UtteranceEnd control kinds,
 * the same signals an external VAD collaborator would send.
 */

#ifndef VOXLINE_FEATURES_VAD_ENERGY_VAD_H
#define VOXLINE_FEATURES_VAD_ENERGY_VAD_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "voxline/pipeline/frame.h"

namespace voxline {

struct EnergyVadConfig {
    int32_t sample_rate = 16000;
    float frame_length_sec = 0.03f;
    float energy_threshold = 0.015f;  // RMS of normalized samples
    int32_t voice_start_frames = 2;
    int32_t voice_end_frames = 20;
};

class EnergyVad {
   public:
    EnergyVad();
    explicit EnergyVad(const EnergyVadConfig& config);

    /**
     * Feed PCM16 audio. Samples are carried over between calls until a full
     * frame is available.
     *
     * @return the speech transitions detected in this chunk, in order
     */
    std::vector<ControlKind> process(const AudioChunk& chunk);

    // Ends an open speech span (e.g., at end of input); empty if none is open
    std::vector<ControlKind> finish();

    void reset();

    bool is_speaking() const { return is_speaking_; }
    float last_energy() const { return last_energy_; }
    size_t frame_length_samples() const { return frame_length_samples_; }
    const EnergyVadConfig& config() const { return config_; }

    static float calculate_rms(const float* samples, size_t count);

   private:
    // Returns true and sets out_kind on a transition
    bool update_state(bool has_voice, ControlKind& out_kind);

    EnergyVadConfig config_;
    size_t frame_length_samples_ = 0;
    std::vector<float> pending_;

    bool is_speaking_ = false;
    int32_t consecutive_voice_frames_ = 0;
    int32_t consecutive_silent_frames_ = 0;
    float last_energy_ = 0.0f;
};

}  // namespace voxline

#endif  // VOXLINE_FEATURES_VAD_ENERGY_VAD_H
