#ifndef VOXLINE_ENGINES_TTS_H
#define VOXLINE_ENGINES_TTS_H

#include <cstdint>
#include <functional>
#include <vector>

#include "voxline/core/error.h"
#include "voxline/engines/capability.h"

namespace voxline {

// TTS synthesis request
struct TTSRequest {
    std::string text;
    std::string voice_id;
    std::string model_id;
    float speed_rate = 1.0f;  // 0.5 = half speed, 2.0 = double speed
};

// Receives PCM16 audio as it is produced; return false to cancel
using TTSAudioCallback =
    std::function<bool(const std::vector<int16_t>& pcm16, int sample_rate, int channels)>;

// Text-to-Speech engine interface
class ISpeechSynthesizer : public ICapability {
   public:
    CapabilityType type() const override { return CapabilityType::TTS; }

    /**
     * Synthesize text, delivering audio in one or more chunks, in order.
     */
    virtual Error synthesize(const TTSRequest& request, const TTSAudioCallback& on_audio) = 0;
};

}  // namespace voxline

#endif  // VOXLINE_ENGINES_TTS_H
