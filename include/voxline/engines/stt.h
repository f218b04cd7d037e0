#ifndef VOXLINE_ENGINES_STT_H
#define VOXLINE_ENGINES_STT_H

#include <vector>

#include "voxline/core/error.h"
#include "voxline/engines/capability.h"

namespace voxline {

// Transcription request
struct STTRequest {
    std::vector<float> audio_samples;  // Float32 samples [-1.0, 1.0]
    int sample_rate = 16000;
    int channels = 1;
    std::string language = "en";  // ISO 639-1 hint
};

// Transcription result
struct STTResult {
    std::string text;
    std::string detected_language;
    double audio_duration_ms = 0.0;
    double inference_time_ms = 0.0;

    nlohmann::json to_json() const {
        return {{"text", text},
                {"detected_language", detected_language},
                {"audio_duration_ms", audio_duration_ms},
                {"inference_time_ms", inference_time_ms}};
    }
};

// Speech-to-Text engine interface
class ISpeechToText : public ICapability {
   public:
    CapabilityType type() const override { return CapabilityType::STT; }

    /**
     * Batch transcription of one utterance.
     *
     * @return a Transcription-category error on failure; an empty result text
     *         with success is a valid "nothing recognized" answer
     */
    virtual Error transcribe(const STTRequest& request, STTResult& out_result) = 0;
};

}  // namespace voxline

#endif  // VOXLINE_ENGINES_STT_H
