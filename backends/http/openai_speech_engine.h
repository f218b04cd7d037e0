#ifndef VOXLINE_OPENAI_SPEECH_ENGINE_H
#define VOXLINE_OPENAI_SPEECH_ENGINE_H

/**
 * OpenAI-compatible Speech Engine - text-to-speech over HTTP
 *
 * POST {base_url}/v1/audio/speech with "response_format": "pcm". Servers such
 * as Kokoro-FastAPI stream raw 16-bit mono PCM back (24 kHz by default).
 */

#include <string>

#include "http_client_slot.h"
#include "voxline/engines/tts.h"

namespace voxline {

class OpenAISpeechEngine : public ISpeechSynthesizer {
   public:
    OpenAISpeechEngine(HttpEngineConfig config, int output_sample_rate = 24000);

    // ICapability
    std::string name() const override { return "openai-speech:" + slot_.config().base_url; }
    bool is_ready() const override { return !slot_.config().base_url.empty(); }
    void cancel() override { slot_.cancel(); }
    void resume() override { slot_.resume(); }
    nlohmann::json get_config() const override;

    // ISpeechSynthesizer
    Error synthesize(const TTSRequest& request, const TTSAudioCallback& on_audio) override;

    static nlohmann::json build_request(const TTSRequest& request);

   private:
    HttpClientSlot slot_;
    int output_sample_rate_;
};

}  // namespace voxline

#endif  // VOXLINE_OPENAI_SPEECH_ENGINE_H
