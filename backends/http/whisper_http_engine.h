#ifndef VOXLINE_WHISPER_HTTP_ENGINE_H
#define VOXLINE_WHISPER_HTTP_ENGINE_H

/**
 * Whisper HTTP Engine - batch speech-to-text over HTTP
 *
 * Uploads the utterance as a 16-bit WAV file (multipart/form-data) to either
 * a whisper.cpp server ("/inference") or an OpenAI-compatible endpoint
 * ("/v1/audio/transcriptions"). Both answer {"text": "..."}.
 */

#include <string>
#include <vector>

#include "http_client_slot.h"
#include "voxline/engines/stt.h"

namespace voxline {

class WhisperHttpEngine : public ISpeechToText {
   public:
    WhisperHttpEngine(HttpEngineConfig config, std::string path = "/inference",
                      std::string model = "whisper-1");

    // ICapability
    std::string name() const override { return "whisper-http:" + slot_.config().base_url + path_; }
    bool is_ready() const override { return !slot_.config().base_url.empty(); }
    void cancel() override { slot_.cancel(); }
    void resume() override { slot_.resume(); }
    nlohmann::json get_config() const override;

    // ISpeechToText
    Error transcribe(const STTRequest& request, STTResult& out_result) override;

    struct FormField {
        std::string name;
        std::string value;
        std::string filename;      // set for file parts
        std::string content_type;  // set for file parts
    };

    static std::string build_multipart_body(const std::vector<FormField>& fields,
                                            const std::string& boundary);

   private:
    HttpClientSlot slot_;
    std::string path_;
    std::string model_;
};

}  // namespace voxline

#endif  // VOXLINE_WHISPER_HTTP_ENGINE_H
