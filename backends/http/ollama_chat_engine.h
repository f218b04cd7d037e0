#ifndef VOXLINE_OLLAMA_CHAT_ENGINE_H
#define VOXLINE_OLLAMA_CHAT_ENGINE_H

/**
 * Ollama Chat Engine - streaming text generation over Ollama's HTTP API
 *
 * POST {base_url}/api/chat with "stream": true; the response is NDJSON, one
 * object per line carrying message.content, the last one with "done": true.
 */

#include <string>

#include "http_client_slot.h"
#include "voxline/engines/text_generation.h"

namespace voxline {

class OllamaChatEngine : public ILanguageModel {
   public:
    OllamaChatEngine(HttpEngineConfig config, std::string model);

    // ICapability
    std::string name() const override { return "ollama:" + model_; }
    bool is_ready() const override { return !slot_.config().base_url.empty(); }
    void cancel() override { slot_.cancel(); }
    void resume() override { slot_.resume(); }
    nlohmann::json get_config() const override;

    // ILanguageModel
    Error generate_stream(const GenerationRequest& request,
                          const TokenCallback& on_token) override;

    // Request body for a message sequence
    static nlohmann::json build_request(const GenerationRequest& request,
                                        const std::string& default_model);

    /**
     * Handle one NDJSON line.
     *
     * @return false to stop reading (callback declined, "done", or an error
     *         object, which is stored in out_error)
     */
    static bool handle_stream_line(const std::string& line, const TokenCallback& on_token,
                                   bool& out_done, bool& out_stopped, Error& out_error);

   private:
    HttpClientSlot slot_;
    std::string model_;
};

}  // namespace voxline

#endif  // VOXLINE_OLLAMA_CHAT_ENGINE_H
