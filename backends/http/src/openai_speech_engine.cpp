#include "openai_speech_engine.h"

#include <cstring>
#include <vector>

#include "voxline/core/logger.h"

namespace voxline {

OpenAISpeechEngine::OpenAISpeechEngine(HttpEngineConfig config, int output_sample_rate)
    : slot_(std::move(config)), output_sample_rate_(output_sample_rate) {}

nlohmann::json OpenAISpeechEngine::get_config() const {
    return {{"base_url", slot_.config().base_url},
            {"sample_rate", output_sample_rate_},
            {"timeout_sec", slot_.config().timeout_sec}};
}

nlohmann::json OpenAISpeechEngine::build_request(const TTSRequest& request) {
    nlohmann::json body = {{"input", request.text},
                           {"response_format", "pcm"},
                           {"speed", request.speed_rate}};
    if (!request.model_id.empty()) {
        body["model"] = request.model_id;
    }
    if (!request.voice_id.empty()) {
        body["voice"] = request.voice_id;
    }
    return body;
}

Error OpenAISpeechEngine::synthesize(const TTSRequest& request, const TTSAudioCallback& on_audio) {
    HttpClientSlot::Lease lease(slot_);
    if (slot_.cancel_requested()) {
        return make_error(ErrorCode::SynthesisCancelled);
    }

    httplib::Request http_request;
    http_request.method = "POST";
    http_request.path = "/v1/audio/speech";
    http_request.set_header("Content-Type", "application/json");
    http_request.body = build_request(request).dump();

    // Network reads do not respect sample boundaries
    std::vector<uint8_t> carry;
    bool stopped = false;
    size_t total_samples = 0;

    http_request.content_receiver = [&](const char* data, size_t length, uint64_t /*offset*/,
                                        uint64_t /*total*/) {
        if (slot_.cancel_requested()) {
            stopped = true;
            return false;
        }
        carry.insert(carry.end(), data, data + length);
        size_t sample_count = carry.size() / 2;
        if (sample_count == 0) {
            return true;
        }

        std::vector<int16_t> pcm(sample_count);
        for (size_t i = 0; i < sample_count; ++i) {
            pcm[i] = static_cast<int16_t>(static_cast<uint16_t>(carry[2 * i]) |
                                          (static_cast<uint16_t>(carry[2 * i + 1]) << 8));
        }
        carry.erase(carry.begin(), carry.begin() + static_cast<std::ptrdiff_t>(sample_count * 2));
        total_samples += sample_count;

        if (!on_audio(pcm, output_sample_rate_, 1)) {
            stopped = true;
            return false;
        }
        return true;
    };

    httplib::Response response;
    httplib::Error transport_error = httplib::Error::Success;
    bool sent = lease.client().send(http_request, response, transport_error);

    if (stopped || slot_.cancel_requested()) {
        return make_error(ErrorCode::SynthesisCancelled);
    }
    if (!sent) {
        return make_error(ErrorCode::SynthesisEngineFailure,
                          "request failed: " + httplib::to_string(transport_error));
    }
    if (response.status != 200) {
        return make_error(ErrorCode::SynthesisEngineFailure,
                          "HTTP " + std::to_string(response.status));
    }
    if (total_samples == 0) {
        return make_error(ErrorCode::SynthesisEngineFailure, "server returned no audio");
    }

    VOXLINE_LOG_DEBUG("TTS", "Received %zu samples @ %d Hz", total_samples, output_sample_rate_);
    return Error{};
}

}  // namespace voxline
