#include "whisper_http_engine.h"

#include <algorithm>
#include <chrono>

#include "voxline/core/audio_utils.h"
#include "voxline/core/logger.h"

namespace voxline {

namespace {

constexpr const char* kBoundary = "voxline-form-boundary-7f3a9c1e";

}  // namespace

WhisperHttpEngine::WhisperHttpEngine(HttpEngineConfig config, std::string path, std::string model)
    : slot_(std::move(config)), path_(std::move(path)), model_(std::move(model)) {}

nlohmann::json WhisperHttpEngine::get_config() const {
    return {{"base_url", slot_.config().base_url},
            {"path", path_},
            {"model", model_},
            {"timeout_sec", slot_.config().timeout_sec}};
}

std::string WhisperHttpEngine::build_multipart_body(const std::vector<FormField>& fields,
                                                    const std::string& boundary) {
    std::string body;
    for (const auto& field : fields) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + field.name + "\"";
        if (!field.filename.empty()) {
            body += "; filename=\"" + field.filename + "\"";
        }
        body += "\r\n";
        if (!field.content_type.empty()) {
            body += "Content-Type: " + field.content_type + "\r\n";
        }
        body += "\r\n";
        body += field.value;
        body += "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

Error WhisperHttpEngine::transcribe(const STTRequest& request, STTResult& out_result) {
    std::vector<int16_t> pcm = float_to_pcm16(request.audio_samples);
    std::vector<uint8_t> pcm_bytes = pcm16_to_bytes(pcm.data(), pcm.size());
    std::vector<uint8_t> wav = build_wav(pcm_bytes.data(), pcm_bytes.size(), request.sample_rate,
                                         static_cast<int16_t>(request.channels));

    std::vector<FormField> fields;
    fields.push_back({"file", std::string(wav.begin(), wav.end()), "audio.wav", "audio/wav"});
    fields.push_back({"response_format", "json", "", ""});
    fields.push_back({"temperature", "0.0", "", ""});
    if (!request.language.empty()) {
        fields.push_back({"language", request.language, "", ""});
    }
    if (path_ != "/inference") {
        fields.push_back({"model", model_, "", ""});
    }

    HttpClientSlot::Lease lease(slot_);
    if (slot_.cancel_requested()) {
        return make_error(ErrorCode::Cancelled, "transcription cancelled");
    }
    auto start = std::chrono::steady_clock::now();
    auto result = lease.client().Post(path_, build_multipart_body(fields, kBoundary),
                                      std::string("multipart/form-data; boundary=") + kBoundary);

    if (slot_.cancel_requested()) {
        return make_error(ErrorCode::Cancelled, "transcription cancelled");
    }
    if (!result) {
        return make_error(ErrorCode::TranscriptionEngineFailure,
                          "request failed: " + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        return make_error(ErrorCode::TranscriptionEngineFailure,
                          "HTTP " + std::to_string(result->status) + ": " + result->body);
    }

    nlohmann::json body = nlohmann::json::parse(result->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return make_error(ErrorCode::TranscriptionEngineFailure, "response is not a JSON object");
    }
    if (body.contains("error")) {
        return make_error(ErrorCode::TranscriptionEngineFailure, body["error"].dump());
    }

    out_result.text = body.contains("text") && body["text"].is_string()
                          ? body["text"].get<std::string>()
                          : std::string();
    if (body.contains("language") && body["language"].is_string()) {
        out_result.detected_language = body["language"].get<std::string>();
    } else {
        out_result.detected_language = request.language;
    }
    out_result.audio_duration_ms = request.sample_rate > 0
                                       ? 1000.0 * static_cast<double>(request.audio_samples.size()) /
                                             (request.sample_rate * std::max(1, request.channels))
                                       : 0.0;
    out_result.inference_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    VOXLINE_LOG_DEBUG("STT", "Server transcription: %s", out_result.to_json().dump().c_str());
    return Error{};
}

}  // namespace voxline
