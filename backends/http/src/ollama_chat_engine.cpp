#include "ollama_chat_engine.h"

#include "voxline/core/logger.h"

namespace voxline {

OllamaChatEngine::OllamaChatEngine(HttpEngineConfig config, std::string model)
    : slot_(std::move(config)), model_(std::move(model)) {}

nlohmann::json OllamaChatEngine::get_config() const {
    return {{"base_url", slot_.config().base_url},
            {"model", model_},
            {"timeout_sec", slot_.config().timeout_sec}};
}

nlohmann::json OllamaChatEngine::build_request(const GenerationRequest& request,
                                               const std::string& default_model) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : request.messages) {
        messages.push_back({{"role", role_name(message.role)}, {"content", message.content}});
    }

    return {{"model", request.model.empty() ? default_model : request.model},
            {"messages", messages},
            {"stream", true},
            {"options", {{"temperature", request.temperature}, {"num_predict", request.max_tokens}}}};
}

bool OllamaChatEngine::handle_stream_line(const std::string& line, const TokenCallback& on_token,
                                          bool& out_done, bool& out_stopped, Error& out_error) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return true;
    }

    nlohmann::json chunk = nlohmann::json::parse(line, nullptr, false);
    if (chunk.is_discarded()) {
        out_error = make_error(ErrorCode::GenerationEngineFailure, "malformed stream line: " + line);
        return false;
    }

    if (chunk.contains("error")) {
        std::string message =
            chunk["error"].is_string() ? chunk["error"].get<std::string>() : chunk["error"].dump();
        out_error = make_error(ErrorCode::GenerationEngineFailure, message);
        return false;
    }

    if (chunk.contains("message") && chunk["message"].is_object()) {
        const auto& message = chunk["message"];
        if (message.contains("content") && message["content"].is_string()) {
            std::string content = message["content"].get<std::string>();
            if (!content.empty() && !on_token(content)) {
                out_stopped = true;
                return false;
            }
        }
    }

    if (chunk.contains("done") && chunk["done"].is_boolean() && chunk["done"].get<bool>()) {
        out_done = true;
        return false;
    }
    return true;
}

Error OllamaChatEngine::generate_stream(const GenerationRequest& request,
                                        const TokenCallback& on_token) {
    HttpClientSlot::Lease lease(slot_);
    if (slot_.cancel_requested()) {
        return make_error(ErrorCode::GenerationCancelled);
    }

    httplib::Request http_request;
    http_request.method = "POST";
    http_request.path = "/api/chat";
    http_request.set_header("Content-Type", "application/json");
    http_request.body = build_request(request, model_).dump();

    std::string pending;
    bool done = false;
    bool stopped = false;
    Error stream_error;

    http_request.content_receiver = [&](const char* data, size_t length, uint64_t /*offset*/,
                                        uint64_t /*total*/) {
        if (slot_.cancel_requested()) {
            stopped = true;
            return false;
        }
        pending.append(data, length);
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!handle_stream_line(line, on_token, done, stopped, stream_error)) {
                return false;
            }
        }
        return true;
    };

    VOXLINE_LOG_DEBUG("LLM", "POST %s/api/chat (%zu messages)", slot_.config().base_url.c_str(),
                      request.messages.size());

    httplib::Response response;
    httplib::Error transport_error = httplib::Error::Success;
    bool sent = lease.client().send(http_request, response, transport_error);

    // A final line without a trailing newline
    if (sent && !done && !stopped && stream_error.ok() && !pending.empty()) {
        handle_stream_line(pending, on_token, done, stopped, stream_error);
    }

    if (stopped || slot_.cancel_requested()) {
        return make_error(ErrorCode::GenerationCancelled);
    }
    if (!stream_error.ok()) {
        return stream_error;
    }
    if (done) {
        return Error{};
    }
    if (!sent) {
        return make_error(ErrorCode::GenerationEngineFailure,
                          "request failed: " + httplib::to_string(transport_error));
    }
    if (response.status != 200) {
        return make_error(ErrorCode::GenerationEngineFailure,
                          "HTTP " + std::to_string(response.status));
    }
    return make_error(ErrorCode::GenerationEngineFailure, "stream ended before completion");
}

}  // namespace voxline
