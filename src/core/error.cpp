/**
 * @file error.cpp
 * @brief voxline - Structured error implementation
 */

#include "voxline/core/error.h"

namespace voxline {

// ------------------------------------------------------------
// Category from error code range
// ------------------------------------------------------------
ErrorCategory error_category(ErrorCode code) {
    const int32_t value = static_cast<int32_t>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= -119 && value <= -100) return ErrorCategory::Configuration;
    if (value >= -139 && value <= -120) return ErrorCategory::Transcription;
    if (value >= -159 && value <= -140) return ErrorCategory::Generation;
    if (value >= -179 && value <= -160) return ErrorCategory::Synthesis;
    if (value >= -199 && value <= -180) return ErrorCategory::Transport;
    return ErrorCategory::Internal;
}

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:
            return "None";
        case ErrorCategory::Configuration:
            return "ConfigurationError";
        case ErrorCategory::Transcription:
            return "TranscriptionError";
        case ErrorCategory::Generation:
            return "GenerationError";
        case ErrorCategory::Synthesis:
            return "SynthesisError";
        case ErrorCategory::Transport:
            return "TransportError";
        case ErrorCategory::Internal:
            return "InternalError";
    }
    return "Unknown";
}

const char* error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::ConfigInvalid:
            return "Invalid configuration";
        case ErrorCode::ConfigFileNotFound:
            return "Configuration file not found";
        case ErrorCode::BotNotFound:
            return "Bot personality not found";
        case ErrorCode::BotPromptEmpty:
            return "Bot personality file is empty";
        case ErrorCode::EngineMissing:
            return "Required engine not provided";
        case ErrorCode::EndpointMissing:
            return "Engine endpoint not configured";
        case ErrorCode::TranscriptionEmptyResult:
            return "Transcription produced no text";
        case ErrorCode::TranscriptionEngineFailure:
            return "Speech-to-text engine failure";
        case ErrorCode::TranscriptionMalformedAudio:
            return "Malformed utterance audio";
        case ErrorCode::GenerationEngineFailure:
            return "Language model engine failure";
        case ErrorCode::GenerationCancelled:
            return "Generation cancelled";
        case ErrorCode::GenerationEmptyResponse:
            return "Language model returned an empty response";
        case ErrorCode::SynthesisEngineFailure:
            return "Text-to-speech engine failure";
        case ErrorCode::SynthesisCancelled:
            return "Synthesis cancelled";
        case ErrorCode::TransportDisconnected:
            return "Transport disconnected";
        case ErrorCode::TransportSendFailed:
            return "Transport send failed";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::Internal:
            return "Internal error";
    }
    return "Unknown error";
}

Error make_error(ErrorCode code, const std::string& message) {
    Error error;
    error.code = code;
    error.category = error_category(code);
    error.message = message.empty() ? error_code_message(code) : message;
    return error;
}

std::string Error::to_string() const {
    if (ok()) {
        return "Success";
    }
    return std::string(error_category_name(category)) + " (" +
           std::to_string(static_cast<int32_t>(code)) + "): " + message;
}

}  // namespace voxline
