/**
 * @file error.h
 * @brief voxline - Error codes and structured errors
 *
 * Error codes are grouped in numeric ranges, one range per category:
 *
 *   -100 .. -119  Configuration   (fatal at session creation)
 *   -120 .. -139  Transcription   (absorbed, utterance discarded)
 *   -140 .. -159  Generation      (absorbed, fallback reply spoken)
 *   -160 .. -179  Synthesis       (absorbed, phrase dropped)
 *   -180 .. -199  Transport       (fatal to the session)
 *   -200 .. -219  Internal
 */

#ifndef VOXLINE_CORE_ERROR_H
#define VOXLINE_CORE_ERROR_H

#include <cstdint>
#include <string>

namespace voxline {

enum class ErrorCode : int32_t {
    Success = 0,

    // Configuration
    ConfigInvalid = -100,
    ConfigFileNotFound = -101,
    BotNotFound = -102,
    BotPromptEmpty = -103,
    EngineMissing = -104,
    EndpointMissing = -105,

    // Transcription
    TranscriptionEmptyResult = -120,
    TranscriptionEngineFailure = -121,
    TranscriptionMalformedAudio = -122,

    // Generation
    GenerationEngineFailure = -140,
    GenerationCancelled = -141,
    GenerationEmptyResponse = -142,

    // Synthesis
    SynthesisEngineFailure = -160,
    SynthesisCancelled = -161,

    // Transport
    TransportDisconnected = -180,
    TransportSendFailed = -181,

    // Internal
    InvalidArgument = -200,
    InvalidState = -201,
    Cancelled = -202,
    Internal = -203,
};

enum class ErrorCategory {
    None,
    Configuration,
    Transcription,
    Generation,
    Synthesis,
    Transport,
    Internal,
};

/**
 * @brief Structured error: code, category and a human-readable message.
 *
 * A default-constructed Error means success.
 */
struct Error {
    ErrorCode code = ErrorCode::Success;
    ErrorCategory category = ErrorCategory::None;
    std::string message;

    bool ok() const { return code == ErrorCode::Success; }

    // Fatal errors terminate the session (configuration and transport)
    bool is_fatal() const {
        return category == ErrorCategory::Configuration || category == ErrorCategory::Transport;
    }

    std::string to_string() const;
};

/**
 * @brief Build a structured error; the category is derived from the code range.
 */
Error make_error(ErrorCode code, const std::string& message = "");

/**
 * @brief Category for a code, derived from its numeric range.
 */
ErrorCategory error_category(ErrorCode code);

const char* error_category_name(ErrorCategory category);

/**
 * @brief Default message for a code.
 */
const char* error_code_message(ErrorCode code);

}  // namespace voxline

#endif  // VOXLINE_CORE_ERROR_H
