/**
 * @file capability.h
 * @brief voxline - Base interface for pluggable inference engines
 *
 * Transcription, generation and synthesis engines are opaque services behind
 * these interfaces. A session owns its engine instances; nothing is shared
 * across sessions.
 */

#ifndef VOXLINE_ENGINES_CAPABILITY_H
#define VOXLINE_ENGINES_CAPABILITY_H

#include <nlohmann/json.hpp>
#include <string>

namespace voxline {

enum class CapabilityType {
    STT,              // Speech-to-text
    TEXT_GENERATION,  // Streaming chat completion
    TTS,              // Text-to-speech
    VAD,              // Voice activity detection
};

inline const char* capability_to_string(CapabilityType type) {
    switch (type) {
        case CapabilityType::STT:
            return "stt";
        case CapabilityType::TEXT_GENERATION:
            return "text_generation";
        case CapabilityType::TTS:
            return "tts";
        case CapabilityType::VAD:
            return "vad";
        default:
            return "unknown";
    }
}

class ICapability {
   public:
    virtual ~ICapability() = default;

    virtual CapabilityType type() const = 0;

    // Engine identifier for logs (e.g., "ollama:llama3.2")
    virtual std::string name() const = 0;

    virtual bool is_ready() const = 0;

    /**
     * Abort any in-flight call. Must be safe to call from a thread other than
     * the one blocked in the engine, and must make that call return promptly.
     */
    virtual void cancel() = 0;

    // Clears a previous cancel() before the engine serves a new session
    virtual void resume() {}

    virtual nlohmann::json get_config() const { return {}; }
};

}  // namespace voxline

#endif  // VOXLINE_ENGINES_CAPABILITY_H
