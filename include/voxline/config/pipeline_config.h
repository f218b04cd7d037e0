/**
 * @file pipeline_config.h
 * @brief voxline - Session configuration
 *
 * Everything a session needs besides its engines and transport. Loaded from
 * JSON; keys that are absent keep their defaults, unknown keys are ignored,
 * and a key with the wrong type is a configuration error.
 *
 * {
 *   "bot": "chatbot", "bots_dir": "bots", "system_prompt": "", "log_level": "info",
 *   "utterance": {"flush_threshold_bytes": 32000, "max_utterance_bytes": 1920000,
 *                 "vad_enabled": false},
 *   "vad":       {"enabled": false, "energy_threshold": 0.015, "frame_length_sec": 0.03,
 *                 "voice_start_frames": 2, "voice_end_frames": 20},
 *   "stt":       {"url": "...", "path": "/inference", "language": "en"},
 *   "llm":       {"url": "...", "model": "llama3.2", "max_tokens": 256,
 *                 "temperature": 0.7, "fallback_reply": "..."},
 *   "tts":       {"url": "...", "model": "tts-1", "voice": "af_sarah", "speed": 1.0,
 *                 "min_phrase_chars": 12, "max_phrase_chars": 240},
 *   "greeting":  {"mode": "none|static|generate", "text": "..."},
 *   "http":      {"timeout_sec": 60}
 * }
 */

#ifndef VOXLINE_CONFIG_PIPELINE_CONFIG_H
#define VOXLINE_CONFIG_PIPELINE_CONFIG_H

#include <nlohmann/json.hpp>
#include <string>

#include "voxline/core/error.h"
#include "voxline/features/llm/generation_stage.h"
#include "voxline/features/stt/transcription_stage.h"
#include "voxline/features/tts/synthesis_stage.h"
#include "voxline/features/vad/energy_vad.h"
#include "voxline/pipeline/utterance_buffer.h"

namespace voxline {

enum class GreetingMode {
    None,      // wait for the user to speak first
    Static,    // speak greeting.text verbatim
    Generate,  // run a completion over the system prompt alone
};

const char* greeting_mode_name(GreetingMode mode);
bool parse_greeting_mode(const std::string& name, GreetingMode& out_mode);

struct GreetingConfig {
    GreetingMode mode = GreetingMode::None;
    std::string text = "Hello! How can I help you today?";
};

// Service endpoints for the HTTP engines
struct EndpointConfig {
    std::string stt_url = "http://localhost:8080";
    std::string stt_path = "/inference";
    std::string llm_url = "http://localhost:11434";
    std::string tts_url = "http://localhost:8000";
    int timeout_sec = 60;
};

struct PipelineConfig {
    std::string bot_name;           // empty selects the default prompt
    std::string bots_dir = "bots";
    std::string system_prompt;      // overrides the bot lookup when set
    std::string log_level = "info";

    UtteranceBufferConfig utterance;
    bool energy_vad_enabled = false;
    EnergyVadConfig energy_vad;

    TranscriptionConfig transcription;
    GenerationConfig generation;
    SynthesisConfig synthesis;
    GreetingConfig greeting;
    EndpointConfig endpoints;

    PipelineConfig();
};

/**
 * @brief Overlay JSON values onto config.
 *
 * @return ConfigInvalid naming the offending key on a type or value error
 */
Error parse_pipeline_config(const nlohmann::json& json, PipelineConfig& config);

/**
 * @brief Read and parse a JSON config file.
 *
 * @return ConfigFileNotFound, ConfigInvalid (malformed JSON or bad value)
 */
Error load_pipeline_config(const std::string& path, PipelineConfig& config);

/**
 * @brief Range checks on a fully assembled config.
 */
Error validate_pipeline_config(const PipelineConfig& config);

nlohmann::json pipeline_config_to_json(const PipelineConfig& config);

}  // namespace voxline

#endif  // VOXLINE_CONFIG_PIPELINE_CONFIG_H
