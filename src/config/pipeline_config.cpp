/**
 * @file pipeline_config.cpp
 * @brief voxline - Session configuration
 */

#include "voxline/config/pipeline_config.h"

#include <fstream>
#include <type_traits>

#include "voxline/core/logger.h"

namespace voxline {

using Json = nlohmann::json;

#define VOXLINE_CONFIG_CHECK(expr)    \
    do {                              \
        Error config_error_ = (expr); \
        if (!config_error_.ok()) {    \
            return config_error_;     \
        }                             \
    } while (0)

namespace {

template <typename T>
bool type_matches(const Json& value) {
    if constexpr (std::is_same_v<T, std::string>) {
        return value.is_string();
    } else if constexpr (std::is_same_v<T, bool>) {
        return value.is_boolean();
    } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
        return value.is_number_unsigned();
    } else if constexpr (std::is_integral_v<T>) {
        return value.is_number_integer();
    } else {
        return value.is_number();
    }
}

template <typename T>
const char* type_label() {
    if constexpr (std::is_same_v<T, std::string>) {
        return "a string";
    } else if constexpr (std::is_same_v<T, bool>) {
        return "a boolean";
    } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
        return "a non-negative integer";
    } else if constexpr (std::is_integral_v<T>) {
        return "an integer";
    } else {
        return "a number";
    }
}

std::string qualify(const char* section, const char* key) {
    if (section == nullptr || section[0] == '\0') {
        return key;
    }
    return std::string(section) + "." + key;
}

// Absent keys leave out untouched
template <typename T>
Error read_field(const Json& object, const char* section, const char* key, T& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return Error{};
    }
    if (!type_matches<T>(*it)) {
        return make_error(ErrorCode::ConfigInvalid,
                          "'" + qualify(section, key) + "' must be " + type_label<T>());
    }
    out = it->template get<T>();
    return Error{};
}

Error read_section(const Json& root, const char* section, const Json*& out) {
    out = nullptr;
    auto it = root.find(section);
    if (it == root.end() || it->is_null()) {
        return Error{};
    }
    if (!it->is_object()) {
        return make_error(ErrorCode::ConfigInvalid,
                          std::string("'") + section + "' must be an object");
    }
    out = &*it;
    return Error{};
}

}  // namespace

// =============================================================================
// GREETING MODE
// =============================================================================

const char* greeting_mode_name(GreetingMode mode) {
    switch (mode) {
        case GreetingMode::None:
            return "none";
        case GreetingMode::Static:
            return "static";
        case GreetingMode::Generate:
            return "generate";
    }
    return "unknown";
}

bool parse_greeting_mode(const std::string& name, GreetingMode& out_mode) {
    if (name == "none") {
        out_mode = GreetingMode::None;
    } else if (name == "static") {
        out_mode = GreetingMode::Static;
    } else if (name == "generate") {
        out_mode = GreetingMode::Generate;
    } else {
        return false;
    }
    return true;
}

// =============================================================================
// PARSING
// =============================================================================

PipelineConfig::PipelineConfig() {
    generation.model = "llama3.2";
    synthesis.model_id = "tts-1";
    synthesis.voice_id = "af_sarah";
}

Error parse_pipeline_config(const Json& json, PipelineConfig& config) {
    if (!json.is_object()) {
        return make_error(ErrorCode::ConfigInvalid, "configuration root must be an object");
    }

    VOXLINE_CONFIG_CHECK(read_field(json, "", "bot", config.bot_name));
    VOXLINE_CONFIG_CHECK(read_field(json, "", "bots_dir", config.bots_dir));
    VOXLINE_CONFIG_CHECK(read_field(json, "", "system_prompt", config.system_prompt));
    VOXLINE_CONFIG_CHECK(read_field(json, "", "log_level", config.log_level));

    const Json* section = nullptr;

    VOXLINE_CONFIG_CHECK(read_section(json, "utterance", section));
    if (section) {
        auto& u = config.utterance;
        VOXLINE_CONFIG_CHECK(
            read_field(*section, "utterance", "flush_threshold_bytes", u.flush_threshold_bytes));
        VOXLINE_CONFIG_CHECK(
            read_field(*section, "utterance", "max_utterance_bytes", u.max_utterance_bytes));
        VOXLINE_CONFIG_CHECK(read_field(*section, "utterance", "vad_enabled", u.vad_enabled));
    }

    VOXLINE_CONFIG_CHECK(read_section(json, "vad", section));
    if (section) {
        auto& v = config.energy_vad;
        VOXLINE_CONFIG_CHECK(read_field(*section, "vad", "enabled", config.energy_vad_enabled));
        VOXLINE_CONFIG_CHECK(read_field(*section, "vad", "energy_threshold", v.energy_threshold));
        VOXLINE_CONFIG_CHECK(read_field(*section, "vad", "frame_length_sec", v.frame_length_sec));
        VOXLINE_CONFIG_CHECK(
            read_field(*section, "vad", "voice_start_frames", v.voice_start_frames));
        VOXLINE_CONFIG_CHECK(read_field(*section, "vad", "voice_end_frames", v.voice_end_frames));
    }

    VOXLINE_CONFIG_CHECK(read_section(json, "stt", section));
    if (section) {
        VOXLINE_CONFIG_CHECK(read_field(*section, "stt", "url", config.endpoints.stt_url));
        VOXLINE_CONFIG_CHECK(read_field(*section, "stt", "path", config.endpoints.stt_path));
        VOXLINE_CONFIG_CHECK(
            read_field(*section, "stt", "language", config.transcription.language));
    }

    VOXLINE_CONFIG_CHECK(read_section(json, "llm", section));
    if (section) {
        auto& g = config.generation;
        VOXLINE_CONFIG_CHECK(read_field(*section, "llm", "url", config.endpoints.llm_url));
        VOXLINE_CONFIG_CHECK(read_field(*section, "llm", "model", g.model));
        VOXLINE_CONFIG_CHECK(read_field(*section, "llm", "max_tokens", g.max_tokens));
        VOXLINE_CONFIG_CHECK(read_field(*section, "llm", "temperature", g.temperature));
        VOXLINE_CONFIG_CHECK(read_field(*section, "llm", "fallback_reply", g.fallback_reply));
    }

    VOXLINE_CONFIG_CHECK(read_section(json, "tts", section));
    if (section) {
        auto& s = config.synthesis;
        VOXLINE_CONFIG_CHECK(read_field(*section, "tts", "url", config.endpoints.tts_url));
        VOXLINE_CONFIG_CHECK(read_field(*section, "tts", "model", s.model_id));
        VOXLINE_CONFIG_CHECK(read_field(*section, "tts", "voice", s.voice_id));
        VOXLINE_CONFIG_CHECK(read_field(*section, "tts", "speed", s.speed));
        VOXLINE_CONFIG_CHECK(read_field(*section, "tts", "min_phrase_chars", s.min_phrase_chars));
        VOXLINE_CONFIG_CHECK(read_field(*section, "tts", "max_phrase_chars", s.max_phrase_chars));
    }

    VOXLINE_CONFIG_CHECK(read_section(json, "greeting", section));
    if (section) {
        std::string mode_name = greeting_mode_name(config.greeting.mode);
        VOXLINE_CONFIG_CHECK(read_field(*section, "greeting", "mode", mode_name));
        if (!parse_greeting_mode(mode_name, config.greeting.mode)) {
            return make_error(ErrorCode::ConfigInvalid,
                              "'greeting.mode' must be one of none, static, generate (got '" +
                                  mode_name + "')");
        }
        VOXLINE_CONFIG_CHECK(read_field(*section, "greeting", "text", config.greeting.text));
    }

    VOXLINE_CONFIG_CHECK(read_section(json, "http", section));
    if (section) {
        VOXLINE_CONFIG_CHECK(
            read_field(*section, "http", "timeout_sec", config.endpoints.timeout_sec));
    }

    return Error{};
}

Error load_pipeline_config(const std::string& path, PipelineConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error(ErrorCode::ConfigFileNotFound, "cannot open config file: " + path);
    }

    Json json;
    try {
        json = Json::parse(file);
    } catch (const Json::parse_error& e) {
        return make_error(ErrorCode::ConfigInvalid,
                          "malformed JSON in " + path + ": " + e.what());
    }

    Error error = parse_pipeline_config(json, config);
    if (!error.ok()) {
        error.message = path + ": " + error.message;
        return error;
    }
    VOXLINE_LOG_DEBUG("Config", "Loaded configuration from %s", path.c_str());
    return Error{};
}

Error validate_pipeline_config(const PipelineConfig& config) {
    if (config.utterance.flush_threshold_bytes == 0) {
        return make_error(ErrorCode::ConfigInvalid, "utterance.flush_threshold_bytes must be > 0");
    }
    if (config.utterance.max_utterance_bytes < config.utterance.flush_threshold_bytes) {
        return make_error(ErrorCode::ConfigInvalid,
                          "utterance.max_utterance_bytes must be >= flush_threshold_bytes");
    }
    if (config.energy_vad.frame_length_sec <= 0.0f || config.energy_vad.energy_threshold < 0.0f) {
        return make_error(ErrorCode::ConfigInvalid,
                          "vad.frame_length_sec must be > 0 and vad.energy_threshold >= 0");
    }
    if (config.generation.max_tokens <= 0) {
        return make_error(ErrorCode::ConfigInvalid, "llm.max_tokens must be > 0");
    }
    if (config.generation.temperature < 0.0f) {
        return make_error(ErrorCode::ConfigInvalid, "llm.temperature must be >= 0");
    }
    if (config.synthesis.speed <= 0.0f) {
        return make_error(ErrorCode::ConfigInvalid, "tts.speed must be > 0");
    }
    if (config.synthesis.max_phrase_chars == 0 ||
        config.synthesis.min_phrase_chars > config.synthesis.max_phrase_chars) {
        return make_error(ErrorCode::ConfigInvalid,
                          "tts.min_phrase_chars must not exceed tts.max_phrase_chars");
    }
    if (config.greeting.mode == GreetingMode::Static && config.greeting.text.empty()) {
        return make_error(ErrorCode::ConfigInvalid, "greeting.text is required for static mode");
    }
    if (config.endpoints.timeout_sec <= 0) {
        return make_error(ErrorCode::ConfigInvalid, "http.timeout_sec must be > 0");
    }
    LogLevel level;
    if (!Logger::parseLevel(config.log_level.c_str(), &level)) {
        return make_error(ErrorCode::ConfigInvalid, "unknown log_level '" + config.log_level + "'");
    }
    return Error{};
}

nlohmann::json pipeline_config_to_json(const PipelineConfig& config) {
    return Json{
        {"bot", config.bot_name},
        {"bots_dir", config.bots_dir},
        {"system_prompt", config.system_prompt},
        {"log_level", config.log_level},
        {"utterance",
         {{"flush_threshold_bytes", config.utterance.flush_threshold_bytes},
          {"max_utterance_bytes", config.utterance.max_utterance_bytes},
          {"vad_enabled", config.utterance.vad_enabled}}},
        {"vad",
         {{"enabled", config.energy_vad_enabled},
          {"energy_threshold", config.energy_vad.energy_threshold},
          {"frame_length_sec", config.energy_vad.frame_length_sec},
          {"voice_start_frames", config.energy_vad.voice_start_frames},
          {"voice_end_frames", config.energy_vad.voice_end_frames}}},
        {"stt",
         {{"url", config.endpoints.stt_url},
          {"path", config.endpoints.stt_path},
          {"language", config.transcription.language}}},
        {"llm",
         {{"url", config.endpoints.llm_url},
          {"model", config.generation.model},
          {"max_tokens", config.generation.max_tokens},
          {"temperature", config.generation.temperature},
          {"fallback_reply", config.generation.fallback_reply}}},
        {"tts",
         {{"url", config.endpoints.tts_url},
          {"model", config.synthesis.model_id},
          {"voice", config.synthesis.voice_id},
          {"speed", config.synthesis.speed},
          {"min_phrase_chars", config.synthesis.min_phrase_chars},
          {"max_phrase_chars", config.synthesis.max_phrase_chars}}},
        {"greeting",
         {{"mode", greeting_mode_name(config.greeting.mode)}, {"text", config.greeting.text}}},
        {"http", {{"timeout_sec", config.endpoints.timeout_sec}}},
    };
}

}  // namespace voxline
