/**
 * @file test_pipeline_config.cpp
 * @brief Tests for JSON configuration loading and validation
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "voxline/config/pipeline_config.h"

using namespace voxline;
using Json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

}  // namespace

TEST(PipelineConfig, Defaults) {
    PipelineConfig config;
    EXPECT_EQ(config.generation.model, "llama3.2");
    EXPECT_EQ(config.synthesis.model_id, "tts-1");
    EXPECT_EQ(config.synthesis.voice_id, "af_sarah");
    EXPECT_EQ(config.utterance.flush_threshold_bytes, 32000u);
    EXPECT_EQ(config.endpoints.llm_url, "http://localhost:11434");
    EXPECT_EQ(config.endpoints.stt_path, "/inference");
    EXPECT_EQ(config.greeting.mode, GreetingMode::None);
    EXPECT_TRUE(validate_pipeline_config(config).ok());
}

TEST(PipelineConfig, ParsesSections) {
    Json json = Json::parse(R"({
        "bot": "tutor",
        "log_level": "debug",
        "utterance": {"flush_threshold_bytes": 16000},
        "vad": {"enabled": true, "voice_end_frames": 10},
        "stt": {"url": "http://stt:9000", "language": "de"},
        "llm": {"model": "mistral", "max_tokens": 128, "temperature": 0.2},
        "tts": {"voice": "bf_emma", "speed": 1.25, "min_phrase_chars": 4},
        "greeting": {"mode": "static", "text": "Welcome back."},
        "http": {"timeout_sec": 15},
        "unknown_key": [1, 2, 3]
    })");

    PipelineConfig config;
    Error error = parse_pipeline_config(json, config);
    ASSERT_TRUE(error.ok()) << error.to_string();

    EXPECT_EQ(config.bot_name, "tutor");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.utterance.flush_threshold_bytes, 16000u);
    EXPECT_TRUE(config.energy_vad_enabled);
    EXPECT_EQ(config.energy_vad.voice_end_frames, 10);
    EXPECT_EQ(config.endpoints.stt_url, "http://stt:9000");
    EXPECT_EQ(config.transcription.language, "de");
    EXPECT_EQ(config.generation.model, "mistral");
    EXPECT_EQ(config.generation.max_tokens, 128);
    EXPECT_FLOAT_EQ(config.generation.temperature, 0.2f);
    EXPECT_EQ(config.synthesis.voice_id, "bf_emma");
    EXPECT_FLOAT_EQ(config.synthesis.speed, 1.25f);
    EXPECT_EQ(config.synthesis.min_phrase_chars, 4u);
    EXPECT_EQ(config.greeting.mode, GreetingMode::Static);
    EXPECT_EQ(config.greeting.text, "Welcome back.");
    EXPECT_EQ(config.endpoints.timeout_sec, 15);
    // Untouched keys keep defaults
    EXPECT_EQ(config.endpoints.llm_url, "http://localhost:11434");
    EXPECT_EQ(config.synthesis.model_id, "tts-1");
}

TEST(PipelineConfig, WrongTypeNamesKey) {
    PipelineConfig config;
    Error error = parse_pipeline_config(Json::parse(R"({"llm": {"max_tokens": "many"}})"), config);
    EXPECT_EQ(error.code, ErrorCode::ConfigInvalid);
    EXPECT_NE(error.message.find("'llm.max_tokens' must be an integer"), std::string::npos);

    error = parse_pipeline_config(Json::parse(R"({"tts": "loud"})"), config);
    EXPECT_EQ(error.code, ErrorCode::ConfigInvalid);
    EXPECT_NE(error.message.find("'tts' must be an object"), std::string::npos);

    error = parse_pipeline_config(Json::parse(R"({"utterance": {"flush_threshold_bytes": -1}})"),
                                  config);
    EXPECT_EQ(error.code, ErrorCode::ConfigInvalid);
}

TEST(PipelineConfig, RejectsNonObjectRoot) {
    PipelineConfig config;
    EXPECT_EQ(parse_pipeline_config(Json::array(), config).code, ErrorCode::ConfigInvalid);
}

TEST(PipelineConfig, RejectsUnknownGreetingMode) {
    PipelineConfig config;
    Error error = parse_pipeline_config(Json::parse(R"({"greeting": {"mode": "shout"}})"), config);
    EXPECT_EQ(error.code, ErrorCode::ConfigInvalid);
    EXPECT_NE(error.message.find("shout"), std::string::npos);
}

TEST(PipelineConfig, GreetingModeNames) {
    GreetingMode mode = GreetingMode::None;
    EXPECT_TRUE(parse_greeting_mode("generate", mode));
    EXPECT_EQ(mode, GreetingMode::Generate);
    EXPECT_STREQ(greeting_mode_name(GreetingMode::Static), "static");
    EXPECT_FALSE(parse_greeting_mode("Static", mode));
}

TEST(PipelineConfig, LoadMissingFile) {
    PipelineConfig config;
    Error error = load_pipeline_config("/nonexistent/voxline.json", config);
    EXPECT_EQ(error.code, ErrorCode::ConfigFileNotFound);
    EXPECT_TRUE(error.is_fatal());
}

TEST(PipelineConfig, LoadMalformedJson) {
    fs::path path = write_temp("voxline_bad_config.json", "{\"llm\": {");
    PipelineConfig config;
    EXPECT_EQ(load_pipeline_config(path.string(), config).code, ErrorCode::ConfigInvalid);
    fs::remove(path);
}

TEST(PipelineConfig, LoadFile) {
    fs::path path = write_temp("voxline_good_config.json",
                               R"({"bot": "concierge", "tts": {"url": "http://tts:8880"}})");
    PipelineConfig config;
    Error error = load_pipeline_config(path.string(), config);
    ASSERT_TRUE(error.ok()) << error.to_string();
    EXPECT_EQ(config.bot_name, "concierge");
    EXPECT_EQ(config.endpoints.tts_url, "http://tts:8880");
    fs::remove(path);
}

TEST(PipelineConfig, Validation) {
    {
        PipelineConfig config;
        config.utterance.flush_threshold_bytes = 0;
        EXPECT_EQ(validate_pipeline_config(config).code, ErrorCode::ConfigInvalid);
    }
    {
        PipelineConfig config;
        config.utterance.max_utterance_bytes = config.utterance.flush_threshold_bytes - 1;
        EXPECT_EQ(validate_pipeline_config(config).code, ErrorCode::ConfigInvalid);
    }
    {
        PipelineConfig config;
        config.generation.max_tokens = 0;
        EXPECT_EQ(validate_pipeline_config(config).code, ErrorCode::ConfigInvalid);
    }
    {
        PipelineConfig config;
        config.synthesis.min_phrase_chars = 300;
        EXPECT_EQ(validate_pipeline_config(config).code, ErrorCode::ConfigInvalid);
    }
    {
        PipelineConfig config;
        config.greeting.mode = GreetingMode::Static;
        config.greeting.text.clear();
        EXPECT_EQ(validate_pipeline_config(config).code, ErrorCode::ConfigInvalid);
    }
    {
        PipelineConfig config;
        config.log_level = "chatty";
        EXPECT_EQ(validate_pipeline_config(config).code, ErrorCode::ConfigInvalid);
    }
}

TEST(PipelineConfig, JsonRoundTripKeepsValues) {
    PipelineConfig config;
    config.bot_name = "tutor";
    config.greeting.mode = GreetingMode::Generate;
    config.synthesis.max_phrase_chars = 120;

    PipelineConfig reloaded;
    ASSERT_TRUE(parse_pipeline_config(pipeline_config_to_json(config), reloaded).ok());
    EXPECT_EQ(reloaded.bot_name, "tutor");
    EXPECT_EQ(reloaded.greeting.mode, GreetingMode::Generate);
    EXPECT_EQ(reloaded.synthesis.max_phrase_chars, 120u);
}
