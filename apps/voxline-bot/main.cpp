// =============================================================================
// voxline-bot - Voice Conversation Bot over WAV Files
// =============================================================================
// Runs one conversation session: speech from a WAV file goes through
// transcription (whisper server), generation (Ollama) and synthesis
// (OpenAI-compatible speech server); the bot's replies are written to a WAV.
//
// Usage: ./voxline-bot --input <in.wav> [options]
//
// Options:
//   --input <path>           16-bit PCM WAV with the user's speech
//   --output <path>          Where to write the bot's replies (default: "reply.wav")
//   --config <path>          JSON configuration file
//   --bot, -b <name>         Bot personality (bots/<name>.txt)
//   --bots-dir <dir>         Personality directory (default: "bots")
//   --list-bots              List available bot personalities
//   --ollama-url <url>       Ollama server (default: http://localhost:11434)
//   --model <name>           Ollama model (default: llama3.2)
//   --tts-url <url>          Speech server (default: http://localhost:8000)
//   --voice <id>             Speech voice (default: af_sarah)
//   --stt-url <url>          Transcription server (default: http://localhost:8080)
//   --stt-path <path>        /inference (whisper.cpp) or /v1/audio/transcriptions
//   --vad                    Detect utterances with the energy VAD
//   --flush-threshold <n>    Bytes per utterance without VAD (default: 32000)
//   --greeting <mode>        none | static | generate
//   --realtime               Feed the input at playback speed
//   --log-level <level>      trace | debug | info | warning | error
//   --help                   Show this help message
// =============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "ollama_chat_engine.h"
#include "openai_speech_engine.h"
#include "wav_file_transport.h"
#include "whisper_http_engine.h"

#include "voxline/config/bot_personality.h"
#include "voxline/config/pipeline_config.h"
#include "voxline/core/logger.h"
#include "voxline/pipeline/pipeline_runner.h"

// =============================================================================
// Global State
// =============================================================================

std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

// =============================================================================
// Command Line Arguments
// =============================================================================

struct AppConfig {
    std::string input_path;
    std::string output_path = "reply.wav";
    std::string config_path;

    // Overrides applied on top of the JSON config
    std::string bot_name;
    std::string bots_dir;
    std::string ollama_url;
    std::string model;
    std::string tts_url;
    std::string voice;
    std::string stt_url;
    std::string stt_path;
    std::string greeting;
    std::string log_level;
    long flush_threshold = -1;
    bool enable_vad = false;

    bool realtime = false;
    bool list_bots = false;
    bool show_help = false;
    std::string parse_error;
};

void print_usage(const char* prog_name) {
    std::cout << "voxline-bot\n"
              << "Voice conversation bot over WAV files\n\n"
              << "Usage: " << prog_name << " --input <in.wav> [options]\n\n"
              << "Options:\n"
              << "  --input <path>           16-bit PCM WAV with the user's speech\n"
              << "  --output <path>          Where to write the bot's replies (default: \"reply.wav\")\n"
              << "  --config <path>          JSON configuration file\n"
              << "  --bot, -b <name>         Bot personality (bots/<name>.txt)\n"
              << "  --bots-dir <dir>         Personality directory (default: \"bots\")\n"
              << "  --list-bots              List available bot personalities\n"
              << "  --ollama-url <url>       Ollama server (default: http://localhost:11434)\n"
              << "  --model <name>           Ollama model (default: llama3.2)\n"
              << "  --tts-url <url>          Speech server (default: http://localhost:8000)\n"
              << "  --voice <id>             Speech voice (default: af_sarah)\n"
              << "  --stt-url <url>          Transcription server (default: http://localhost:8080)\n"
              << "  --stt-path <path>        /inference or /v1/audio/transcriptions\n"
              << "  --vad                    Detect utterances with the energy VAD\n"
              << "  --flush-threshold <n>    Bytes per utterance without VAD (default: 32000)\n"
              << "  --greeting <mode>        none | static | generate\n"
              << "  --realtime               Feed the input at playback speed\n"
              << "  --log-level <level>      trace | debug | info | warning | error\n"
              << "  --help                   Show this help message\n"
              << std::endl;
}

AppConfig parse_args(int argc, char* argv[]) {
    AppConfig config;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            config.input_path = argv[++i];
        } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            config.output_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config.config_path = argv[++i];
        } else if ((strcmp(argv[i], "--bot") == 0 || strcmp(argv[i], "-b") == 0) && i + 1 < argc) {
            config.bot_name = argv[++i];
        } else if (strcmp(argv[i], "--bots-dir") == 0 && i + 1 < argc) {
            config.bots_dir = argv[++i];
        } else if (strcmp(argv[i], "--list-bots") == 0) {
            config.list_bots = true;
        } else if (strcmp(argv[i], "--ollama-url") == 0 && i + 1 < argc) {
            config.ollama_url = argv[++i];
        } else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            config.model = argv[++i];
        } else if (strcmp(argv[i], "--tts-url") == 0 && i + 1 < argc) {
            config.tts_url = argv[++i];
        } else if (strcmp(argv[i], "--voice") == 0 && i + 1 < argc) {
            config.voice = argv[++i];
        } else if (strcmp(argv[i], "--stt-url") == 0 && i + 1 < argc) {
            config.stt_url = argv[++i];
        } else if (strcmp(argv[i], "--stt-path") == 0 && i + 1 < argc) {
            config.stt_path = argv[++i];
        } else if (strcmp(argv[i], "--vad") == 0) {
            config.enable_vad = true;
        } else if (strcmp(argv[i], "--flush-threshold") == 0 && i + 1 < argc) {
            char* end = nullptr;
            config.flush_threshold = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || config.flush_threshold <= 0) {
                config.parse_error = std::string("invalid --flush-threshold: ") + argv[i];
            }
        } else if (strcmp(argv[i], "--greeting") == 0 && i + 1 < argc) {
            config.greeting = argv[++i];
        } else if (strcmp(argv[i], "--realtime") == 0) {
            config.realtime = true;
        } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            config.show_help = true;
        } else {
            config.parse_error = std::string("unknown option: ") + argv[i];
        }
    }

    return config;
}

bool apply_overrides(const AppConfig& app, voxline::PipelineConfig& config, std::string& error) {
    if (!app.bot_name.empty()) config.bot_name = app.bot_name;
    if (!app.bots_dir.empty()) config.bots_dir = app.bots_dir;
    if (!app.ollama_url.empty()) config.endpoints.llm_url = app.ollama_url;
    if (!app.model.empty()) config.generation.model = app.model;
    if (!app.tts_url.empty()) config.endpoints.tts_url = app.tts_url;
    if (!app.voice.empty()) config.synthesis.voice_id = app.voice;
    if (!app.stt_url.empty()) config.endpoints.stt_url = app.stt_url;
    if (!app.stt_path.empty()) config.endpoints.stt_path = app.stt_path;
    if (!app.log_level.empty()) config.log_level = app.log_level;
    if (app.enable_vad) config.energy_vad_enabled = true;
    if (app.flush_threshold > 0) {
        config.utterance.flush_threshold_bytes = static_cast<size_t>(app.flush_threshold);
    }
    if (!app.greeting.empty() &&
        !voxline::parse_greeting_mode(app.greeting, config.greeting.mode)) {
        error = "invalid --greeting: " + app.greeting;
        return false;
    }
    return true;
}

void list_bots(const std::string& bots_dir) {
    auto bots = voxline::list_available_bots(bots_dir);
    if (bots.empty()) {
        std::cout << "No bot personalities found in the '" << bots_dir << "' directory.\n"
                  << "Create .txt files there to add personalities." << std::endl;
        return;
    }
    std::cout << "Available bot personalities:\n";
    for (const auto& name : bots) {
        std::cout << "  - " << name << "\n";
    }
    std::cout << std::flush;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    AppConfig app = parse_args(argc, argv);

    if (app.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (!app.parse_error.empty()) {
        std::cerr << "ERROR: " << app.parse_error << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    voxline::PipelineConfig config;
    if (!app.config_path.empty()) {
        voxline::Error error = voxline::load_pipeline_config(app.config_path, config);
        if (!error.ok()) {
            std::cerr << "ERROR: " << error.to_string() << std::endl;
            return 1;
        }
    }

    std::string override_error;
    if (!apply_overrides(app, config, override_error)) {
        std::cerr << "ERROR: " << override_error << std::endl;
        return 2;
    }

    if (app.list_bots) {
        list_bots(config.bots_dir);
        return 0;
    }

    voxline::LogLevel level;
    if (voxline::Logger::parseLevel(config.log_level.c_str(), &level)) {
        voxline::Logger::instance().setMinLevel(level);
    }

    if (app.input_path.empty()) {
        std::cerr << "ERROR: --input is required\n\n";
        print_usage(argv[0]);
        return 2;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // =============================================================================
    // Transport and Engines
    // =============================================================================

    auto transport = std::make_shared<voxline_bot::WavFileTransport>();
    if (!transport->open_input(app.input_path)) {
        std::cerr << "ERROR: " << transport->last_error() << std::endl;
        return 1;
    }

    const int timeout = config.endpoints.timeout_sec;
    voxline::SessionEngines engines;
    engines.stt = std::make_shared<voxline::WhisperHttpEngine>(
        voxline::HttpEngineConfig{config.endpoints.stt_url, timeout}, config.endpoints.stt_path);
    engines.llm = std::make_shared<voxline::OllamaChatEngine>(
        voxline::HttpEngineConfig{config.endpoints.llm_url, timeout}, config.generation.model);
    engines.tts = std::make_shared<voxline::OpenAISpeechEngine>(
        voxline::HttpEngineConfig{config.endpoints.tts_url, timeout});

    // =============================================================================
    // Session
    // =============================================================================

    voxline::SessionCallbacks callbacks;
    callbacks.on_transcription = [](const std::string& text, bool is_final) {
        if (is_final) {
            std::cout << "[USER] " << text << std::endl;
        }
    };
    callbacks.on_response_complete = [](const std::string& response) {
        std::cout << "[BOT]  " << response << std::endl;
    };
    callbacks.on_error = [](const voxline::Error& error, const std::string& stage) {
        std::cerr << "[ERROR] " << stage << ": " << error.to_string() << std::endl;
    };

    voxline::PipelineRunner runner(config, engines, transport, callbacks);
    if (!runner.initialize()) {
        std::cerr << "ERROR: Failed to initialize session: " << runner.last_error().to_string()
                  << std::endl;
        if (runner.last_error().code == voxline::ErrorCode::BotNotFound) {
            list_bots(config.bots_dir);
        }
        return 1;
    }

    std::cout << "Input:  " << app.input_path << " (" << transport->input_duration_sec()
              << " s)\n"
              << "Output: " << app.output_path << "\n"
              << std::endl;

    if (!runner.dispatch(voxline::ClientConnected{"file:" + app.input_path}) ||
        !runner.dispatch(voxline::ClientReady{})) {
        std::cerr << "ERROR: Failed to start session: " << runner.last_error().to_string()
                  << std::endl;
        return 1;
    }

    transport->stream_into(runner, 20, app.realtime, g_running);

    if (g_running) {
        runner.dispatch(voxline::InboundFrame{voxline::ControlSignal{voxline::ControlKind::Shutdown}});
    }

    // Drain, or cancel on Ctrl+C
    while (!runner.wait_closed(std::chrono::milliseconds(100))) {
        if (!g_running) {
            std::cout << "\nCancelling..." << std::endl;
            runner.dispatch(voxline::ClientDisconnected{});
        }
    }

    if (!transport->write_output(app.output_path)) {
        std::cerr << "ERROR: " << transport->last_error() << std::endl;
        return 1;
    }
    std::cout << "\nWrote " << transport->output_duration_sec() << " s of audio to "
              << app.output_path << std::endl;
    return 0;
}
