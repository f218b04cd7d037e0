/**
 * @file bot_personality.cpp
 * @brief voxline - Bot personalities loaded from text files
 */

#include "voxline/config/bot_personality.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "voxline/core/logger.h"
#include "voxline/core/string_utils.h"

namespace fs = std::filesystem;

namespace voxline {

std::vector<std::string> list_available_bots(const std::string& bots_dir) {
    std::vector<std::string> bots;

    std::error_code ec;
    if (!fs::is_directory(bots_dir, ec)) {
        return bots;
    }

    for (const auto& entry : fs::directory_iterator(bots_dir, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".txt") {
            bots.push_back(entry.path().stem().string());
        }
    }
    std::sort(bots.begin(), bots.end());
    return bots;
}

Error load_bot_prompt(const std::string& bots_dir, const std::string& bot_name,
                      std::string& out_prompt) {
    fs::path bot_path = fs::path(bots_dir) / (bot_name + ".txt");

    std::ifstream file(bot_path);
    if (bot_name.empty() || !file.is_open()) {
        std::string message = "Bot file '" + bot_path.string() + "' not found.";
        std::vector<std::string> available = list_available_bots(bots_dir);
        if (!available.empty()) {
            message += " Available bots: ";
            for (size_t i = 0; i < available.size(); ++i) {
                if (i > 0) {
                    message += ", ";
                }
                message += available[i];
            }
        }
        return make_error(ErrorCode::BotNotFound, message);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string prompt = trim(buffer.str());
    if (prompt.empty()) {
        return make_error(ErrorCode::BotPromptEmpty,
                          "Bot file '" + bot_path.string() + "' is empty");
    }

    out_prompt = std::move(prompt);
    return Error{};
}

Error resolve_system_prompt(const std::string& bots_dir, const std::string& bot_name,
                            std::string& out_prompt) {
    if (bot_name.empty()) {
        out_prompt = DEFAULT_SYSTEM_PROMPT;
        return Error{};
    }

    Error error = load_bot_prompt(bots_dir, bot_name, out_prompt);
    if (error.ok()) {
        VOXLINE_LOG_INFO("Config", "Loaded bot personality: %s", bot_name.c_str());
    } else {
        VOXLINE_LOG_ERROR("Config", "Error loading bot personality: %s", error.message.c_str());
    }
    return error;
}

}  // namespace voxline
