/**
 * @file bot_personality.h
 * @brief voxline - Bot personalities loaded from text files
 *
 * A personality is a plain-text system prompt stored as <bots_dir>/<name>.txt.
 */

#ifndef VOXLINE_CONFIG_BOT_PERSONALITY_H
#define VOXLINE_CONFIG_BOT_PERSONALITY_H

#include <string>
#include <vector>

#include "voxline/core/error.h"

namespace voxline {

// Used when no personality is selected
constexpr const char* DEFAULT_SYSTEM_PROMPT =
    "You are Chatbot, a friendly, helpful robot. Your goal is to demonstrate your "
    "capabilities in a succinct way. Your output will be converted to audio so don't "
    "include special characters in your answers. Respond to what the user said in a "
    "creative and helpful way, but keep your responses brief. Start by introducing yourself.";

/**
 * @brief Names of the personalities in a directory (file stems of *.txt), sorted.
 *
 * A missing directory yields an empty list.
 */
std::vector<std::string> list_available_bots(const std::string& bots_dir);

/**
 * @brief Load the trimmed system prompt for a personality.
 *
 * @return BotNotFound (message lists the available bots) or BotPromptEmpty
 */
Error load_bot_prompt(const std::string& bots_dir, const std::string& bot_name,
                      std::string& out_prompt);

/**
 * @brief Prompt for a session: the named personality, or DEFAULT_SYSTEM_PROMPT
 *        when bot_name is empty.
 */
Error resolve_system_prompt(const std::string& bots_dir, const std::string& bot_name,
                            std::string& out_prompt);

}  // namespace voxline

#endif  // VOXLINE_CONFIG_BOT_PERSONALITY_H
