/**
 * @file conversation_context.cpp
 * @brief voxline - Conversation history implementation
 */

#include "voxline/features/llm/conversation_context.h"

#include "voxline/core/logger.h"

namespace voxline {

const char* role_name(Role role) {
    switch (role) {
        case Role::System:
            return "system";
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
    }
    return "unknown";
}

ConversationContext::ConversationContext(std::string system_prompt)
    : system_prompt_(std::move(system_prompt)) {
    messages_.push_back(Message{Role::System, system_prompt_});
}

bool ConversationContext::append_user(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    Message& last = messages_.back();
    if (last.role == Role::User) {
        VOXLINE_LOG_DEBUG("LLM", "Previous user turn unanswered, merging");
        last.content += " ";
        last.content += text;
        return false;
    }
    messages_.push_back(Message{Role::User, text});
    return true;
}

bool ConversationContext::append_assistant(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (text.empty() || messages_.back().role == Role::Assistant) {
        return false;
    }
    messages_.push_back(Message{Role::Assistant, text});
    return true;
}

std::vector<Message> ConversationContext::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

size_t ConversationContext::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

bool ConversationContext::awaiting_response() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.back().role == Role::User;
}

bool ConversationContext::is_well_formed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (messages_.empty() || messages_.front().role != Role::System) {
        return false;
    }
    for (size_t i = 1; i < messages_.size(); ++i) {
        if (messages_[i].role == Role::System) {
            return false;
        }
        if (i > 1 && messages_[i].role == messages_[i - 1].role) {
            return false;
        }
    }
    return true;
}

}  // namespace voxline
