/**
 * @file conversation_context.h
 * @brief voxline - Ordered conversation history
 *
 * Invariants:
 *  - exactly one System message, always first
 *  - after it, User and Assistant strictly alternate
 *  - an Assistant message is only ever appended whole
 *
 * The session owns the context and hands a reference to the GenerationStage,
 * its only writer. Other components read snapshots.
 */

#ifndef VOXLINE_FEATURES_LLM_CONVERSATION_CONTEXT_H
#define VOXLINE_FEATURES_LLM_CONVERSATION_CONTEXT_H

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace voxline {

enum class Role {
    System,
    User,
    Assistant,
};

const char* role_name(Role role);

struct Message {
    Role role = Role::User;
    std::string content;
};

class ConversationContext {
   public:
    explicit ConversationContext(std::string system_prompt);

    ConversationContext(const ConversationContext&) = delete;
    ConversationContext& operator=(const ConversationContext&) = delete;

    /**
     * Append the user's turn.
     *
     * If the previous user turn was never answered (generation failed), the
     * new text is joined onto that message instead, so roles keep alternating.
     *
     * @return true if a new message was appended, false if merged
     */
    bool append_user(const std::string& text);

    /**
     * Append a complete assistant turn.
     *
     * @return false (nothing appended) if the last message is already an
     *         Assistant message or the text is empty
     */
    bool append_assistant(const std::string& text);

    // Copy of the full history, System message first
    std::vector<Message> messages() const;

    size_t size() const;
    const std::string& system_prompt() const { return system_prompt_; }
    bool awaiting_response() const;

    // True when the invariants above hold (used by tests and debug checks)
    bool is_well_formed() const;

   private:
    const std::string system_prompt_;
    mutable std::mutex mutex_;
    std::vector<Message> messages_;
};

}  // namespace voxline

#endif  // VOXLINE_FEATURES_LLM_CONVERSATION_CONTEXT_H
