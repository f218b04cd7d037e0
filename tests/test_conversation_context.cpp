/**
 * @file test_conversation_context.cpp
 * @brief Tests for conversation history invariants
 */

#include <gtest/gtest.h>

#include "voxline/features/llm/conversation_context.h"

using namespace voxline;

TEST(ConversationContext, StartsWithSystemMessage) {
    ConversationContext context("be nice");
    auto messages = context.messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].role, Role::System);
    EXPECT_EQ(messages[0].content, "be nice");
    EXPECT_FALSE(context.awaiting_response());
    EXPECT_TRUE(context.is_well_formed());
}

TEST(ConversationContext, AlternatesTurns) {
    ConversationContext context("sys");
    EXPECT_TRUE(context.append_user("hello"));
    EXPECT_TRUE(context.awaiting_response());
    EXPECT_TRUE(context.append_assistant("Hi there!"));
    EXPECT_TRUE(context.append_user("how are you"));
    EXPECT_TRUE(context.append_assistant("Fine."));

    auto messages = context.messages();
    ASSERT_EQ(messages.size(), 5u);
    EXPECT_EQ(messages[1].role, Role::User);
    EXPECT_EQ(messages[2].role, Role::Assistant);
    EXPECT_EQ(messages[2].content, "Hi there!");
    EXPECT_EQ(messages[3].role, Role::User);
    EXPECT_EQ(messages[4].role, Role::Assistant);
    EXPECT_TRUE(context.is_well_formed());
}

TEST(ConversationContext, MergesUnansweredUserTurn) {
    ConversationContext context("sys");
    EXPECT_TRUE(context.append_user("first"));
    // Generation failed; next transcript arrives
    EXPECT_FALSE(context.append_user("second"));

    auto messages = context.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1].content, "first second");
    EXPECT_TRUE(context.is_well_formed());
}

TEST(ConversationContext, AssistantAppendedOnce) {
    ConversationContext context("sys");
    context.append_user("q");
    EXPECT_TRUE(context.append_assistant("a"));
    EXPECT_FALSE(context.append_assistant("again"));
    EXPECT_EQ(context.size(), 3u);
}

TEST(ConversationContext, RejectsEmptyAssistantText) {
    ConversationContext context("sys");
    context.append_user("q");
    EXPECT_FALSE(context.append_assistant(""));
    EXPECT_TRUE(context.awaiting_response());
}

TEST(ConversationContext, AssistantMayOpenConversation) {
    ConversationContext context("sys");
    EXPECT_TRUE(context.append_assistant("Welcome!"));
    EXPECT_TRUE(context.append_user("thanks"));
    EXPECT_TRUE(context.is_well_formed());
    EXPECT_STREQ(role_name(Role::Assistant), "assistant");
}
