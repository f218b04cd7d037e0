/**
 * @file test_error.cpp
 * @brief Tests for error codes and structured errors
 */

#include <gtest/gtest.h>

#include <string>

#include "voxline/core/error.h"

using namespace voxline;

TEST(Error, DefaultIsSuccess) {
    Error error;
    EXPECT_TRUE(error.ok());
    EXPECT_EQ(error.category, ErrorCategory::None);
    EXPECT_EQ(error.to_string(), "Success");
}

TEST(Error, CategoryFollowsCodeRange) {
    EXPECT_EQ(error_category(ErrorCode::BotNotFound), ErrorCategory::Configuration);
    EXPECT_EQ(error_category(ErrorCode::TranscriptionEmptyResult), ErrorCategory::Transcription);
    EXPECT_EQ(error_category(ErrorCode::GenerationEngineFailure), ErrorCategory::Generation);
    EXPECT_EQ(error_category(ErrorCode::SynthesisEngineFailure), ErrorCategory::Synthesis);
    EXPECT_EQ(error_category(ErrorCode::TransportSendFailed), ErrorCategory::Transport);
    EXPECT_EQ(error_category(ErrorCode::Internal), ErrorCategory::Internal);
}

TEST(Error, MakeErrorUsesDefaultMessage) {
    Error error = make_error(ErrorCode::TranscriptionEngineFailure);
    EXPECT_FALSE(error.ok());
    EXPECT_EQ(error.message, error_code_message(ErrorCode::TranscriptionEngineFailure));

    Error custom = make_error(ErrorCode::TranscriptionEngineFailure, "model not loaded");
    EXPECT_EQ(custom.message, "model not loaded");
}

TEST(Error, OnlyConfigurationAndTransportAreFatal) {
    EXPECT_TRUE(make_error(ErrorCode::ConfigInvalid).is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::TransportDisconnected).is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::TranscriptionEngineFailure).is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::GenerationEngineFailure).is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::SynthesisEngineFailure).is_fatal());
}

TEST(Error, ToStringNamesCategoryAndCode) {
    std::string text = make_error(ErrorCode::SynthesisEngineFailure, "voice missing").to_string();
    EXPECT_NE(text.find("SynthesisError"), std::string::npos);
    EXPECT_NE(text.find("-160"), std::string::npos);
    EXPECT_NE(text.find("voice missing"), std::string::npos);
}
