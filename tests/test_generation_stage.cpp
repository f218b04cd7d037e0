/**
 * @file test_generation_stage.cpp
 * @brief Tests for streaming response generation
 */

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "fake_engines.h"
#include "voxline/features/llm/generation_stage.h"

using namespace voxline;
using voxline_test::FakeLLM;

namespace {

std::vector<Frame> drain(FrameBus& bus, Link link) {
    bus.close(link);
    std::vector<Frame> frames;
    Frame frame;
    while (bus.pop(link, frame)) {
        frames.push_back(std::move(frame));
    }
    return frames;
}

class GenerationStageTest : public ::testing::Test {
   protected:
    GenerationStageTest() : context_("You are a test bot.") {}

    void SetUp() override {
        llm_ = std::make_shared<FakeLLM>();
        config_.model = "llama3.2";
        stage_ = std::make_unique<GenerationStage>(llm_, context_, config_, token_);
    }

    DeltaSink collect() {
        return [this](TextDelta delta) {
            deltas_.push_back(delta.text);
            return true;
        };
    }

    std::shared_ptr<FakeLLM> llm_;
    ConversationContext context_;
    GenerationConfig config_;
    CancellationToken token_;
    std::unique_ptr<GenerationStage> stage_;
    std::vector<std::string> deltas_;
    FrameBus bus_;
};

}  // namespace

TEST_F(GenerationStageTest, StreamsDeltasAndRecordsTurn) {
    GenerationOutcome outcome = stage_->respond("hello", collect());

    ASSERT_TRUE(outcome.ok()) << outcome.error.to_string();
    EXPECT_EQ(deltas_, (std::vector<std::string>{"Hi", " there!"}));
    EXPECT_EQ(outcome.response, "Hi there!");
    EXPECT_EQ(outcome.delta_count, 2u);
    EXPECT_TRUE(outcome.assistant_appended);

    auto messages = context_.messages();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[1].role, Role::User);
    EXPECT_EQ(messages[1].content, "hello");
    EXPECT_EQ(messages[2].role, Role::Assistant);
    EXPECT_EQ(messages[2].content, "Hi there!");
}

TEST_F(GenerationStageTest, RequestCarriesHistoryAndSettings) {
    stage_->respond("one", collect());
    stage_->respond("two", collect());

    auto requests = llm_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].model, "llama3.2");
    EXPECT_EQ(requests[0].max_tokens, 256);
    ASSERT_EQ(requests[1].messages.size(), 4u);
    EXPECT_EQ(requests[1].messages[0].role, Role::System);
    EXPECT_EQ(requests[1].messages[3].content, "two");
}

TEST_F(GenerationStageTest, EngineFailureEmitsFallback) {
    FakeLLM::Script script;
    script.tokens = {"Partial", " answer"};
    script.fail_after = 1;
    llm_->push_script(script);

    size_t withdrawn_at = 0;
    GenerationOutcome outcome =
        stage_->respond("hello", collect(), [&] { withdrawn_at = deltas_.size(); });
    EXPECT_EQ(outcome.error.code, ErrorCode::GenerationEngineFailure);
    EXPECT_TRUE(outcome.fallback_emitted);
    EXPECT_FALSE(outcome.assistant_appended);
    EXPECT_EQ(deltas_, (std::vector<std::string>{"Partial", DEFAULT_FALLBACK_REPLY}));
    EXPECT_EQ(withdrawn_at, 1u);
    EXPECT_TRUE(context_.awaiting_response());
}

TEST_F(GenerationStageTest, FailureBeforeAnyDeltaWithdrawsNothing) {
    FakeLLM::Script script;
    script.fail_after = 0;
    llm_->push_script(script);

    bool withdrawn = false;
    stage_->respond("hello", collect(), [&] { withdrawn = true; });
    EXPECT_FALSE(withdrawn);
    EXPECT_EQ(deltas_, (std::vector<std::string>{DEFAULT_FALLBACK_REPLY}));
}

TEST_F(GenerationStageTest, AssistantTurnIsForwardedTextVerbatim) {
    FakeLLM::Script script;
    script.tokens = {" Sure", ", one moment. "};
    llm_->push_script(script);

    GenerationOutcome outcome = stage_->respond("hello", collect());
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(context_.messages()[2].content, " Sure, one moment. ");
}

TEST_F(GenerationStageTest, EngineExceptionTreatedAsFailure) {
    FakeLLM::Script script;
    script.fail_after = 0;
    script.throw_on_failure = true;
    llm_->push_script(script);

    GenerationOutcome outcome = stage_->respond("hello", collect());
    EXPECT_EQ(outcome.error.code, ErrorCode::GenerationEngineFailure);
    EXPECT_TRUE(outcome.fallback_emitted);
}

TEST_F(GenerationStageTest, EmptyFallbackDisablesIt) {
    config_.fallback_reply.clear();
    stage_ = std::make_unique<GenerationStage>(llm_, context_, config_, token_);
    FakeLLM::Script script;
    script.fail_after = 0;
    llm_->push_script(script);

    GenerationOutcome outcome = stage_->respond("hello", collect());
    EXPECT_FALSE(outcome.fallback_emitted);
    EXPECT_TRUE(deltas_.empty());
}

TEST_F(GenerationStageTest, FailedTurnMergesIntoNextUserTurn) {
    FakeLLM::Script script;
    script.fail_after = 0;
    llm_->push_script(script);

    stage_->respond("first", collect());
    stage_->respond("second", collect());

    auto messages = context_.messages();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[1].content, "first second");
    EXPECT_TRUE(context_.is_well_formed());
}

TEST_F(GenerationStageTest, CancellationStopsForwarding) {
    FakeLLM::Script script;
    script.tokens = {"Once", " upon"};
    script.block_until_cancelled = true;
    script.tokens_after_cancel = {" a", " time"};
    llm_->push_script(script);

    GenerationOutcome outcome;
    std::thread worker([&] { outcome = stage_->respond("story please", collect()); });
    ASSERT_TRUE(llm_->wait_blocked());
    token_.cancel();
    stage_->cancel();
    worker.join();

    EXPECT_TRUE(llm_->was_cancelled());
    EXPECT_EQ(outcome.error.code, ErrorCode::GenerationCancelled);
    EXPECT_FALSE(outcome.fallback_emitted);
    EXPECT_FALSE(outcome.assistant_appended);
    EXPECT_EQ(deltas_, (std::vector<std::string>{"Once", " upon"}));
    EXPECT_TRUE(context_.awaiting_response());
}

TEST_F(GenerationStageTest, DownstreamClosedCountsAsCancelled) {
    size_t accepted = 0;
    GenerationOutcome outcome = stage_->respond("hello", [&](TextDelta) {
        return accepted++ < 1;
    });
    EXPECT_EQ(outcome.error.code, ErrorCode::GenerationCancelled);
    EXPECT_EQ(outcome.delta_count, 1u);
    EXPECT_FALSE(outcome.assistant_appended);
}

TEST_F(GenerationStageTest, EmptyResponseNotRecorded) {
    FakeLLM::Script script;
    script.tokens = {"", "  "};
    llm_->push_script(script);

    GenerationOutcome outcome = stage_->respond("hello", collect());
    EXPECT_EQ(outcome.error.code, ErrorCode::GenerationEmptyResponse);
    EXPECT_FALSE(outcome.assistant_appended);
    EXPECT_EQ(context_.size(), 2u);
}

TEST_F(GenerationStageTest, KickoffGeneratesWithoutUserTurn) {
    GenerationOutcome outcome = stage_->kickoff(collect());
    ASSERT_TRUE(outcome.ok());

    auto messages = context_.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1].role, Role::Assistant);
    ASSERT_EQ(llm_->requests().size(), 1u);
    EXPECT_EQ(llm_->requests()[0].messages.size(), 1u);
}

TEST_F(GenerationStageTest, ProcessFrameBracketsResponse) {
    stage_->process_frame(FinalTranscript{"  hello "}, bus_);

    auto frames = drain(bus_, Link::Text);
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(std::get<ControlSignal>(frames[0]).kind, ControlKind::ResponseStart);
    EXPECT_EQ(std::get<TextDelta>(frames[1]).text, "Hi");
    EXPECT_EQ(std::get<TextDelta>(frames[2]).text, " there!");
    EXPECT_EQ(std::get<ControlSignal>(frames[3]).kind, ControlKind::ResponseEnd);
    EXPECT_EQ(stage_->response_count(), 1u);
    EXPECT_EQ(context_.messages()[1].content, "hello");
}

TEST_F(GenerationStageTest, ProcessFrameReportsEngineFailure) {
    FakeLLM::Script script;
    script.fail_after = 0;
    llm_->push_script(script);

    stage_->process_frame(FinalTranscript{"hello"}, bus_);

    auto text = drain(bus_, Link::Text);
    ASSERT_EQ(text.size(), 3u);
    EXPECT_EQ(std::get<TextDelta>(text[1]).text, DEFAULT_FALLBACK_REPLY);

    auto upstream = drain(bus_, Link::Upstream);
    ASSERT_EQ(upstream.size(), 1u);
    const auto& error = std::get<StageError>(upstream[0]);
    EXPECT_FALSE(error.fatal);
    EXPECT_EQ(error.stage, "generation");
    EXPECT_EQ(error.error.code, ErrorCode::GenerationEngineFailure);
}

TEST_F(GenerationStageTest, ProcessFrameWithdrawsPartialReplyBeforeFallback) {
    FakeLLM::Script script;
    script.tokens = {"Hi", " there", "!"};
    script.fail_after = 1;
    llm_->push_script(script);

    stage_->process_frame(FinalTranscript{"hello"}, bus_);

    auto text = drain(bus_, Link::Text);
    ASSERT_EQ(text.size(), 5u);
    EXPECT_EQ(std::get<ControlSignal>(text[0]).kind, ControlKind::ResponseStart);
    EXPECT_EQ(std::get<TextDelta>(text[1]).text, "Hi");
    EXPECT_EQ(std::get<ControlSignal>(text[2]).kind, ControlKind::ResponseAbort);
    EXPECT_EQ(std::get<TextDelta>(text[3]).text, DEFAULT_FALLBACK_REPLY);
    EXPECT_EQ(std::get<ControlSignal>(text[4]).kind, ControlKind::ResponseEnd);
}

TEST_F(GenerationStageTest, ProcessFrameIgnoresBlankTranscriptAndPartials) {
    stage_->process_frame(FinalTranscript{"   "}, bus_);
    stage_->process_frame(PartialTranscript{"hel"}, bus_);
    EXPECT_EQ(bus_.pending(Link::Text), 0u);
    EXPECT_TRUE(llm_->requests().empty());
}

TEST_F(GenerationStageTest, ProcessFrameKickoffAndForwarding) {
    stage_->process_frame(ControlSignal{ControlKind::Kickoff}, bus_);
    stage_->process_frame(ControlSignal{ControlKind::UtteranceEnd}, bus_);

    auto frames = drain(bus_, Link::Text);
    ASSERT_EQ(frames.size(), 5u);
    EXPECT_EQ(std::get<ControlSignal>(frames[0]).kind, ControlKind::ResponseStart);
    EXPECT_EQ(std::get<ControlSignal>(frames[3]).kind, ControlKind::ResponseEnd);
    EXPECT_EQ(std::get<ControlSignal>(frames[4]).kind, ControlKind::UtteranceEnd);
}

TEST_F(GenerationStageTest, CancelledSessionStartsNoTurn) {
    token_.cancel();
    stage_->process_frame(FinalTranscript{"hello"}, bus_);
    EXPECT_EQ(bus_.pending(Link::Text), 0u);
    EXPECT_TRUE(llm_->requests().empty());
}
