/**
 * @file test_transcription_stage.cpp
 * @brief Tests for utterance transcription
 */

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "fake_engines.h"
#include "voxline/features/stt/transcription_stage.h"

using namespace voxline;
using voxline_test::FakeSTT;
using voxline_test::make_audio;

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

class TranscriptionStageTest : public ::testing::Test {
   protected:
    void SetUp() override {
        stt_ = std::make_shared<FakeSTT>();
        stage_ = std::make_unique<TranscriptionStage>(stt_, TranscriptionConfig{}, token_);
    }

    std::shared_ptr<FakeSTT> stt_;
    CancellationToken token_;
    std::unique_ptr<TranscriptionStage> stage_;
    FrameBus bus_;
};

}  // namespace

TEST_F(TranscriptionStageTest, TranscribesAndClosesUtterance) {
    stt_->push_reply({"  turn on the lights \n", {}, false});
    Utterance utterance = Utterance::from_audio(make_audio(3200, 16384));

    TranscriptionOutcome outcome = stage_->transcribe(utterance);
    ASSERT_TRUE(outcome.ok()) << outcome.error.to_string();
    EXPECT_EQ(outcome.text, "turn on the lights");
    EXPECT_EQ(utterance.state(), UtteranceState::Closed);

    auto requests = stt_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].audio_samples.size(), 1600u);
    EXPECT_NEAR(requests[0].audio_samples[0], 0.5f, 1e-4f);
    EXPECT_EQ(requests[0].sample_rate, 16000);
    EXPECT_EQ(requests[0].language, "en");
}

TEST_F(TranscriptionStageTest, EmptyResult) {
    stt_->push_reply({"   ", {}, false});
    Utterance utterance = Utterance::from_audio(make_audio(320));
    TranscriptionOutcome outcome = stage_->transcribe(utterance);
    EXPECT_EQ(outcome.error.code, ErrorCode::TranscriptionEmptyResult);
    EXPECT_EQ(utterance.state(), UtteranceState::Closed);
}

TEST_F(TranscriptionStageTest, EngineErrorAndException) {
    stt_->push_reply({"", make_error(ErrorCode::TranscriptionEngineFailure, "503"), false});
    stt_->push_reply({"", {}, true});

    Utterance first = Utterance::from_audio(make_audio(320));
    EXPECT_EQ(stage_->transcribe(first).error.code, ErrorCode::TranscriptionEngineFailure);

    Utterance second = Utterance::from_audio(make_audio(320));
    TranscriptionOutcome outcome = stage_->transcribe(second);
    EXPECT_EQ(outcome.error.code, ErrorCode::TranscriptionEngineFailure);
    EXPECT_NE(outcome.error.message.find("crashed"), std::string::npos);
    EXPECT_EQ(second.state(), UtteranceState::Closed);
}

TEST_F(TranscriptionStageTest, RejectsAudioShorterThanOneSample) {
    Utterance utterance = Utterance::from_audio(make_audio(1));
    EXPECT_EQ(stage_->transcribe(utterance).error.code, ErrorCode::TranscriptionMalformedAudio);
    EXPECT_EQ(stt_->call_count(), 0u);
}

TEST_F(TranscriptionStageTest, ProcessFrameEmitsFinalTranscript) {
    stage_->process_frame(make_audio(640), bus_);

    auto frames = drain(bus_, Link::Transcripts);
    ASSERT_EQ(frames.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<FinalTranscript>(frames[0]));
    EXPECT_EQ(std::get<FinalTranscript>(frames[0]).text, "hello");
    EXPECT_EQ(stage_->transcribed_count(), 1u);
    EXPECT_EQ(bus_.pending(Link::Upstream), 0u);
}

TEST_F(TranscriptionStageTest, ProcessFrameDropsEmptyResult) {
    stt_->push_reply({"", {}, false});
    stage_->process_frame(make_audio(640), bus_);
    EXPECT_EQ(bus_.pending(Link::Transcripts), 0u);
    EXPECT_EQ(bus_.pending(Link::Upstream), 0u);
    EXPECT_EQ(stage_->failed_count(), 0u);
}

TEST_F(TranscriptionStageTest, ProcessFrameReportsFailureUpstream) {
    stt_->push_reply({"", make_error(ErrorCode::TranscriptionEngineFailure, "timeout"), false});
    stage_->process_frame(make_audio(640), bus_);

    EXPECT_EQ(bus_.pending(Link::Transcripts), 0u);
    auto upstream = drain(bus_, Link::Upstream);
    ASSERT_EQ(upstream.size(), 1u);
    const auto& error = std::get<StageError>(upstream[0]);
    EXPECT_FALSE(error.fatal);
    EXPECT_EQ(error.stage, "transcription");
    EXPECT_EQ(error.error.category, ErrorCategory::Transcription);
    EXPECT_EQ(stage_->failed_count(), 1u);
}

TEST_F(TranscriptionStageTest, CancelledSessionSkipsAudio) {
    token_.cancel();
    stage_->process_frame(make_audio(640), bus_);
    EXPECT_EQ(stt_->call_count(), 0u);
    EXPECT_EQ(bus_.pending(Link::Transcripts), 0u);
}

TEST_F(TranscriptionStageTest, ForwardsOtherFrames) {
    stage_->process_frame(ControlSignal{ControlKind::Kickoff}, bus_);
    stage_->process_frame(FinalTranscript{"typed"}, bus_);
    stage_->process_frame(StageError{make_error(ErrorCode::Internal), "x", true}, bus_);

    auto frames = drain(bus_, Link::Transcripts);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(std::get<ControlSignal>(frames[0]).kind, ControlKind::Kickoff);
    EXPECT_EQ(std::get<FinalTranscript>(frames[1]).text, "typed");
    EXPECT_EQ(bus_.pending(Link::Upstream), 1u);
}

TEST_F(TranscriptionStageTest, CancelAndRelease) {
    stage_->cancel();
    EXPECT_TRUE(stt_->cancelled_.load());

    stage_->release();
    Utterance utterance = Utterance::from_audio(make_audio(320));
    EXPECT_EQ(stage_->transcribe(utterance).error.code, ErrorCode::TranscriptionEngineFailure);
}
