/**
 * @file transcription_stage.h
 * @brief voxline - Utterance to final transcript
 */

#ifndef VOXLINE_FEATURES_STT_TRANSCRIPTION_STAGE_H
#define VOXLINE_FEATURES_STT_TRANSCRIPTION_STAGE_H

#include <atomic>
#include <memory>
#include <string>

#include "voxline/core/cancellation.h"
#include "voxline/core/error.h"
#include "voxline/engines/stt.h"
#include "voxline/pipeline/pipeline_stage.h"
#include "voxline/pipeline/utterance_buffer.h"

namespace voxline {

struct TranscriptionConfig {
    std::string language = "en";
};

struct TranscriptionOutcome {
    Error error;       // EmptyResult or EngineFailure on failure
    std::string text;  // trimmed transcript on success

    bool ok() const { return error.ok(); }
};

class TranscriptionStage : public PipelineStage {
   public:
    TranscriptionStage(std::shared_ptr<ISpeechToText> engine, const TranscriptionConfig& config,
                       const CancellationToken& token);

    const char* name() const override { return "transcription"; }
    Link input() const override { return Link::Utterances; }

    /**
     * Transcribe one flushed utterance. The utterance is closed on return,
     * whatever the outcome. Engine exceptions are reported as EngineFailure.
     */
    TranscriptionOutcome transcribe(Utterance& utterance);

    /**
     * AudioChunk (a complete utterance) -> FinalTranscript on Transcripts.
     * Failures go upstream as non-fatal StageErrors; empty results are dropped.
     * Transcript and control frames pass through.
     */
    void process_frame(Frame&& frame, FrameBus& bus) override;

    void cancel() override;
    void release() override;

    size_t transcribed_count() const { return transcribed_count_.load(); }
    size_t failed_count() const { return failed_count_.load(); }

   private:
    std::shared_ptr<ISpeechToText> engine_;
    TranscriptionConfig config_;
    const CancellationToken& token_;

    std::atomic<size_t> transcribed_count_{0};
    std::atomic<size_t> failed_count_{0};
};

}  // namespace voxline

#endif  // VOXLINE_FEATURES_STT_TRANSCRIPTION_STAGE_H
