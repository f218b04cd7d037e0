/**
 * @file generation_stage.h
 * @brief voxline - Streaming response generation over the conversation
 *
 * Sole writer of the session's ConversationContext. For each final
 * transcript the stage appends the User turn, streams a completion over the
 * whole history, forwards every increment downstream as a TextDelta, and
 * appends the Assistant turn once the stream completes.
 */

#ifndef VOXLINE_FEATURES_LLM_GENERATION_STAGE_H
#define VOXLINE_FEATURES_LLM_GENERATION_STAGE_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "voxline/core/cancellation.h"
#include "voxline/core/error.h"
#include "voxline/engines/text_generation.h"
#include "voxline/features/llm/conversation_context.h"
#include "voxline/pipeline/pipeline_stage.h"

namespace voxline {

constexpr const char* DEFAULT_FALLBACK_REPLY =
    "I'm sorry, but I encountered an error while trying to respond.";

struct GenerationConfig {
    std::string model;
    int max_tokens = 256;
    float temperature = 0.7f;
    // Spoken when the engine fails; empty disables the fallback
    std::string fallback_reply = DEFAULT_FALLBACK_REPLY;
};

struct GenerationOutcome {
    Error error;
    std::string response;  // accumulated text forwarded downstream
    size_t delta_count = 0;
    bool assistant_appended = false;
    bool fallback_emitted = false;

    bool ok() const { return error.ok(); }
};

// Receives each delta in order; returns false once downstream stops accepting
using DeltaSink = std::function<bool(TextDelta delta)>;

// Tells downstream to drop deltas it has not spoken yet
using WithdrawSink = std::function<void()>;

class GenerationStage : public PipelineStage {
   public:
    GenerationStage(std::shared_ptr<ILanguageModel> engine, ConversationContext& context,
                    const GenerationConfig& config, const CancellationToken& token);

    const char* name() const override { return "generation"; }
    Link input() const override { return Link::Transcripts; }

    /**
     * One conversational turn for a final transcript.
     *
     * Engine failure: no Assistant append, one fallback delta emitted. When
     * deltas were already forwarded, `withdraw` runs before the fallback.
     * Cancellation: forwarding stops, no Assistant append, no fallback.
     * Exceptions from the context itself propagate to the caller.
     */
    GenerationOutcome respond(const std::string& user_text, const DeltaSink& emit,
                              const WithdrawSink& withdraw = nullptr);

    // Completion over the current context without new user text (greeting)
    GenerationOutcome kickoff(const DeltaSink& emit, const WithdrawSink& withdraw = nullptr);

    /**
     * FinalTranscript / Kickoff -> ResponseStart, TextDelta..., ResponseEnd on
     * Text. Engine failures go upstream as non-fatal StageErrors; exceptions
     * from the context are fatal.
     */
    void process_frame(Frame&& frame, FrameBus& bus) override;

    void cancel() override;
    void release() override;

    size_t response_count() const { return response_count_.load(); }

   private:
    GenerationOutcome run_completion(const DeltaSink& emit, const WithdrawSink& withdraw);
    void run_turn(FrameBus& bus, const std::string* user_text);

    std::shared_ptr<ILanguageModel> engine_;
    ConversationContext& context_;
    GenerationConfig config_;
    const CancellationToken& token_;

    std::atomic<size_t> response_count_{0};
};

}  // namespace voxline

#endif  // VOXLINE_FEATURES_LLM_GENERATION_STAGE_H
