/**
 * @file synthesis_stage.h
 * @brief voxline - Text to outbound audio
 */

#ifndef VOXLINE_FEATURES_TTS_SYNTHESIS_STAGE_H
#define VOXLINE_FEATURES_TTS_SYNTHESIS_STAGE_H

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "voxline/core/cancellation.h"
#include "voxline/core/error.h"
#include "voxline/engines/tts.h"
#include "voxline/pipeline/pipeline_stage.h"

namespace voxline {

struct SynthesisConfig {
    std::string voice_id;
    std::string model_id;
    float speed = 1.0f;
    // A terminator only ends a phrase once the phrase is at least this long
    size_t min_phrase_chars = 12;
    // Longer buffers are cut at the last space before this length
    size_t max_phrase_chars = 240;
};

// =============================================================================
// PhraseAggregator - groups streamed deltas into speakable phrases
// =============================================================================

class PhraseAggregator {
   public:
    PhraseAggregator(size_t min_phrase_chars, size_t max_phrase_chars);

    // Append a delta; returns the phrases it completed, in order
    std::vector<std::string> push(const std::string& delta);

    // Remaining text (trimmed); empty when nothing is buffered
    std::string flush();

    void clear() { buffer_.clear(); }
    const std::string& pending() const { return buffer_; }

   private:
    // Index one past the end of the first complete phrase, or 0
    size_t find_boundary() const;

    size_t min_phrase_chars_;
    size_t max_phrase_chars_;
    std::string buffer_;
};

// Receives synthesized audio in order; returns false once downstream stops accepting
using AudioSink = std::function<bool(AudioChunk chunk)>;

class SynthesisStage : public PipelineStage {
   public:
    SynthesisStage(std::shared_ptr<ISpeechSynthesizer> engine, const SynthesisConfig& config,
                   const CancellationToken& token);

    const char* name() const override { return "synthesis"; }
    Link input() const override { return Link::Text; }

    /**
     * Synthesize one piece of text.
     *
     * Empty or whitespace-only text produces no audio and succeeds. Audio is
     * handed to @p emit only once the engine reports success, so a failed
     * phrase never produces truncated output.
     */
    Error synthesize(const std::string& text, const AudioSink& emit);

    /**
     * TextDelta is batched into phrases; ResponseEnd flushes the remainder.
     * Synthesized audio and response control signals go to Outbound.
     */
    void process_frame(Frame&& frame, FrameBus& bus) override;

    void cancel() override;
    void release() override;

    size_t phrase_count() const { return phrase_count_.load(); }

   private:
    void speak(const std::string& phrase, FrameBus& bus);

    std::shared_ptr<ISpeechSynthesizer> engine_;
    SynthesisConfig config_;
    const CancellationToken& token_;
    PhraseAggregator aggregator_;

    std::atomic<size_t> phrase_count_{0};
};

}  // namespace voxline

#endif  // VOXLINE_FEATURES_TTS_SYNTHESIS_STAGE_H
