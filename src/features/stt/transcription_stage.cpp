/**
 * @file transcription_stage.cpp
 * @brief voxline - Utterance to final transcript
 */

#include "voxline/features/stt/transcription_stage.h"

#include <chrono>
#include <exception>
#include <utility>

#include "voxline/core/audio_utils.h"
#include "voxline/core/logger.h"
#include "voxline/core/string_utils.h"

namespace voxline {

TranscriptionStage::TranscriptionStage(std::shared_ptr<ISpeechToText> engine,
                                       const TranscriptionConfig& config,
                                       const CancellationToken& token)
    : engine_(std::move(engine)), config_(config), token_(token) {}

TranscriptionOutcome TranscriptionStage::transcribe(Utterance& utterance) {
    TranscriptionOutcome outcome;

    if (!engine_) {
        utterance.close();
        outcome.error = make_error(ErrorCode::TranscriptionEngineFailure, "no STT engine");
        return outcome;
    }

    if (utterance.byte_count() < sizeof(int16_t)) {
        utterance.close();
        outcome.error = make_error(ErrorCode::TranscriptionMalformedAudio,
                                   "utterance holds less than one sample");
        return outcome;
    }

    STTRequest request;
    request.audio_samples = pcm16_bytes_to_float(utterance.bytes());
    request.sample_rate = utterance.sample_rate();
    request.channels = utterance.channels();
    request.language = config_.language;

    const double duration_sec = utterance.duration_sec();
    // The float copy is all the engine needs
    utterance.close();

    VOXLINE_LOG_DEBUG("STT", "Transcribing %.2fs of audio (%zu samples @ %d Hz)", duration_sec,
                      request.audio_samples.size(), request.sample_rate);

    STTResult result;
    auto start = std::chrono::steady_clock::now();
    try {
        outcome.error = engine_->transcribe(request, result);
    } catch (const std::exception& e) {
        outcome.error = make_error(ErrorCode::TranscriptionEngineFailure, e.what());
    }
    auto elapsed_ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - start)
                          .count();

    if (!outcome.ok()) {
        VOXLINE_LOG_ERROR("STT", "Transcription failed after %.0f ms: %s", elapsed_ms,
                          outcome.error.to_string().c_str());
        return outcome;
    }

    outcome.text = trim(result.text);
    if (outcome.text.empty()) {
        outcome.error = make_error(ErrorCode::TranscriptionEmptyResult);
        VOXLINE_LOG_INFO("STT", "No speech recognized in %.2fs utterance", duration_sec);
        return outcome;
    }

    VOXLINE_LOG_INFO("STT", "Transcribed in %.0f ms: \"%s\"", elapsed_ms, outcome.text.c_str());
    return outcome;
}

void TranscriptionStage::process_frame(Frame&& frame, FrameBus& bus) {
    std::visit(
        overloaded{
            [&](AudioChunk& chunk) {
                if (token_.is_cancelled()) {
                    return;
                }
                Utterance utterance = Utterance::from_audio(std::move(chunk));
                TranscriptionOutcome outcome = transcribe(utterance);
                if (outcome.ok()) {
                    transcribed_count_++;
                    bus.push(Link::Transcripts, FinalTranscript{std::move(outcome.text)});
                    return;
                }
                if (outcome.error.code == ErrorCode::TranscriptionEmptyResult) {
                    return;
                }
                failed_count_++;
                // Cancelled sessions do not report the failure they caused
                if (!token_.is_cancelled()) {
                    bus.push(Link::Upstream, StageError{outcome.error, name(), false});
                }
            },
            [&](PartialTranscript& partial) {
                bus.push(Link::Transcripts, std::move(partial));
            },
            [&](FinalTranscript& transcript) {
                bus.push(Link::Transcripts, std::move(transcript));
            },
            [&](TextDelta& delta) { bus.push(Link::Transcripts, std::move(delta)); },
            [&](ControlSignal& signal) { bus.push(Link::Transcripts, signal); },
            [&](StageError& error) { bus.push(Link::Upstream, std::move(error)); },
        },
        frame);
}

void TranscriptionStage::cancel() {
    if (engine_) {
        engine_->cancel();
    }
}

void TranscriptionStage::release() {
    engine_.reset();
}

}  // namespace voxline
