/**
 * @file synthesis_stage.cpp
 * @brief voxline - Text to outbound audio
 */

#include "voxline/features/tts/synthesis_stage.h"

#include <chrono>
#include <exception>
#include <utility>

#include "voxline/core/audio_utils.h"
#include "voxline/core/logger.h"
#include "voxline/core/string_utils.h"

namespace voxline {

namespace {

bool is_terminator(char c) {
    return c == '.' || c == '!' || c == '?' || c == ';' || c == ':' || c == '\n';
}

}  // namespace

// =============================================================================
// PhraseAggregator
// =============================================================================

PhraseAggregator::PhraseAggregator(size_t min_phrase_chars, size_t max_phrase_chars)
    : min_phrase_chars_(min_phrase_chars),
      max_phrase_chars_(max_phrase_chars < 1 ? 1 : max_phrase_chars) {}

size_t PhraseAggregator::find_boundary() const {
    for (size_t i = 0; i < buffer_.size(); ++i) {
        char c = buffer_[i];
        if (!is_terminator(c) || i + 1 < min_phrase_chars_) {
            continue;
        }
        // "3.5" or "e.g." mid-stream must not end a phrase
        if (c == '\n' || (i + 1 < buffer_.size() && is_space(buffer_[i + 1]))) {
            return i + 1;
        }
    }

    if (buffer_.size() > max_phrase_chars_) {
        size_t cut = buffer_.rfind(' ', max_phrase_chars_);
        if (cut == std::string::npos || cut == 0) {
            return max_phrase_chars_;
        }
        return cut;
    }
    return 0;
}

std::vector<std::string> PhraseAggregator::push(const std::string& delta) {
    std::vector<std::string> phrases;
    buffer_ += delta;

    size_t boundary = find_boundary();
    while (boundary > 0) {
        std::string phrase = trim(buffer_.substr(0, boundary));
        buffer_.erase(0, boundary);
        if (!phrase.empty()) {
            phrases.push_back(std::move(phrase));
        }
        boundary = find_boundary();
    }
    return phrases;
}

std::string PhraseAggregator::flush() {
    std::string phrase = trim(buffer_);
    buffer_.clear();
    return phrase;
}

// =============================================================================
// SynthesisStage
// =============================================================================

SynthesisStage::SynthesisStage(std::shared_ptr<ISpeechSynthesizer> engine,
                               const SynthesisConfig& config, const CancellationToken& token)
    : engine_(std::move(engine)),
      config_(config),
      token_(token),
      aggregator_(config.min_phrase_chars, config.max_phrase_chars) {}

Error SynthesisStage::synthesize(const std::string& text, const AudioSink& emit) {
    std::string phrase = trim(text);
    if (phrase.empty()) {
        return Error{};
    }
    if (!engine_) {
        return make_error(ErrorCode::SynthesisEngineFailure, "no TTS engine");
    }

    TTSRequest request;
    request.text = phrase;
    request.voice_id = config_.voice_id;
    request.model_id = config_.model_id;
    request.speed_rate = config_.speed;

    std::vector<AudioChunk> produced;
    size_t total_bytes = 0;
    auto on_audio = [&](const std::vector<int16_t>& pcm16, int sample_rate, int channels) {
        if (token_.is_cancelled()) {
            return false;
        }
        if (!pcm16.empty()) {
            AudioChunk chunk;
            chunk.samples = pcm16_to_bytes(pcm16.data(), pcm16.size());
            chunk.sample_rate = sample_rate;
            chunk.channels = channels;
            total_bytes += chunk.samples.size();
            produced.push_back(std::move(chunk));
        }
        return !token_.is_cancelled();
    };

    Error result;
    auto start = std::chrono::steady_clock::now();
    try {
        result = engine_->synthesize(request, on_audio);
    } catch (const std::exception& e) {
        result = make_error(ErrorCode::SynthesisEngineFailure, e.what());
    }
    auto elapsed_ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - start)
                          .count();

    if (token_.is_cancelled()) {
        return make_error(ErrorCode::SynthesisCancelled);
    }
    if (!result.ok()) {
        VOXLINE_LOG_ERROR("TTS", "Synthesis failed for \"%s\": %s", phrase.c_str(),
                          result.to_string().c_str());
        return result;
    }

    VOXLINE_LOG_DEBUG("TTS", "Synthesized %zu chars -> %zu bytes in %.0f ms", phrase.size(),
                      total_bytes, elapsed_ms);

    for (auto& chunk : produced) {
        if (!emit(std::move(chunk))) {
            return make_error(ErrorCode::SynthesisCancelled, "outbound link closed");
        }
    }
    return Error{};
}

void SynthesisStage::speak(const std::string& phrase, FrameBus& bus) {
    if (phrase.empty() || token_.is_cancelled()) {
        return;
    }
    AudioSink emit = [&bus](AudioChunk chunk) { return bus.push(Link::Outbound, std::move(chunk)); };
    Error error = synthesize(phrase, emit);
    if (error.ok()) {
        phrase_count_++;
    } else if (error.code == ErrorCode::SynthesisEngineFailure) {
        bus.push(Link::Upstream, StageError{error, name(), false});
    }
}

void SynthesisStage::process_frame(Frame&& frame, FrameBus& bus) {
    std::visit(
        overloaded{
            [&](TextDelta& delta) {
                for (const auto& phrase : aggregator_.push(delta.text)) {
                    speak(phrase, bus);
                }
            },
            [&](ControlSignal& signal) {
                if (signal.kind == ControlKind::ResponseStart ||
                    signal.kind == ControlKind::ResponseEnd) {
                    speak(aggregator_.flush(), bus);
                } else if (signal.kind == ControlKind::ResponseAbort) {
                    aggregator_.clear();
                }
                bus.push(Link::Outbound, signal);
            },
            [&](AudioChunk& chunk) { bus.push(Link::Outbound, std::move(chunk)); },
            [&](PartialTranscript&) {},
            [&](FinalTranscript&) {},
            [&](StageError& error) { bus.push(Link::Upstream, std::move(error)); },
        },
        frame);
}

void SynthesisStage::cancel() {
    if (engine_) {
        engine_->cancel();
    }
}

void SynthesisStage::release() {
    aggregator_.clear();
    engine_.reset();
}

}  // namespace voxline
