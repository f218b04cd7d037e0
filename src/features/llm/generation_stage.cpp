/**
 * @file generation_stage.cpp
 * @brief voxline - Streaming response generation over the conversation
 */

#include "voxline/features/llm/generation_stage.h"

#include <chrono>
#include <exception>
#include <utility>

#include "voxline/core/logger.h"
#include "voxline/core/string_utils.h"

namespace voxline {

GenerationStage::GenerationStage(std::shared_ptr<ILanguageModel> engine,
                                 ConversationContext& context, const GenerationConfig& config,
                                 const CancellationToken& token)
    : engine_(std::move(engine)), context_(context), config_(config), token_(token) {}

// =============================================================================
// TURNS
// =============================================================================

GenerationOutcome GenerationStage::respond(const std::string& user_text, const DeltaSink& emit,
                                           const WithdrawSink& withdraw) {
    context_.append_user(user_text);
    VOXLINE_LOG_DEBUG("LLM", "User: \"%s\" (%zu messages)", user_text.c_str(), context_.size());
    return run_completion(emit, withdraw);
}

GenerationOutcome GenerationStage::kickoff(const DeltaSink& emit, const WithdrawSink& withdraw) {
    VOXLINE_LOG_DEBUG("LLM", "Kickoff over %zu messages", context_.size());
    return run_completion(emit, withdraw);
}

GenerationOutcome GenerationStage::run_completion(const DeltaSink& emit,
                                                  const WithdrawSink& withdraw) {
    GenerationOutcome outcome;

    if (token_.is_cancelled()) {
        outcome.error = make_error(ErrorCode::GenerationCancelled);
        return outcome;
    }

    GenerationRequest request;
    request.messages = context_.messages();
    request.model = config_.model;
    request.max_tokens = config_.max_tokens;
    request.temperature = config_.temperature;

    bool downstream_closed = false;
    auto on_token = [&](const std::string& token) -> bool {
        if (token_.is_cancelled()) {
            return false;
        }
        if (token.empty()) {
            return true;
        }
        if (!emit(TextDelta{token})) {
            downstream_closed = true;
            return false;
        }
        outcome.response += token;
        outcome.delta_count++;
        return !token_.is_cancelled();
    };

    Error result;
    auto start = std::chrono::steady_clock::now();
    if (!engine_) {
        result = make_error(ErrorCode::GenerationEngineFailure, "no LLM engine");
    } else {
        try {
            result = engine_->generate_stream(request, on_token);
        } catch (const std::exception& e) {
            result = make_error(ErrorCode::GenerationEngineFailure, e.what());
        }
    }
    auto elapsed_ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - start)
                          .count();

    // Cancellation wins over whatever the engine reported
    if (token_.is_cancelled() || downstream_closed ||
        result.code == ErrorCode::GenerationCancelled) {
        VOXLINE_LOG_INFO("LLM", "Generation cancelled after %zu deltas", outcome.delta_count);
        outcome.error = make_error(ErrorCode::GenerationCancelled);
        return outcome;
    }

    if (!result.ok()) {
        VOXLINE_LOG_ERROR("LLM", "Generation failed after %zu deltas: %s", outcome.delta_count,
                          result.to_string().c_str());
        outcome.error = result;
        if (config_.fallback_reply.empty()) {
            return outcome;
        }
        // The partial reply is never spoken ahead of the fallback
        if (outcome.delta_count > 0 && withdraw) {
            withdraw();
        }
        if (emit(TextDelta{config_.fallback_reply})) {
            outcome.fallback_emitted = true;
        }
        return outcome;
    }

    if (trim(outcome.response).empty()) {
        VOXLINE_LOG_WARNING("LLM", "Engine completed with an empty response");
        outcome.error = make_error(ErrorCode::GenerationEmptyResponse);
        return outcome;
    }

    // Recorded exactly as forwarded downstream
    outcome.assistant_appended = context_.append_assistant(outcome.response);
    if (!outcome.assistant_appended) {
        VOXLINE_LOG_WARNING("LLM", "Assistant turn not recorded: previous turn is Assistant");
    }
    VOXLINE_LOG_INFO("LLM", "Response complete in %.0f ms (%zu deltas, %zu chars)", elapsed_ms,
                     outcome.delta_count, outcome.response.size());
    return outcome;
}

// =============================================================================
// FRAME HANDLING
// =============================================================================

void GenerationStage::run_turn(FrameBus& bus, const std::string* user_text) {
    if (token_.is_cancelled()) {
        return;
    }

    DeltaSink emit = [&bus](TextDelta delta) { return bus.push(Link::Text, std::move(delta)); };
    WithdrawSink withdraw = [&bus] {
        bus.push(Link::Text, ControlSignal{ControlKind::ResponseAbort});
    };

    bus.push(Link::Text, ControlSignal{ControlKind::ResponseStart});
    GenerationOutcome outcome =
        user_text ? respond(*user_text, emit, withdraw) : kickoff(emit, withdraw);
    bus.push(Link::Text, ControlSignal{ControlKind::ResponseEnd});

    if (outcome.ok()) {
        response_count_++;
        return;
    }
    if (outcome.error.code == ErrorCode::GenerationEngineFailure) {
        bus.push(Link::Upstream, StageError{outcome.error, name(), false});
    }
}

void GenerationStage::process_frame(Frame&& frame, FrameBus& bus) {
    try {
        std::visit(
            overloaded{
                [&](FinalTranscript& transcript) {
                    std::string text = trim(transcript.text);
                    if (!text.empty()) {
                        run_turn(bus, &text);
                    }
                },
                [&](ControlSignal& signal) {
                    if (signal.kind == ControlKind::Kickoff) {
                        run_turn(bus, nullptr);
                    } else {
                        bus.push(Link::Text, signal);
                    }
                },
                [&](PartialTranscript&) {
                    // Observed by the session callbacks; nothing to generate
                },
                [&](TextDelta& delta) { bus.push(Link::Text, std::move(delta)); },
                [&](AudioChunk&) {
                    VOXLINE_LOG_WARNING("LLM", "Dropping audio chunk on the transcript link");
                },
                [&](StageError& error) { bus.push(Link::Upstream, std::move(error)); },
            },
            frame);
    } catch (const std::exception& e) {
        VOXLINE_LOG_FATAL("LLM", "Unrecoverable generation failure: %s", e.what());
        bus.push(Link::Upstream,
                 StageError{make_error(ErrorCode::Internal, e.what()), name(), true});
    }
}

void GenerationStage::cancel() {
    if (engine_) {
        engine_->cancel();
    }
}

void GenerationStage::release() {
    engine_.reset();
}

}  // namespace voxline
