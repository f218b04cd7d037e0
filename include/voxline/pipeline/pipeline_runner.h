/**
 * @file pipeline_runner.h
 * @brief voxline - One voice-conversation session
 *
 * Owns the session's frame bus, utterance buffer, conversation context,
 * stages, engines and worker threads. The transport drives it through a
 * single entry point, dispatch(), which never waits on inference: inbound
 * frames are queued and handled by the ingest worker.
 *
 * State machine:
 *
 *   Idle --ClientConnected--> Connected --ClientReady--> Ready --frame--> Active
 *   Ready/Active --disconnect | Cancel | transport failure | fatal error--> Cancelling
 *   Cancelling --all workers exited, resources released--> Closed
 *   Idle/Connected --disconnect--> Closed
 *   Ready/Active --Shutdown (drain in order)--> Closed
 *
 * Closed is terminal; later events are rejected.
 */

#ifndef VOXLINE_PIPELINE_PIPELINE_RUNNER_H
#define VOXLINE_PIPELINE_PIPELINE_RUNNER_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "voxline/config/pipeline_config.h"
#include "voxline/core/error.h"
#include "voxline/engines/stt.h"
#include "voxline/engines/text_generation.h"
#include "voxline/engines/tts.h"
#include "voxline/features/llm/conversation_context.h"
#include "voxline/pipeline/transport.h"

namespace voxline {

enum class SessionState {
    Idle,
    Connected,
    Ready,
    Active,
    Cancelling,
    Closed,
};

const char* session_state_name(SessionState state);

// Engine instances owned by one session
struct SessionEngines {
    std::shared_ptr<ISpeechToText> stt;
    std::shared_ptr<ILanguageModel> llm;
    std::shared_ptr<ISpeechSynthesizer> tts;
};

/**
 * Session observers. All optional; invoked from worker threads (or the
 * dispatching thread for state changes), so they must not call back into
 * dispatch() synchronously.
 */
struct SessionCallbacks {
    std::function<void(SessionState from, SessionState to)> on_state_changed;
    std::function<void(const std::string& text, bool is_final)> on_transcription;
    std::function<void(const std::string& delta)> on_response_delta;
    std::function<void(const std::string& response)> on_response_complete;
    std::function<void(const AudioChunk& chunk)> on_audio_output;
    std::function<void(const Error& error, const std::string& stage)> on_error;
};

class PipelineRunner {
   public:
    PipelineRunner(const PipelineConfig& config, SessionEngines engines,
                   std::shared_ptr<AudioTransport> transport, SessionCallbacks callbacks = {});
    ~PipelineRunner();

    PipelineRunner(const PipelineRunner&) = delete;
    PipelineRunner& operator=(const PipelineRunner&) = delete;

    /**
     * Validate configuration, resolve the system prompt and build the stages.
     *
     * @return false with a Configuration-category last_error() on failure
     */
    bool initialize();

    const Error& last_error() const;

    /**
     * Apply one transport event.
     *
     * Disconnect, Cancel and TransportFailure tear the session down before
     * returning (in-flight engine calls are cancelled, workers joined).
     *
     * @return false if the event is not valid in the current state
     */
    bool dispatch(TransportEvent event);

    SessionState state() const;

    // Blocks until Closed; false on timeout
    bool wait_closed(std::chrono::milliseconds timeout);

    // Snapshot of the conversation history
    std::vector<Message> context() const;

    std::string participant() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace voxline

#endif  // VOXLINE_PIPELINE_PIPELINE_RUNNER_H
