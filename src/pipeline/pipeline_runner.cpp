/**
 * @file pipeline_runner.cpp
 * @brief voxline - One voice-conversation session
 */

#include "voxline/pipeline/pipeline_runner.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "voxline/config/bot_personality.h"
#include "voxline/core/cancellation.h"
#include "voxline/core/logger.h"
#include "voxline/features/llm/generation_stage.h"
#include "voxline/features/stt/transcription_stage.h"
#include "voxline/features/tts/synthesis_stage.h"
#include "voxline/features/vad/energy_vad.h"
#include "voxline/pipeline/frame_bus.h"
#include "voxline/pipeline/utterance_buffer.h"

namespace voxline {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "Idle";
        case SessionState::Connected:
            return "Connected";
        case SessionState::Ready:
            return "Ready";
        case SessionState::Active:
            return "Active";
        case SessionState::Cancelling:
            return "Cancelling";
        case SessionState::Closed:
            return "Closed";
    }
    return "Unknown";
}

const char* transport_event_name(const TransportEvent& event) {
    return std::visit(overloaded{
                          [](const ClientConnected&) { return "ClientConnected"; },
                          [](const ClientReady&) { return "ClientReady"; },
                          [](const ClientDisconnected&) { return "ClientDisconnected"; },
                          [](const InboundFrame&) { return "InboundFrame"; },
                          [](const TransportFailure&) { return "TransportFailure"; },
                      },
                      event);
}

// =============================================================================
// IMPLEMENTATION
// =============================================================================

struct PipelineRunner::Impl {
    PipelineConfig config;
    SessionEngines engines;
    std::shared_ptr<AudioTransport> transport;
    SessionCallbacks callbacks;

    bool initialized = false;
    Error last_error;

    // Session state; guarded by state_mutex
    mutable std::mutex state_mutex;
    std::condition_variable state_cv;
    SessionState state = SessionState::Idle;
    bool workers_started = false;
    bool abort_requested = false;
    bool shutdown_requested = false;
    std::string participant;

    CancellationToken token;
    FrameBus bus;
    std::unique_ptr<ConversationContext> context;

    // Touched only by the ingest worker once started
    std::unique_ptr<UtteranceBuffer> buffer;
    std::unique_ptr<EnergyVad> vad;

    std::unique_ptr<TranscriptionStage> transcription;
    std::unique_ptr<GenerationStage> generation;
    std::unique_ptr<SynthesisStage> synthesis;
    std::mutex stages_mutex;
    bool stages_released = false;

    // ingest, transcription, generation, synthesis, outbound; in data order
    std::vector<std::thread> data_workers;
    std::thread upstream_worker;
    std::thread supervisor;
    std::mutex join_mutex;

    std::mutex response_mutex;
    std::string response_text;

    Impl(const PipelineConfig& cfg, SessionEngines eng, std::shared_ptr<AudioTransport> tr,
         SessionCallbacks cb)
        : config(cfg), engines(std::move(eng)), transport(std::move(tr)), callbacks(std::move(cb)) {}

    bool fail(const Error& error) {
        last_error = error;
        VOXLINE_LOG_ERROR("Pipeline", "%s", error.to_string().c_str());
        return false;
    }

    // ---- state ----------------------------------------------------------------

    // Sets the state, releases the lock, then notifies the observer. Closed is
    // terminal: any transition out of it is refused.
    bool change_state(std::unique_lock<std::mutex>& lock, SessionState to) {
        SessionState from = state;
        if (from == to || from == SessionState::Closed) {
            lock.unlock();
            if (from != to) {
                VOXLINE_LOG_WARNING("Pipeline", "Refusing transition Closed -> %s",
                                    session_state_name(to));
            }
            return false;
        }
        state = to;
        lock.unlock();
        state_cv.notify_all();

        VOXLINE_LOG_INFO("Pipeline", "State %s -> %s", session_state_name(from),
                         session_state_name(to));
        if (callbacks.on_state_changed) {
            callbacks.on_state_changed(from, to);
        }
        return true;
    }

    void report_error(const Error& error, const std::string& stage) {
        VOXLINE_LOG_WARNING("Pipeline", "[%s] %s", stage.c_str(), error.to_string().c_str());
        if (callbacks.on_error) {
            callbacks.on_error(error, stage);
        }
    }

    // ---- event handlers -------------------------------------------------------

    bool on_connected(const ClientConnected& event) {
        std::unique_lock<std::mutex> lock(state_mutex);
        if (state != SessionState::Idle) {
            VOXLINE_LOG_WARNING("Pipeline", "ClientConnected rejected in state %s",
                                session_state_name(state));
            return false;
        }
        participant = event.participant;
        VOXLINE_LOG_INFO("Pipeline", "Client connected: %s", participant.c_str());
        change_state(lock, SessionState::Connected);
        return true;
    }

    bool on_ready() {
        {
            std::unique_lock<std::mutex> lock(state_mutex);
            if (state != SessionState::Connected) {
                VOXLINE_LOG_WARNING("Pipeline", "ClientReady rejected in state %s",
                                    session_state_name(state));
                return false;
            }
            if (!initialized) {
                last_error = make_error(ErrorCode::InvalidState, "runner not initialized");
                VOXLINE_LOG_ERROR("Pipeline", "ClientReady before initialize()");
                return false;
            }

            // Workers start and the session leaves Connected under one lock, so a
            // concurrent disconnect either closes before this point or sees Ready
            workers_started = true;
            engines.stt->resume();
            engines.llm->resume();
            engines.tts->resume();
            start_workers();
            change_state(lock, SessionState::Ready);
        }

        start_greeting();
        return true;
    }

    bool on_inbound(Frame frame) {
        std::unique_lock<std::mutex> lock(state_mutex);
        if (state != SessionState::Ready && state != SessionState::Active) {
            VOXLINE_LOG_DEBUG("Pipeline", "Inbound %s rejected in state %s",
                              frame_type_name(frame), session_state_name(state));
            return false;
        }
        if (shutdown_requested) {
            return false;
        }

        if (const auto* signal = std::get_if<ControlSignal>(&frame)) {
            if (signal->kind == ControlKind::Cancel) {
                lock.unlock();
                abort(make_error(ErrorCode::Cancelled, "cancel requested by client"));
                return true;
            }
            if (signal->kind == ControlKind::Shutdown) {
                shutdown_requested = true;
                VOXLINE_LOG_INFO("Pipeline", "Graceful shutdown requested, draining");
                change_state(lock, SessionState::Cancelling);
                return true;
            }
        }

        if (state == SessionState::Ready) {
            change_state(lock, SessionState::Active);
        } else {
            lock.unlock();
        }
        return bus.push(Link::Inbound, std::move(frame));
    }

    bool on_disconnected(const Error& reason) {
        std::unique_lock<std::mutex> lock(state_mutex);
        switch (state) {
            case SessionState::Closed:
                return false;
            case SessionState::Idle:
            case SessionState::Connected:
                if (!workers_started) {
                    change_state(lock, SessionState::Closed);
                    return true;
                }
                lock.unlock();
                abort(reason);
                return true;
            default:
                lock.unlock();
                abort(reason);
                return true;
        }
    }

    // ---- cancellation -----------------------------------------------------------

    // Fire cancellation without waiting; safe from any thread, including workers
    void request_abort(const Error& reason) {
        {
            std::unique_lock<std::mutex> lock(state_mutex);
            if (!workers_started || abort_requested || state == SessionState::Closed) {
                return;
            }
            abort_requested = true;
            VOXLINE_LOG_INFO("Pipeline", "Cancelling session: %s", reason.to_string().c_str());
            if (state == SessionState::Ready || state == SessionState::Active) {
                change_state(lock, SessionState::Cancelling);
            }
        }

        token.cancel();
        bus.cancel_all();
        {
            std::lock_guard<std::mutex> lock(stages_mutex);
            if (!stages_released) {
                transcription->cancel();
                generation->cancel();
                synthesis->cancel();
            }
        }
        state_cv.notify_all();
    }

    void join_supervisor() {
        std::lock_guard<std::mutex> lock(join_mutex);
        if (supervisor.joinable() && supervisor.get_id() != std::this_thread::get_id()) {
            supervisor.join();
        }
    }

    // Cancel and wait until Closed
    void abort(const Error& reason) {
        request_abort(reason);
        join_supervisor();
    }

    // ---- workers ----------------------------------------------------------------

    void start_workers() {
        bus.set_observer([this](Link link, const Frame& frame) { observe(link, frame); });

        data_workers.emplace_back([this] { run_ingest(); });
        data_workers.emplace_back([this] { run_stage(*transcription, Link::Transcripts); });
        data_workers.emplace_back([this] { run_stage(*generation, Link::Text); });
        data_workers.emplace_back([this] { run_stage(*synthesis, Link::Outbound); });
        data_workers.emplace_back([this] { run_outbound(); });
        upstream_worker = std::thread([this] { run_upstream(); });
        supervisor = std::thread([this] { supervise(); });
        VOXLINE_LOG_DEBUG("Pipeline", "Started %zu workers", data_workers.size() + 2);
    }

    void start_greeting() {
        switch (config.greeting.mode) {
            case GreetingMode::None:
                break;
            case GreetingMode::Static:
                VOXLINE_LOG_INFO("Pipeline", "Speaking static greeting");
                bus.push(Link::Text, ControlSignal{ControlKind::ResponseStart});
                bus.push(Link::Text, TextDelta{config.greeting.text});
                bus.push(Link::Text, ControlSignal{ControlKind::ResponseEnd});
                break;
            case GreetingMode::Generate:
                VOXLINE_LOG_INFO("Pipeline", "Generating greeting");
                bus.push(Link::Transcripts, ControlSignal{ControlKind::Kickoff});
                break;
        }
    }

    void emit_utterance(std::optional<Utterance> utterance) {
        if (!utterance) {
            return;
        }
        AudioChunk audio = utterance->release_audio();
        VOXLINE_LOG_DEBUG("Pipeline", "Utterance complete: %zu bytes", audio.samples.size());
        bus.push(Link::Utterances, std::move(audio));
    }

    void ingest_audio(const AudioChunk& chunk) {
        if (!vad) {
            emit_utterance(buffer->accept(chunk));
            return;
        }

        // Start signals open the utterance before the chunk lands in it;
        // end signals close it after
        bool accepted = false;
        for (ControlKind kind : vad->process(chunk)) {
            if (kind == ControlKind::UtteranceEnd && !accepted) {
                emit_utterance(buffer->accept(chunk));
                accepted = true;
            }
            emit_utterance(buffer->on_control(ControlSignal{kind}));
        }
        if (!accepted) {
            emit_utterance(buffer->accept(chunk));
        }
    }

    void run_ingest() {
        Frame frame;
        while (bus.pop(Link::Inbound, frame)) {
            std::visit(overloaded{
                           [&](AudioChunk& chunk) { ingest_audio(chunk); },
                           [&](ControlSignal& signal) {
                               if (signal.kind == ControlKind::UtteranceStart ||
                                   signal.kind == ControlKind::UtteranceEnd) {
                                   emit_utterance(buffer->on_control(signal));
                               } else {
                                   bus.push(Link::Utterances, signal);
                               }
                           },
                           [&](StageError& error) { bus.push(Link::Upstream, std::move(error)); },
                           [&](PartialTranscript& partial) {
                               bus.push(Link::Utterances, std::move(partial));
                           },
                           [&](FinalTranscript& transcript) {
                               bus.push(Link::Utterances, std::move(transcript));
                           },
                           [&](TextDelta& delta) { bus.push(Link::Utterances, std::move(delta)); },
                       },
                       frame);
        }

        // Input drained: whatever was said last still counts
        if (!token.is_cancelled()) {
            if (vad) {
                for (ControlKind kind : vad->finish()) {
                    emit_utterance(buffer->on_control(ControlSignal{kind}));
                }
            }
            emit_utterance(buffer->flush());
        }
        buffer->reset();
        bus.close(Link::Utterances);
    }

    void run_stage(PipelineStage& stage, Link output) {
        Frame frame;
        while (bus.pop(stage.input(), frame)) {
            try {
                stage.process_frame(std::move(frame), bus);
            } catch (const std::exception& e) {
                VOXLINE_LOG_ERROR("Pipeline", "Stage %s threw: %s", stage.name(), e.what());
                bus.push(Link::Upstream,
                         StageError{make_error(ErrorCode::Internal, e.what()), stage.name(), true});
            }
        }
        bus.close(output);
        VOXLINE_LOG_DEBUG("Pipeline", "Stage %s stopped", stage.name());
    }

    void run_outbound() {
        Frame frame;
        while (bus.pop(Link::Outbound, frame)) {
            bool keep_going = std::visit(
                overloaded{
                    [&](AudioChunk& chunk) {
                        if (token.is_cancelled()) {
                            return false;
                        }
                        bool sent = false;
                        try {
                            sent = transport->send_audio(chunk);
                        } catch (const std::exception& e) {
                            VOXLINE_LOG_ERROR("Pipeline", "Transport threw: %s", e.what());
                        }
                        if (!sent) {
                            Error error = make_error(ErrorCode::TransportSendFailed);
                            report_error(error, "transport");
                            request_abort(error);
                            return false;
                        }
                        if (callbacks.on_audio_output) {
                            callbacks.on_audio_output(chunk);
                        }
                        return true;
                    },
                    [&](ControlSignal& signal) {
                        VOXLINE_LOG_TRACE("Pipeline", "Outbound %s", control_kind_name(signal.kind));
                        return true;
                    },
                    [&](StageError& error) {
                        bus.push(Link::Upstream, std::move(error));
                        return true;
                    },
                    [&](PartialTranscript&) { return true; },
                    [&](FinalTranscript&) { return true; },
                    [&](TextDelta&) { return true; },
                },
                frame);
            if (!keep_going) {
                break;
            }
        }
    }

    void run_upstream() {
        Frame frame;
        while (bus.pop(Link::Upstream, frame)) {
            if (auto* error = std::get_if<StageError>(&frame)) {
                report_error(error->error, error->stage);
                if (error->fatal) {
                    request_abort(error->error);
                }
            }
        }
    }

    void supervise() {
        bool graceful = false;
        {
            std::unique_lock<std::mutex> lock(state_mutex);
            state_cv.wait(lock, [this] { return abort_requested || shutdown_requested; });
            graceful = !abort_requested;
        }

        if (graceful) {
            // Each data worker closes the next link once its input is drained
            bus.close(Link::Inbound);
            for (auto& worker : data_workers) {
                worker.join();
            }
            bus.close(Link::Upstream);
        }

        for (auto& worker : data_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        if (upstream_worker.joinable()) {
            upstream_worker.join();
        }

        release_resources();

        std::unique_lock<std::mutex> lock(state_mutex);
        change_state(lock, SessionState::Closed);
    }

    void release_resources() {
        std::lock_guard<std::mutex> lock(stages_mutex);
        VOXLINE_LOG_INFO("Pipeline",
                         "Session summary: %zu transcripts, %zu responses, %zu phrases spoken",
                         transcription->transcribed_count(), generation->response_count(),
                         synthesis->phrase_count());
        transcription->release();
        generation->release();
        synthesis->release();
        stages_released = true;

        buffer->reset();
        if (vad) {
            vad->reset();
        }
        engines = SessionEngines{};
        transport.reset();
    }

    // ---- observer ---------------------------------------------------------------

    void observe(Link link, const Frame& frame) {
        std::visit(overloaded{
                       [&](const PartialTranscript& partial) {
                           if (link == Link::Transcripts && callbacks.on_transcription) {
                               callbacks.on_transcription(partial.text, false);
                           }
                       },
                       [&](const FinalTranscript& transcript) {
                           if (link == Link::Transcripts && callbacks.on_transcription) {
                               callbacks.on_transcription(transcript.text, true);
                           }
                       },
                       [&](const TextDelta& delta) {
                           if (link != Link::Text) {
                               return;
                           }
                           {
                               std::lock_guard<std::mutex> lock(response_mutex);
                               response_text += delta.text;
                           }
                           if (callbacks.on_response_delta) {
                               callbacks.on_response_delta(delta.text);
                           }
                       },
                       [&](const ControlSignal& signal) {
                           if (link != Link::Text) {
                               return;
                           }
                           if (signal.kind == ControlKind::ResponseAbort) {
                               std::lock_guard<std::mutex> lock(response_mutex);
                               response_text.clear();
                               return;
                           }
                           if (signal.kind != ControlKind::ResponseStart &&
                               signal.kind != ControlKind::ResponseEnd) {
                               return;
                           }
                           std::string response;
                           {
                               std::lock_guard<std::mutex> lock(response_mutex);
                               response.swap(response_text);
                           }
                           if (signal.kind == ControlKind::ResponseEnd && !response.empty() &&
                               callbacks.on_response_complete) {
                               callbacks.on_response_complete(response);
                           }
                       },
                       [](const AudioChunk&) {},
                       [](const StageError&) {},
                   },
                   frame);
    }
};

// =============================================================================
// PUBLIC API
// =============================================================================

PipelineRunner::PipelineRunner(const PipelineConfig& config, SessionEngines engines,
                               std::shared_ptr<AudioTransport> transport,
                               SessionCallbacks callbacks)
    : impl_(std::make_unique<Impl>(config, std::move(engines), std::move(transport),
                                   std::move(callbacks))) {}

PipelineRunner::~PipelineRunner() {
    impl_->abort(make_error(ErrorCode::Cancelled, "session destroyed"));
}

bool PipelineRunner::initialize() {
    Impl& s = *impl_;
    if (s.initialized) {
        return true;
    }

    Error error = validate_pipeline_config(s.config);
    if (!error.ok()) {
        return s.fail(error);
    }
    if (!s.engines.stt || !s.engines.llm || !s.engines.tts) {
        return s.fail(make_error(ErrorCode::EngineMissing,
                                 "STT, LLM and TTS engines are all required"));
    }
    if (!s.transport) {
        return s.fail(make_error(ErrorCode::ConfigInvalid, "no audio transport"));
    }

    std::string prompt = s.config.system_prompt;
    if (prompt.empty()) {
        error = resolve_system_prompt(s.config.bots_dir, s.config.bot_name, prompt);
        if (!error.ok()) {
            return s.fail(error);
        }
    }
    s.context = std::make_unique<ConversationContext>(prompt);

    UtteranceBufferConfig buffer_config = s.config.utterance;
    if (s.config.energy_vad_enabled) {
        buffer_config.vad_enabled = true;
        s.vad = std::make_unique<EnergyVad>(s.config.energy_vad);
    }
    s.buffer = std::make_unique<UtteranceBuffer>(buffer_config);

    s.transcription =
        std::make_unique<TranscriptionStage>(s.engines.stt, s.config.transcription, s.token);
    s.generation = std::make_unique<GenerationStage>(s.engines.llm, *s.context,
                                                     s.config.generation, s.token);
    s.synthesis =
        std::make_unique<SynthesisStage>(s.engines.tts, s.config.synthesis, s.token);

    VOXLINE_LOG_INFO("Pipeline", "Initialized: stt=%s llm=%s tts=%s vad=%s greeting=%s",
                     s.engines.stt->name().c_str(), s.engines.llm->name().c_str(),
                     s.engines.tts->name().c_str(),
                     s.vad ? "energy" : (buffer_config.vad_enabled ? "external" : "threshold"),
                     greeting_mode_name(s.config.greeting.mode));
    s.initialized = true;
    return true;
}

const Error& PipelineRunner::last_error() const {
    return impl_->last_error;
}

bool PipelineRunner::dispatch(TransportEvent event) {
    Impl& s = *impl_;
    VOXLINE_LOG_TRACE("Pipeline", "dispatch %s", transport_event_name(event));
    return std::visit(
        overloaded{
            [&](ClientConnected& e) { return s.on_connected(e); },
            [&](ClientReady&) { return s.on_ready(); },
            [&](ClientDisconnected&) {
                return s.on_disconnected(make_error(ErrorCode::TransportDisconnected));
            },
            [&](InboundFrame& e) { return s.on_inbound(std::move(e.frame)); },
            [&](TransportFailure& e) {
                Error error = e.error.ok() ? make_error(ErrorCode::TransportDisconnected) : e.error;
                s.report_error(error, "transport");
                return s.on_disconnected(error);
            },
        },
        event);
}

SessionState PipelineRunner::state() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->state;
}

bool PipelineRunner::wait_closed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(impl_->state_mutex);
    return impl_->state_cv.wait_for(lock, timeout,
                                    [this] { return impl_->state == SessionState::Closed; });
}

std::vector<Message> PipelineRunner::context() const {
    if (!impl_->context) {
        return {};
    }
    return impl_->context->messages();
}

std::string PipelineRunner::participant() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->participant;
}

}  // namespace voxline
