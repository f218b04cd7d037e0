/**
 * @file frame.h
 * @brief voxline - Frames carried on the frame bus
 *
 * A Frame is a closed tagged variant. Stages match it exhaustively with
 * std::visit + overloaded{...}; adding an alternative breaks every stage at
 * compile time until it handles the new type.
 *
 * Frames are created once and moved from link to link; a frame instance has
 * exactly one consumer.
 */

#ifndef VOXLINE_PIPELINE_FRAME_H
#define VOXLINE_PIPELINE_FRAME_H

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "voxline/core/error.h"

namespace voxline {

// Raw 16-bit little-endian PCM
struct AudioChunk {
    std::vector<uint8_t> samples;
    int32_t sample_rate = 16000;
    int32_t channels = 1;
};

struct PartialTranscript {
    std::string text;
};

struct FinalTranscript {
    std::string text;
};

struct TextDelta {
    std::string text;
};

enum class ControlKind {
    UtteranceStart,  // VAD: user started speaking
    UtteranceEnd,    // VAD: user stopped speaking
    Cancel,          // abort in-flight work immediately
    Shutdown,        // stop accepting input, drain, then close
    ResponseStart,   // first delta of a generated response follows
    ResponseEnd,     // generated response complete (flush phrase buffer)
    ResponseAbort,   // generated response withdrawn (drop unspoken text)
    Kickoff,         // generate from the current context without new user text
};

struct ControlSignal {
    ControlKind kind = ControlKind::Cancel;
};

// Upstream only: a stage reporting a failure to the runner
struct StageError {
    Error error;
    std::string stage;
    bool fatal = false;
};

using Frame =
    std::variant<AudioChunk, PartialTranscript, FinalTranscript, TextDelta, ControlSignal, StageError>;

// Visitor helper for exhaustive matching
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

const char* control_kind_name(ControlKind kind);
const char* frame_type_name(const Frame& frame);

}  // namespace voxline

#endif  // VOXLINE_PIPELINE_FRAME_H
