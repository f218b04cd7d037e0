/**
 * @file transport.h
 * @brief voxline - Transport-facing events and the outbound audio sink
 */

#ifndef VOXLINE_PIPELINE_TRANSPORT_H
#define VOXLINE_PIPELINE_TRANSPORT_H

#include <string>
#include <variant>

#include "voxline/core/error.h"
#include "voxline/pipeline/frame.h"

namespace voxline {

// =============================================================================
// INBOUND EVENTS
// =============================================================================

struct ClientConnected {
    std::string participant;
};

// Client finished its handshake; the pipeline may start
struct ClientReady {};

struct ClientDisconnected {};

// Audio, transcripts from an external STT, or VAD / Cancel / Shutdown signals
struct InboundFrame {
    Frame frame;
};

// The transport broke (e.g., socket error); fatal to the session
struct TransportFailure {
    Error error;
};

using TransportEvent =
    std::variant<ClientConnected, ClientReady, ClientDisconnected, InboundFrame, TransportFailure>;

const char* transport_event_name(const TransportEvent& event);

// =============================================================================
// OUTBOUND
// =============================================================================

class AudioTransport {
   public:
    virtual ~AudioTransport() = default;

    /**
     * Deliver synthesized audio to the client. Called from a single worker
     * thread, in order.
     *
     * @return false when the send failed; the session is then torn down
     */
    virtual bool send_audio(const AudioChunk& chunk) = 0;
};

}  // namespace voxline

#endif  // VOXLINE_PIPELINE_TRANSPORT_H
