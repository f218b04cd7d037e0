/**
 * @file frame_bus.h
 * @brief voxline - Ordered typed links between pipeline stages
 *
 * The bus is a fixed set of FIFO links. Each link has exactly one consumer
 * (a worker thread owned by the PipelineRunner) and preserves push order:
 *
 *   Inbound     transport   -> ingest (UtteranceBuffer)
 *   Utterances  ingest      -> TranscriptionStage
 *   Transcripts transcriber -> GenerationStage
 *   Text        generator   -> SynthesisStage
 *   Outbound    synthesizer -> transport
 *   Upstream    any stage   -> runner (errors, flowing against the data)
 */

#ifndef VOXLINE_PIPELINE_FRAME_BUS_H
#define VOXLINE_PIPELINE_FRAME_BUS_H

#include <array>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

#include "voxline/pipeline/frame.h"

namespace voxline {

enum class Link : size_t {
    Inbound = 0,
    Utterances,
    Transcripts,
    Text,
    Outbound,
    Upstream,
};

constexpr size_t LINK_COUNT = 6;

const char* link_name(Link link);

// =============================================================================
// FrameQueue - one link
// =============================================================================

class FrameQueue {
   public:
    FrameQueue() = default;
    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    // Returns false (and drops the frame) once the queue is closed or cancelled
    bool push(Frame frame);

    /**
     * Blocks until a frame is available.
     *
     * @return false when the queue is closed and drained, or cancelled
     */
    bool pop(Frame& out);

    // Graceful: reject new frames, let the consumer drain what is queued
    void close();

    // Immediate: drop queued frames and wake the consumer
    void cancel();

    bool accepts() const;
    size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> queue_;
    bool closed_ = false;
    bool cancelled_ = false;
};

// =============================================================================
// FrameBus
// =============================================================================

class FrameBus {
   public:
    // Observes every frame the link queued, on the pushing thread, after the push
    using Observer = std::function<void(Link link, const Frame& frame)>;

    FrameBus() = default;
    FrameBus(const FrameBus&) = delete;
    FrameBus& operator=(const FrameBus&) = delete;

    bool push(Link link, Frame frame);
    bool pop(Link link, Frame& out);

    void close(Link link);
    void cancel_all();

    // Must be set before any worker starts
    void set_observer(Observer observer) { observer_ = std::move(observer); }

    FrameQueue& queue(Link link) { return queues_[static_cast<size_t>(link)]; }
    size_t pending(Link link) const { return queues_[static_cast<size_t>(link)].size(); }

   private:
    std::array<FrameQueue, LINK_COUNT> queues_;
    Observer observer_;
};

}  // namespace voxline

#endif  // VOXLINE_PIPELINE_FRAME_BUS_H
