/**
 * @file frame_bus.cpp
 * @brief voxline - Frame bus implementation
 */

#include "voxline/pipeline/frame_bus.h"


namespace voxline {

// =============================================================================
// Names
// =============================================================================

const char* link_name(Link link) {
    switch (link) {
        case Link::Inbound:
            return "inbound";
        case Link::Utterances:
            return "utterances";
        case Link::Transcripts:
            return "transcripts";
        case Link::Text:
            return "text";
        case Link::Outbound:
            return "outbound";
        case Link::Upstream:
            return "upstream";
    }
    return "unknown";
}

const char* control_kind_name(ControlKind kind) {
    switch (kind) {
        case ControlKind::UtteranceStart:
            return "UtteranceStart";
        case ControlKind::UtteranceEnd:
            return "UtteranceEnd";
        case ControlKind::Cancel:
            return "Cancel";
        case ControlKind::Shutdown:
            return "Shutdown";
        case ControlKind::ResponseStart:
            return "ResponseStart";
        case ControlKind::ResponseEnd:
            return "ResponseEnd";
        case ControlKind::ResponseAbort:
            return "ResponseAbort";
        case ControlKind::Kickoff:
            return "Kickoff";
    }
    return "Unknown";
}

const char* frame_type_name(const Frame& frame) {
    return std::visit(overloaded{
                          [](const AudioChunk&) { return "AudioChunk"; },
                          [](const PartialTranscript&) { return "PartialTranscript"; },
                          [](const FinalTranscript&) { return "FinalTranscript"; },
                          [](const TextDelta&) { return "TextDelta"; },
                          [](const ControlSignal&) { return "ControlSignal"; },
                          [](const StageError&) { return "StageError"; },
                      },
                      frame);
}

// =============================================================================
// FrameQueue
// =============================================================================

bool FrameQueue::push(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || cancelled_) {
            return false;
        }
        queue_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
}

bool FrameQueue::pop(Frame& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_ || cancelled_; });

    if (cancelled_) return false;
    if (queue_.empty()) return false;  // closed and drained

    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void FrameQueue::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        closed_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

bool FrameQueue::accepts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_ && !cancelled_;
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// =============================================================================
// FrameBus
// =============================================================================

bool FrameBus::push(Link link, Frame frame) {
    FrameQueue& target = queue(link);
    if (!observer_) {
        return target.push(std::move(frame));
    }

    // The queue takes ownership; the observer sees a copy, and only once queued
    Frame observed = frame;
    if (!target.push(std::move(frame))) {
        return false;
    }
    observer_(link, observed);
    return true;
}

bool FrameBus::pop(Link link, Frame& out) {
    return queue(link).pop(out);
}

void FrameBus::close(Link link) {
    queue(link).close();
}

void FrameBus::cancel_all() {
    for (auto& q : queues_) {
        q.cancel();
    }
}

}  // namespace voxline
