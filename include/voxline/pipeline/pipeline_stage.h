/**
 * @file pipeline_stage.h
 * @brief voxline - Interface implemented by the frame-processing stages
 */

#ifndef VOXLINE_PIPELINE_PIPELINE_STAGE_H
#define VOXLINE_PIPELINE_PIPELINE_STAGE_H

#include "voxline/pipeline/frame.h"
#include "voxline/pipeline/frame_bus.h"

namespace voxline {

class PipelineStage {
   public:
    virtual ~PipelineStage() = default;

    virtual const char* name() const = 0;

    // Link this stage consumes
    virtual Link input() const = 0;

    /**
     * Handle one frame popped from input(). Called from the stage's single
     * worker thread, so at most one unit of work is in flight per stage.
     * Results are pushed to the bus; stages never call each other.
     */
    virtual void process_frame(Frame&& frame, FrameBus& bus) = 0;

    // Abort in-flight engine work; called from another thread
    virtual void cancel() = 0;

    // Drop engine handles and buffers; called after the worker has exited
    virtual void release() = 0;
};

}  // namespace voxline

#endif  // VOXLINE_PIPELINE_PIPELINE_STAGE_H
