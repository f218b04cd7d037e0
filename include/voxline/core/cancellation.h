/**
 * @file cancellation.h
 * @brief voxline - Session cancellation token
 */

#ifndef VOXLINE_CORE_CANCELLATION_H
#define VOXLINE_CORE_CANCELLATION_H

#include <atomic>

namespace voxline {

/**
 * One token per session. Fired once on disconnect / cancel; stages poll it
 * between units of work (between streamed tokens, between audio chunks).
 */
class CancellationToken {
   public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

   private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace voxline

#endif  // VOXLINE_CORE_CANCELLATION_H
