#pragma once

#include "linkgl/core/types.hpp"

#include <functional>
#include <memory>

namespace linkgl {

/**
 * @brief Repeats a frame function at the host's display cadence
 *
 * State machine: Stopped -> Running -> Stopped.
 *
 * - start() requests one frame from the scheduler and becomes Running.
 * - Each fired frame re-checks Running, runs the frame function, and only
 *   then requests the next frame, so frames never overlap.
 * - stop() cancels the pending request. A frame already executing is not
 *   interrupted; no further frame runs after it.
 * - If the frame function throws, the driver stops and the exception
 *   propagates to whoever dispatched the frame.
 *
 * The driver must outlive its pending request or be stopped first;
 * destruction stops it.
 */
class AnimationDriver {
public:
    using FrameFunction = std::function<void(double timestampMs)>;

    enum class State {
        Stopped,
        Running
    };

    AnimationDriver() = default;
    AnimationDriver(FrameScheduler* scheduler, FrameFunction frame);
    ~AnimationDriver();

    // Pending scheduler callbacks refer to this object
    AnimationDriver(const AnimationDriver&) = delete;
    AnimationDriver& operator=(const AnimationDriver&) = delete;
    AnimationDriver(AnimationDriver&&) = delete;
    AnimationDriver& operator=(AnimationDriver&&) = delete;

    /// Start animating; no-op when already running (throws SchedulerError without a scheduler)
    void start();

    /// Stop animating; no-op when stopped
    void stop();

    State state() const { return state_; }
    bool isRunning() const { return state_ == State::Running; }

    /// Token of the pending frame request (NULL_FRAME_TOKEN if none)
    FrameToken pendingToken() const { return token_; }

    /// Number of frames that ran the frame function
    uint64_t frameCount() const { return frameCount_; }

    FrameScheduler* scheduler() const { return scheduler_; }

private:
    void requestNext();
    void onFrame(double timestampMs);

    FrameScheduler* scheduler_ = nullptr;
    FrameFunction frame_;
    State state_ = State::Stopped;
    FrameToken token_ = NULL_FRAME_TOKEN;
    uint64_t frameCount_ = 0;

    // Expires with the driver; guards callbacks a scheduler failed to cancel
    std::shared_ptr<AnimationDriver*> self_ = std::make_shared<AnimationDriver*>(this);
};

} // namespace linkgl
