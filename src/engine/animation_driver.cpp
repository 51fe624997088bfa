#include "linkgl/engine/animation_driver.hpp"
#include "linkgl/gfx/frame_scheduler.hpp"
#include "linkgl/core/errors.hpp"
#include "linkgl/core/logging.hpp"

namespace linkgl {

AnimationDriver::AnimationDriver(FrameScheduler* scheduler, FrameFunction frame)
    : scheduler_(scheduler)
    , frame_(std::move(frame)) {
}

AnimationDriver::~AnimationDriver() {
    stop();
}

void AnimationDriver::start() {
    if (state_ == State::Running) {
        return;
    }
    if (!scheduler_) {
        throw SchedulerError("Cannot start animating: no frame scheduler was supplied");
    }
    if (!frame_) {
        throw SchedulerError("Cannot start animating: no frame function");
    }

    state_ = State::Running;
    requestNext();

    LINKGL_DEBUG(LogCategory::Animation, "Animation started");
}

void AnimationDriver::stop() {
    if (state_ == State::Stopped) {
        return;
    }

    state_ = State::Stopped;
    if (token_ != NULL_FRAME_TOKEN && scheduler_) {
        scheduler_->cancelFrame(token_);
    }
    token_ = NULL_FRAME_TOKEN;

    LINKGL_DEBUG(LogCategory::Animation,
        "Animation stopped after " + std::to_string(frameCount_) + " frames");
}

void AnimationDriver::requestNext() {
    std::weak_ptr<AnimationDriver*> weak = self_;
    token_ = scheduler_->requestFrame([weak](double timestampMs) {
        if (auto self = weak.lock()) {
            (*self)->onFrame(timestampMs);
        }
    });
}

void AnimationDriver::onFrame(double timestampMs) {
    token_ = NULL_FRAME_TOKEN;

    // stop() may have run earlier in the same tick
    if (state_ != State::Running) {
        return;
    }

    frameCount_++;
    try {
        frame_(timestampMs);
    } catch (...) {
        state_ = State::Stopped;
        LINKGL_WARN(LogCategory::Animation, "Animation stopped by an exception in the frame");
        throw;
    }

    // The frame may have stopped (or stopped and restarted) the animation itself
    if (state_ == State::Running && token_ == NULL_FRAME_TOKEN) {
        requestNext();
    }
}

} // namespace linkgl
