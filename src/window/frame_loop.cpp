#include "linkgl/window/frame_loop.hpp"
#include "linkgl/core/errors.hpp"
#include "linkgl/core/logging.hpp"

#include <algorithm>

namespace linkgl {

FrameLoop::FrameLoop(Window* window)
    : window_(window) {
    if (!window_) {
        throw SchedulerError("FrameLoop: window cannot be null");
    }
}

FrameLoop::~FrameLoop() {
    shutdown();
}

// =============================================================================
// FrameScheduler
// =============================================================================

FrameToken FrameLoop::requestFrame(FrameCallback callback) {
    FrameToken token = nextToken_++;
    pending_.push_back(Request{token, std::move(callback)});
    return token;
}

void FrameLoop::cancelFrame(FrameToken token) {
    auto matches = [token](const Request& request) { return request.token == token; };
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(), matches), pending_.end());

    // Still waiting in the batch being fired
    for (auto& request : dispatching_) {
        if (request.token == token) {
            request.callback = nullptr;
        }
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void FrameLoop::setup() {
    if (isSetup_) {
        return;
    }

    window_->onResize([this](uint32_t w, uint32_t h) {
        this->handleResize(w, h);
    });

    clock_.start();
    isSetup_ = true;

    LINKGL_DEBUG(LogCategory::Core, "FrameLoop setup complete");
}

void FrameLoop::run() {
    if (isRunning_) {
        LINKGL_WARN(LogCategory::Core, "FrameLoop::run() called while already running");
        return;
    }

    setup();

    isRunning_ = true;
    shouldQuit_ = false;
    frameNumber_ = 0;

    LINKGL_INFO(LogCategory::Core, "FrameLoop started");

    while (!shouldQuit()) {
        runFrame();
    }

    isRunning_ = false;
    LINKGL_INFO(LogCategory::Core, "FrameLoop exited after " + std::to_string(frameNumber_) + " frames");
}

void FrameLoop::shutdown() {
    if (!isSetup_) {
        return;
    }

    window_->onResize(nullptr);
    pending_.clear();

    isSetup_ = false;
    LINKGL_DEBUG(LogCategory::Core, "FrameLoop shutdown complete");
}

// =============================================================================
// Frame Execution
// =============================================================================

void FrameLoop::runFrame() {
    try {
        onProcessEvents();
    } catch (const std::exception& e) {
        if (!onError(e)) {
            quit();
            return;
        }
    }

    double dt = clock_.tick();
    onDispatch(FrameClock::now());

    try {
        onFrameEnd();
    } catch (const std::exception& e) {
        if (!onError(e)) {
            quit();
            return;
        }
    }
    frameNumber_++;

    // Frame pacing
    if (targetFrameMs_ > 0.0) {
        double sleepMs = targetFrameMs_ - dt;
        if (sleepMs > 0.0) {
            FrameClock::sleep(sleepMs);
        }
    }
}

// =============================================================================
// Virtual Method Implementations (Default Behavior)
// =============================================================================

void FrameLoop::onProcessEvents() {
    window_->pollEvents();
}

void FrameLoop::onDispatch(double timestampMs) {
    // Requests made from here on belong to the next iteration
    dispatching_.swap(pending_);

    for (size_t i = 0; i < dispatching_.size(); ++i) {
        FrameCallback callback = std::move(dispatching_[i].callback);
        if (!callback) {
            continue;  // Cancelled
        }
        try {
            callback(timestampMs);
        } catch (const std::exception& e) {
            if (!onError(e)) {
                quit();
            }
        }
    }

    dispatching_.clear();
}

void FrameLoop::onFrameEnd() {
    window_->present();
    if (frameEndListener_) {
        frameEndListener_();
    }
}

void FrameLoop::onWindowResize(uint32_t width, uint32_t height) {
    if (resizeListener_) {
        resizeListener_(width, height);
    }
}

bool FrameLoop::onError(const std::exception& e) {
    LINKGL_ERROR(LogCategory::Render, "Frame error: " + std::string(e.what()));

    if (errorListener_) {
        return errorListener_(e);
    }

    return true;  // Continue by default
}

bool FrameLoop::shouldQuit() const {
    return shouldQuit_ || !window_->isOpen();
}

// =============================================================================
// Private Helpers
// =============================================================================

void FrameLoop::handleResize(uint32_t width, uint32_t height) {
    try {
        onWindowResize(width, height);
    } catch (const std::exception& e) {
        onError(e);
    }
}

} // namespace linkgl
