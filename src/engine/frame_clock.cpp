#include "linkgl/engine/frame_clock.hpp"
#include <thread>

namespace linkgl {

FrameClock::FrameClock() {
    start();
}

FrameClock::Clock::time_point FrameClock::epoch() {
    static const Clock::time_point origin = Clock::now();
    return origin;
}

double FrameClock::now() {
    std::chrono::duration<double, std::milli> elapsed = Clock::now() - epoch();
    return elapsed.count();
}

void FrameClock::start() {
    startMs_ = now();
    lastFrameMs_ = startMs_;
    deltaMs_ = 0.0;
    fps_ = 0.0;
    fpsAccumulatorMs_ = 0.0;
    fpsFrameCount_ = 0;
}

double FrameClock::tick() {
    double currentMs = now();
    deltaMs_ = currentMs - lastFrameMs_;
    lastFrameMs_ = currentMs;

    fpsAccumulatorMs_ += deltaMs_;
    fpsFrameCount_++;

    if (fpsFrameCount_ >= FPS_SAMPLE_COUNT && fpsAccumulatorMs_ > 0.0) {
        fps_ = 1000.0 * static_cast<double>(fpsFrameCount_) / fpsAccumulatorMs_;
        fpsAccumulatorMs_ = 0.0;
        fpsFrameCount_ = 0;
    }

    return deltaMs_;
}

void FrameClock::sleep(double milliseconds) {
    if (milliseconds > 0.0) {
        std::this_thread::sleep_for(
            std::chrono::duration<double, std::milli>(milliseconds));
    }
}

} // namespace linkgl
