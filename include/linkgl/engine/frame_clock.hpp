#pragma once

#include <chrono>

namespace linkgl {

/**
 * @brief Monotonic frame timing
 *
 * FrameClock::now() is the time value handed to link update callbacks and
 * frame callbacks: milliseconds since the first call in this process, from
 * a steady clock. Instances additionally track per-frame delta and a
 * smoothed FPS.
 */
class FrameClock {
public:
    FrameClock();

    /// Milliseconds since the process-wide epoch
    static double now();

    /// Start/restart the clock
    void start();

    /// Mark the end of a frame and return delta time in milliseconds
    double tick();

    /// Last frame's delta time in milliseconds
    double deltaMs() const { return deltaMs_; }

    /// Timestamp of the last tick (same scale as now())
    double lastFrameMs() const { return lastFrameMs_; }

    /// Current FPS, averaged over FPS_SAMPLE_COUNT frames
    double fps() const { return fps_; }

    /// Milliseconds since start()
    double elapsedMs() const { return now() - startMs_; }

    /// Sleep for a duration in milliseconds
    static void sleep(double milliseconds);

private:
    using Clock = std::chrono::steady_clock;

    static Clock::time_point epoch();

    double startMs_ = 0.0;
    double lastFrameMs_ = 0.0;
    double deltaMs_ = 0.0;
    double fps_ = 0.0;

    // FPS smoothing
    static constexpr int FPS_SAMPLE_COUNT = 60;
    double fpsAccumulatorMs_ = 0.0;
    int fpsFrameCount_ = 0;
};

} // namespace linkgl
