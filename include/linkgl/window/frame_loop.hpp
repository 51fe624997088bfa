#pragma once

#include "linkgl/engine/frame_clock.hpp"
#include "linkgl/gfx/frame_scheduler.hpp"
#include "linkgl/window/window.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <vector>

namespace linkgl {

/**
 * @brief Display-refresh loop of the desktop backend
 *
 * FrameLoop is the FrameScheduler a Window-based application hands to
 * Renderer::Builder::frameScheduler(). Each iteration:
 * 1. polls window events
 * 2. fires every callback requested before the iteration began, all with
 *    the same FrameClock::now() timestamp
 * 3. presents the window (swap interval set by the window's vsync option)
 * 4. sleeps to the target framerate, if one is set
 *
 * Callbacks requested while callbacks are firing run on the next
 * iteration. Exceptions escaping a callback go to onError(); by default
 * they are logged and the loop keeps running.
 *
 * Usage patterns:
 * 1. Inheritance: derive and override the virtual methods
 * 2. Listeners: use as-is and set callback functions
 *
 * Example:
 * @code
 * FrameLoop loop(window.get());
 *
 * auto renderer = Renderer::create()
 *     .canvas(window.get())
 *     .frameScheduler(&loop)
 *     ...
 *     .build();
 *
 * renderer->startAnimating();
 * loop.run();  // Blocks until the window closes or quit() is called
 * @endcode
 */
class FrameLoop : public FrameScheduler {
public:
    using FrameEndListener = std::function<void()>;
    using ResizeListener = std::function<void(uint32_t width, uint32_t height)>;
    using ErrorListener = std::function<bool(const std::exception&)>;

    /**
     * @brief Construct a frame loop
     *
     * @param window The window to poll and present (non-owning reference)
     */
    explicit FrameLoop(Window* window);
    explicit FrameLoop(Window& window) : FrameLoop(&window) {}

    /// Virtual destructor - calls shutdown() if not already called
    ~FrameLoop() override;

    // Non-copyable, non-movable (registered with window callbacks)
    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;
    FrameLoop(FrameLoop&&) = delete;
    FrameLoop& operator=(FrameLoop&&) = delete;

    // =========================================================================
    // FrameScheduler
    // =========================================================================

    FrameToken requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameToken token) override;

    /// Number of callbacks waiting for the next iteration
    size_t pendingCount() const { return pending_.size(); }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Set target framerate (0 = unlimited, use vsync) (default: 0)
    void setTargetFramerate(double fps) {
        targetFrameMs_ = (fps > 0.0) ? (1000.0 / fps) : 0.0;
    }

    void setFrameEndListener(FrameEndListener listener) { frameEndListener_ = std::move(listener); }
    void setResizeListener(ResizeListener listener) { resizeListener_ = std::move(listener); }
    void setErrorListener(ErrorListener listener) { errorListener_ = std::move(listener); }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Register window callbacks (called automatically by run())
    virtual void setup();

    /// Run iterations until shouldQuit() returns true
    void run();

    /// Run a single iteration
    void runFrame();

    /// Unregister window callbacks and drop pending requests
    virtual void shutdown();

    /// Exit after the current iteration
    void quit() { shouldQuit_ = true; }

    bool isRunning() const { return isRunning_; }
    const FrameClock& clock() const { return clock_; }
    uint64_t frameNumber() const { return frameNumber_; }

protected:
    /// Default: window->pollEvents()
    virtual void onProcessEvents();

    /// Default: fire the callbacks in the batch
    virtual void onDispatch(double timestampMs);

    /// Default: window->present(), then frameEndListener_ if set
    virtual void onFrameEnd();

    /// Default: calls resizeListener_ if set
    virtual void onWindowResize(uint32_t width, uint32_t height);

    /**
     * @brief Handle an exception escaping a frame callback
     *
     * Default: logs it and asks errorListener_ if set.
     *
     * @return true to continue running, false to exit the loop
     */
    virtual bool onError(const std::exception& e);

    /// Default: quit requested or window closed
    virtual bool shouldQuit() const;

    Window* window() { return window_; }

private:
    struct Request {
        FrameToken token;
        FrameCallback callback;
    };

    void handleResize(uint32_t width, uint32_t height);

    Window* window_ = nullptr;

    FrameClock clock_;
    double targetFrameMs_ = 0.0;

    std::vector<Request> pending_;
    std::vector<Request> dispatching_;
    FrameToken nextToken_ = 1;

    bool isSetup_ = false;
    bool isRunning_ = false;
    bool shouldQuit_ = false;
    uint64_t frameNumber_ = 0;

    FrameEndListener frameEndListener_;
    ResizeListener resizeListener_;
    ErrorListener errorListener_;
};

} // namespace linkgl
