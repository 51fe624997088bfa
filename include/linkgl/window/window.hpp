#pragma once

#include "linkgl/core/types.hpp"
#include "linkgl/gfx/graphics_context.hpp"

#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace linkgl {

class GlesContext;

/**
 * @brief Keyboard key codes - uses GLFW key constants directly
 *
 * See https://www.glfw.org/docs/latest/group__keys.html for the full list.
 */
using Key = int;

/**
 * @brief Input action states
 */
enum class Action {
    Release,
    Press,
    Repeat
};

/**
 * @brief Modifier key flags
 */
enum class Modifier : uint32_t {
    None = 0,
    Shift = 1 << 0,
    Control = 1 << 1,
    Alt = 1 << 2,
    Super = 1 << 3
};

inline Modifier operator|(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(Modifier a, Modifier b) {
    return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/**
 * @brief Window configuration options
 */
struct WindowConfig {
    std::string title = "linkgl";
    uint32_t width = 800;
    uint32_t height = 600;
    bool resizable = true;
    bool fullscreen = false;
    bool vsync = true;
    ContextAttributes context;
};

/**
 * @brief Desktop window with an OpenGL ES 3.0 context
 *
 * Window is the Canvas of the desktop backend. The GLFW window and its GL
 * context are created together in build(), using the context attributes
 * given to the builder; acquireContext() makes that context current and
 * returns the same GlesContext on every call.
 *
 * Usage:
 * @code
 * auto window = Window::create()
 *     .title("Quad")
 *     .size(1280, 720)
 *     .build();
 *
 * auto renderer = Renderer::create()
 *     .canvas(window.get())
 *     ...
 *     .build();
 *
 * while (window->isOpen()) {
 *     window->pollEvents();
 *     renderer->updateAndRender();
 *     window->present();
 * }
 * @endcode
 */
class Window : public Canvas {
public:
    /**
     * @brief Builder for creating Window objects
     */
    class Builder {
    public:
        Builder() = default;

        /// Set window title
        Builder& title(std::string_view title);

        /// Set window size
        Builder& size(uint32_t width, uint32_t height);

        /// Enable/disable resizing
        Builder& resizable(bool enabled = true);

        /// Enable/disable fullscreen
        Builder& fullscreen(bool enabled = true);

        /// Enable/disable vsync
        Builder& vsync(bool enabled = true);

        /// Set the attributes the GL context is created with
        Builder& contextAttributes(const ContextAttributes& attributes);

        /// Build the window (throws ContextAcquisitionError)
        WindowPtr build();

    private:
        WindowConfig config_;
    };

    /// Create a builder for a window
    static Builder create();

    // ========================================================================
    // Canvas
    // ========================================================================

    GraphicsContext* acquireContext(const ContextAttributes& attributes) override;
    glm::uvec2 drawingBufferSize() const override;

    /// The context attributes the window was created with
    const ContextAttributes& contextAttributes() const { return config_.context; }

    // ========================================================================
    // Window state
    // ========================================================================

    /// Check if the window is still open
    bool isOpen() const;

    /// Request the window to close
    void close();

    /// Swap front and back buffers
    void present();

    /// Get the underlying GLFW window
    GLFWwindow* handle() const { return window_; }

    // ========================================================================
    // Event handling
    // ========================================================================

    /// Process pending window events (call once per frame)
    void pollEvents();

    using ResizeCallback = std::function<void(uint32_t width, uint32_t height)>;
    using KeyCallback = std::function<void(Key key, Action action, Modifier mods)>;

    void onResize(ResizeCallback callback) { resizeCallback_ = std::move(callback); }
    void onKey(KeyCallback callback) { keyCallback_ = std::move(callback); }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    ~Window() override;

    // Non-copyable, non-movable (GLFW keeps a pointer to this object)
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

private:
    friend class Builder;
    Window();

    void setupCallbacks();
    void cleanup();

    static void glfwKeyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void glfwFramebufferSizeCallback(GLFWwindow* window, int width, int height);

    static Modifier glfwModsToModifier(int glfwMods);

    GLFWwindow* window_ = nullptr;
    WindowConfig config_;
    std::unique_ptr<GlesContext> context_;

    ResizeCallback resizeCallback_;
    KeyCallback keyCallback_;
};

} // namespace linkgl
