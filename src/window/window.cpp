#include "linkgl/window/window.hpp"
#include "linkgl/window/gles_context.hpp"
#include "linkgl/core/errors.hpp"
#include "linkgl/core/logging.hpp"

#include <GLFW/glfw3.h>

namespace linkgl {

// ============================================================================
// Builder implementation
// ============================================================================

Window::Builder& Window::Builder::title(std::string_view title) {
    config_.title = std::string(title);
    return *this;
}

Window::Builder& Window::Builder::size(uint32_t width, uint32_t height) {
    config_.width = width;
    config_.height = height;
    return *this;
}

Window::Builder& Window::Builder::resizable(bool enabled) {
    config_.resizable = enabled;
    return *this;
}

Window::Builder& Window::Builder::fullscreen(bool enabled) {
    config_.fullscreen = enabled;
    return *this;
}

Window::Builder& Window::Builder::vsync(bool enabled) {
    config_.vsync = enabled;
    return *this;
}

Window::Builder& Window::Builder::contextAttributes(const ContextAttributes& attributes) {
    config_.context = attributes;
    return *this;
}

WindowPtr Window::Builder::build() {
    auto window = WindowPtr(new Window());
    window->config_ = config_;

    // Initialize GLFW if needed
    if (!glfwInit()) {
        throw ContextAcquisitionError("failed to initialize GLFW");
    }

    // OpenGL ES 3.0 context with the requested surface format
    const ContextAttributes& attributes = config_.context;
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    glfwWindowHint(GLFW_ALPHA_BITS, attributes.alpha ? 8 : 0);
    glfwWindowHint(GLFW_DEPTH_BITS, attributes.depth ? 24 : 0);
    glfwWindowHint(GLFW_STENCIL_BITS, attributes.stencil ? 8 : 0);
    glfwWindowHint(GLFW_SAMPLES, attributes.antialias ? static_cast<int>(attributes.samples) : 0);
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, attributes.debugOutput ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, config_.resizable ? GLFW_TRUE : GLFW_FALSE);

    // Get monitor for fullscreen
    GLFWmonitor* monitor = nullptr;
    if (config_.fullscreen) {
        monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode* mode = glfwGetVideoMode(monitor);
        window->config_.width = mode->width;
        window->config_.height = mode->height;
    }

    window->window_ = glfwCreateWindow(
        static_cast<int>(window->config_.width),
        static_cast<int>(window->config_.height),
        window->config_.title.c_str(),
        monitor,
        nullptr);

    if (!window->window_) {
        throw ContextAcquisitionError("failed to create a GLFW window with an OpenGL ES 3.0 context");
    }

    // Store pointer to Window instance for callbacks
    glfwSetWindowUserPointer(window->window_, window.get());
    window->setupCallbacks();

    glfwMakeContextCurrent(window->window_);
    glfwSwapInterval(config_.vsync ? 1 : 0);

    LINKGL_INFO(LogCategory::Core, "Window created: " + std::to_string(window->config_.width) + "x" +
                std::to_string(window->config_.height) + " \"" + window->config_.title + "\"");

    return window;
}

// ============================================================================
// Window implementation
// ============================================================================

Window::Builder Window::create() {
    return Builder();
}

Window::Window() = default;

Window::~Window() {
    cleanup();
}

void Window::cleanup() {
    if (window_) {
        // Context objects must go before the context itself
        glfwMakeContextCurrent(window_);
        context_.reset();
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
}

void Window::setupCallbacks() {
    glfwSetKeyCallback(window_, glfwKeyCallback);
    glfwSetFramebufferSizeCallback(window_, glfwFramebufferSizeCallback);
}

// ============================================================================
// Canvas
// ============================================================================

GraphicsContext* Window::acquireContext(const ContextAttributes& attributes) {
    if (!window_) {
        return nullptr;
    }

    glfwMakeContextCurrent(window_);

    if (!context_) {
        context_.reset(new GlesContext(config_.context));
    }
    if (attributes != config_.context) {
        LINKGL_WARN(LogCategory::Core,
            "Context attributes differ from those the window was created with; "
            "using the existing context");
    }
    return context_.get();
}

glm::uvec2 Window::drawingBufferSize() const {
    if (!window_) {
        return {0, 0};
    }
    int w, h;
    glfwGetFramebufferSize(window_, &w, &h);
    return {static_cast<uint32_t>(w), static_cast<uint32_t>(h)};
}

// ============================================================================
// Window state
// ============================================================================

bool Window::isOpen() const {
    return window_ && !glfwWindowShouldClose(window_);
}

void Window::close() {
    if (window_) {
        glfwSetWindowShouldClose(window_, GLFW_TRUE);
    }
}

void Window::present() {
    glfwSwapBuffers(window_);
}

// ============================================================================
// Event handling
// ============================================================================

void Window::pollEvents() {
    glfwPollEvents();
}

// ============================================================================
// GLFW callbacks
// ============================================================================

void Window::glfwKeyCallback(GLFWwindow* glfwWindow, int key, int /*scancode*/, int action, int mods) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window && window->keyCallback_) {
        window->keyCallback_(key,
                            action == GLFW_RELEASE ? Action::Release :
                            action == GLFW_PRESS ? Action::Press : Action::Repeat,
                            glfwModsToModifier(mods));
    }
}

void Window::glfwFramebufferSizeCallback(GLFWwindow* glfwWindow, int width, int height) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window && window->resizeCallback_) {
        window->resizeCallback_(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    }
}

Modifier Window::glfwModsToModifier(int glfwMods) {
    Modifier mods = Modifier::None;
    if (glfwMods & GLFW_MOD_SHIFT) mods = mods | Modifier::Shift;
    if (glfwMods & GLFW_MOD_CONTROL) mods = mods | Modifier::Control;
    if (glfwMods & GLFW_MOD_ALT) mods = mods | Modifier::Alt;
    if (glfwMods & GLFW_MOD_SUPER) mods = mods | Modifier::Super;
    return mods;
}

} // namespace linkgl
