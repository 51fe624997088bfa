#pragma once

#include "linkgl/core/types.hpp"

#include <GLES3/gl3.h>
#include <glm/glm.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace linkgl {

/**
 * @brief The stateful, handle-based graphics API a renderer drives
 *
 * GraphicsContext mirrors the OpenGL ES 3.0 / WebGL2 object model: every
 * resource is a plain integer name, and binding state is global to the
 * context. Enumerants are the standard GL values.
 *
 * The renderer core only allocates, deletes, compiles, links and queries
 * locations through this interface. Everything else is called from the
 * callbacks supplied to links and to the render callback.
 *
 * Implementations:
 * - GlesContext: the real API (GLFW window)
 * - test doubles that record calls
 */
class GraphicsContext {
public:
    virtual ~GraphicsContext() = default;

    // =========================================================================
    // Buffers
    // =========================================================================

    virtual Handle createBuffer() = 0;
    virtual void deleteBuffer(Handle buffer) = 0;
    virtual void bindBuffer(GLenum target, Handle buffer) = 0;
    virtual void bufferData(GLenum target, const void* data, size_t size, GLenum usage) = 0;
    virtual void bufferSubData(GLenum target, size_t offset, const void* data, size_t size) = 0;
    virtual void bindBufferBase(GLenum target, GLuint index, Handle buffer) = 0;

    /// Upload a vector of plain values (float, vec2, ...) to the bound buffer
    template <typename T>
    void bufferData(GLenum target, const std::vector<T>& data, GLenum usage) {
        bufferData(target, data.data(), data.size() * sizeof(T), usage);
    }

    // =========================================================================
    // Shaders & programs
    // =========================================================================

    virtual Handle createShader(ShaderStage stage) = 0;
    virtual void shaderSource(Handle shader, std::string_view source) = 0;
    virtual void compileShader(Handle shader) = 0;
    virtual bool shaderCompileStatus(Handle shader) = 0;
    virtual std::string shaderInfoLog(Handle shader) = 0;
    virtual void deleteShader(Handle shader) = 0;

    virtual Handle createProgram() = 0;
    virtual void attachShader(Handle program, Handle shader) = 0;
    virtual void transformFeedbackVaryings(Handle program,
                                           const std::vector<std::string>& varyings,
                                           GLenum bufferMode) = 0;
    virtual void linkProgram(Handle program) = 0;
    virtual bool programLinkStatus(Handle program) = 0;
    virtual std::string programInfoLog(Handle program) = 0;
    virtual void useProgram(Handle program) = 0;
    virtual void deleteProgram(Handle program) = 0;

    /// Returns INVALID_LOCATION if the attribute is not active
    virtual Location attribLocation(Handle program, std::string_view name) = 0;

    /// Returns INVALID_LOCATION if the uniform is not active
    virtual Location uniformLocation(Handle program, std::string_view name) = 0;

    // =========================================================================
    // Vertex arrays
    // =========================================================================

    virtual Handle createVertexArray() = 0;
    virtual void bindVertexArray(Handle vertexArray) = 0;
    virtual void deleteVertexArray(Handle vertexArray) = 0;
    virtual void enableVertexAttribArray(Location location) = 0;
    virtual void vertexAttribPointer(Location location, GLint size, GLenum type,
                                     bool normalized, GLsizei stride, size_t offset) = 0;
    virtual void vertexAttribDivisor(Location location, GLuint divisor) = 0;

    // =========================================================================
    // Textures
    // =========================================================================

    virtual Handle createTexture() = 0;
    virtual void bindTexture(GLenum target, Handle texture) = 0;
    virtual void activeTexture(GLuint unit) = 0;
    virtual void texImage2D(GLenum target, GLint level, GLint internalFormat,
                            GLsizei width, GLsizei height, GLenum format,
                            GLenum type, const void* pixels) = 0;
    virtual void texParameteri(GLenum target, GLenum name, GLint value) = 0;
    virtual void deleteTexture(Handle texture) = 0;

    // =========================================================================
    // Framebuffers
    // =========================================================================

    virtual Handle createFramebuffer() = 0;
    virtual void bindFramebuffer(GLenum target, Handle framebuffer) = 0;
    virtual void framebufferTexture2D(GLenum target, GLenum attachment,
                                      GLenum textureTarget, Handle texture, GLint level) = 0;
    virtual GLenum checkFramebufferStatus(GLenum target) = 0;
    virtual void deleteFramebuffer(Handle framebuffer) = 0;

    // =========================================================================
    // Transform feedback
    // =========================================================================

    virtual Handle createTransformFeedback() = 0;
    virtual void bindTransformFeedback(Handle transformFeedback) = 0;
    virtual void beginTransformFeedback(GLenum primitiveMode) = 0;
    virtual void endTransformFeedback() = 0;
    virtual void deleteTransformFeedback(Handle transformFeedback) = 0;

    // =========================================================================
    // Uniforms (apply to the program in use)
    // =========================================================================

    virtual void uniform1i(Location location, GLint value) = 0;
    virtual void uniform1f(Location location, float value) = 0;
    virtual void uniform2f(Location location, const glm::vec2& value) = 0;
    virtual void uniform3f(Location location, const glm::vec3& value) = 0;
    virtual void uniform4f(Location location, const glm::vec4& value) = 0;
    virtual void uniformMatrix4f(Location location, const glm::mat4& value) = 0;

    // =========================================================================
    // State & drawing
    // =========================================================================

    virtual void viewport(GLint x, GLint y, GLsizei width, GLsizei height) = 0;
    virtual void clearColor(const glm::vec4& color) = 0;
    virtual void clear(GLbitfield mask) = 0;
    virtual void enable(GLenum capability) = 0;
    virtual void disable(GLenum capability) = 0;
    virtual void drawArrays(GLenum mode, GLint first, GLsizei count) = 0;
    virtual void drawElements(GLenum mode, GLsizei count, GLenum type, size_t offset) = 0;
};

/**
 * @brief Context creation options
 *
 * Mirrors WebGL context attributes. Backends map them onto their own
 * context creation hints; options a backend cannot honor are ignored.
 */
struct ContextAttributes {
    bool alpha = true;
    bool depth = true;
    bool stencil = false;
    bool antialias = true;
    uint32_t samples = 4;              // Used when antialias is set
    bool premultipliedAlpha = true;
    bool preserveDrawingBuffer = false;
    bool debugOutput = false;          // Route driver debug messages to the logger

    bool operator==(const ContextAttributes& other) const {
        return alpha == other.alpha && depth == other.depth && stencil == other.stencil &&
               antialias == other.antialias && samples == other.samples &&
               premultipliedAlpha == other.premultipliedAlpha &&
               preserveDrawingBuffer == other.preserveDrawingBuffer &&
               debugOutput == other.debugOutput;
    }
    bool operator!=(const ContextAttributes& other) const { return !(*this == other); }
};

/**
 * @brief Drawing surface that hands out a graphics context
 *
 * The canvas and its context are borrowed by a renderer, never owned.
 * Resizing is the canvas owner's business; renderers only read the
 * current drawing-buffer size.
 */
class Canvas {
public:
    virtual ~Canvas() = default;

    /**
     * @brief Get the graphics context of this canvas
     *
     * Repeated calls return the same context. Attributes are only honored
     * when the context is first created.
     *
     * @return The context, or nullptr if none can be obtained
     */
    virtual GraphicsContext* acquireContext(const ContextAttributes& attributes) = 0;

    /// Current drawing-buffer size in pixels
    virtual glm::uvec2 drawingBufferSize() const = 0;
};

} // namespace linkgl
