#pragma once

#include "linkgl/gfx/graphics_context.hpp"

namespace linkgl {

/**
 * @brief GraphicsContext over OpenGL ES 3.0
 *
 * Thin forwarding layer: each call maps onto the matching gl* entry point of
 * the context current on this thread. Owned by the Window that created the
 * context.
 *
 * With ContextAttributes::debugOutput set and KHR_debug available, driver
 * messages are forwarded to Logger::glMessage().
 */
class GlesContext : public GraphicsContext {
public:
    explicit GlesContext(const ContextAttributes& attributes);
    ~GlesContext() override;

    GlesContext(const GlesContext&) = delete;
    GlesContext& operator=(const GlesContext&) = delete;

    const ContextAttributes& attributes() const { return attributes_; }

    /// True if driver debug messages are routed to the logger
    bool debugOutputEnabled() const { return debugOutput_; }

    // Buffers
    using GraphicsContext::bufferData;
    Handle createBuffer() override;
    void deleteBuffer(Handle buffer) override;
    void bindBuffer(GLenum target, Handle buffer) override;
    void bufferData(GLenum target, const void* data, size_t size, GLenum usage) override;
    void bufferSubData(GLenum target, size_t offset, const void* data, size_t size) override;
    void bindBufferBase(GLenum target, GLuint index, Handle buffer) override;

    // Shaders & programs
    Handle createShader(ShaderStage stage) override;
    void shaderSource(Handle shader, std::string_view source) override;
    void compileShader(Handle shader) override;
    bool shaderCompileStatus(Handle shader) override;
    std::string shaderInfoLog(Handle shader) override;
    void deleteShader(Handle shader) override;

    Handle createProgram() override;
    void attachShader(Handle program, Handle shader) override;
    void transformFeedbackVaryings(Handle program, const std::vector<std::string>& varyings,
                                   GLenum bufferMode) override;
    void linkProgram(Handle program) override;
    bool programLinkStatus(Handle program) override;
    std::string programInfoLog(Handle program) override;
    void useProgram(Handle program) override;
    void deleteProgram(Handle program) override;
    Location attribLocation(Handle program, std::string_view name) override;
    Location uniformLocation(Handle program, std::string_view name) override;

    // Vertex arrays
    Handle createVertexArray() override;
    void bindVertexArray(Handle vertexArray) override;
    void deleteVertexArray(Handle vertexArray) override;
    void enableVertexAttribArray(Location location) override;
    void vertexAttribPointer(Location location, GLint size, GLenum type,
                             bool normalized, GLsizei stride, size_t offset) override;
    void vertexAttribDivisor(Location location, GLuint divisor) override;

    // Textures
    Handle createTexture() override;
    void bindTexture(GLenum target, Handle texture) override;
    void activeTexture(GLuint unit) override;
    void texImage2D(GLenum target, GLint level, GLint internalFormat,
                    GLsizei width, GLsizei height, GLenum format,
                    GLenum type, const void* pixels) override;
    void texParameteri(GLenum target, GLenum name, GLint value) override;
    void deleteTexture(Handle texture) override;

    // Framebuffers
    Handle createFramebuffer() override;
    void bindFramebuffer(GLenum target, Handle framebuffer) override;
    void framebufferTexture2D(GLenum target, GLenum attachment,
                              GLenum textureTarget, Handle texture, GLint level) override;
    GLenum checkFramebufferStatus(GLenum target) override;
    void deleteFramebuffer(Handle framebuffer) override;

    // Transform feedback
    Handle createTransformFeedback() override;
    void bindTransformFeedback(Handle transformFeedback) override;
    void beginTransformFeedback(GLenum primitiveMode) override;
    void endTransformFeedback() override;
    void deleteTransformFeedback(Handle transformFeedback) override;

    // Uniforms
    void uniform1i(Location location, GLint value) override;
    void uniform1f(Location location, float value) override;
    void uniform2f(Location location, const glm::vec2& value) override;
    void uniform3f(Location location, const glm::vec3& value) override;
    void uniform4f(Location location, const glm::vec4& value) override;
    void uniformMatrix4f(Location location, const glm::mat4& value) override;

    // State & drawing
    void viewport(GLint x, GLint y, GLsizei width, GLsizei height) override;
    void clearColor(const glm::vec4& color) override;
    void clear(GLbitfield mask) override;
    void enable(GLenum capability) override;
    void disable(GLenum capability) override;
    void drawArrays(GLenum mode, GLint first, GLsizei count) override;
    void drawElements(GLenum mode, GLsizei count, GLenum type, size_t offset) override;

private:
    void installDebugCallback();

    ContextAttributes attributes_;
    bool debugOutput_ = false;
};

} // namespace linkgl
