#include "linkgl/window/gles_context.hpp"
#include "linkgl/core/logging.hpp"

#include <GLES2/gl2ext.h>
#include <GLFW/glfw3.h>
#include <glm/gtc/type_ptr.hpp>

#include <cstring>

namespace linkgl {

// Debug callback function
static void GL_APIENTRY debugCallback(
    GLenum /*source*/,
    GLenum /*type*/,
    GLuint /*id*/,
    GLenum severity,
    GLsizei length,
    const GLchar* message,
    const void* /*userParam*/)
{
    GlDebugSeverity level = GlDebugSeverity::Notification;
    switch (severity) {
        case GL_DEBUG_SEVERITY_HIGH_KHR:   level = GlDebugSeverity::High; break;
        case GL_DEBUG_SEVERITY_MEDIUM_KHR: level = GlDebugSeverity::Medium; break;
        case GL_DEBUG_SEVERITY_LOW_KHR:    level = GlDebugSeverity::Low; break;
        default: break;
    }

    size_t size = length >= 0 ? static_cast<size_t>(length) : std::strlen(message);
    Logger::global().glMessage(level, std::string_view(message, size));
}

namespace {

template <typename Query>
std::string readInfoLog(GLint length, Query query, GLuint object) {
    if (length <= 1) {
        return {};
    }
    std::string log(static_cast<size_t>(length), '\0');
    GLsizei written = 0;
    query(object, length, &written, &log[0]);
    log.resize(static_cast<size_t>(written));
    return log;
}

} // anonymous namespace

GlesContext::GlesContext(const ContextAttributes& attributes)
    : attributes_(attributes) {
    if (attributes_.debugOutput) {
        installDebugCallback();
    }

    const char* version = reinterpret_cast<const char*>(glGetString(GL_VERSION));
    LINKGL_INFO(LogCategory::Core,
        std::string("GL context: ") + (version ? version : "unknown version"));
}

GlesContext::~GlesContext() = default;

void GlesContext::installDebugCallback() {
    auto messageCallback = reinterpret_cast<PFNGLDEBUGMESSAGECALLBACKKHRPROC>(
        glfwGetProcAddress("glDebugMessageCallbackKHR"));
    if (!messageCallback) {
        LINKGL_WARN(LogCategory::Gl, "KHR_debug not available, debug output disabled");
        return;
    }

    glEnable(GL_DEBUG_OUTPUT_KHR);
    glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS_KHR);
    messageCallback(debugCallback, nullptr);
    debugOutput_ = true;

    LINKGL_DEBUG(LogCategory::Gl, "Driver debug output enabled");
}

// ============================================================================
// Buffers
// ============================================================================

Handle GlesContext::createBuffer() {
    GLuint buffer = 0;
    glGenBuffers(1, &buffer);
    return buffer;
}

void GlesContext::deleteBuffer(Handle buffer) {
    glDeleteBuffers(1, &buffer);
}

void GlesContext::bindBuffer(GLenum target, Handle buffer) {
    glBindBuffer(target, buffer);
}

void GlesContext::bufferData(GLenum target, const void* data, size_t size, GLenum usage) {
    glBufferData(target, static_cast<GLsizeiptr>(size), data, usage);
}

void GlesContext::bufferSubData(GLenum target, size_t offset, const void* data, size_t size) {
    glBufferSubData(target, static_cast<GLintptr>(offset), static_cast<GLsizeiptr>(size), data);
}

void GlesContext::bindBufferBase(GLenum target, GLuint index, Handle buffer) {
    glBindBufferBase(target, index, buffer);
}

// ============================================================================
// Shaders & programs
// ============================================================================

Handle GlesContext::createShader(ShaderStage stage) {
    return glCreateShader(stage == ShaderStage::Vertex ? GL_VERTEX_SHADER : GL_FRAGMENT_SHADER);
}

void GlesContext::shaderSource(Handle shader, std::string_view source) {
    const GLchar* text = source.data();
    GLint length = static_cast<GLint>(source.size());
    glShaderSource(shader, 1, &text, &length);
}

void GlesContext::compileShader(Handle shader) {
    glCompileShader(shader);
}

bool GlesContext::shaderCompileStatus(Handle shader) {
    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    return status == GL_TRUE;
}

std::string GlesContext::shaderInfoLog(Handle shader) {
    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    return readInfoLog(length, glGetShaderInfoLog, shader);
}

void GlesContext::deleteShader(Handle shader) {
    glDeleteShader(shader);
}

Handle GlesContext::createProgram() {
    return glCreateProgram();
}

void GlesContext::attachShader(Handle program, Handle shader) {
    glAttachShader(program, shader);
}

void GlesContext::transformFeedbackVaryings(Handle program,
                                            const std::vector<std::string>& varyings,
                                            GLenum bufferMode) {
    std::vector<const GLchar*> names;
    names.reserve(varyings.size());
    for (const auto& varying : varyings) {
        names.push_back(varying.c_str());
    }
    glTransformFeedbackVaryings(program, static_cast<GLsizei>(names.size()), names.data(), bufferMode);
}

void GlesContext::linkProgram(Handle program) {
    glLinkProgram(program);
}

bool GlesContext::programLinkStatus(Handle program) {
    GLint status = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &status);
    return status == GL_TRUE;
}

std::string GlesContext::programInfoLog(Handle program) {
    GLint length = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    return readInfoLog(length, glGetProgramInfoLog, program);
}

void GlesContext::useProgram(Handle program) {
    glUseProgram(program);
}

void GlesContext::deleteProgram(Handle program) {
    glDeleteProgram(program);
}

Location GlesContext::attribLocation(Handle program, std::string_view name) {
    return glGetAttribLocation(program, std::string(name).c_str());
}

Location GlesContext::uniformLocation(Handle program, std::string_view name) {
    return glGetUniformLocation(program, std::string(name).c_str());
}

// ============================================================================
// Vertex arrays
// ============================================================================

Handle GlesContext::createVertexArray() {
    GLuint vertexArray = 0;
    glGenVertexArrays(1, &vertexArray);
    return vertexArray;
}

void GlesContext::bindVertexArray(Handle vertexArray) {
    glBindVertexArray(vertexArray);
}

void GlesContext::deleteVertexArray(Handle vertexArray) {
    glDeleteVertexArrays(1, &vertexArray);
}

void GlesContext::enableVertexAttribArray(Location location) {
    glEnableVertexAttribArray(static_cast<GLuint>(location));
}

void GlesContext::vertexAttribPointer(Location location, GLint size, GLenum type,
                                      bool normalized, GLsizei stride, size_t offset) {
    glVertexAttribPointer(static_cast<GLuint>(location), size, type,
                          normalized ? GL_TRUE : GL_FALSE, stride,
                          reinterpret_cast<const void*>(offset));
}

void GlesContext::vertexAttribDivisor(Location location, GLuint divisor) {
    glVertexAttribDivisor(static_cast<GLuint>(location), divisor);
}

// ============================================================================
// Textures
// ============================================================================

Handle GlesContext::createTexture() {
    GLuint texture = 0;
    glGenTextures(1, &texture);
    return texture;
}

void GlesContext::bindTexture(GLenum target, Handle texture) {
    glBindTexture(target, texture);
}

void GlesContext::activeTexture(GLuint unit) {
    glActiveTexture(GL_TEXTURE0 + unit);
}

void GlesContext::texImage2D(GLenum target, GLint level, GLint internalFormat,
                             GLsizei width, GLsizei height, GLenum format,
                             GLenum type, const void* pixels) {
    glTexImage2D(target, level, internalFormat, width, height, 0, format, type, pixels);
}

void GlesContext::texParameteri(GLenum target, GLenum name, GLint value) {
    glTexParameteri(target, name, value);
}

void GlesContext::deleteTexture(Handle texture) {
    glDeleteTextures(1, &texture);
}

// ============================================================================
// Framebuffers
// ============================================================================

Handle GlesContext::createFramebuffer() {
    GLuint framebuffer = 0;
    glGenFramebuffers(1, &framebuffer);
    return framebuffer;
}

void GlesContext::bindFramebuffer(GLenum target, Handle framebuffer) {
    glBindFramebuffer(target, framebuffer);
}

void GlesContext::framebufferTexture2D(GLenum target, GLenum attachment,
                                       GLenum textureTarget, Handle texture, GLint level) {
    glFramebufferTexture2D(target, attachment, textureTarget, texture, level);
}

GLenum GlesContext::checkFramebufferStatus(GLenum target) {
    return glCheckFramebufferStatus(target);
}

void GlesContext::deleteFramebuffer(Handle framebuffer) {
    glDeleteFramebuffers(1, &framebuffer);
}

// ============================================================================
// Transform feedback
// ============================================================================

Handle GlesContext::createTransformFeedback() {
    GLuint feedback = 0;
    glGenTransformFeedbacks(1, &feedback);
    return feedback;
}

void GlesContext::bindTransformFeedback(Handle transformFeedback) {
    glBindTransformFeedback(GL_TRANSFORM_FEEDBACK, transformFeedback);
}

void GlesContext::beginTransformFeedback(GLenum primitiveMode) {
    glBeginTransformFeedback(primitiveMode);
}

void GlesContext::endTransformFeedback() {
    glEndTransformFeedback();
}

void GlesContext::deleteTransformFeedback(Handle transformFeedback) {
    glDeleteTransformFeedbacks(1, &transformFeedback);
}

// ============================================================================
// Uniforms
// ============================================================================

void GlesContext::uniform1i(Location location, GLint value) {
    glUniform1i(location, value);
}

void GlesContext::uniform1f(Location location, float value) {
    glUniform1f(location, value);
}

void GlesContext::uniform2f(Location location, const glm::vec2& value) {
    glUniform2f(location, value.x, value.y);
}

void GlesContext::uniform3f(Location location, const glm::vec3& value) {
    glUniform3f(location, value.x, value.y, value.z);
}

void GlesContext::uniform4f(Location location, const glm::vec4& value) {
    glUniform4f(location, value.x, value.y, value.z, value.w);
}

void GlesContext::uniformMatrix4f(Location location, const glm::mat4& value) {
    glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(value));
}

// ============================================================================
// State & drawing
// ============================================================================

void GlesContext::viewport(GLint x, GLint y, GLsizei width, GLsizei height) {
    glViewport(x, y, width, height);
}

void GlesContext::clearColor(const glm::vec4& color) {
    glClearColor(color.r, color.g, color.b, color.a);
}

void GlesContext::clear(GLbitfield mask) {
    glClear(mask);
}

void GlesContext::enable(GLenum capability) {
    glEnable(capability);
}

void GlesContext::disable(GLenum capability) {
    glDisable(capability);
}

void GlesContext::drawArrays(GLenum mode, GLint first, GLsizei count) {
    glDrawArrays(mode, first, count);
}

void GlesContext::drawElements(GLenum mode, GLsizei count, GLenum type, size_t offset) {
    glDrawElements(mode, count, type, reinterpret_cast<const void*>(offset));
}

} // namespace linkgl
