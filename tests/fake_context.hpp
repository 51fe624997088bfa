#pragma once

/**
 * @file fake_context.hpp
 * @brief Test doubles for the graphics API and the host
 *
 * - RecordingContext: GraphicsContext that hands out fresh integer handles,
 *   tracks which are live and logs every call
 * - FakeCanvas: Canvas owning a RecordingContext
 * - ManualScheduler: FrameScheduler fired explicitly by the test
 */

#include <linkgl/linkgl.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace linkgl {
namespace testing {

class RecordingContext : public GraphicsContext {
public:
    // ---- Configuration ----

    /// Active attributes and uniforms by GLSL name (absent = not active)
    std::map<std::string, Location> attributes;
    std::map<std::string, Location> uniforms;

    /// Shaders whose source contains this text fail to compile
    std::string failCompileMarker;
    std::string compileLog = "ERROR: 0:1: 'vec5' : undeclared identifier";

    bool failLink = false;
    std::string linkLog = "error: vertex shader output not read by fragment shader";

    /// Make createX() return the null handle
    bool nullBuffers = false;
    bool nullShaders = false;

    // ---- Recorded state ----

    std::vector<std::string> calls;
    std::set<Handle> live;
    size_t created = 0;
    size_t deleted = 0;
    size_t invalidDeletes = 0;

    Handle currentProgram = NULL_HANDLE;
    Handle currentVertexArray = NULL_HANDLE;
    Handle currentArrayBuffer = NULL_HANDLE;

    std::map<Handle, std::vector<Handle>> attachedShaders;
    std::map<Handle, std::vector<std::string>> varyings;
    std::map<Handle, std::set<Location>> enabledAttributes;  // per vertex array
    std::map<Location, float> uniformFloats;

    /// Number of calls whose log line starts with prefix
    size_t count(const std::string& prefix) const {
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
            [&](const std::string& call) { return call.compare(0, prefix.size(), prefix) == 0; }));
    }

    // ---- Buffers ----

    using GraphicsContext::bufferData;

    Handle createBuffer() override {
        if (nullBuffers) {
            calls.push_back("createBuffer -> 0");
            return NULL_HANDLE;
        }
        return allocate("createBuffer");
    }
    void deleteBuffer(Handle buffer) override { release("deleteBuffer", buffer); }
    void bindBuffer(GLenum target, Handle buffer) override {
        if (target == GL_ARRAY_BUFFER) {
            currentArrayBuffer = buffer;
        }
        calls.push_back("bindBuffer " + std::to_string(buffer));
    }
    void bufferData(GLenum, const void*, size_t size, GLenum) override {
        calls.push_back("bufferData " + std::to_string(size));
    }
    void bufferSubData(GLenum, size_t, const void*, size_t size) override {
        calls.push_back("bufferSubData " + std::to_string(size));
    }
    void bindBufferBase(GLenum, GLuint index, Handle buffer) override {
        calls.push_back("bindBufferBase " + std::to_string(index) + " " + std::to_string(buffer));
    }

    // ---- Shaders & programs ----

    Handle createShader(ShaderStage stage) override {
        if (nullShaders) {
            calls.push_back("createShader -> 0");
            return NULL_HANDLE;
        }
        return allocate(std::string("createShader ") + shaderStageName(stage));
    }
    void shaderSource(Handle shader, std::string_view source) override {
        sources_[shader] = std::string(source);
        calls.push_back("shaderSource " + std::to_string(shader));
    }
    void compileShader(Handle shader) override {
        calls.push_back("compileShader " + std::to_string(shader));
    }
    bool shaderCompileStatus(Handle shader) override {
        return failCompileMarker.empty() ||
               sources_[shader].find(failCompileMarker) == std::string::npos;
    }
    std::string shaderInfoLog(Handle shader) override {
        return shaderCompileStatus(shader) ? std::string() : compileLog;
    }
    void deleteShader(Handle shader) override { release("deleteShader", shader); }

    Handle createProgram() override { return allocate("createProgram"); }
    void attachShader(Handle program, Handle shader) override {
        attachedShaders[program].push_back(shader);
        calls.push_back("attachShader " + std::to_string(program) + " " + std::to_string(shader));
    }
    void transformFeedbackVaryings(Handle program, const std::vector<std::string>& names,
                                   GLenum) override {
        varyings[program] = names;
        calls.push_back("transformFeedbackVaryings " + std::to_string(program));
    }
    void linkProgram(Handle program) override {
        calls.push_back("linkProgram " + std::to_string(program));
    }
    bool programLinkStatus(Handle) override { return !failLink; }
    std::string programInfoLog(Handle) override { return failLink ? linkLog : std::string(); }
    void useProgram(Handle program) override {
        currentProgram = program;
        calls.push_back("useProgram " + std::to_string(program));
    }
    void deleteProgram(Handle program) override { release("deleteProgram", program); }

    Location attribLocation(Handle, std::string_view name) override {
        auto it = attributes.find(std::string(name));
        return it == attributes.end() ? INVALID_LOCATION : it->second;
    }
    Location uniformLocation(Handle, std::string_view name) override {
        auto it = uniforms.find(std::string(name));
        return it == uniforms.end() ? INVALID_LOCATION : it->second;
    }

    // ---- Vertex arrays ----

    Handle createVertexArray() override { return allocate("createVertexArray"); }
    void bindVertexArray(Handle vertexArray) override {
        currentVertexArray = vertexArray;
        calls.push_back("bindVertexArray " + std::to_string(vertexArray));
    }
    void deleteVertexArray(Handle vertexArray) override { release("deleteVertexArray", vertexArray); }
    void enableVertexAttribArray(Location location) override {
        enabledAttributes[currentVertexArray].insert(location);
        calls.push_back("enableVertexAttribArray " + std::to_string(location));
    }
    void vertexAttribPointer(Location location, GLint size, GLenum, bool, GLsizei, size_t) override {
        calls.push_back("vertexAttribPointer " + std::to_string(location) + " " + std::to_string(size) +
                        " vao=" + std::to_string(currentVertexArray) +
                        " buffer=" + std::to_string(currentArrayBuffer));
    }
    void vertexAttribDivisor(Location location, GLuint divisor) override {
        calls.push_back("vertexAttribDivisor " + std::to_string(location) + " " + std::to_string(divisor));
    }

    // ---- Textures ----

    Handle createTexture() override { return allocate("createTexture"); }
    void bindTexture(GLenum, Handle texture) override {
        calls.push_back("bindTexture " + std::to_string(texture));
    }
    void activeTexture(GLuint unit) override {
        calls.push_back("activeTexture " + std::to_string(unit));
    }
    void texImage2D(GLenum, GLint, GLint, GLsizei width, GLsizei height, GLenum, GLenum,
                    const void*) override {
        calls.push_back("texImage2D " + std::to_string(width) + "x" + std::to_string(height));
    }
    void texParameteri(GLenum, GLenum, GLint) override { calls.push_back("texParameteri"); }
    void deleteTexture(Handle texture) override { release("deleteTexture", texture); }

    // ---- Framebuffers ----

    Handle createFramebuffer() override { return allocate("createFramebuffer"); }
    void bindFramebuffer(GLenum, Handle framebuffer) override {
        calls.push_back("bindFramebuffer " + std::to_string(framebuffer));
    }
    void framebufferTexture2D(GLenum, GLenum, GLenum, Handle texture, GLint) override {
        calls.push_back("framebufferTexture2D " + std::to_string(texture));
    }
    GLenum checkFramebufferStatus(GLenum) override { return GL_FRAMEBUFFER_COMPLETE; }
    void deleteFramebuffer(Handle framebuffer) override { release("deleteFramebuffer", framebuffer); }

    // ---- Transform feedback ----

    Handle createTransformFeedback() override { return allocate("createTransformFeedback"); }
    void bindTransformFeedback(Handle feedback) override {
        calls.push_back("bindTransformFeedback " + std::to_string(feedback));
    }
    void beginTransformFeedback(GLenum) override { calls.push_back("beginTransformFeedback"); }
    void endTransformFeedback() override { calls.push_back("endTransformFeedback"); }
    void deleteTransformFeedback(Handle feedback) override {
        release("deleteTransformFeedback", feedback);
    }

    // ---- Uniforms ----

    void uniform1i(Location location, GLint value) override {
        calls.push_back("uniform1i " + std::to_string(location) + " program=" + std::to_string(currentProgram));
        uniformFloats[location] = static_cast<float>(value);
    }
    void uniform1f(Location location, float value) override {
        calls.push_back("uniform1f " + std::to_string(location) + " program=" + std::to_string(currentProgram));
        uniformFloats[location] = value;
    }
    void uniform2f(Location location, const glm::vec2&) override {
        calls.push_back("uniform2f " + std::to_string(location));
    }
    void uniform3f(Location location, const glm::vec3&) override {
        calls.push_back("uniform3f " + std::to_string(location));
    }
    void uniform4f(Location location, const glm::vec4&) override {
        calls.push_back("uniform4f " + std::to_string(location));
    }
    void uniformMatrix4f(Location location, const glm::mat4&) override {
        calls.push_back("uniformMatrix4f " + std::to_string(location));
    }

    // ---- State & drawing ----

    void viewport(GLint, GLint, GLsizei width, GLsizei height) override {
        calls.push_back("viewport " + std::to_string(width) + "x" + std::to_string(height));
    }
    void clearColor(const glm::vec4&) override { calls.push_back("clearColor"); }
    void clear(GLbitfield) override { calls.push_back("clear"); }
    void enable(GLenum) override { calls.push_back("enable"); }
    void disable(GLenum) override { calls.push_back("disable"); }
    void drawArrays(GLenum, GLint, GLsizei count) override {
        calls.push_back("drawArrays " + std::to_string(count) +
                        " program=" + std::to_string(currentProgram) +
                        " vao=" + std::to_string(currentVertexArray));
    }
    void drawElements(GLenum, GLsizei count, GLenum, size_t) override {
        calls.push_back("drawElements " + std::to_string(count));
    }

private:
    Handle allocate(const std::string& call) {
        Handle handle = nextHandle_++;
        live.insert(handle);
        created++;
        calls.push_back(call + " -> " + std::to_string(handle));
        return handle;
    }

    void release(const std::string& call, Handle handle) {
        calls.push_back(call + " " + std::to_string(handle));
        if (live.erase(handle) == 0) {
            invalidDeletes++;
            return;
        }
        deleted++;
    }

    Handle nextHandle_ = 1;
    std::map<Handle, std::string> sources_;
};

class FakeCanvas : public Canvas {
public:
    RecordingContext context;
    bool provideContext = true;
    int acquisitions = 0;
    ContextAttributes lastAttributes;
    glm::uvec2 size{640, 480};

    GraphicsContext* acquireContext(const ContextAttributes& attributes) override {
        acquisitions++;
        lastAttributes = attributes;
        return provideContext ? &context : nullptr;
    }

    glm::uvec2 drawingBufferSize() const override { return size; }
};

/// Frame scheduler fired by hand: fire() runs what was pending beforehand
class ManualScheduler : public FrameScheduler {
public:
    size_t requests = 0;
    size_t cancellations = 0;

    FrameToken requestFrame(FrameCallback callback) override {
        requests++;
        FrameToken token = nextToken_++;
        pending_.push_back({token, std::move(callback)});
        return token;
    }

    void cancelFrame(FrameToken token) override {
        auto it = std::find_if(pending_.begin(), pending_.end(),
            [token](const Pending& p) { return p.token == token; });
        if (it != pending_.end()) {
            pending_.erase(it);
            cancellations++;
        }
    }

    size_t pending() const { return pending_.size(); }

    /// Fire one refresh; returns the number of callbacks run
    size_t fire(double timestampMs) {
        std::vector<Pending> batch;
        batch.swap(pending_);
        for (auto& p : batch) {
            p.callback(timestampMs);
        }
        return batch.size();
    }

private:
    struct Pending {
        FrameToken token;
        FrameCallback callback;
    };

    std::vector<Pending> pending_;
    FrameToken nextToken_ = 1;
};

} // namespace testing
} // namespace linkgl
