#pragma once

#include <cstdint>
#include <memory>
#include <functional>

namespace linkgl {

// Forward declarations
class GraphicsContext;
class Canvas;
class FrameScheduler;
class Renderer;
class RendererData;
class AnimationDriver;
class Window;
class GlesContext;
class FrameLoop;

/// Native object name returned by the graphics API (0 is the null object)
using Handle = uint32_t;
constexpr Handle NULL_HANDLE = 0;

/// Attribute and uniform locations (-1 means "not found")
using Location = int32_t;
constexpr Location INVALID_LOCATION = -1;

/// Opaque token returned by a FrameScheduler (0 means "no frame pending")
using FrameToken = uint64_t;
constexpr FrameToken NULL_FRAME_TOKEN = 0;

/**
 * @brief The closed set of resource kinds managed by a renderer
 *
 * Every kind has its own identifier namespace and its own handle map.
 */
enum class ResourceKind {
    Shader,
    Program,
    Buffer,
    VertexArray,
    Attribute,
    Uniform,
    Texture,
    Framebuffer,
    TransformFeedback
};

constexpr int RESOURCE_KIND_COUNT = 9;

/// Lower-case display name ("buffer", "vertex array", ...)
const char* resourceKindName(ResourceKind kind);

enum class ShaderStage {
    Vertex,
    Fragment
};

const char* shaderStageName(ShaderStage stage);

// Ownership typedefs
using RendererPtr = std::unique_ptr<Renderer>;
using WindowPtr = std::unique_ptr<Window>;

/// Callback invoked by a FrameScheduler with a timestamp in milliseconds
using FrameCallback = std::function<void(double timestampMs)>;

} // namespace linkgl
