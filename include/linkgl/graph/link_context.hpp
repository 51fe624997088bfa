#pragma once

#include "linkgl/core/id.hpp"
#include "linkgl/gfx/graphics_context.hpp"
#include "linkgl/graph/resource_table.hpp"

#include <vector>

namespace linkgl {

/**
 * @brief What a link callback sees when it is created or updated
 *
 * Exposes the live graphics context, the time value (milliseconds, same
 * clock as the frame scheduler), the link's own handle once it exists, and
 * the handles of the link's declared dependencies. Looking up anything that
 * is not a declared dependency throws UnknownIdError.
 */
class LinkContext {
public:
    LinkContext(GraphicsContext& gl, double now, const ResourceTable& handles,
                const ResourceRef& self, const std::vector<ResourceRef>& dependencies);
    virtual ~LinkContext() = default;

    GraphicsContext& gl() const { return gl_; }

    /// Time in milliseconds
    double now() const { return now_; }

    /// Identity of the link being created or updated
    const ResourceRef& ref() const { return self_; }

    /// The link's own handle (NULL_HANDLE while it is being created)
    Handle self() const;

    /// True while the create callback runs, false during updates
    bool creating() const { return self() == NULL_HANDLE; }

    Handle shader(const ShaderId& id) const { return dependency(id.ref()); }
    Handle program(const ProgramId& id) const { return dependency(id.ref()); }
    Handle buffer(const BufferId& id) const { return dependency(id.ref()); }
    Handle vertexArray(const VertexArrayId& id) const { return dependency(id.ref()); }
    Handle texture(const TextureId& id) const { return dependency(id.ref()); }
    Handle framebuffer(const FramebufferId& id) const { return dependency(id.ref()); }
    Handle transformFeedback(const TransformFeedbackId& id) const { return dependency(id.ref()); }

    /// Handle of a declared dependency of any kind
    Handle dependency(const ResourceRef& ref) const;

    const std::vector<ResourceRef>& dependencies() const { return dependencies_; }

private:
    GraphicsContext& gl_;
    double now_;
    const ResourceTable& handles_;
    const ResourceRef& self_;
    const std::vector<ResourceRef>& dependencies_;
};

/**
 * @brief Context for attribute callbacks
 *
 * When the callback runs, the vertex array and the attribute's buffer are
 * bound and the attribute array at location() is enabled, so a single
 * vertexAttribPointer() call records the layout into the vertex array.
 */
class AttributeContext : public LinkContext {
public:
    AttributeContext(GraphicsContext& gl, double now, const ResourceTable& handles,
                     const ResourceRef& self, const std::vector<ResourceRef>& dependencies,
                     Location location, Handle buffer, Handle vertexArray)
        : LinkContext(gl, now, handles, self, dependencies)
        , location_(location)
        , buffer_(buffer)
        , vertexArray_(vertexArray) {}

    Location location() const { return location_; }
    Handle attributeBuffer() const { return buffer_; }
    Handle boundVertexArray() const { return vertexArray_; }

private:
    Location location_;
    Handle buffer_;
    Handle vertexArray_;
};

/**
 * @brief Context for uniform callbacks
 *
 * The program is already in use when the callback runs.
 */
class UniformContext : public LinkContext {
public:
    UniformContext(GraphicsContext& gl, double now, const ResourceTable& handles,
                   const ResourceRef& self, const std::vector<ResourceRef>& dependencies,
                   Location location, Handle program)
        : LinkContext(gl, now, handles, self, dependencies)
        , location_(location)
        , program_(program) {}

    Location location() const { return location_; }
    Handle activeProgram() const { return program_; }

private:
    Location location_;
    Handle program_;
};

/// Context for framebuffer callbacks: adds the linked texture, if any
class FramebufferContext : public LinkContext {
public:
    FramebufferContext(GraphicsContext& gl, double now, const ResourceTable& handles,
                       const ResourceRef& self, const std::vector<ResourceRef>& dependencies,
                       Handle texture)
        : LinkContext(gl, now, handles, self, dependencies)
        , texture_(texture) {}

    /// The linked texture (NULL_HANDLE if the link names none)
    Handle linkedTexture() const { return texture_; }

private:
    Handle texture_;
};

} // namespace linkgl
