#pragma once

#include "linkgl/core/id.hpp"
#include "linkgl/graph/link_context.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace linkgl {

/**
 * @brief Extra ordering dependencies shared by every link kind
 *
 * Structural dependencies come from each link's typed fields; dependsOn()
 * adds anything else that must exist first (e.g. a texture filled from a
 * buffer). The combined list is ordered and free of duplicates.
 */
class LinkDependencies {
public:
    void add(const ResourceRef& ref);
    const std::vector<ResourceRef>& extra() const { return extra_; }

    /// Merge structural dependencies with the extra ones
    std::vector<ResourceRef> merge(std::vector<ResourceRef> structural) const;

private:
    std::vector<ResourceRef> extra_;
};

// ============================================================================
// Shaders & programs (compiled and linked by the renderer itself)
// ============================================================================

/// Shader source text keyed by identifier
class ShaderLink {
public:
    ShaderLink(ShaderId id, ShaderStage stage, std::string source);

    const ShaderId& id() const { return id_; }
    ShaderStage stage() const { return stage_; }
    const std::string& source() const { return source_; }

    ShaderLink& dependsOn(const ResourceRef& ref) { deps_.add(ref); return *this; }
    std::vector<ResourceRef> dependencies() const { return deps_.merge({}); }

private:
    ShaderId id_;
    ShaderStage stage_;
    std::string source_;
    LinkDependencies deps_;
};

/**
 * @brief Links a vertex shader and a fragment shader into a program
 *
 * Transform-feedback varyings, if any, are declared before linking.
 */
class ProgramLink {
public:
    ProgramLink(ProgramId id, ShaderId vertexShader, ShaderId fragmentShader);

    const ProgramId& id() const { return id_; }
    const ShaderId& vertexShader() const { return vertexShader_; }
    const ShaderId& fragmentShader() const { return fragmentShader_; }

    /// Declare transform-feedback outputs (GL_INTERLEAVED_ATTRIBS or GL_SEPARATE_ATTRIBS)
    ProgramLink& transformFeedbackVaryings(std::vector<std::string> varyings,
                                           GLenum bufferMode = GL_INTERLEAVED_ATTRIBS);
    const std::vector<std::string>& varyings() const { return varyings_; }
    GLenum varyingBufferMode() const { return bufferMode_; }

    ProgramLink& dependsOn(const ResourceRef& ref) { deps_.add(ref); return *this; }
    std::vector<ResourceRef> dependencies() const;

private:
    ProgramId id_;
    ShaderId vertexShader_;
    ShaderId fragmentShader_;
    std::vector<std::string> varyings_;
    GLenum bufferMode_ = GL_INTERLEAVED_ATTRIBS;
    LinkDependencies deps_;
};

// ============================================================================
// Handle-producing links
// ============================================================================

/**
 * @brief Link whose create callback returns a native handle
 *
 * Shared implementation for buffers, textures and framebuffers. The create
 * callback runs once; the optional update callback runs every
 * updateAndRender() (gated by the optional should-update predicate) and can
 * read its own handle through ctx.self().
 */
template <ResourceKind K, typename Context, typename Derived>
class HandleLink {
public:
    using IdType = Id<K>;
    using CreateCallback = std::function<Handle(const Context&)>;
    using UpdateCallback = std::function<void(const Context&)>;
    using ShouldUpdateCallback = std::function<bool(const Context&)>;

    HandleLink(IdType id, CreateCallback create, UpdateCallback update = nullptr)
        : id_(std::move(id))
        , create_(std::move(create))
        , update_(std::move(update)) {}

    const IdType& id() const { return id_; }

    const CreateCallback& createCallback() const { return create_; }
    const UpdateCallback& updateCallback() const { return update_; }
    const ShouldUpdateCallback& shouldUpdateCallback() const { return shouldUpdate_; }

    Derived& setUpdateCallback(UpdateCallback callback) {
        update_ = std::move(callback);
        return static_cast<Derived&>(*this);
    }

    Derived& setShouldUpdateCallback(ShouldUpdateCallback callback) {
        shouldUpdate_ = std::move(callback);
        return static_cast<Derived&>(*this);
    }

    bool hasUpdate() const { return static_cast<bool>(update_); }

    Derived& dependsOn(const ResourceRef& ref) {
        deps_.add(ref);
        return static_cast<Derived&>(*this);
    }

protected:
    IdType id_;
    CreateCallback create_;
    UpdateCallback update_;
    ShouldUpdateCallback shouldUpdate_;
    LinkDependencies deps_;
};

class BufferLink : public HandleLink<ResourceKind::Buffer, LinkContext, BufferLink> {
public:
    using HandleLink::HandleLink;

    std::vector<ResourceRef> dependencies() const { return deps_.merge({}); }
};

class TextureLink : public HandleLink<ResourceKind::Texture, LinkContext, TextureLink> {
public:
    using HandleLink::HandleLink;

    std::vector<ResourceRef> dependencies() const { return deps_.merge({}); }
};

/// Framebuffer, optionally depending on the texture it renders into
class FramebufferLink : public HandleLink<ResourceKind::Framebuffer, FramebufferContext, FramebufferLink> {
public:
    FramebufferLink(FramebufferId id, CreateCallback create,
                    std::optional<TextureId> texture = std::nullopt);

    const std::optional<TextureId>& texture() const { return texture_; }

    std::vector<ResourceRef> dependencies() const;

private:
    std::optional<TextureId> texture_;
};

/**
 * @brief Vertex array object
 *
 * Allocated with createVertexArray() unless a create callback is given.
 * The optional program is used to look up attribute locations for
 * attributes recorded into this vertex array.
 */
class VertexArrayLink {
public:
    using CreateCallback = std::function<Handle(const LinkContext&)>;

    explicit VertexArrayLink(VertexArrayId id,
                             std::optional<ProgramId> program = std::nullopt,
                             CreateCallback create = nullptr);

    const VertexArrayId& id() const { return id_; }
    const std::optional<ProgramId>& program() const { return program_; }
    const CreateCallback& createCallback() const { return create_; }

    VertexArrayLink& dependsOn(const ResourceRef& ref) { deps_.add(ref); return *this; }
    std::vector<ResourceRef> dependencies() const;

private:
    VertexArrayId id_;
    std::optional<ProgramId> program_;
    CreateCallback create_;
    LinkDependencies deps_;
};

/// Transform feedback object; allocated with createTransformFeedback() by default
class TransformFeedbackLink {
public:
    using CreateCallback = std::function<Handle(const LinkContext&)>;

    explicit TransformFeedbackLink(TransformFeedbackId id, CreateCallback create = nullptr);

    const TransformFeedbackId& id() const { return id_; }
    const CreateCallback& createCallback() const { return create_; }

    TransformFeedbackLink& dependsOn(const ResourceRef& ref) { deps_.add(ref); return *this; }
    std::vector<ResourceRef> dependencies() const { return deps_.merge({}); }

private:
    TransformFeedbackId id_;
    CreateCallback create_;
    LinkDependencies deps_;
};

// ============================================================================
// Binding links (side effects only, no handle of their own)
// ============================================================================

/**
 * @brief Binding link shared by attributes and uniforms
 *
 * The create callback performs a binding side effect. With
 * useInitCallbackForUpdate set, it also serves as the per-frame update.
 */
template <ResourceKind K, typename Context, typename Derived>
class BindingLink {
public:
    using IdType = Id<K>;
    using Callback = std::function<void(const Context&)>;
    using ShouldUpdateCallback = std::function<bool(const Context&)>;

    BindingLink(IdType id, Callback create)
        : id_(std::move(id))
        , create_(std::move(create)) {}

    const IdType& id() const { return id_; }

    const Callback& createCallback() const { return create_; }
    const ShouldUpdateCallback& shouldUpdateCallback() const { return shouldUpdate_; }
    bool useInitCallbackForUpdate() const { return useInitForUpdate_; }

    /// The callback run on update: the explicit one, else create when flagged
    const Callback& effectiveUpdateCallback() const {
        return (!update_ && useInitForUpdate_) ? create_ : update_;
    }

    Derived& setUpdateCallback(Callback callback) {
        update_ = std::move(callback);
        return static_cast<Derived&>(*this);
    }

    Derived& setShouldUpdateCallback(ShouldUpdateCallback callback) {
        shouldUpdate_ = std::move(callback);
        return static_cast<Derived&>(*this);
    }

    Derived& setUseInitCallbackForUpdate(bool enabled) {
        useInitForUpdate_ = enabled;
        return static_cast<Derived&>(*this);
    }

    bool hasUpdate() const { return static_cast<bool>(effectiveUpdateCallback()); }

    Derived& dependsOn(const ResourceRef& ref) {
        deps_.add(ref);
        return static_cast<Derived&>(*this);
    }

protected:
    IdType id_;
    Callback create_;
    Callback update_;
    ShouldUpdateCallback shouldUpdate_;
    bool useInitForUpdate_ = false;
    LinkDependencies deps_;
};

/**
 * @brief Vertex attribute recorded into one or more vertex arrays
 *
 * Depends on every listed vertex array and on the buffer. The location is
 * either fixed with setLocation() (layout-qualified shaders) or looked up by
 * name in each vertex array's program.
 */
class AttributeLink : public BindingLink<ResourceKind::Attribute, AttributeContext, AttributeLink> {
public:
    AttributeLink(AttributeId id, std::vector<VertexArrayId> vertexArrays,
                  BufferId buffer, Callback create);

    const std::vector<VertexArrayId>& vertexArrays() const { return vertexArrays_; }
    const BufferId& buffer() const { return buffer_; }

    AttributeLink& setLocation(Location location) {
        location_ = location;
        return *this;
    }
    const std::optional<Location>& location() const { return location_; }

    std::vector<ResourceRef> dependencies() const;

private:
    std::vector<VertexArrayId> vertexArrays_;
    BufferId buffer_;
    std::optional<Location> location_;
};

/// Uniform variable shared by one or more programs
class UniformLink : public BindingLink<ResourceKind::Uniform, UniformContext, UniformLink> {
public:
    UniformLink(UniformId id, std::vector<ProgramId> programs, Callback create);

    const std::vector<ProgramId>& programs() const { return programs_; }

    std::vector<ResourceRef> dependencies() const;

private:
    std::vector<ProgramId> programs_;
};

} // namespace linkgl
