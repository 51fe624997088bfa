#pragma once

#include "linkgl/core/id.hpp"
#include "linkgl/gfx/graphics_context.hpp"
#include "linkgl/graph/link_registry.hpp"
#include "linkgl/graph/resource_table.hpp"
#include "linkgl/graph/resource_ledger.hpp"
#include "linkgl/engine/animation_driver.hpp"

#include <glm/glm.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace linkgl {

/**
 * @brief The resolved graph: live handles, callbacks and animation state
 *
 * RendererData is created by Renderer::Builder::build() and is the view
 * handed to render and animation callbacks. Its shape never changes after
 * the build; only the contents of the GPU objects do.
 *
 * Ownership:
 * - Every native handle it creates is recorded in its ResourceLedger and
 *   deleted by free() (or the destructor).
 * - The canvas, the graphics context and the frame scheduler are borrowed.
 *
 * After free(), every operation other than free(), isFreed(),
 * stopAnimating() and isAnimating() throws UseAfterFreeError.
 */
class RendererData {
public:
    using RenderCallback = std::function<void(RendererData&)>;
    using AnimationCallback = std::function<void(RendererData&, double nowMs)>;

    /// Where an attribute was recorded: one entry per vertex array
    struct AttributeBinding {
        VertexArrayId vertexArray;
        Handle vertexArrayHandle;
        Location location;
    };

    /// Where a uniform lives: one entry per program
    struct UniformBinding {
        ProgramId program;
        Handle programHandle;
        Location location;
    };

    /// Frees all handles (no-op if already freed)
    ~RendererData();

    // Non-copyable, non-movable (the animation driver refers to this object)
    RendererData(const RendererData&) = delete;
    RendererData& operator=(const RendererData&) = delete;
    RendererData(RendererData&&) = delete;
    RendererData& operator=(RendererData&&) = delete;

    // =========================================================================
    // Context
    // =========================================================================

    GraphicsContext& gl() const;
    Canvas& canvas() const;
    glm::uvec2 drawingBufferSize() const;
    const ContextAttributes& contextAttributes() const { return attributes_; }

    /// Current time in milliseconds (FrameClock::now())
    double now() const;

    // =========================================================================
    // Handle lookup (throws UnknownIdError)
    // =========================================================================

    Handle shader(const ShaderId& id) const;
    Handle program(const ProgramId& id) const;
    Handle buffer(const BufferId& id) const;
    Handle vertexArray(const VertexArrayId& id) const;
    Handle texture(const TextureId& id) const;
    Handle framebuffer(const FramebufferId& id) const;
    Handle transformFeedback(const TransformFeedbackId& id) const;

    Location attributeLocation(const AttributeId& attribute, const VertexArrayId& vertexArray) const;
    Location uniformLocation(const UniformId& uniform, const ProgramId& program) const;

    const std::vector<AttributeBinding>& attributeBindings(const AttributeId& id) const;
    const std::vector<UniformBinding>& uniformBindings(const UniformId& id) const;

    /// Number of live native handles owned by this renderer
    size_t handleCount() const { return ledger_.size(); }

    /// Links in the order they were created (and are updated)
    const std::vector<ResourceRef>& buildOrder() const { return order_; }

    const LinkRegistry& links() const { return links_; }

    // =========================================================================
    // Binding helpers
    // =========================================================================

    void useProgram(const ProgramId& id);
    void useVertexArray(const VertexArrayId& id);

    /// Switch to a program and a vertex array in one call
    void useProgramWithVertexArray(const ProgramId& program, const VertexArrayId& vertexArray);

    // =========================================================================
    // Frames
    // =========================================================================

    /// Invoke the render callback once
    void render();

    /**
     * @brief Run every update callback in build order, then render
     *
     * Order within the frame: link updates (dependencies before dependents),
     * the animation callback if one was supplied, then the render callback.
     */
    void updateAndRender();
    void updateAndRender(double nowMs);

    /// Run every update callback (and the animation callback) without rendering
    void update(double nowMs);

    /// Re-run one uniform's update callback (no-op if it has none)
    void updateUniform(const UniformId& id);

    void updateUniforms();
    void updateBuffers();
    void updateTextures();
    void updateAttributes();

    // =========================================================================
    // Animation
    // =========================================================================

    void startAnimating();
    void stopAnimating();
    bool isAnimating() const { return driver_.isRunning(); }
    const AnimationDriver& animationDriver() const { return driver_; }

    // =========================================================================
    // Release
    // =========================================================================

    /**
     * @brief Stop animating and delete every owned handle
     *
     * Idempotent: later calls do nothing. Never throws.
     */
    void free() noexcept;

    bool isFreed() const { return freed_; }

private:
    friend class Renderer;

    RendererData(Canvas* canvas, GraphicsContext* gl, const ContextAttributes& attributes,
                 LinkRegistry links, std::vector<ResourceRef> order,
                 RenderCallback render, AnimationCallback animation,
                 FrameScheduler* scheduler);

    // Build every handle in order; on failure release what was built and rethrow
    void realize();
    void realize(const ResourceRef& ref, double now);

    void realizeShader(const ResourceRef& ref);
    void realizeProgram(const ResourceRef& ref);
    void realizeVertexArray(const ResourceRef& ref, double now);
    void realizeTransformFeedback(const ResourceRef& ref, double now);
    void realizeBuffer(const ResourceRef& ref, double now);
    void realizeTexture(const ResourceRef& ref, double now);
    void realizeFramebuffer(const ResourceRef& ref, double now);
    void realizeAttribute(const ResourceRef& ref, double now);
    void realizeUniform(const ResourceRef& ref, double now);

    Location resolveAttributeLocation(const AttributeLink& link, const VertexArrayId& vertexArray);

    // Record ownership and make the handle visible to dependents
    void adopt(const ResourceRef& ref, Handle handle);

    template <typename LinkT, typename ContextT>
    bool wantsUpdate(const LinkT& link, const ContextT& ctx);
    void updateLink(const ResourceRef& ref, double now);
    void updateKind(ResourceKind kind, double now);
    void invokeRender();

    const std::vector<ResourceRef>& dependenciesOf(const ResourceRef& ref) const;
    void ensureLive(const char* operation) const;

    Canvas* canvas_;
    GraphicsContext* gl_;
    ContextAttributes attributes_;

    LinkRegistry links_;
    std::vector<ResourceRef> order_;
    std::unordered_map<ResourceRef, std::vector<ResourceRef>, ResourceRefHash> dependencies_;

    ResourceTable handles_;
    ResourceLedger ledger_;
    std::unordered_map<AttributeId, std::vector<AttributeBinding>> attributeBindings_;
    std::unordered_map<UniformId, std::vector<UniformBinding>> uniformBindings_;

    RenderCallback render_;
    AnimationCallback animation_;
    AnimationDriver driver_;

    bool inFrame_ = false;
    bool freed_ = false;
};

} // namespace linkgl
