#pragma once

#include "linkgl/engine/renderer_data.hpp"
#include "linkgl/graph/link_registry.hpp"

#include <memory>
#include <optional>
#include <string>

namespace linkgl {

class FrameScheduler;

/**
 * @brief Owns a resolved resource graph and drives its frames
 *
 * A Renderer is produced by Renderer::create()...build(). Construction
 * resolves the declared links in dependency order and creates every GPU
 * object; once build() returns, the graph is fixed. Each frame either
 * renders as-is (render()) or first runs the update callbacks
 * (updateAndRender()). With a frame scheduler, startAnimating() repeats
 * updateAndRender() at the host's display cadence.
 *
 * Destroying the Renderer calls free().
 *
 * Usage:
 * @code
 * auto renderer = Renderer::create()
 *     .canvas(window.get())
 *     .addVertexShaderSource("quad_vs", vertexSource)
 *     .addFragmentShaderSource("quad_fs", fragmentSource)
 *     .addProgramLink(ProgramLink("quad", "quad_vs", "quad_fs"))
 *     .addBufferLink(BufferLink("quad", createQuadBuffer))
 *     .addVertexArrayObject("quad", ProgramId("quad"))
 *     .addAttributeLink(AttributeLink("a_position", {"quad"}, "quad", describePositions))
 *     .renderCallback([](RendererData& data) {
 *         data.useProgramWithVertexArray("quad", "quad");
 *         data.gl().drawArrays(GL_TRIANGLES, 0, 6);
 *     })
 *     .build();
 *
 * renderer->render();
 * @endcode
 */
class Renderer {
public:
    using RenderCallback = RendererData::RenderCallback;
    using AnimationCallback = RendererData::AnimationCallback;

    /**
     * @brief Builder for creating Renderer objects
     *
     * Links can be added in any order. Identifiers must be unique within a
     * kind: adding a duplicate throws DuplicateIdError immediately. The
     * builder keeps its links after build(), so it can build again.
     */
    class Builder {
    public:
        Builder() = default;

        /// Set the drawing surface (required)
        Builder& canvas(Canvas* canvas);

        /// Set the context attributes requested from the canvas
        Builder& contextAttributes(const ContextAttributes& attributes);

        /// Set the per-frame draw logic (required)
        Builder& renderCallback(RenderCallback callback);

        /// Set logic run each updateAndRender() after the link updates
        Builder& animationCallback(AnimationCallback callback);

        /**
         * @brief Set the host's frame scheduler (required for startAnimating())
         *
         * The scheduler is borrowed and must outlive every renderer built
         * with it: free() and the destructor cancel the pending frame through
         * it.
         */
        Builder& frameScheduler(FrameScheduler* scheduler);

        // Shader sources
        Builder& addShaderSource(ShaderId id, ShaderStage stage, std::string source);
        Builder& addVertexShaderSource(ShaderId id, std::string source);
        Builder& addFragmentShaderSource(ShaderId id, std::string source);

        // Links
        Builder& addShaderLink(ShaderLink link);
        Builder& addProgramLink(ProgramLink link);
        Builder& addBufferLink(BufferLink link);
        Builder& addAttributeLink(AttributeLink link);
        Builder& addUniformLink(UniformLink link);
        Builder& addVertexArrayLink(VertexArrayLink link);
        Builder& addTextureLink(TextureLink link);
        Builder& addFramebufferLink(FramebufferLink link);
        Builder& addTransformFeedbackLink(TransformFeedbackLink link);

        /// Register a vertex array allocated with createVertexArray()
        Builder& addVertexArrayObject(VertexArrayId id,
                                      std::optional<ProgramId> program = std::nullopt);

        const LinkRegistry& links() const { return links_; }

        /**
         * @brief Resolve the graph and create every GPU object
         *
         * Checks run in this order, each before anything is allocated:
         * render callback, canvas and context, unknown dependencies, cycles.
         * If creating a resource then fails, everything created so far is
         * released before the error propagates.
         *
         * @throws MissingRenderCallbackError, ContextAcquisitionError,
         *         UnknownIdError, CyclicDependencyError, ShaderCompileError,
         *         ProgramLinkError, LocationNotFoundError, ResourceCreationError
         *         or whatever a create callback throws
         */
        RendererPtr build() const;

    private:
        Canvas* canvas_ = nullptr;
        ContextAttributes attributes_;
        RenderCallback render_;
        AnimationCallback animation_;
        FrameScheduler* scheduler_ = nullptr;
        LinkRegistry links_;
    };

    /// Create a new Renderer builder
    static Builder create();

    /// Destructor - frees every owned handle
    ~Renderer();

    // Non-copyable
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Movable
    Renderer(Renderer&& other) noexcept = default;
    Renderer& operator=(Renderer&& other) noexcept;

    /// The resolved graph, as handed to callbacks
    RendererData& data();
    const RendererData& data() const;

    // Frames
    void render() { data().render(); }
    void updateAndRender() { data().updateAndRender(); }
    void updateAndRender(double nowMs) { data().updateAndRender(nowMs); }

    void updateUniform(const UniformId& id) { data().updateUniform(id); }
    void updateUniforms() { data().updateUniforms(); }
    void updateBuffers() { data().updateBuffers(); }
    void updateTextures() { data().updateTextures(); }

    // Binding
    void useProgram(const ProgramId& id) { data().useProgram(id); }
    void useVertexArray(const VertexArrayId& id) { data().useVertexArray(id); }
    void useProgramWithVertexArray(const ProgramId& program, const VertexArrayId& vertexArray) {
        data().useProgramWithVertexArray(program, vertexArray);
    }

    // Lookup
    Handle shader(const ShaderId& id) const { return data().shader(id); }
    Handle program(const ProgramId& id) const { return data().program(id); }
    Handle buffer(const BufferId& id) const { return data().buffer(id); }
    Handle vertexArray(const VertexArrayId& id) const { return data().vertexArray(id); }
    Handle texture(const TextureId& id) const { return data().texture(id); }
    Handle framebuffer(const FramebufferId& id) const { return data().framebuffer(id); }
    Handle transformFeedback(const TransformFeedbackId& id) const { return data().transformFeedback(id); }

    Location attributeLocation(const AttributeId& attribute, const VertexArrayId& vertexArray) const {
        return data().attributeLocation(attribute, vertexArray);
    }
    Location uniformLocation(const UniformId& uniform, const ProgramId& program) const {
        return data().uniformLocation(uniform, program);
    }

    GraphicsContext& gl() const { return data().gl(); }
    Canvas& canvas() const { return data().canvas(); }
    glm::uvec2 drawingBufferSize() const { return data().drawingBufferSize(); }
    double now() const { return data().now(); }

    // Animation
    void startAnimating() { data().startAnimating(); }
    void stopAnimating();
    bool isAnimating() const;

    /// Stop animating and delete every owned handle (idempotent)
    void free() noexcept;
    bool isFreed() const;

private:
    explicit Renderer(std::unique_ptr<RendererData> data);

    std::unique_ptr<RendererData> data_;
};

using RendererBuilder = Renderer::Builder;

} // namespace linkgl
