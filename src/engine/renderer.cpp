#include "linkgl/engine/renderer.hpp"
#include "linkgl/graph/dependency_graph.hpp"
#include "linkgl/core/errors.hpp"
#include "linkgl/core/logging.hpp"

namespace linkgl {

// ============================================================================
// Renderer::Builder
// ============================================================================

Renderer::Builder Renderer::create() {
    return Builder();
}

Renderer::Builder& Renderer::Builder::canvas(Canvas* canvas) {
    canvas_ = canvas;
    return *this;
}

Renderer::Builder& Renderer::Builder::contextAttributes(const ContextAttributes& attributes) {
    attributes_ = attributes;
    return *this;
}

Renderer::Builder& Renderer::Builder::renderCallback(RenderCallback callback) {
    render_ = std::move(callback);
    return *this;
}

Renderer::Builder& Renderer::Builder::animationCallback(AnimationCallback callback) {
    animation_ = std::move(callback);
    return *this;
}

Renderer::Builder& Renderer::Builder::frameScheduler(FrameScheduler* scheduler) {
    scheduler_ = scheduler;
    return *this;
}

Renderer::Builder& Renderer::Builder::addShaderSource(ShaderId id, ShaderStage stage,
                                                      std::string source) {
    links_.add(ShaderLink(std::move(id), stage, std::move(source)));
    return *this;
}

Renderer::Builder& Renderer::Builder::addVertexShaderSource(ShaderId id, std::string source) {
    return addShaderSource(std::move(id), ShaderStage::Vertex, std::move(source));
}

Renderer::Builder& Renderer::Builder::addFragmentShaderSource(ShaderId id, std::string source) {
    return addShaderSource(std::move(id), ShaderStage::Fragment, std::move(source));
}

Renderer::Builder& Renderer::Builder::addShaderLink(ShaderLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addProgramLink(ProgramLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addBufferLink(BufferLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addAttributeLink(AttributeLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addUniformLink(UniformLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addVertexArrayLink(VertexArrayLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addTextureLink(TextureLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addFramebufferLink(FramebufferLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addTransformFeedbackLink(TransformFeedbackLink link) {
    links_.add(std::move(link));
    return *this;
}

Renderer::Builder& Renderer::Builder::addVertexArrayObject(VertexArrayId id,
                                                           std::optional<ProgramId> program) {
    links_.add(VertexArrayLink(std::move(id), std::move(program)));
    return *this;
}

RendererPtr Renderer::Builder::build() const {
    if (!render_) {
        throw MissingRenderCallbackError();
    }
    if (!canvas_) {
        throw ContextAcquisitionError("no canvas was supplied");
    }

    GraphicsContext* gl = canvas_->acquireContext(attributes_);
    if (!gl) {
        throw ContextAcquisitionError("the canvas did not provide a context");
    }

    // Structural errors surface here, before anything is allocated
    std::vector<ResourceRef> order = DependencyGraph(links_).sort();

    std::unique_ptr<RendererData> data(new RendererData(
        canvas_, gl, attributes_, links_, std::move(order), render_, animation_, scheduler_));
    data->realize();

    return RendererPtr(new Renderer(std::move(data)));
}

// ============================================================================
// Renderer
// ============================================================================

Renderer::Renderer(std::unique_ptr<RendererData> data)
    : data_(std::move(data)) {
}

Renderer::~Renderer() {
    free();
}

Renderer& Renderer::operator=(Renderer&& other) noexcept {
    if (this != &other) {
        free();
        data_ = std::move(other.data_);
    }
    return *this;
}

RendererData& Renderer::data() {
    if (!data_) {
        throw UseAfterFreeError("renderer was moved from");
    }
    return *data_;
}

const RendererData& Renderer::data() const {
    if (!data_) {
        throw UseAfterFreeError("renderer was moved from");
    }
    return *data_;
}

void Renderer::stopAnimating() {
    if (data_) {
        data_->stopAnimating();
    }
}

bool Renderer::isAnimating() const {
    return data_ && data_->isAnimating();
}

void Renderer::free() noexcept {
    if (data_) {
        data_->free();
    }
}

bool Renderer::isFreed() const {
    return !data_ || data_->isFreed();
}

} // namespace linkgl
