#include "linkgl/engine/renderer_data.hpp"
#include "linkgl/engine/frame_clock.hpp"
#include "linkgl/core/errors.hpp"
#include "linkgl/core/logging.hpp"

#include <string>

namespace linkgl {

namespace {

// Marks the renderer as inside a frame for the lifetime of the scope
class FrameGuard {
public:
    FrameGuard(bool& inFrame, const char* operation) : inFrame_(inFrame) {
        if (inFrame_) {
            throw ReentrancyError(operation);
        }
        inFrame_ = true;
    }
    ~FrameGuard() { inFrame_ = false; }

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

private:
    bool& inFrame_;
};

} // anonymous namespace

RendererData::RendererData(Canvas* canvas, GraphicsContext* gl, const ContextAttributes& attributes,
                           LinkRegistry links, std::vector<ResourceRef> order,
                           RenderCallback render, AnimationCallback animation,
                           FrameScheduler* scheduler)
    : canvas_(canvas)
    , gl_(gl)
    , attributes_(attributes)
    , links_(std::move(links))
    , order_(std::move(order))
    , render_(std::move(render))
    , animation_(std::move(animation))
    , driver_(scheduler, [this](double timestampMs) { updateAndRender(timestampMs); }) {

    for (const auto& ref : order_) {
        dependencies_.emplace(ref, links_.dependencies(ref));
    }
}

RendererData::~RendererData() {
    free();
}

// ============================================================================
// Realization
// ============================================================================

void RendererData::realize() {
    double now = FrameClock::now();

    try {
        for (const auto& ref : order_) {
            realize(ref, now);
        }
    } catch (...) {
        size_t released = ledger_.releaseAll(*gl_);
        handles_.clear();
        attributeBindings_.clear();
        uniformBindings_.clear();
        freed_ = true;
        LINKGL_ERROR(LogCategory::Graph,
            "Build failed, released " + std::to_string(released) + " handles");
        throw;
    }

    LINKGL_INFO(LogCategory::Graph,
        "Renderer built: " + std::to_string(order_.size()) + " links, " +
        std::to_string(ledger_.size()) + " handles");
}

void RendererData::realize(const ResourceRef& ref, double now) {
    LINKGL_TRACE(LogCategory::Graph, "Realizing " + ref.describe());

    switch (ref.kind) {
        case ResourceKind::Shader:            realizeShader(ref); break;
        case ResourceKind::Program:           realizeProgram(ref); break;
        case ResourceKind::Buffer:            realizeBuffer(ref, now); break;
        case ResourceKind::VertexArray:       realizeVertexArray(ref, now); break;
        case ResourceKind::Attribute:         realizeAttribute(ref, now); break;
        case ResourceKind::Uniform:           realizeUniform(ref, now); break;
        case ResourceKind::Texture:           realizeTexture(ref, now); break;
        case ResourceKind::Framebuffer:       realizeFramebuffer(ref, now); break;
        case ResourceKind::TransformFeedback: realizeTransformFeedback(ref, now); break;
    }
}

void RendererData::adopt(const ResourceRef& ref, Handle handle) {
    if (handle == NULL_HANDLE) {
        throw ResourceCreationError(ref);
    }
    ledger_.record(ref, handle);
    handles_.insert(ref, handle);
    LINKGL_TRACE(LogCategory::Resource,
        "Created " + ref.describe() + " (handle " + std::to_string(handle) + ")");
}

void RendererData::realizeShader(const ResourceRef& ref) {
    const ShaderLink& link = links_.shader(ref.name);

    Handle shader = gl_->createShader(link.stage());
    adopt(ref, shader);

    gl_->shaderSource(shader, link.source());
    gl_->compileShader(shader);
    if (!gl_->shaderCompileStatus(shader)) {
        throw ShaderCompileError(link.id(), link.stage(), gl_->shaderInfoLog(shader));
    }
}

void RendererData::realizeProgram(const ResourceRef& ref) {
    const ProgramLink& link = links_.program(ref.name);

    Handle program = gl_->createProgram();
    adopt(ref, program);

    gl_->attachShader(program, handles_.get(link.vertexShader()));
    gl_->attachShader(program, handles_.get(link.fragmentShader()));
    if (!link.varyings().empty()) {
        gl_->transformFeedbackVaryings(program, link.varyings(), link.varyingBufferMode());
    }
    gl_->linkProgram(program);
    if (!gl_->programLinkStatus(program)) {
        throw ProgramLinkError(link.id(), gl_->programInfoLog(program));
    }
}

void RendererData::realizeVertexArray(const ResourceRef& ref, double now) {
    const VertexArrayLink& link = links_.vertexArray(ref.name);

    Handle vertexArray = NULL_HANDLE;
    if (link.createCallback()) {
        LinkContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref));
        vertexArray = link.createCallback()(ctx);
    } else {
        vertexArray = gl_->createVertexArray();
    }
    adopt(ref, vertexArray);
}

void RendererData::realizeTransformFeedback(const ResourceRef& ref, double now) {
    const TransformFeedbackLink& link = links_.transformFeedback(ref.name);

    Handle feedback = NULL_HANDLE;
    if (link.createCallback()) {
        LinkContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref));
        feedback = link.createCallback()(ctx);
    } else {
        feedback = gl_->createTransformFeedback();
    }
    adopt(ref, feedback);
}

void RendererData::realizeBuffer(const ResourceRef& ref, double now) {
    const BufferLink& link = links_.buffer(ref.name);
    if (!link.createCallback()) {
        throw ResourceCreationError(ref);
    }

    LinkContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref));
    adopt(ref, link.createCallback()(ctx));
}

void RendererData::realizeTexture(const ResourceRef& ref, double now) {
    const TextureLink& link = links_.texture(ref.name);
    if (!link.createCallback()) {
        throw ResourceCreationError(ref);
    }

    LinkContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref));
    adopt(ref, link.createCallback()(ctx));
}

void RendererData::realizeFramebuffer(const ResourceRef& ref, double now) {
    const FramebufferLink& link = links_.framebuffer(ref.name);
    if (!link.createCallback()) {
        throw ResourceCreationError(ref);
    }

    Handle texture = link.texture() ? handles_.get(*link.texture()) : NULL_HANDLE;
    FramebufferContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref), texture);
    adopt(ref, link.createCallback()(ctx));
}

Location RendererData::resolveAttributeLocation(const AttributeLink& link,
                                                const VertexArrayId& vertexArray) {
    if (link.location()) {
        return *link.location();
    }

    const VertexArrayLink& vertexArrayLink = links_.vertexArray(vertexArray.name());
    if (!vertexArrayLink.program()) {
        // Nowhere to look the name up
        throw LocationNotFoundError(link.id(), vertexArray);
    }

    const ProgramId& programId = *vertexArrayLink.program();
    Location location = gl_->attribLocation(handles_.get(programId), link.id().name());
    if (location == INVALID_LOCATION) {
        throw LocationNotFoundError(link.id(), programId);
    }
    return location;
}

void RendererData::realizeAttribute(const ResourceRef& ref, double now) {
    const AttributeLink& link = links_.attribute(ref.name);
    Handle buffer = handles_.get(link.buffer());

    if (link.vertexArrays().empty()) {
        LINKGL_WARN(LogCategory::Graph, ref.describe() + " is not recorded into any vertex array");
    }

    std::vector<AttributeBinding> bindings;
    bindings.reserve(link.vertexArrays().size());

    for (const auto& vertexArrayId : link.vertexArrays()) {
        Handle vertexArray = handles_.get(vertexArrayId);
        Location location = resolveAttributeLocation(link, vertexArrayId);

        gl_->bindVertexArray(vertexArray);
        gl_->bindBuffer(GL_ARRAY_BUFFER, buffer);
        gl_->enableVertexAttribArray(location);

        if (link.createCallback()) {
            AttributeContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref),
                                 location, buffer, vertexArray);
            link.createCallback()(ctx);
        }

        gl_->bindVertexArray(NULL_HANDLE);
        gl_->bindBuffer(GL_ARRAY_BUFFER, NULL_HANDLE);

        bindings.push_back(AttributeBinding{vertexArrayId, vertexArray, location});
    }

    attributeBindings_[link.id()] = std::move(bindings);
}

void RendererData::realizeUniform(const ResourceRef& ref, double now) {
    const UniformLink& link = links_.uniform(ref.name);

    std::vector<UniformBinding> bindings;
    bindings.reserve(link.programs().size());

    for (const auto& programId : link.programs()) {
        Handle program = handles_.get(programId);

        Location location = gl_->uniformLocation(program, link.id().name());
        if (location == INVALID_LOCATION) {
            throw LocationNotFoundError(link.id(), programId);
        }

        gl_->useProgram(program);
        if (link.createCallback()) {
            UniformContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref), location, program);
            link.createCallback()(ctx);
        }
        gl_->useProgram(NULL_HANDLE);

        bindings.push_back(UniformBinding{programId, program, location});
    }

    uniformBindings_[link.id()] = std::move(bindings);
}

// ============================================================================
// Updates
// ============================================================================

// False when the link's predicate declines the update. The predicate may free
// the renderer, so callers check freed_ before touching any binding.
template <typename LinkT, typename ContextT>
bool RendererData::wantsUpdate(const LinkT& link, const ContextT& ctx) {
    return !link.shouldUpdateCallback() || link.shouldUpdateCallback()(ctx);
}

void RendererData::updateLink(const ResourceRef& ref, double now) {
    switch (ref.kind) {
        case ResourceKind::Buffer: {
            const BufferLink& link = links_.buffer(ref.name);
            if (!link.hasUpdate()) {
                return;
            }
            LinkContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref));
            if (!wantsUpdate(link, ctx) || freed_) {
                return;
            }
            link.updateCallback()(ctx);
            break;
        }
        case ResourceKind::Texture: {
            const TextureLink& link = links_.texture(ref.name);
            if (!link.hasUpdate()) {
                return;
            }
            LinkContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref));
            if (!wantsUpdate(link, ctx) || freed_) {
                return;
            }
            link.updateCallback()(ctx);
            break;
        }
        case ResourceKind::Framebuffer: {
            const FramebufferLink& link = links_.framebuffer(ref.name);
            if (!link.hasUpdate()) {
                return;
            }
            Handle texture = link.texture() ? handles_.get(*link.texture()) : NULL_HANDLE;
            FramebufferContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref), texture);
            if (!wantsUpdate(link, ctx) || freed_) {
                return;
            }
            link.updateCallback()(ctx);
            break;
        }
        case ResourceKind::Attribute: {
            const AttributeLink& link = links_.attribute(ref.name);
            if (!link.hasUpdate()) {
                return;
            }
            Handle buffer = handles_.get(link.buffer());
            for (const auto& binding : attributeBindings(link.id())) {
                AttributeContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref),
                                     binding.location, buffer, binding.vertexArrayHandle);
                bool update = wantsUpdate(link, ctx);
                if (freed_) {
                    // The bindings were cleared along with the handles
                    return;
                }
                if (!update) {
                    continue;
                }
                gl_->bindVertexArray(binding.vertexArrayHandle);
                gl_->bindBuffer(GL_ARRAY_BUFFER, buffer);
                link.effectiveUpdateCallback()(ctx);
                if (freed_) {
                    return;
                }
                gl_->bindVertexArray(NULL_HANDLE);
                gl_->bindBuffer(GL_ARRAY_BUFFER, NULL_HANDLE);
            }
            break;
        }
        case ResourceKind::Uniform: {
            const UniformLink& link = links_.uniform(ref.name);
            if (!link.hasUpdate()) {
                return;
            }
            for (const auto& binding : uniformBindings(link.id())) {
                UniformContext ctx(*gl_, now, handles_, ref, dependenciesOf(ref),
                                   binding.location, binding.programHandle);
                bool update = wantsUpdate(link, ctx);
                if (freed_) {
                    return;
                }
                if (!update) {
                    continue;
                }
                gl_->useProgram(binding.programHandle);
                link.effectiveUpdateCallback()(ctx);
                if (freed_) {
                    return;
                }
            }
            gl_->useProgram(NULL_HANDLE);
            break;
        }
        case ResourceKind::Shader:
        case ResourceKind::Program:
        case ResourceKind::VertexArray:
        case ResourceKind::TransformFeedback:
            // Created once, never updated
            break;
    }
}

void RendererData::updateKind(ResourceKind kind, double now) {
    for (const auto& ref : order_) {
        if (ref.kind == kind) {
            updateLink(ref, now);
            if (freed_) {
                return;
            }
        }
    }
}

void RendererData::update(double nowMs) {
    ensureLive("update");

    for (const auto& ref : order_) {
        updateLink(ref, nowMs);
        if (freed_) {
            // An update callback released the renderer
            return;
        }
    }
    if (animation_) {
        animation_(*this, nowMs);
    }
}

void RendererData::updateUniform(const UniformId& id) {
    ensureLive("updateUniform");

    // Throws UnknownIdError for an unregistered uniform
    links_.uniform(id.name());

    // updateLink() keeps a reference to the ref, so use the one stored in order_
    for (const auto& ref : order_) {
        if (ref.kind == ResourceKind::Uniform && ref.name == id.name()) {
            updateLink(ref, now());
            return;
        }
    }
}

void RendererData::updateUniforms() {
    ensureLive("updateUniforms");
    updateKind(ResourceKind::Uniform, now());
}

void RendererData::updateBuffers() {
    ensureLive("updateBuffers");
    updateKind(ResourceKind::Buffer, now());
}

void RendererData::updateTextures() {
    ensureLive("updateTextures");
    updateKind(ResourceKind::Texture, now());
}

void RendererData::updateAttributes() {
    ensureLive("updateAttributes");
    updateKind(ResourceKind::Attribute, now());
}

// ============================================================================
// Frames
// ============================================================================

void RendererData::invokeRender() {
    render_(*this);
}

void RendererData::render() {
    ensureLive("render");
    FrameGuard guard(inFrame_, "render");
    invokeRender();
}

void RendererData::updateAndRender() {
    updateAndRender(now());
}

void RendererData::updateAndRender(double nowMs) {
    ensureLive("updateAndRender");
    FrameGuard guard(inFrame_, "updateAndRender");

    update(nowMs);

    // The animation callback may have freed the renderer
    if (!freed_) {
        invokeRender();
    }
}

// ============================================================================
// Context and lookup
// ============================================================================

GraphicsContext& RendererData::gl() const {
    ensureLive("gl");
    return *gl_;
}

Canvas& RendererData::canvas() const {
    ensureLive("canvas");
    return *canvas_;
}

glm::uvec2 RendererData::drawingBufferSize() const {
    ensureLive("drawingBufferSize");
    return canvas_->drawingBufferSize();
}

double RendererData::now() const {
    return FrameClock::now();
}

Handle RendererData::shader(const ShaderId& id) const {
    ensureLive("shader");
    return handles_.get(id);
}

Handle RendererData::program(const ProgramId& id) const {
    ensureLive("program");
    return handles_.get(id);
}

Handle RendererData::buffer(const BufferId& id) const {
    ensureLive("buffer");
    return handles_.get(id);
}

Handle RendererData::vertexArray(const VertexArrayId& id) const {
    ensureLive("vertexArray");
    return handles_.get(id);
}

Handle RendererData::texture(const TextureId& id) const {
    ensureLive("texture");
    return handles_.get(id);
}

Handle RendererData::framebuffer(const FramebufferId& id) const {
    ensureLive("framebuffer");
    return handles_.get(id);
}

Handle RendererData::transformFeedback(const TransformFeedbackId& id) const {
    ensureLive("transformFeedback");
    return handles_.get(id);
}

const std::vector<RendererData::AttributeBinding>&
RendererData::attributeBindings(const AttributeId& id) const {
    ensureLive("attributeBindings");
    auto it = attributeBindings_.find(id);
    if (it == attributeBindings_.end()) {
        throw UnknownIdError(id);
    }
    return it->second;
}

const std::vector<RendererData::UniformBinding>&
RendererData::uniformBindings(const UniformId& id) const {
    ensureLive("uniformBindings");
    auto it = uniformBindings_.find(id);
    if (it == uniformBindings_.end()) {
        throw UnknownIdError(id);
    }
    return it->second;
}

Location RendererData::attributeLocation(const AttributeId& attribute,
                                         const VertexArrayId& vertexArray) const {
    for (const auto& binding : attributeBindings(attribute)) {
        if (binding.vertexArray == vertexArray) {
            return binding.location;
        }
    }
    throw UnknownIdError(vertexArray, attribute);
}

Location RendererData::uniformLocation(const UniformId& uniform, const ProgramId& program) const {
    for (const auto& binding : uniformBindings(uniform)) {
        if (binding.program == program) {
            return binding.location;
        }
    }
    throw UnknownIdError(program, uniform);
}

const std::vector<ResourceRef>& RendererData::dependenciesOf(const ResourceRef& ref) const {
    return dependencies_.at(ref);
}

// ============================================================================
// Binding helpers
// ============================================================================

void RendererData::useProgram(const ProgramId& id) {
    ensureLive("useProgram");
    gl_->useProgram(handles_.get(id));
}

void RendererData::useVertexArray(const VertexArrayId& id) {
    ensureLive("useVertexArray");
    gl_->bindVertexArray(handles_.get(id));
}

void RendererData::useProgramWithVertexArray(const ProgramId& program,
                                             const VertexArrayId& vertexArray) {
    ensureLive("useProgramWithVertexArray");
    Handle programHandle = handles_.get(program);
    Handle vertexArrayHandle = handles_.get(vertexArray);
    gl_->useProgram(programHandle);
    gl_->bindVertexArray(vertexArrayHandle);
}

// ============================================================================
// Animation
// ============================================================================

void RendererData::startAnimating() {
    ensureLive("startAnimating");
    driver_.start();
}

void RendererData::stopAnimating() {
    driver_.stop();
}

// ============================================================================
// Release
// ============================================================================

void RendererData::free() noexcept {
    if (freed_) {
        return;
    }
    freed_ = true;

    try {
        driver_.stop();
    } catch (const std::exception& e) {
        LINKGL_WARN(LogCategory::Animation, std::string("Failed to cancel pending frame: ") + e.what());
    }

    size_t released = ledger_.releaseAll(*gl_);
    handles_.clear();
    attributeBindings_.clear();
    uniformBindings_.clear();

    LINKGL_INFO(LogCategory::Resource, "Renderer freed (" + std::to_string(released) + " handles)");
}

void RendererData::ensureLive(const char* operation) const {
    if (freed_) {
        throw UseAfterFreeError(operation);
    }
}

} // namespace linkgl
