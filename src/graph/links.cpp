#include "linkgl/graph/links.hpp"

#include <algorithm>

namespace linkgl {

// ============================================================================
// LinkDependencies
// ============================================================================

void LinkDependencies::add(const ResourceRef& ref) {
    if (std::find(extra_.begin(), extra_.end(), ref) == extra_.end()) {
        extra_.push_back(ref);
    }
}

std::vector<ResourceRef> LinkDependencies::merge(std::vector<ResourceRef> structural) const {
    std::vector<ResourceRef> merged;
    merged.reserve(structural.size() + extra_.size());

    auto append = [&merged](const ResourceRef& ref) {
        if (std::find(merged.begin(), merged.end(), ref) == merged.end()) {
            merged.push_back(ref);
        }
    };

    for (const auto& ref : structural) {
        append(ref);
    }
    for (const auto& ref : extra_) {
        append(ref);
    }
    return merged;
}

// ============================================================================
// Shaders & programs
// ============================================================================

ShaderLink::ShaderLink(ShaderId id, ShaderStage stage, std::string source)
    : id_(std::move(id))
    , stage_(stage)
    , source_(std::move(source)) {
}

ProgramLink::ProgramLink(ProgramId id, ShaderId vertexShader, ShaderId fragmentShader)
    : id_(std::move(id))
    , vertexShader_(std::move(vertexShader))
    , fragmentShader_(std::move(fragmentShader)) {
}

ProgramLink& ProgramLink::transformFeedbackVaryings(std::vector<std::string> varyings,
                                                    GLenum bufferMode) {
    varyings_ = std::move(varyings);
    bufferMode_ = bufferMode;
    return *this;
}

std::vector<ResourceRef> ProgramLink::dependencies() const {
    return deps_.merge({vertexShader_.ref(), fragmentShader_.ref()});
}

// ============================================================================
// Handle-producing links
// ============================================================================

FramebufferLink::FramebufferLink(FramebufferId id, CreateCallback create,
                                 std::optional<TextureId> texture)
    : HandleLink(std::move(id), std::move(create))
    , texture_(std::move(texture)) {
}

std::vector<ResourceRef> FramebufferLink::dependencies() const {
    std::vector<ResourceRef> structural;
    if (texture_) {
        structural.push_back(texture_->ref());
    }
    return deps_.merge(std::move(structural));
}

VertexArrayLink::VertexArrayLink(VertexArrayId id, std::optional<ProgramId> program,
                                 CreateCallback create)
    : id_(std::move(id))
    , program_(std::move(program))
    , create_(std::move(create)) {
}

std::vector<ResourceRef> VertexArrayLink::dependencies() const {
    std::vector<ResourceRef> structural;
    if (program_) {
        structural.push_back(program_->ref());
    }
    return deps_.merge(std::move(structural));
}

TransformFeedbackLink::TransformFeedbackLink(TransformFeedbackId id, CreateCallback create)
    : id_(std::move(id))
    , create_(std::move(create)) {
}

// ============================================================================
// Binding links
// ============================================================================

AttributeLink::AttributeLink(AttributeId id, std::vector<VertexArrayId> vertexArrays,
                             BufferId buffer, Callback create)
    : BindingLink(std::move(id), std::move(create))
    , vertexArrays_(std::move(vertexArrays))
    , buffer_(std::move(buffer)) {
}

std::vector<ResourceRef> AttributeLink::dependencies() const {
    std::vector<ResourceRef> structural;
    for (const auto& vertexArray : vertexArrays_) {
        structural.push_back(vertexArray.ref());
    }
    structural.push_back(buffer_.ref());
    return deps_.merge(std::move(structural));
}

UniformLink::UniformLink(UniformId id, std::vector<ProgramId> programs, Callback create)
    : BindingLink(std::move(id), std::move(create))
    , programs_(std::move(programs)) {
}

std::vector<ResourceRef> UniformLink::dependencies() const {
    std::vector<ResourceRef> structural;
    for (const auto& program : programs_) {
        structural.push_back(program.ref());
    }
    return deps_.merge(std::move(structural));
}

} // namespace linkgl
