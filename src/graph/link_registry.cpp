#include "linkgl/graph/link_registry.hpp"
#include "linkgl/core/errors.hpp"
#include "linkgl/core/logging.hpp"

namespace linkgl {

template <typename LinkType>
void LinkRegistry::insert(LinkMap<LinkType>& map, LinkType link) {
    ResourceRef ref = link.id().ref();
    if (map.find(ref.name) != map.end()) {
        throw DuplicateIdError(ref);
    }

    map.emplace(ref.name, std::move(link));
    order_.push_back(ref);

    LINKGL_TRACE(LogCategory::Graph, "Registered " + ref.describe());
}

template <typename LinkType>
const LinkType& LinkRegistry::lookup(const LinkMap<LinkType>& map, ResourceKind kind,
                                     const std::string& name) {
    auto it = map.find(name);
    if (it == map.end()) {
        throw UnknownIdError(ResourceRef{kind, name});
    }
    return it->second;
}

void LinkRegistry::add(ShaderLink link) { insert(shaders_, std::move(link)); }
void LinkRegistry::add(ProgramLink link) { insert(programs_, std::move(link)); }
void LinkRegistry::add(BufferLink link) { insert(buffers_, std::move(link)); }
void LinkRegistry::add(VertexArrayLink link) { insert(vertexArrays_, std::move(link)); }
void LinkRegistry::add(AttributeLink link) { insert(attributes_, std::move(link)); }
void LinkRegistry::add(UniformLink link) { insert(uniforms_, std::move(link)); }
void LinkRegistry::add(TextureLink link) { insert(textures_, std::move(link)); }
void LinkRegistry::add(FramebufferLink link) { insert(framebuffers_, std::move(link)); }
void LinkRegistry::add(TransformFeedbackLink link) { insert(transformFeedbacks_, std::move(link)); }

bool LinkRegistry::contains(const ResourceRef& ref) const {
    switch (ref.kind) {
        case ResourceKind::Shader:            return shaders_.count(ref.name) > 0;
        case ResourceKind::Program:           return programs_.count(ref.name) > 0;
        case ResourceKind::Buffer:            return buffers_.count(ref.name) > 0;
        case ResourceKind::VertexArray:       return vertexArrays_.count(ref.name) > 0;
        case ResourceKind::Attribute:         return attributes_.count(ref.name) > 0;
        case ResourceKind::Uniform:           return uniforms_.count(ref.name) > 0;
        case ResourceKind::Texture:           return textures_.count(ref.name) > 0;
        case ResourceKind::Framebuffer:       return framebuffers_.count(ref.name) > 0;
        case ResourceKind::TransformFeedback: return transformFeedbacks_.count(ref.name) > 0;
    }
    return false;
}

std::vector<ResourceRef> LinkRegistry::dependencies(const ResourceRef& ref) const {
    switch (ref.kind) {
        case ResourceKind::Shader:            return shader(ref.name).dependencies();
        case ResourceKind::Program:           return program(ref.name).dependencies();
        case ResourceKind::Buffer:            return buffer(ref.name).dependencies();
        case ResourceKind::VertexArray:       return vertexArray(ref.name).dependencies();
        case ResourceKind::Attribute:         return attribute(ref.name).dependencies();
        case ResourceKind::Uniform:           return uniform(ref.name).dependencies();
        case ResourceKind::Texture:           return texture(ref.name).dependencies();
        case ResourceKind::Framebuffer:       return framebuffer(ref.name).dependencies();
        case ResourceKind::TransformFeedback: return transformFeedback(ref.name).dependencies();
    }
    throw UnknownIdError(ref);
}

const ShaderLink& LinkRegistry::shader(const std::string& name) const {
    return lookup(shaders_, ResourceKind::Shader, name);
}

const ProgramLink& LinkRegistry::program(const std::string& name) const {
    return lookup(programs_, ResourceKind::Program, name);
}

const BufferLink& LinkRegistry::buffer(const std::string& name) const {
    return lookup(buffers_, ResourceKind::Buffer, name);
}

const VertexArrayLink& LinkRegistry::vertexArray(const std::string& name) const {
    return lookup(vertexArrays_, ResourceKind::VertexArray, name);
}

const AttributeLink& LinkRegistry::attribute(const std::string& name) const {
    return lookup(attributes_, ResourceKind::Attribute, name);
}

const UniformLink& LinkRegistry::uniform(const std::string& name) const {
    return lookup(uniforms_, ResourceKind::Uniform, name);
}

const TextureLink& LinkRegistry::texture(const std::string& name) const {
    return lookup(textures_, ResourceKind::Texture, name);
}

const FramebufferLink& LinkRegistry::framebuffer(const std::string& name) const {
    return lookup(framebuffers_, ResourceKind::Framebuffer, name);
}

const TransformFeedbackLink& LinkRegistry::transformFeedback(const std::string& name) const {
    return lookup(transformFeedbacks_, ResourceKind::TransformFeedback, name);
}

} // namespace linkgl
