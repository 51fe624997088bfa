#pragma once

#include "linkgl/graph/links.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace linkgl {

/**
 * @brief Every registered link, one map per resource kind
 *
 * Registration order is remembered so that dependency resolution is
 * deterministic. Adding a second link with an identifier already present in
 * the same kind throws DuplicateIdError; equal names in different kinds are
 * independent.
 */
class LinkRegistry {
public:
    void add(ShaderLink link);
    void add(ProgramLink link);
    void add(BufferLink link);
    void add(VertexArrayLink link);
    void add(AttributeLink link);
    void add(UniformLink link);
    void add(TextureLink link);
    void add(FramebufferLink link);
    void add(TransformFeedbackLink link);

    bool contains(const ResourceRef& ref) const;

    /// Dependencies of a registered link (throws UnknownIdError)
    std::vector<ResourceRef> dependencies(const ResourceRef& ref) const;

    /// All links, in registration order
    const std::vector<ResourceRef>& order() const { return order_; }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    // Typed access (throws UnknownIdError)
    const ShaderLink& shader(const std::string& name) const;
    const ProgramLink& program(const std::string& name) const;
    const BufferLink& buffer(const std::string& name) const;
    const VertexArrayLink& vertexArray(const std::string& name) const;
    const AttributeLink& attribute(const std::string& name) const;
    const UniformLink& uniform(const std::string& name) const;
    const TextureLink& texture(const std::string& name) const;
    const FramebufferLink& framebuffer(const std::string& name) const;
    const TransformFeedbackLink& transformFeedback(const std::string& name) const;

private:
    template <typename LinkType>
    using LinkMap = std::unordered_map<std::string, LinkType>;

    template <typename LinkType>
    void insert(LinkMap<LinkType>& map, LinkType link);

    template <typename LinkType>
    static const LinkType& lookup(const LinkMap<LinkType>& map, ResourceKind kind,
                                  const std::string& name);

    LinkMap<ShaderLink> shaders_;
    LinkMap<ProgramLink> programs_;
    LinkMap<BufferLink> buffers_;
    LinkMap<VertexArrayLink> vertexArrays_;
    LinkMap<AttributeLink> attributes_;
    LinkMap<UniformLink> uniforms_;
    LinkMap<TextureLink> textures_;
    LinkMap<FramebufferLink> framebuffers_;
    LinkMap<TransformFeedbackLink> transformFeedbacks_;

    std::vector<ResourceRef> order_;
};

} // namespace linkgl
