#pragma once

#include "linkgl/core/types.hpp"

#include <string>
#include <string_view>
#include <functional>
#include <utility>

namespace linkgl {

/**
 * @brief Reference to a resource of any kind: (kind, name)
 *
 * Used for dependency lists and diagnostics. Two references are equal only
 * if both the kind and the name match.
 */
struct ResourceRef {
    ResourceKind kind = ResourceKind::Buffer;
    std::string name;

    /// "buffer 'quad'"
    std::string describe() const;

    bool operator==(const ResourceRef& other) const {
        return kind == other.kind && name == other.name;
    }
    bool operator!=(const ResourceRef& other) const { return !(*this == other); }
};

struct ResourceRefHash {
    size_t operator()(const ResourceRef& ref) const {
        size_t h = std::hash<std::string>()(ref.name);
        return h ^ (static_cast<size_t>(ref.kind) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

/**
 * @brief Identifier naming a user-defined resource of one kind
 *
 * Each ResourceKind gets a distinct identifier type, so a BufferId can
 * never be passed where a ShaderId is expected. For attributes and uniforms
 * the name is also the GLSL variable name used for location lookup.
 *
 * Usage:
 * @code
 * BufferId quad("quad");
 * AttributeId position("a_position");
 * @endcode
 */
template <ResourceKind K>
class Id {
public:
    static constexpr ResourceKind kind = K;

    Id() = default;
    Id(std::string name) : name_(std::move(name)) {}
    Id(const char* name) : name_(name) {}
    Id(std::string_view name) : name_(name) {}

    const std::string& name() const { return name_; }

    /// Convert to a kind-erased reference (for dependency lists)
    ResourceRef ref() const { return ResourceRef{K, name_}; }
    operator ResourceRef() const { return ref(); }

    bool operator==(const Id& other) const { return name_ == other.name_; }
    bool operator!=(const Id& other) const { return name_ != other.name_; }
    bool operator<(const Id& other) const { return name_ < other.name_; }

private:
    std::string name_;
};

using ShaderId = Id<ResourceKind::Shader>;
using ProgramId = Id<ResourceKind::Program>;
using BufferId = Id<ResourceKind::Buffer>;
using VertexArrayId = Id<ResourceKind::VertexArray>;
using AttributeId = Id<ResourceKind::Attribute>;
using UniformId = Id<ResourceKind::Uniform>;
using TextureId = Id<ResourceKind::Texture>;
using FramebufferId = Id<ResourceKind::Framebuffer>;
using TransformFeedbackId = Id<ResourceKind::TransformFeedback>;

} // namespace linkgl

namespace std {

template <linkgl::ResourceKind K>
struct hash<linkgl::Id<K>> {
    size_t operator()(const linkgl::Id<K>& id) const {
        return hash<string>()(id.name());
    }
};

} // namespace std
