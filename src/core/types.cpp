#include "linkgl/core/types.hpp"

namespace linkgl {

const char* resourceKindName(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Shader:            return "shader";
        case ResourceKind::Program:           return "program";
        case ResourceKind::Buffer:            return "buffer";
        case ResourceKind::VertexArray:       return "vertex array";
        case ResourceKind::Attribute:         return "attribute";
        case ResourceKind::Uniform:           return "uniform";
        case ResourceKind::Texture:           return "texture";
        case ResourceKind::Framebuffer:       return "framebuffer";
        case ResourceKind::TransformFeedback: return "transform feedback";
    }
    return "unknown";
}

const char* shaderStageName(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:   return "vertex";
        case ShaderStage::Fragment: return "fragment";
    }
    return "unknown";
}

} // namespace linkgl
