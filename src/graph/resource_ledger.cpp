#include "linkgl/graph/resource_ledger.hpp"
#include "linkgl/gfx/graphics_context.hpp"
#include "linkgl/core/logging.hpp"

namespace linkgl {

void ResourceLedger::record(const ResourceRef& ref, Handle handle) {
    entries_.push_back({ref, handle});
}

size_t ResourceLedger::releaseAll(GraphicsContext& gl) noexcept {
    std::vector<Entry> toRelease = std::move(entries_);
    entries_.clear();

    for (auto it = toRelease.rbegin(); it != toRelease.rend(); ++it) {
        try {
            release(gl, *it);
        } catch (const std::exception& e) {
            LINKGL_ERROR(LogCategory::Resource,
                "Exception while releasing " + it->ref.describe() + ": " + e.what());
        }
    }

    if (!toRelease.empty()) {
        LINKGL_DEBUG(LogCategory::Resource,
            "Released " + std::to_string(toRelease.size()) + " native handles");
    }

    return toRelease.size();
}

void ResourceLedger::release(GraphicsContext& gl, const Entry& entry) {
    switch (entry.ref.kind) {
        case ResourceKind::Shader:            gl.deleteShader(entry.handle); break;
        case ResourceKind::Program:           gl.deleteProgram(entry.handle); break;
        case ResourceKind::Buffer:            gl.deleteBuffer(entry.handle); break;
        case ResourceKind::VertexArray:       gl.deleteVertexArray(entry.handle); break;
        case ResourceKind::Texture:           gl.deleteTexture(entry.handle); break;
        case ResourceKind::Framebuffer:       gl.deleteFramebuffer(entry.handle); break;
        case ResourceKind::TransformFeedback: gl.deleteTransformFeedback(entry.handle); break;
        case ResourceKind::Attribute:
        case ResourceKind::Uniform:
            // No native object behind attributes and uniforms
            break;
    }
}

} // namespace linkgl
