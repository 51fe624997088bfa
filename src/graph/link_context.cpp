#include "linkgl/graph/link_context.hpp"
#include "linkgl/core/errors.hpp"

#include <algorithm>

namespace linkgl {

LinkContext::LinkContext(GraphicsContext& gl, double now, const ResourceTable& handles,
                         const ResourceRef& self, const std::vector<ResourceRef>& dependencies)
    : gl_(gl)
    , now_(now)
    , handles_(handles)
    , self_(self)
    , dependencies_(dependencies) {
}

Handle LinkContext::self() const {
    return handles_.find(self_);
}

Handle LinkContext::dependency(const ResourceRef& ref) const {
    if (std::find(dependencies_.begin(), dependencies_.end(), ref) == dependencies_.end()) {
        throw UnknownIdError(ref, self_);
    }
    return handles_.get(ref);
}

} // namespace linkgl
