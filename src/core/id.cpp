#include "linkgl/core/id.hpp"

namespace linkgl {

std::string ResourceRef::describe() const {
    return std::string(resourceKindName(kind)) + " '" + name + "'";
}

} // namespace linkgl
