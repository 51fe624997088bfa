#include "linkgl/graph/resource_table.hpp"
#include "linkgl/core/errors.hpp"

namespace linkgl {

bool ResourceTable::insert(const ResourceRef& ref, Handle handle) {
    return maps_[index(ref.kind)].emplace(ref.name, handle).second;
}

bool ResourceTable::contains(const ResourceRef& ref) const {
    const auto& map = maps_[index(ref.kind)];
    return map.find(ref.name) != map.end();
}

Handle ResourceTable::get(const ResourceRef& ref) const {
    const auto& map = maps_[index(ref.kind)];
    auto it = map.find(ref.name);
    if (it == map.end()) {
        throw UnknownIdError(ref);
    }
    return it->second;
}

Handle ResourceTable::find(const ResourceRef& ref) const {
    const auto& map = maps_[index(ref.kind)];
    auto it = map.find(ref.name);
    return it == map.end() ? NULL_HANDLE : it->second;
}

size_t ResourceTable::size() const {
    size_t total = 0;
    for (const auto& map : maps_) {
        total += map.size();
    }
    return total;
}

void ResourceTable::clear() {
    for (auto& map : maps_) {
        map.clear();
    }
}

} // namespace linkgl
