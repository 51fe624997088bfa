#pragma once

#include "linkgl/core/id.hpp"

#include <array>
#include <string>
#include <unordered_map>

namespace linkgl {

/**
 * @brief Realized native handles, one map per resource kind
 *
 * Attributes and uniforms have no handle of their own and are never stored
 * here. Lookups are O(1) on average and throw UnknownIdError for ids that
 * were never realized.
 */
class ResourceTable {
public:
    /// Store a handle; returns false if the id already has one
    bool insert(const ResourceRef& ref, Handle handle);

    bool contains(const ResourceRef& ref) const;

    /// Get a handle (throws UnknownIdError)
    Handle get(const ResourceRef& ref) const;

    /// Get a handle or NULL_HANDLE
    Handle find(const ResourceRef& ref) const;

    template <ResourceKind K>
    Handle get(const Id<K>& id) const { return get(id.ref()); }

    /// Number of handles of one kind
    size_t count(ResourceKind kind) const { return maps_[index(kind)].size(); }

    /// Number of handles across all kinds
    size_t size() const;

    void clear();

private:
    using HandleMap = std::unordered_map<std::string, Handle>;

    static size_t index(ResourceKind kind) { return static_cast<size_t>(kind); }

    std::array<HandleMap, RESOURCE_KIND_COUNT> maps_;
};

} // namespace linkgl
