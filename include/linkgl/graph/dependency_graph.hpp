#pragma once

#include "linkgl/graph/link_registry.hpp"

#include <unordered_map>
#include <vector>

namespace linkgl {

/**
 * @brief Build order over the links of a registry
 *
 * Edges run from each link to the links it depends on. The resulting order
 * places every dependency before its dependents; independent links keep
 * their registration order.
 *
 * Usage:
 * @code
 * auto order = DependencyGraph(registry).sort();
 * for (const auto& ref : order) {
 *     // realize ref
 * }
 * @endcode
 */
class DependencyGraph {
public:
    explicit DependencyGraph(const LinkRegistry& registry);

    /**
     * @brief Compute the topological order
     *
     * @throws UnknownIdError if a link names an unregistered dependency
     * @throws CyclicDependencyError naming the cycle if one exists
     */
    std::vector<ResourceRef> sort() const;

private:
    // Index of a node in registration order
    size_t indexOf(const ResourceRef& ref) const;

    // Find and throw a cycle among the nodes that could not be ordered
    void throwCycle(const std::vector<size_t>& remainingInDegree) const;

    const LinkRegistry& registry_;
    std::vector<ResourceRef> nodes_;
    std::unordered_map<ResourceRef, size_t, ResourceRefHash> index_;
    std::vector<std::vector<size_t>> dependencies_;  // node -> nodes it depends on
};

} // namespace linkgl
