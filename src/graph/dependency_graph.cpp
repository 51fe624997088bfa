#include "linkgl/graph/dependency_graph.hpp"
#include "linkgl/core/errors.hpp"
#include "linkgl/core/logging.hpp"

#include <algorithm>
#include <set>

namespace linkgl {

DependencyGraph::DependencyGraph(const LinkRegistry& registry)
    : registry_(registry)
    , nodes_(registry.order()) {
    dependencies_.resize(nodes_.size());

    index_.reserve(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        index_.emplace(nodes_[i], i);
    }

    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (const auto& dep : registry_.dependencies(nodes_[i])) {
            if (!registry_.contains(dep)) {
                throw UnknownIdError(dep, nodes_[i]);
            }
            dependencies_[i].push_back(indexOf(dep));
        }
    }
}

size_t DependencyGraph::indexOf(const ResourceRef& ref) const {
    auto it = index_.find(ref);
    if (it == index_.end()) {
        throw UnknownIdError(ref);
    }
    return it->second;
}

std::vector<ResourceRef> DependencyGraph::sort() const {
    const size_t count = nodes_.size();

    // Reverse edges: dependency -> dependents
    std::vector<std::vector<size_t>> dependents(count);
    std::vector<size_t> inDegree(count, 0);
    for (size_t node = 0; node < count; ++node) {
        inDegree[node] = dependencies_[node].size();
        for (size_t dep : dependencies_[node]) {
            dependents[dep].push_back(node);
        }
    }

    // Kahn's algorithm; the ready set is ordered by registration index
    std::set<size_t> ready;
    for (size_t node = 0; node < count; ++node) {
        if (inDegree[node] == 0) {
            ready.insert(node);
        }
    }

    std::vector<ResourceRef> order;
    order.reserve(count);

    while (!ready.empty()) {
        size_t node = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(nodes_[node]);

        for (size_t dependent : dependents[node]) {
            if (--inDegree[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != count) {
        throwCycle(inDegree);
    }

    LINKGL_DEBUG(LogCategory::Graph,
        "Resolved build order for " + std::to_string(count) + " links");
    return order;
}

void DependencyGraph::throwCycle(const std::vector<size_t>& remainingInDegree) const {
    enum class Mark { Unvisited, InPath, Done };
    std::vector<Mark> marks(nodes_.size(), Mark::Unvisited);
    std::vector<size_t> path;

    // Iterative DFS along "depends on" edges, restricted to unordered nodes
    for (size_t start = 0; start < nodes_.size(); ++start) {
        if (remainingInDegree[start] == 0 || marks[start] != Mark::Unvisited) {
            continue;
        }

        std::vector<std::pair<size_t, size_t>> stack;  // (node, next edge)
        stack.emplace_back(start, 0);
        marks[start] = Mark::InPath;
        path.push_back(start);

        while (!stack.empty()) {
            auto& [node, edge] = stack.back();

            if (edge < dependencies_[node].size()) {
                size_t next = dependencies_[node][edge++];

                if (marks[next] == Mark::InPath) {
                    std::vector<ResourceRef> cycle;
                    auto begin = std::find(path.begin(), path.end(), next);
                    for (auto it = begin; it != path.end(); ++it) {
                        cycle.push_back(nodes_[*it]);
                    }
                    cycle.push_back(nodes_[next]);
                    throw CyclicDependencyError(std::move(cycle));
                }

                if (marks[next] == Mark::Unvisited) {
                    marks[next] = Mark::InPath;
                    path.push_back(next);
                    stack.emplace_back(next, 0);
                }
            } else {
                marks[node] = Mark::Done;
                path.pop_back();
                stack.pop_back();
            }
        }
    }

    // Unreachable when the in-degrees came from sort()
    throw CyclicDependencyError({});
}

} // namespace linkgl
