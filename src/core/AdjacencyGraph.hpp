#pragma once

/**
 * @file AdjacencyGraph.hpp
 * @brief Undirected cell adjacency over local cell indices
 */

#include "tessellation.hpp"
#include <set>
#include <vector>

namespace tess {

/**
 * @brief Undirected graph over cell indices 0..n-1
 *
 * Two cells are adjacent when their geometries share any point, or, without
 * corner adjacency, when they share at least a line segment.
 */
class AdjacencyGraph {
public:
    explicit AdjacencyGraph(size_t node_count = 0);

    /**
     * @brief Build from geometries with pairwise intersection tests
     * @param geometries One geometry per node (nullptr nodes stay isolated)
     * @param corners Whether point contact counts as adjacency
     */
    static AdjacencyGraph from_geometries(const std::vector<const OGRGeometry*>& geometries, bool corners);

    void add_edge(size_t a, size_t b);
    bool is_adjacent(size_t a, size_t b) const;

    const std::set<size_t>& neighbors(size_t node) const { return neighbors_.at(node); }

    size_t node_count() const { return neighbors_.size(); }
    size_t edge_count() const;

    /// True when any two members of the set are adjacent
    bool has_internal_edge(const std::set<size_t>& nodes) const;

    /**
     * @brief Connected components of the subgraph induced by a node set
     *
     * Only components with at least two nodes are returned; each component is
     * listed in ascending node order and components are ordered by their
     * smallest node.
     */
    std::vector<std::vector<size_t>> clusters(const std::set<size_t>& nodes) const;

private:
    std::vector<std::set<size_t>> neighbors_;
};

} // namespace tess
