/**
 * @file AdjacencyGraph.cpp
 * @brief Cell adjacency graph
 */

#include "AdjacencyGraph.hpp"
#include "GeometryUtils.hpp"
#include <stdexcept>

namespace tess {

AdjacencyGraph::AdjacencyGraph(size_t node_count)
    : neighbors_(node_count) {
}

AdjacencyGraph AdjacencyGraph::from_geometries(const std::vector<const OGRGeometry*>& geometries, bool corners) {
    AdjacencyGraph graph(geometries.size());

    std::vector<BoundingBox> bounds(geometries.size());
    for (size_t i = 0; i < geometries.size(); ++i) {
        if (!geometry::is_empty(geometries[i])) {
            bounds[i] = geometry::envelope(*geometries[i]);
        }
    }

    for (size_t a = 0; a < geometries.size(); ++a) {
        if (geometry::is_empty(geometries[a])) {
            continue;
        }
        for (size_t b = a + 1; b < geometries.size(); ++b) {
            if (geometry::is_empty(geometries[b]) || geometries[a] == geometries[b]) {
                continue;
            }
            const BoundingBox& ba = bounds[a];
            const BoundingBox& bb = bounds[b];
            if (ba.max_x < bb.min_x || bb.max_x < ba.min_x || ba.max_y < bb.min_y || bb.max_y < ba.min_y) {
                continue;
            }

            if (corners) {
                if (geometries[a]->Intersects(geometries[b])) {
                    graph.add_edge(a, b);
                }
            } else if (geometry::contact_dimension(*geometries[a], *geometries[b]) >= 1) {
                graph.add_edge(a, b);
            }
        }
    }
    return graph;
}

void AdjacencyGraph::add_edge(size_t a, size_t b) {
    if (a >= neighbors_.size() || b >= neighbors_.size()) {
        throw std::out_of_range("Adjacency edge (" + std::to_string(a) + ", " + std::to_string(b) +
                                ") outside graph of " + std::to_string(neighbors_.size()) + " nodes");
    }
    if (a == b) {
        return;
    }
    neighbors_[a].insert(b);
    neighbors_[b].insert(a);
}

bool AdjacencyGraph::is_adjacent(size_t a, size_t b) const {
    return neighbors_.at(a).count(b) > 0;
}

size_t AdjacencyGraph::edge_count() const {
    size_t total = 0;
    for (const auto& adjacent : neighbors_) {
        total += adjacent.size();
    }
    return total / 2;
}

bool AdjacencyGraph::has_internal_edge(const std::set<size_t>& nodes) const {
    for (size_t node : nodes) {
        for (size_t neighbor : neighbors_.at(node)) {
            if (nodes.count(neighbor)) {
                return true;
            }
        }
    }
    return false;
}

std::vector<std::vector<size_t>> AdjacencyGraph::clusters(const std::set<size_t>& nodes) const {
    std::vector<std::vector<size_t>> result;
    std::set<size_t> visited;

    for (size_t start : nodes) {
        if (visited.count(start)) {
            continue;
        }

        std::set<size_t> component{start};
        std::vector<size_t> stack{start};
        visited.insert(start);
        while (!stack.empty()) {
            size_t node = stack.back();
            stack.pop_back();
            for (size_t neighbor : neighbors_.at(node)) {
                if (nodes.count(neighbor) && visited.insert(neighbor).second) {
                    component.insert(neighbor);
                    stack.push_back(neighbor);
                }
            }
        }

        if (component.size() > 1) {
            result.emplace_back(component.begin(), component.end());
        }
    }
    return result;
}

} // namespace tess
