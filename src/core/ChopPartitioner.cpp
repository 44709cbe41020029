/**
 * @file ChopPartitioner.cpp
 * @brief Greedy tranche bucketing and single-pass conflict resolution
 */

#include "ChopPartitioner.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <sstream>

#ifdef HAVE_TBB
#include <tbb/parallel_for.h>
#endif

namespace tess {

namespace {

/// Descending order with NaN after every number
bool score_before(double a, double b) {
    if (std::isnan(a)) {
        return false;
    }
    if (std::isnan(b)) {
        return true;
    }
    return a > b;
}

double summable(double score) {
    return std::isnan(score) ? 0.0 : score;
}

void extend_subsets(const std::vector<size_t>& cluster, const AdjacencyGraph& graph,
                    size_t size, size_t start, std::vector<size_t>& current,
                    std::vector<std::vector<size_t>>& out, size_t limit) {
    if (current.size() == size) {
        out.push_back(current);
        return;
    }
    for (size_t pos = start; pos + (size - current.size()) <= cluster.size(); ++pos) {
        if (out.size() >= limit) {
            return;
        }
        size_t node = cluster[pos];
        bool compatible = std::none_of(current.begin(), current.end(),
                                       [&](size_t chosen) { return graph.is_adjacent(chosen, node); });
        if (!compatible) {
            continue;
        }
        current.push_back(node);
        extend_subsets(cluster, graph, size, pos + 1, current, out, limit);
        current.pop_back();
    }
}

std::string describe_key(const SplitKey& key) {
    if (key.empty()) {
        return "()";
    }
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < key.size(); ++i) {
        oss << (i ? ", " : "") << key[i];
    }
    oss << ")";
    return oss.str();
}

std::string tranche_counts(const std::vector<size_t>& assignment, size_t overflow) {
    std::vector<size_t> counts(overflow + 1, 0);
    for (size_t tranche : assignment) {
        counts[std::min(tranche, overflow)]++;
    }
    std::ostringstream oss;
    for (size_t i = 0; i < counts.size(); ++i) {
        oss << (i ? "/" : "") << counts[i];
    }
    return oss.str();
}

} // anonymous namespace

ChopPartitioner::ChopPartitioner(const ChopOptions& options)
    : options_(options), logger_("ChopPartitioner") {
}

// ============================================================================
// Stage A
// ============================================================================

std::vector<size_t> ChopPartitioner::initial_assignment(const std::vector<double>& scores,
                                                        const std::vector<double>& areas) const {
    const size_t overflow = overflow_tranche();
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&scores](size_t a, size_t b) { return score_before(scores[a], scores[b]); });

    std::vector<size_t> assignment(scores.size(), overflow);
    size_t tranche = 0;
    size_t placed = 0;
    double total = 0.0;
    double limit = overflow > 0 ? options_.divisions[0] : std::numeric_limits<double>::infinity();

    for (size_t index : order) {
        total += areas[index];
        if (total > limit && placed > 0) {
            ++tranche;
            total = areas[index];
            placed = 0;
            limit = tranche < overflow ? options_.divisions[tranche] : std::numeric_limits<double>::infinity();
        }
        assignment[index] = tranche;
        ++placed;
    }
    return assignment;
}

// ============================================================================
// Stage C
// ============================================================================

std::vector<std::vector<size_t>> ChopPartitioner::independent_subsets(const std::vector<size_t>& cluster,
                                                                      const AdjacencyGraph& graph,
                                                                      size_t limit) {
    std::vector<std::vector<size_t>> subsets;
    std::vector<size_t> current;
    for (size_t size = 1; size < cluster.size() && subsets.size() < limit; ++size) {
        extend_subsets(cluster, graph, size, 0, current, subsets, limit);
    }
    return subsets;
}

std::vector<size_t> ChopPartitioner::greedy_subset(const std::vector<size_t>& cluster,
                                                   const std::vector<double>& scores,
                                                   const AdjacencyGraph& graph) const {
    std::vector<size_t> order = cluster;
    std::stable_sort(order.begin(), order.end(),
                     [&scores](size_t a, size_t b) { return score_before(scores[a], scores[b]); });

    std::vector<size_t> subset;
    for (size_t node : order) {
        bool compatible = std::none_of(subset.begin(), subset.end(),
                                       [&](size_t chosen) { return graph.is_adjacent(chosen, node); });
        if (compatible) {
            subset.push_back(node);
        }
    }
    std::sort(subset.begin(), subset.end());
    return subset;
}

std::set<size_t> ChopPartitioner::best_promotion(const std::set<size_t>& kept,
                                                 double kept_area,
                                                 double limit,
                                                 const std::vector<size_t>& assignment,
                                                 size_t tranche,
                                                 const std::vector<double>& scores,
                                                 const std::vector<double>& areas,
                                                 const AdjacencyGraph& graph,
                                                 double& promotion_score) const {
    std::set<size_t> blocked;
    for (size_t node : kept) {
        const auto& adjacent = graph.neighbors(node);
        blocked.insert(adjacent.begin(), adjacent.end());
    }

    std::set<size_t> promotable;
    for (size_t node = 0; node < assignment.size(); ++node) {
        if (assignment[node] > tranche && !blocked.count(node)) {
            promotable.insert(promotable.end(), node);
        }
    }

    std::set<size_t> best;
    promotion_score = 0.0;
    bool have_best = false;

    // One greedy fill per start cell; after the start, the lowest remaining index is taken next
    for (size_t start : promotable) {
        std::set<size_t> remaining = promotable;
        std::set<size_t> promoted;
        double area = kept_area;
        size_t index = start;

        while (!remaining.empty()) {
            area += areas[index];
            if (area > limit) {
                break;
            }
            remaining.erase(index);
            promoted.insert(index);
            for (size_t neighbor : graph.neighbors(index)) {
                remaining.erase(neighbor);
            }
            if (!remaining.empty()) {
                index = *remaining.begin();
            }
        }

        if (promoted.empty()) {
            continue;
        }
        double score = 0.0;
        for (size_t node : promoted) {
            score += summable(scores[node]);
        }
        if (!have_best || score > promotion_score) {
            have_best = true;
            promotion_score = score;
            best = std::move(promoted);
        }
    }
    return best;
}

std::vector<size_t> ChopPartitioner::improve(const std::vector<size_t>& initial,
                                             const std::vector<double>& scores,
                                             const std::vector<double>& areas,
                                             const AdjacencyGraph& graph) const {
    const size_t overflow = overflow_tranche();
    const size_t candidate_limit = std::max<size_t>(1, options_.max_candidates);
    std::vector<size_t> assignment = initial;

    for (size_t tranche = 0; tranche < overflow; ++tranche) {
        std::set<size_t> chop_set;
        for (size_t node = 0; node < assignment.size(); ++node) {
            if (assignment[node] == tranche) {
                chop_set.insert(node);
            }
        }

        auto clusters = graph.clusters(chop_set);
        std::set<size_t> free_cells = chop_set;
        std::vector<std::vector<std::vector<size_t>>> choices;
        double combinations = 1.0;

        for (const auto& cluster : clusters) {
            for (size_t node : cluster) {
                free_cells.erase(node);
            }
            if (cluster.size() > options_.max_cluster_size) {
                logger_.debug("Tranche " + std::to_string(tranche + 1) + ": cluster of " +
                              std::to_string(cluster.size()) + " cells reduced to one greedy subset");
                choices.push_back({greedy_subset(cluster, scores, graph)});
            } else {
                choices.push_back(independent_subsets(cluster, graph, candidate_limit));
            }
            combinations *= static_cast<double>(choices.back().size());
        }

        if (combinations > static_cast<double>(candidate_limit)) {
            logger_.warning("Tranche " + std::to_string(tranche + 1) + ": " + format_number(combinations) +
                            " demotion candidates, evaluating the first " + std::to_string(candidate_limit));
        }

        Candidate best;
        bool have_best = false;
        size_t evaluated = 0;
        std::vector<size_t> odometer(choices.size(), 0);

        while (true) {
            std::set<size_t> kept = free_cells;
            for (size_t c = 0; c < choices.size(); ++c) {
                const auto& subset = choices[c][odometer[c]];
                kept.insert(subset.begin(), subset.end());
            }

            if (!graph.has_internal_edge(kept)) {
                double kept_area = 0.0;
                double kept_score = 0.0;
                for (size_t node : kept) {
                    kept_area += areas[node];
                    kept_score += summable(scores[node]);
                }

                double promotion_score = 0.0;
                std::set<size_t> promoted = best_promotion(kept, kept_area, options_.divisions[tranche],
                                                           assignment, tranche, scores, areas, graph,
                                                           promotion_score);
                double total = kept_score + promotion_score;
                if (!have_best || total > best.score) {
                    have_best = true;
                    best.score = total;
                    best.kept = std::move(kept);
                    best.promoted = std::move(promoted);
                }
            }

            if (++evaluated >= candidate_limit) {
                break;
            }

            // Rightmost cluster varies fastest
            size_t dimension = choices.size();
            while (dimension > 0) {
                --dimension;
                if (++odometer[dimension] < choices[dimension].size()) {
                    break;
                }
                odometer[dimension] = 0;
                if (dimension == 0) {
                    dimension = choices.size() + 1;
                    break;
                }
            }
            if (dimension >= choices.size()) {
                break;
            }
        }

        if (!have_best) {
            logger_.debug("Tranche " + std::to_string(tranche + 1) + ": no admissible candidate, unchanged");
            continue;
        }

        size_t demoted = 0;
        for (size_t node : chop_set) {
            if (!best.kept.count(node)) {
                assignment[node] = overflow;
                ++demoted;
            }
        }
        for (size_t node : best.promoted) {
            assignment[node] = tranche;
        }

        logger_.debug("Tranche " + std::to_string(tranche + 1) + ": " + std::to_string(chop_set.size()) +
                      " cells, " + std::to_string(clusters.size()) + " clusters, " +
                      std::to_string(evaluated) + " candidates, " + std::to_string(demoted) +
                      " demoted, " + std::to_string(best.promoted.size()) + " promoted");
    }

    return assignment;
}

// ============================================================================
// Groups
// ============================================================================

GroupAssignment ChopPartitioner::partition_group(const std::vector<double>& scores,
                                                 const std::vector<double>& areas,
                                                 const AdjacencyGraph& graph) const {
    GroupAssignment result;
    result.initial = initial_assignment(scores, areas);
    result.improved = improve(result.initial, scores, areas, graph);
    return result;
}

std::vector<std::vector<size_t>> ChopPartitioner::split_groups(const std::vector<ChopCell>& cells) const {
    std::map<SplitKey, size_t> group_of_key;
    std::vector<std::vector<size_t>> groups;
    for (size_t i = 0; i < cells.size(); ++i) {
        auto it = group_of_key.find(cells[i].split_key);
        if (it == group_of_key.end()) {
            it = group_of_key.emplace(cells[i].split_key, groups.size()).first;
            groups.emplace_back();
        }
        groups[it->second].push_back(i);
    }
    return groups;
}

ChopResult ChopPartitioner::partition(const std::vector<ChopCell>& cells) const {
    if (options_.divisions.empty()) {
        throw ConfigurationError("at least one area division is required");
    }

    const size_t overflow = overflow_tranche();
    auto groups = split_groups(cells);

    ChopResult result;
    result.initial_chop.assign(cells.size(), 0);
    result.final_chop.assign(cells.size(), 0);

    logger_.info("Partitioning " + std::to_string(cells.size()) + " cells in " +
                 std::to_string(groups.size()) + " split groups into " + std::to_string(overflow) + " tranches");

    auto to_chop = [overflow](size_t tranche) {
        return tranche < overflow ? static_cast<int>(tranche) + 1 : 0;
    };

    auto process_group = [&](size_t g) {
        const auto& members = groups[g];
        if (members.empty()) {
            return;
        }

        std::vector<double> scores;
        std::vector<double> areas;
        std::vector<const OGRGeometry*> geometries;
        for (size_t index : members) {
            scores.push_back(cells[index].score());
            areas.push_back(cells[index].area);
            geometries.push_back(cells[index].geometry);
        }

        AdjacencyGraph graph = AdjacencyGraph::from_geometries(geometries, options_.neighbor_corners);
        GroupAssignment assignment = partition_group(scores, areas, graph);

        for (size_t local = 0; local < members.size(); ++local) {
            result.initial_chop[members[local]] = to_chop(assignment.initial[local]);
            result.final_chop[members[local]] = to_chop(assignment.improved[local]);
        }

        logger_.detailed("Split group " + describe_key(cells[members.front()].split_key) + ": " +
                         std::to_string(members.size()) + " cells, " + std::to_string(graph.edge_count()) +
                         " adjacencies, tranches " + tranche_counts(assignment.initial, overflow) +
                         " -> " + tranche_counts(assignment.improved, overflow));
    };

#ifdef HAVE_TBB
    if (options_.parallel && groups.size() > 1) {
        tbb::parallel_for(size_t(0), groups.size(), process_group);
    } else {
        for (size_t g = 0; g < groups.size(); ++g) {
            process_group(g);
        }
    }
#else
    for (size_t g = 0; g < groups.size(); ++g) {
        process_group(g);
    }
#endif

    return result;
}

// ============================================================================
// Verification
// ============================================================================

std::vector<std::pair<size_t, size_t>> ChopPartitioner::conflicts(const std::vector<size_t>& assignment,
                                                                  size_t overflow,
                                                                  const AdjacencyGraph& graph) {
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t a = 0; a < assignment.size(); ++a) {
        if (assignment[a] >= overflow) {
            continue;
        }
        for (size_t b : graph.neighbors(a)) {
            if (b > a && assignment[b] == assignment[a]) {
                pairs.emplace_back(a, b);
            }
        }
    }
    return pairs;
}

std::vector<std::pair<size_t, size_t>> ChopPartitioner::verify_assignment(const std::vector<ChopCell>& cells,
                                                                          const ChopResult& result) const {
    const size_t overflow = overflow_tranche();
    std::vector<std::pair<size_t, size_t>> pairs;

    for (const auto& members : split_groups(cells)) {
        std::vector<const OGRGeometry*> geometries;
        std::vector<size_t> assignment;
        for (size_t index : members) {
            geometries.push_back(cells[index].geometry);
            int chop = result.final_chop.at(index);
            assignment.push_back(chop == 0 ? overflow : static_cast<size_t>(chop - 1));
        }

        AdjacencyGraph graph = AdjacencyGraph::from_geometries(geometries, options_.neighbor_corners);
        for (const auto& pair : conflicts(assignment, overflow, graph)) {
            pairs.emplace_back(members[pair.first], members[pair.second]);
        }
    }

    if (!pairs.empty()) {
        logger_.warning(std::to_string(pairs.size()) + " adjacent cell pairs share a tranche");
    }
    return pairs;
}

} // namespace tess
