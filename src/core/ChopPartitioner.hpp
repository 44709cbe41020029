#pragma once

/**
 * @file ChopPartitioner.hpp
 * @brief Assignment of cells to area-bounded, non-adjacent tranches
 *
 * Cells are grouped by split key. Within a group, cells are first bucketed
 * greedily by score into tranches whose cumulative area crosses each quota
 * once (stage A). A pass over the tranches in order then resolves adjacency
 * conflicts: every tranche keeps the best non-adjacent subset of its cells,
 * demotes the rest to the overflow tranche and refills freed quota with
 * non-adjacent cells promoted from later tranches (stage C). The pass runs
 * once; later tranches see the promotions taken from them.
 */

#include "tessellation.hpp"
#include "AdjacencyGraph.hpp"
#include "Logger.hpp"
#include <set>
#include <utility>
#include <vector>

namespace tess {

/**
 * @brief Input record of one cell
 */
struct ChopCell {
    double value = 0.0;                  ///< Priority field value
    double area = 0.0;                   ///< Area fraction of the parent split polygon
    const OGRGeometry* geometry = nullptr;
    SplitKey split_key;

    /// value * area; NaN when either is NaN
    double score() const { return value * area; }
};

/**
 * @brief Partitioning parameters
 */
struct ChopOptions {
    std::vector<double> divisions{20, 20, 20};  ///< Area quota per tranche
    bool neighbor_corners = true;
    size_t max_cluster_size = 12;
    size_t max_candidates = 100000;
    bool parallel = true;
};

/**
 * @brief Tranche indices of one split-key group, 0..K with K = overflow
 */
struct GroupAssignment {
    std::vector<size_t> initial;
    std::vector<size_t> improved;
};

class ChopPartitioner {
public:
    explicit ChopPartitioner(const ChopOptions& options);

    /**
     * @brief Partition all cells, group by group
     * @return 1-based tranche numbers per cell, 0 for overflow
     * @throws ConfigurationError when no divisions are configured
     */
    ChopResult partition(const std::vector<ChopCell>& cells) const;

    /// Stages A and C for one group over a prebuilt adjacency graph
    GroupAssignment partition_group(const std::vector<double>& scores,
                                    const std::vector<double>& areas,
                                    const AdjacencyGraph& graph) const;

    /// Stage A: greedy bucketing by descending score
    std::vector<size_t> initial_assignment(const std::vector<double>& scores,
                                           const std::vector<double>& areas) const;

    /// Stage C: single improvement pass over tranches 0..K-1
    std::vector<size_t> improve(const std::vector<size_t>& initial,
                                const std::vector<double>& scores,
                                const std::vector<double>& areas,
                                const AdjacencyGraph& graph) const;

    /**
     * @brief Non-adjacent proper subsets of a connected cluster
     *
     * Sizes ascend from 1 to |cluster| - 1; within a size, subsets follow
     * lexicographic order of cluster positions. At most limit subsets are
     * produced.
     */
    static std::vector<std::vector<size_t>> independent_subsets(const std::vector<size_t>& cluster,
                                                                const AdjacencyGraph& graph,
                                                                size_t limit);

    /**
     * @brief Same-tranche adjacent pairs of a group assignment
     * @param assignment Tranche per node, overflow excluded from the check
     */
    static std::vector<std::pair<size_t, size_t>> conflicts(const std::vector<size_t>& assignment,
                                                            size_t overflow,
                                                            const AdjacencyGraph& graph);

    /**
     * @brief Post-hoc check of a partition result
     * @return Global index pairs that share a final tranche and are adjacent
     */
    std::vector<std::pair<size_t, size_t>> verify_assignment(const std::vector<ChopCell>& cells,
                                                             const ChopResult& result) const;

    size_t overflow_tranche() const { return options_.divisions.size(); }
    const ChopOptions& options() const { return options_; }

private:
    struct Candidate {
        double score = 0.0;
        std::set<size_t> kept;
        std::set<size_t> promoted;
    };

    ChopOptions options_;
    Logger logger_;

    std::vector<std::vector<size_t>> split_groups(const std::vector<ChopCell>& cells) const;

    std::vector<size_t> greedy_subset(const std::vector<size_t>& cluster,
                                      const std::vector<double>& scores,
                                      const AdjacencyGraph& graph) const;

    std::set<size_t> best_promotion(const std::set<size_t>& kept,
                                    double kept_area,
                                    double limit,
                                    const std::vector<size_t>& assignment,
                                    size_t tranche,
                                    const std::vector<double>& scores,
                                    const std::vector<double>& areas,
                                    const AdjacencyGraph& graph,
                                    double& promotion_score) const;
};

} // namespace tess
