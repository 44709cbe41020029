#include "core/ChopPartitioner.hpp"
#include "core/GeometryUtils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <vector>

namespace tess {
namespace gtest {
namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

ChopOptions withDivisions(std::vector<double> divisions) {
    ChopOptions options;
    options.divisions = std::move(divisions);
    options.parallel = false;
    return options;
}

//! Path graph 0-1-...-(n-1).
AdjacencyGraph pathGraph(size_t n) {
    AdjacencyGraph graph(n);
    for (size_t i = 1; i < n; ++i) {
        graph.add_edge(i - 1, i);
    }
    return graph;
}

struct GridCells {
    std::vector<OGRGeometryUniquePtr> geometries;
    std::vector<ChopCell> cells;
};

//! 3x3 unit squares, row-major; values 9..1 so cell 0 has the highest score.
GridCells threeByThree(double area) {
    GridCells grid;
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            grid.geometries.push_back(geometry::make_box(BoundingBox(c, r, c + 1, r + 1)));
        }
    }
    for (size_t i = 0; i < grid.geometries.size(); ++i) {
        ChopCell cell;
        cell.value = 9.0 - static_cast<double>(i);
        cell.area = area;
        cell.geometry = grid.geometries[i].get();
        grid.cells.push_back(cell);
    }
    return grid;
}

} // namespace

// ============================================================================
// Stage A
// ============================================================================

TEST(ChopPartitioner, InitialAssignmentFillsTranchesByScore) {
    ChopPartitioner partitioner(withDivisions({15, 15}));
    const auto assignment = partitioner.initial_assignment({1, 3, 2}, {10, 10, 10});
    EXPECT_EQ(assignment, (std::vector<size_t>{2, 0, 1}));
}

TEST(ChopPartitioner, InitialAssignmentKeepsOversizedFirstCell) {
    ChopPartitioner partitioner(withDivisions({20, 20}));
    const auto assignment = partitioner.initial_assignment({5, 4}, {50, 5});
    EXPECT_EQ(assignment, (std::vector<size_t>{0, 1}));
}

TEST(ChopPartitioner, InitialAssignmentFillsUpToTheQuota) {
    ChopPartitioner partitioner(withDivisions({30}));
    const auto assignment = partitioner.initial_assignment({3, 2, 1, 0.5}, {10, 10, 10, 10});
    EXPECT_EQ(assignment, (std::vector<size_t>{0, 0, 0, 1}));
}

TEST(ChopPartitioner, NaNScoresSortLast) {
    ChopPartitioner partitioner(withDivisions({10, 10}));
    const auto assignment = partitioner.initial_assignment({NaN, 1}, {10, 10});
    EXPECT_EQ(assignment, (std::vector<size_t>{1, 0}));
}

// ============================================================================
// Stage C
// ============================================================================

TEST(ChopPartitioner, IndependentSubsetsAscendBySize) {
    const auto graph = pathGraph(3);
    const auto subsets = ChopPartitioner::independent_subsets({0, 1, 2}, graph, 100);
    const std::vector<std::vector<size_t>> expected = {{0}, {1}, {2}, {0, 2}};
    EXPECT_EQ(subsets, expected);
    EXPECT_EQ(ChopPartitioner::independent_subsets({0, 1, 2}, graph, 2).size(), 2u);
}

TEST(ChopPartitioner, TriangleKeepsOnlyBestCell) {
    AdjacencyGraph graph(3);
    graph.add_edge(0, 1);
    graph.add_edge(1, 2);
    graph.add_edge(0, 2);

    ChopPartitioner partitioner(withDivisions({30}));
    const auto result = partitioner.partition_group({30, 20, 10}, {10, 10, 10}, graph);

    EXPECT_EQ(result.initial, (std::vector<size_t>{0, 0, 0}));
    EXPECT_EQ(result.improved, (std::vector<size_t>{0, 1, 1}));
}

TEST(ChopPartitioner, DemotedQuotaIsRefilledByPromotion) {
    ChopPartitioner partitioner(withDivisions({20, 20}));
    const auto graph = pathGraph(4);
    const auto result = partitioner.partition_group({40, 30, 20, 10}, {10, 10, 10, 10}, graph);

    EXPECT_EQ(result.initial, (std::vector<size_t>{0, 0, 1, 1}));
    // Tranche 1 keeps 0 and pulls 2 forward; tranche 2 keeps 3 and takes the demoted 1
    EXPECT_EQ(result.improved, (std::vector<size_t>{0, 1, 0, 1}));
    EXPECT_TRUE(ChopPartitioner::conflicts(result.improved, 2, graph).empty());
}

TEST(ChopPartitioner, PromotionKeepsTheBestStartCell) {
    AdjacencyGraph graph(5);
    graph.add_edge(0, 1);

    ChopPartitioner partitioner(withDivisions({30}));
    const auto result = partitioner.partition_group({100, 90, 5, 50, 40}, {10, 10, 10, 10, 10}, graph);

    EXPECT_EQ(result.initial, (std::vector<size_t>{0, 0, 1, 0, 1}));
    // Room for one cell after demoting 1; starting from 4 beats the lower index 2
    EXPECT_EQ(result.improved, (std::vector<size_t>{0, 1, 1, 0, 0}));
}

TEST(ChopPartitioner, ExhaustiveSearchPrefersBestIndependentSet) {
    const auto graph = pathGraph(3);
    ChopPartitioner partitioner(withDivisions({100}));
    const auto result = partitioner.partition_group({10, 30, 25}, {1, 1, 1}, graph);
    EXPECT_EQ(result.improved, (std::vector<size_t>{0, 1, 0}));
}

TEST(ChopPartitioner, LargeClustersFallBackToGreedySubset) {
    const auto graph = pathGraph(3);
    ChopOptions options = withDivisions({100});
    options.max_cluster_size = 2;
    ChopPartitioner partitioner(options);

    const auto result = partitioner.partition_group({10, 30, 25}, {1, 1, 1}, graph);
    EXPECT_EQ(result.improved, (std::vector<size_t>{1, 0, 1}));
}

TEST(ChopPartitioner, CandidateCapLimitsEnumeration) {
    const auto graph = pathGraph(3);
    ChopOptions options = withDivisions({100});
    options.max_candidates = 1;
    ChopPartitioner partitioner(options);

    const auto result = partitioner.partition_group({10, 30, 25}, {1, 1, 1}, graph);
    EXPECT_EQ(result.improved, (std::vector<size_t>{0, 1, 1}));
}

TEST(ChopPartitioner, ConflictsListSameTranchePairs) {
    const auto graph = pathGraph(3);
    const auto pairs = ChopPartitioner::conflicts({0, 0, 2}, 2, graph);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0], (std::pair<size_t, size_t>{0, 1}));

    // Overflow cells may touch each other
    EXPECT_TRUE(ChopPartitioner::conflicts({2, 2, 2}, 2, graph).empty());
}

// ============================================================================
// Full partition
// ============================================================================

TEST(ChopPartitioner, GridResultHasNoAdjacentSameTrancheCells) {
    auto grid = threeByThree(10.0);
    ChopPartitioner partitioner(withDivisions({20, 20, 20}));

    const ChopResult result = partitioner.partition(grid.cells);
    ASSERT_EQ(result.final_chop.size(), 9u);
    EXPECT_TRUE(partitioner.verify_assignment(grid.cells, result).empty());

    // Best cell stays first and the best non-adjacent cell joins it
    EXPECT_EQ(result.final_chop[0], 1);
    EXPECT_EQ(result.final_chop[2], 1);
    EXPECT_NE(result.final_chop[1], 1);
}

TEST(ChopPartitioner, SingleDivisionPushesMostGridCellsToOverflow) {
    auto grid = threeByThree(10.0);
    ChopPartitioner partitioner(withDivisions({20}));

    const ChopResult result = partitioner.partition(grid.cells);
    EXPECT_EQ(std::count(result.final_chop.begin(), result.final_chop.end(), 0), 7);
    EXPECT_EQ(result.final_chop[0], 1);
    EXPECT_EQ(result.final_chop[2], 1);
}

TEST(ChopPartitioner, TrancheAreasStayWithinDivisions) {
    auto grid = threeByThree(10.0);
    const std::vector<double> divisions = {20, 20, 20};
    ChopPartitioner partitioner(withDivisions(divisions));

    const ChopResult result = partitioner.partition(grid.cells);

    for (const auto* chops : {&result.initial_chop, &result.final_chop}) {
        std::map<int, double> areas;
        for (size_t i = 0; i < chops->size(); ++i) {
            EXPECT_GE((*chops)[i], 0);
            EXPECT_LE((*chops)[i], 3);
            areas[(*chops)[i]] += grid.cells[i].area;
        }
        for (int tranche = 1; tranche <= 3; ++tranche) {
            EXPECT_LE(areas[tranche], divisions[tranche - 1]);
        }
    }
}

TEST(ChopPartitioner, SplitGroupsArePartitionedIndependently) {
    auto square = geometry::make_box(BoundingBox(0, 0, 1, 1));
    auto twin = geometry::make_box(BoundingBox(0, 0, 1, 1));

    ChopCell a;
    a.value = 2.0;
    a.area = 10.0;
    a.geometry = square.get();
    ChopCell b = a;
    b.value = 1.0;
    b.geometry = twin.get();

    ChopPartitioner partitioner(withDivisions({20}));

    // Same group: the overlapping twins conflict and the weaker one is demoted
    ChopResult shared = partitioner.partition({a, b});
    EXPECT_EQ(shared.initial_chop, (std::vector<int>{1, 1}));
    EXPECT_EQ(shared.final_chop, (std::vector<int>{1, 0}));

    // Different groups never see each other
    a.split_key = {"north"};
    b.split_key = {"south"};
    ChopResult separate = partitioner.partition({a, b});
    EXPECT_EQ(separate.final_chop, (std::vector<int>{1, 1}));
}

TEST(ChopPartitioner, ParallelAndSequentialAgree) {
    auto grid = threeByThree(10.0);
    for (size_t i = 0; i < grid.cells.size(); ++i) {
        grid.cells[i].split_key = {i < 5 ? "a" : "b"};
    }

    ChopOptions sequential = withDivisions({20, 20});
    ChopOptions parallel = sequential;
    parallel.parallel = true;

    const ChopResult first = ChopPartitioner(sequential).partition(grid.cells);
    const ChopResult second = ChopPartitioner(parallel).partition(grid.cells);
    EXPECT_EQ(first.initial_chop, second.initial_chop);
    EXPECT_EQ(first.final_chop, second.final_chop);
}

TEST(ChopPartitioner, NaNValuesLandInTheLastTranche) {
    std::vector<OGRGeometryUniquePtr> squares;
    std::vector<ChopCell> cells;
    const std::vector<double> values = {NaN, 1, 2};
    for (size_t i = 0; i < values.size(); ++i) {
        squares.push_back(geometry::make_box(BoundingBox(3.0 * i, 0, 3.0 * i + 1, 1)));
        ChopCell cell;
        cell.value = values[i];
        cell.area = 10.0;
        cell.geometry = squares.back().get();
        cells.push_back(cell);
    }

    ChopPartitioner partitioner(withDivisions({10, 10}));
    const ChopResult result = partitioner.partition(cells);
    EXPECT_EQ(result.initial_chop, (std::vector<int>{0, 2, 1}));
    EXPECT_EQ(result.final_chop, (std::vector<int>{0, 2, 1}));
}

TEST(ChopPartitioner, EmptyDivisionsAreAConfigurationError) {
    ChopPartitioner partitioner(withDivisions({}));
    EXPECT_THROW(partitioner.partition({}), ConfigurationError);
}

} // namespace gtest
} // namespace tess
