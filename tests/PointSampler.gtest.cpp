#include "core/GeometryUtils.hpp"
#include "core/PointSampler.hpp"
#include "core/RasterSource.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace tess {
namespace gtest {
namespace {

//! 4x4 grid of unit pixels covering (0,0)-(4,4); value = row * 4 + col, row 0 at the top.
GridRasterSource ascendingGrid(std::optional<double> nodata = std::nullopt) {
    std::vector<double> values(16);
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<double>(i);
    }
    return GridRasterSource(4, 4, GeoTransform({0.0, 1.0, 0.0, 4.0, 0.0, -1.0}), values, nodata);
}

double minPairDistance(const std::vector<Point2D>& points) {
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = i + 1; j < points.size(); ++j) {
            best = std::min(best, std::hypot(points[i].x() - points[j].x(), points[i].y() - points[j].y()));
        }
    }
    return best;
}

bool containsPoint(const std::vector<Point2D>& points, const Point2D& wanted) {
    return std::find(points.begin(), points.end(), wanted) != points.end();
}

} // namespace

TEST(PointSampler, DistanceFilterKeepsFirstOfEachCloseGroup) {
    const std::vector<Point2D> candidates = {{0, 0}, {1, 0}, {5, 0}, {5.5, 0}};
    const auto kept = PointSampler::distance_filter(candidates, 2.0, {});

    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0], Point2D(0, 0));
    EXPECT_EQ(kept[1], Point2D(5, 0));
}

TEST(PointSampler, DistanceFilterNeverKeepsMaskedCandidates) {
    const std::vector<Point2D> candidates = {{0, 0}, {1, 0}, {5, 0}, {5.5, 0}};
    const auto kept = PointSampler::distance_filter(candidates, 2.0, {false, true, true, true});

    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0], Point2D(1, 0));
    EXPECT_EQ(kept[1], Point2D(5, 0));
}

TEST(PointSampler, DistanceFilterKeepsPointsExactlyAtMinimumDistance) {
    const std::vector<Point2D> candidates = {{0, 0}, {3, 0}, {6, 0}};
    EXPECT_EQ(PointSampler::distance_filter(candidates, 3.0, {}).size(), 3u);
}

TEST(PointSampler, RandomPointCountScalesWithBox) {
    EXPECT_EQ(PointSampler::random_point_count(BoundingBox(0, 0, 100, 50), 10.0), 660u);
    EXPECT_EQ(PointSampler::random_point_count(BoundingBox(0, 0, 1, 1), 10.0), 13u);
}

TEST(PointSampler, DirectReturnsDistinctRegionVertices) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    PointSampler sampler(SamplingOptions{PointMethod::DIRECT, 35.0, BorderInclusion::NONE, 42});

    const auto points = sampler.sample(*region);
    ASSERT_EQ(points.size(), 4u);
    EXPECT_TRUE(containsPoint(points, Point2D(0, 0)));
    EXPECT_TRUE(containsPoint(points, Point2D(10, 10)));
}

TEST(PointSampler, RandomUniformRespectsRegionAndDistance) {
    auto region = geometry::make_box(BoundingBox(0, 0, 100, 100));
    PointSampler sampler(SamplingOptions{PointMethod::RANDOM_UNIFORM, 10.0, BorderInclusion::NONE, 7});

    const auto points = sampler.sample(*region);
    ASSERT_GT(points.size(), 10u);
    EXPECT_GE(minPairDistance(points), 10.0);
    for (const auto& point : points) {
        EXPECT_TRUE(geometry::contains(*region, point));
    }
}

TEST(PointSampler, RandomUniformIsDeterministicPerSeed) {
    auto region = geometry::make_box(BoundingBox(0, 0, 100, 100));
    PointSampler first(SamplingOptions{PointMethod::RANDOM_UNIFORM, 10.0, BorderInclusion::NONE, 42});
    PointSampler again(SamplingOptions{PointMethod::RANDOM_UNIFORM, 10.0, BorderInclusion::NONE, 42});
    PointSampler other(SamplingOptions{PointMethod::RANDOM_UNIFORM, 10.0, BorderInclusion::NONE, 43});

    const auto a = first.sample(*region);
    EXPECT_EQ(a, again.sample(*region));
    EXPECT_NE(a, other.sample(*region));
}

TEST(PointSampler, RasterWeightedStartsAtHighestPixel) {
    auto raster = ascendingGrid();
    auto region = geometry::make_box(BoundingBox(0, 0, 4, 4));
    PointSampler sampler(SamplingOptions{PointMethod::RASTER_WEIGHTED, 0.5, BorderInclusion::NONE, 42});

    const auto points = sampler.sample(*region, &raster);
    ASSERT_EQ(points.size(), 16u);
    EXPECT_EQ(points.front(), Point2D(3.5, 0.5));
    EXPECT_EQ(points.back(), Point2D(0.5, 3.5));
}

TEST(PointSampler, RasterWeightedSkipsNodataPixels) {
    auto raster = ascendingGrid(0.0);
    auto region = geometry::make_box(BoundingBox(0, 0, 4, 4));
    PointSampler sampler(SamplingOptions{PointMethod::RASTER_WEIGHTED, 0.5, BorderInclusion::NONE, 42});

    const auto points = sampler.sample(*region, &raster);
    EXPECT_EQ(points.size(), 15u);
    EXPECT_FALSE(containsPoint(points, Point2D(0.5, 3.5)));
}

TEST(PointSampler, RasterWeightedThinsByDistance) {
    auto raster = ascendingGrid();
    auto region = geometry::make_box(BoundingBox(0, 0, 4, 4));
    PointSampler sampler(SamplingOptions{PointMethod::RASTER_WEIGHTED, 1.5, BorderInclusion::NONE, 42});

    const auto points = sampler.sample(*region, &raster);
    EXPECT_LT(points.size(), 16u);
    EXPECT_GE(minPairDistance(points), 1.5);
    EXPECT_EQ(points.front(), Point2D(3.5, 0.5));
}

TEST(PointSampler, RasterWeightedWithoutRasterThrows) {
    auto region = geometry::make_box(BoundingBox(0, 0, 4, 4));
    PointSampler sampler(SamplingOptions{PointMethod::RASTER_WEIGHTED, 1.0, BorderInclusion::NONE, 42});
    EXPECT_THROW(sampler.sample(*region), ConfigurationError);
}

TEST(PointSampler, EmptySampleFallsBackToCentroid) {
    GridRasterSource raster(4, 4, GeoTransform({0.0, 1.0, 0.0, 4.0, 0.0, -1.0}), std::vector<double>(16, -9999.0), -9999.0);
    auto region = geometry::make_box(BoundingBox(0, 0, 4, 4));
    PointSampler sampler(SamplingOptions{PointMethod::RASTER_WEIGHTED, 1.0, BorderInclusion::NONE, 42});

    const auto points = sampler.sample(*region, &raster);
    ASSERT_EQ(points.size(), 1u);
    EXPECT_NEAR(points[0].x(), 2.0, 1e-9);
    EXPECT_NEAR(points[0].y(), 2.0, 1e-9);
}

TEST(PointSampler, BorderAfterAddsEveryVertexOnce) {
    auto raster = ascendingGrid();
    auto region = geometry::make_box(BoundingBox(0, 0, 4, 4));
    PointSampler sampler(SamplingOptions{PointMethod::RASTER_WEIGHTED, 10.0, BorderInclusion::AFTER_DISTANCE_FILTER, 42});

    const auto points = sampler.sample(*region, &raster);
    // One raster point survives the filter, then the four corners are appended unfiltered
    ASSERT_EQ(points.size(), 5u);
    EXPECT_EQ(points.front(), Point2D(3.5, 0.5));
    EXPECT_TRUE(containsPoint(points, Point2D(0, 0)));
    EXPECT_TRUE(containsPoint(points, Point2D(4, 0)));
    EXPECT_TRUE(containsPoint(points, Point2D(4, 4)));
    EXPECT_TRUE(containsPoint(points, Point2D(0, 4)));
}

TEST(PointSampler, BorderBeforeVerticesAreFilteredLast) {
    auto raster = ascendingGrid();
    auto region = geometry::make_box(BoundingBox(0, 0, 4, 4));
    PointSampler sampler(SamplingOptions{PointMethod::RASTER_WEIGHTED, 0.5, BorderInclusion::BEFORE_DISTANCE_FILTER, 42});

    const auto points = sampler.sample(*region, &raster);
    // All 16 centres, then the four corners; the repeated closing vertex is filtered out
    ASSERT_EQ(points.size(), 20u);
    EXPECT_EQ(points.front(), Point2D(3.5, 0.5));
    EXPECT_GE(minPairDistance(points), 0.5);
}

} // namespace gtest
} // namespace tess
