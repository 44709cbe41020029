#include "core/CellBuilder.hpp"
#include "core/GeometryUtils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

namespace tess {
namespace gtest {
namespace {

double totalArea(const std::vector<OGRGeometryUniquePtr>& cells) {
    double total = 0.0;
    for (const auto& cell : cells) {
        total += geometry::area(*cell);
    }
    return total;
}

const std::vector<Point2D> QUADRANT_SITES = {{2.5, 2.5}, {7.5, 2.5}, {2.5, 7.5}, {7.5, 7.5}};

} // namespace

TEST(CellBuilder, VoronoiCellsCoverTheRegion) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 1.0});

    const auto cells = builder.build(QUADRANT_SITES, *region);
    ASSERT_EQ(cells.size(), 4u);
    for (const auto& cell : cells) {
        EXPECT_NEAR(geometry::area(*cell), 25.0, 1e-6);
        EXPECT_EQ(wkbFlatten(cell->getGeometryType()), wkbPolygon);
    }
    EXPECT_NEAR(totalArea(cells), 100.0, 1e-6);
}

TEST(CellBuilder, VoronoiCellsPartitionTheRegion) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 0.0});

    const std::vector<Point2D> sites = {{1, 1}, {9, 2}, {4, 6}, {8, 8}, {2, 9}, {5, 3}};
    const auto cells = builder.build(sites, *region);
    ASSERT_EQ(cells.size(), sites.size());
    EXPECT_NEAR(totalArea(cells), 100.0, 1e-6);
    for (size_t i = 0; i < cells.size(); ++i) {
        EXPECT_TRUE(geometry::contains(*cells[i], sites[i]));
    }
}

TEST(CellBuilder, SinglePointYieldsWholeRegion) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 1.0});

    const auto cells = builder.build({{3, 3}}, *region);
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_NEAR(geometry::area(*cells[0]), 100.0, 1e-6);
}

TEST(CellBuilder, CollinearPointsSplitRegionIntoStrips) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 1.0});

    const auto cells = builder.build({{2.5, 5}, {7.5, 5}}, *region);
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_NEAR(geometry::area(*cells[0]), 50.0, 1e-6);
    EXPECT_NEAR(geometry::area(*cells[1]), 50.0, 1e-6);
}

TEST(CellBuilder, DuplicatePointsAreIgnored) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 1.0});

    std::vector<Point2D> sites = QUADRANT_SITES;
    sites.push_back(sites.front());
    EXPECT_EQ(builder.build(sites, *region).size(), 4u);
}

TEST(CellBuilder, MinimumAreaDropsSmallCells) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 30.0});
    EXPECT_TRUE(builder.build(QUADRANT_SITES, *region).empty());
}

TEST(CellBuilder, RemoveAfterIsSubtractedFromCells) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    auto removal = geometry::make_box(BoundingBox(0, 0, 5, 5));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 1.0});

    const auto cells = builder.build(QUADRANT_SITES, *region, removal.get());
    EXPECT_EQ(cells.size(), 3u);
    EXPECT_NEAR(totalArea(cells), 75.0, 1e-6);
}

TEST(CellBuilder, DelaunayTrianglesOfRegionVertices) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::DELAUNAY, 1.0});

    const auto cells = builder.build(geometry::unique_vertices(*region), *region);
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_NEAR(geometry::area(*cells[0]), 50.0, 1e-6);
    EXPECT_NEAR(geometry::area(*cells[1]), 50.0, 1e-6);
}

TEST(CellBuilder, DelaunayOfCollinearPointsIsEmpty) {
    EXPECT_TRUE(CellBuilder::delaunay_faces({{0, 0}, {1, 1}, {2, 2}}).empty());
}

TEST(CellBuilder, DelaunayCellsOfDegeneratePointsAreAGeometryError) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::DELAUNAY, 1.0});
    EXPECT_THROW(builder.build({{1, 1}, {5, 5}, {9, 9}}, *region), GeometryError);
    EXPECT_THROW(builder.build({{5, 5}}, *region), GeometryError);
}

TEST(CellBuilder, NonFinitePointIsAGeometryError) {
    auto region = geometry::make_box(BoundingBox(0, 0, 10, 10));
    CellBuilder builder(CellOptions{PolygonMethod::VORONOI, 1.0});
    const std::vector<Point2D> sites = {{1, 1}, {std::numeric_limits<double>::quiet_NaN(), 2}};
    EXPECT_THROW(builder.build(sites, *region), GeometryError);
}

TEST(CellBuilder, VoronoiFacesBelongToTheirSites) {
    const auto faces = CellBuilder::voronoi_faces(QUADRANT_SITES, BoundingBox(0, 0, 10, 10));
    ASSERT_EQ(faces.size(), QUADRANT_SITES.size());
    for (size_t i = 0; i < faces.size(); ++i) {
        ASSERT_NE(faces[i], nullptr);
        EXPECT_TRUE(geometry::contains(*faces[i], QUADRANT_SITES[i]));
    }
}

} // namespace gtest
} // namespace tess
