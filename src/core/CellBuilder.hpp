#pragma once

/**
 * @file CellBuilder.hpp
 * @brief Voronoi and Delaunay cell generation clipped to a region
 */

#include "tessellation.hpp"
#include "Logger.hpp"
#include <vector>

namespace tess {

/**
 * @brief Cell generation parameters
 */
struct CellOptions {
    PolygonMethod method = PolygonMethod::VORONOI;
    double min_area = 1.0;
};

/**
 * @brief Turns a point set into single-polygon cells covering a region
 */
class CellBuilder {
public:
    explicit CellBuilder(const CellOptions& options);

    /**
     * @brief Tessellate points and clip the faces to the region
     * @param points Seed points (exact duplicates are ignored)
     * @param region Polygon or multi-polygon to cover
     * @param remove_after Optional geometry subtracted from every face before clipping
     * @return Single polygons with area >= min_area
     * @throws GeometryError when the geometry engine fails on this point set,
     *         or when Delaunay cells are asked of fewer than three
     *         non-collinear points
     */
    std::vector<OGRGeometryUniquePtr> build(const std::vector<Point2D>& points,
                                            const OGRGeometry& region,
                                            const OGRGeometry* remove_after = nullptr) const;

    /**
     * @brief Voronoi faces of the points, each bounded by the frame box
     *
     * Face i belongs to points[i]; the points must be distinct.
     */
    static std::vector<OGRGeometryUniquePtr> voronoi_faces(const std::vector<Point2D>& points,
                                                           const BoundingBox& frame);

    /// Finite Delaunay triangles of the points
    static std::vector<OGRGeometryUniquePtr> delaunay_faces(const std::vector<Point2D>& points);

    const CellOptions& options() const { return options_; }

private:
    CellOptions options_;
    Logger logger_;
};

} // namespace tess
