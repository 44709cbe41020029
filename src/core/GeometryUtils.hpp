#pragma once

/**
 * @file GeometryUtils.hpp
 * @brief OGR geometry helpers shared by the tessellation stages
 *
 * Every helper returns owned geometries (OGRGeometryUniquePtr). Boolean
 * operations return nullptr only when OGR reports a failure.
 */

#include "tessellation.hpp"
#include <vector>

namespace tess {
namespace geometry {

OGRGeometryUniquePtr clone(const OGRGeometry& geometry);

/// Parse WKT, throws GeometryError on malformed input
OGRGeometryUniquePtr from_wkt(const std::string& wkt);

std::string to_wkt(const OGRGeometry& geometry);

OGRGeometryUniquePtr make_box(const BoundingBox& box);

/// Closed polygon from a ring of points (the ring is closed if needed)
OGRGeometryUniquePtr make_polygon(const std::vector<Point2D>& ring);

OGRGeometryUniquePtr make_point(const Point2D& point);

BoundingBox envelope(const OGRGeometry& geometry);

double area(const OGRGeometry& geometry);

bool is_empty(const OGRGeometry* geometry);

/// Validity repair through a zero-width buffer
OGRGeometryUniquePtr repair(const OGRGeometry& geometry);

OGRGeometryUniquePtr intersection(const OGRGeometry& a, const OGRGeometry& b);
OGRGeometryUniquePtr difference(const OGRGeometry& a, const OGRGeometry& b);

/// Union of all non-empty geometries; nullptr when there are none
OGRGeometryUniquePtr union_all(const std::vector<const OGRGeometry*>& geometries);

OGRGeometryUniquePtr simplify(const OGRGeometry& geometry, double tolerance);

Point2D centroid(const OGRGeometry& geometry);

/// Single polygons of a polygon, multi-polygon or geometry collection
std::vector<OGRGeometryUniquePtr> polygon_parts(const OGRGeometry& geometry);

/// Ring vertices in ring order, closing vertices included
std::vector<Point2D> vertices(const OGRGeometry& geometry);

/// Vertices with exact duplicates removed, first occurrence kept
std::vector<Point2D> unique_vertices(const OGRGeometry& geometry);

/// Point-in-geometry test, boundary excluded
bool contains(const OGRGeometry& geometry, const Point2D& point);

/// Point-on-geometry test, boundary included
bool intersects(const OGRGeometry& geometry, const Point2D& point);

/**
 * @brief Topological dimension of the shared part of two geometries
 * @return -1 when disjoint, 0 for point contact, 1 for a shared edge, 2 for overlap
 */
int contact_dimension(const OGRGeometry& a, const OGRGeometry& b);

} // namespace geometry
} // namespace tess
