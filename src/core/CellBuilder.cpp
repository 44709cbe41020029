/**
 * @file CellBuilder.cpp
 * @brief Cell generation from a CGAL Delaunay triangulation
 */

#include "CellBuilder.hpp"
#include "GeometryUtils.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Delaunay_triangulation_2.h>
#include <CGAL/Triangulation_vertex_base_with_info_2.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace tess {

namespace {

using K = CGAL::Exact_predicates_inexact_constructions_kernel;
using Point_2 = K::Point_2;
using Vb = CGAL::Triangulation_vertex_base_with_info_2<size_t, K>;
using Tds = CGAL::Triangulation_data_structure_2<Vb>;
using Delaunay = CGAL::Delaunay_triangulation_2<K, Tds>;

Delaunay triangulate(const std::vector<Point2D>& points) {
    std::vector<std::pair<Point_2, size_t>> indexed;
    indexed.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        indexed.emplace_back(Point_2(points[i].x(), points[i].y()), i);
    }

    Delaunay triangulation;
    triangulation.insert(indexed.begin(), indexed.end());
    return triangulation;
}

/**
 * Keep the part of a convex ring on the site's side of the perpendicular
 * bisector between site and other (Sutherland-Hodgman against one plane).
 */
std::vector<Point2D> clip_to_bisector(const std::vector<Point2D>& ring, const Point2D& site, const Point2D& other) {
    const double nx = other.x() - site.x();
    const double ny = other.y() - site.y();
    const double mx = (site.x() + other.x()) / 2.0;
    const double my = (site.y() + other.y()) / 2.0;

    auto side = [&](const Point2D& p) {
        return (p.x() - mx) * nx + (p.y() - my) * ny;
    };

    std::vector<Point2D> clipped;
    const size_t n = ring.size();
    for (size_t i = 0; i < n; ++i) {
        const Point2D& current = ring[i];
        const Point2D& next = ring[(i + 1) % n];
        double current_side = side(current);
        double next_side = side(next);

        if (current_side <= 0.0) {
            clipped.push_back(current);
        }
        if ((current_side < 0.0 && next_side > 0.0) || (current_side > 0.0 && next_side < 0.0)) {
            double t = current_side / (current_side - next_side);
            clipped.emplace_back(current.x() + t * (next.x() - current.x()),
                                 current.y() + t * (next.y() - current.y()));
        }
    }
    return clipped;
}

std::vector<Point2D> distinct_points(const std::vector<Point2D>& points) {
    std::vector<Point2D> distinct;
    std::set<std::pair<double, double>> seen;
    for (const auto& point : points) {
        if (!std::isfinite(point.x()) || !std::isfinite(point.y())) {
            throw GeometryError("non-finite seed point");
        }
        if (seen.insert({point.x(), point.y()}).second) {
            distinct.push_back(point);
        }
    }
    return distinct;
}

} // anonymous namespace

CellBuilder::CellBuilder(const CellOptions& options)
    : options_(options), logger_("CellBuilder") {
}

std::vector<OGRGeometryUniquePtr> CellBuilder::voronoi_faces(const std::vector<Point2D>& points,
                                                             const BoundingBox& frame) {
    std::vector<OGRGeometryUniquePtr> faces;
    if (points.empty()) {
        return faces;
    }

    // Neighbours from the Delaunay graph; degenerate sets use every other point
    std::vector<std::vector<size_t>> neighbors(points.size());
    Delaunay triangulation = triangulate(points);
    if (triangulation.dimension() == 2) {
        for (auto edge = triangulation.finite_edges_begin(); edge != triangulation.finite_edges_end(); ++edge) {
            auto face = edge->first;
            int i = edge->second;
            size_t a = face->vertex(Delaunay::cw(i))->info();
            size_t b = face->vertex(Delaunay::ccw(i))->info();
            neighbors[a].push_back(b);
            neighbors[b].push_back(a);
        }
    } else {
        for (size_t a = 0; a < points.size(); ++a) {
            for (size_t b = 0; b < points.size(); ++b) {
                if (a != b) {
                    neighbors[a].push_back(b);
                }
            }
        }
    }

    const std::vector<Point2D> box = {
        Point2D(frame.min_x, frame.min_y), Point2D(frame.max_x, frame.min_y),
        Point2D(frame.max_x, frame.max_y), Point2D(frame.min_x, frame.max_y)
    };

    faces.reserve(points.size());
    for (size_t site = 0; site < points.size(); ++site) {
        std::vector<Point2D> ring = box;
        for (size_t other : neighbors[site]) {
            ring = clip_to_bisector(ring, points[site], points[other]);
            if (ring.size() < 3) {
                break;
            }
        }
        if (ring.size() < 3) {
            faces.push_back(nullptr);
        } else {
            faces.push_back(geometry::make_polygon(ring));
        }
    }
    return faces;
}

std::vector<OGRGeometryUniquePtr> CellBuilder::delaunay_faces(const std::vector<Point2D>& points) {
    std::vector<OGRGeometryUniquePtr> faces;
    Delaunay triangulation = triangulate(points);
    if (triangulation.dimension() < 2) {
        return faces;
    }

    for (auto face = triangulation.finite_faces_begin(); face != triangulation.finite_faces_end(); ++face) {
        std::vector<Point2D> ring;
        for (int i = 0; i < 3; ++i) {
            ring.push_back(points[face->vertex(i)->info()]);
        }
        faces.push_back(geometry::make_polygon(ring));
    }
    return faces;
}

std::vector<OGRGeometryUniquePtr> CellBuilder::build(const std::vector<Point2D>& points,
                                                     const OGRGeometry& region,
                                                     const OGRGeometry* remove_after) const {
    std::vector<Point2D> sites = distinct_points(points);

    std::vector<OGRGeometryUniquePtr> faces;
    try {
        if (options_.method == PolygonMethod::VORONOI) {
            BoundingBox frame = geometry::envelope(region);
            for (const auto& site : sites) {
                frame.min_x = std::min(frame.min_x, site.x());
                frame.min_y = std::min(frame.min_y, site.y());
                frame.max_x = std::max(frame.max_x, site.x());
                frame.max_y = std::max(frame.max_y, site.y());
            }
            faces = voronoi_faces(sites, frame.expanded(std::max(frame.width(), frame.height()) + 1.0));
        } else {
            faces = delaunay_faces(sites);
            if (faces.empty()) {
                throw GeometryError("degenerate point set, no Delaunay triangle from " +
                                    std::to_string(sites.size()) + " points");
            }
        }
    } catch (const CGAL::Failure_exception& e) {
        throw GeometryError(std::string("triangulation failed: ") + e.what());
    }

    logger_.debug(to_string(options_.method) + " produced " + std::to_string(faces.size()) +
                  " faces from " + std::to_string(sites.size()) + " points");

    std::vector<OGRGeometryUniquePtr> cells;
    size_t dropped = 0;
    for (auto& face : faces) {
        if (geometry::is_empty(face.get())) {
            continue;
        }

        if (remove_after != nullptr) {
            auto repaired = geometry::repair(*face);
            if (!repaired) {
                throw GeometryError("cannot repair tessellation face");
            }
            face = geometry::difference(*repaired, *remove_after);
            if (!face) {
                throw GeometryError("cannot subtract exclusion geometry from face");
            }
            if (face->IsEmpty()) {
                continue;
            }
        }

        auto clipped = geometry::intersection(region, *face);
        if (!clipped) {
            throw GeometryError("cannot clip face to region");
        }
        auto repaired = geometry::repair(*clipped);
        if (!repaired) {
            throw GeometryError("cannot repair clipped face");
        }

        for (auto& part : geometry::polygon_parts(*repaired)) {
            if (geometry::area(*part) >= options_.min_area) {
                cells.push_back(std::move(part));
            } else {
                ++dropped;
            }
        }
    }

    if (dropped > 0) {
        logger_.debug("Dropped " + std::to_string(dropped) + " parts below minimum area " +
                      format_number(options_.min_area));
    }
    return cells;
}

} // namespace tess
