/**
 * @file GeometryUtils.cpp
 * @brief OGR geometry helpers
 */

#include "GeometryUtils.hpp"
#include <ogr_api.h>
#include <algorithm>
#include <set>

namespace tess {
namespace geometry {

OGRGeometryUniquePtr clone(const OGRGeometry& geometry) {
    return OGRGeometryUniquePtr(geometry.clone());
}

OGRGeometryUniquePtr from_wkt(const std::string& wkt) {
    OGRGeometry* parsed = nullptr;
    OGRErr err = OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &parsed);
    if (err != OGRERR_NONE || parsed == nullptr) {
        throw GeometryError("cannot parse WKT '" + wkt.substr(0, 64) + "'");
    }
    return OGRGeometryUniquePtr(parsed);
}

std::string to_wkt(const OGRGeometry& geometry) {
    return geometry.exportToWkt();
}

OGRGeometryUniquePtr make_box(const BoundingBox& box) {
    return make_polygon({
        Point2D(box.min_x, box.min_y),
        Point2D(box.max_x, box.min_y),
        Point2D(box.max_x, box.max_y),
        Point2D(box.min_x, box.max_y)
    });
}

OGRGeometryUniquePtr make_polygon(const std::vector<Point2D>& ring) {
    auto* exterior = new OGRLinearRing();
    for (const auto& point : ring) {
        exterior->addPoint(point.x(), point.y());
    }
    exterior->closeRings();

    auto* polygon = new OGRPolygon();
    polygon->addRingDirectly(exterior);
    return OGRGeometryUniquePtr(polygon);
}

OGRGeometryUniquePtr make_point(const Point2D& point) {
    return OGRGeometryUniquePtr(new OGRPoint(point.x(), point.y()));
}

BoundingBox envelope(const OGRGeometry& geometry) {
    OGREnvelope env;
    geometry.getEnvelope(&env);
    return BoundingBox(env.MinX, env.MinY, env.MaxX, env.MaxY);
}

double area(const OGRGeometry& geometry) {
    if (geometry.IsEmpty()) {
        return 0.0;
    }
    return OGR_G_Area(OGRGeometry::ToHandle(const_cast<OGRGeometry*>(&geometry)));
}

bool is_empty(const OGRGeometry* geometry) {
    return geometry == nullptr || geometry->IsEmpty();
}

OGRGeometryUniquePtr repair(const OGRGeometry& geometry) {
    return OGRGeometryUniquePtr(geometry.Buffer(0.0));
}

OGRGeometryUniquePtr intersection(const OGRGeometry& a, const OGRGeometry& b) {
    return OGRGeometryUniquePtr(a.Intersection(&b));
}

OGRGeometryUniquePtr difference(const OGRGeometry& a, const OGRGeometry& b) {
    return OGRGeometryUniquePtr(a.Difference(&b));
}

OGRGeometryUniquePtr union_all(const std::vector<const OGRGeometry*>& geometries) {
    if (geometries.empty()) {
        return nullptr;
    }

    OGRGeometryUniquePtr merged;
    for (const auto* geometry : geometries) {
        if (is_empty(geometry)) {
            continue;
        }
        if (!merged) {
            merged = clone(*geometry);
        } else {
            OGRGeometryUniquePtr next(merged->Union(geometry));
            if (!next) {
                throw GeometryError("union of exclusion geometries failed");
            }
            merged = std::move(next);
        }
    }
    return merged;
}

OGRGeometryUniquePtr simplify(const OGRGeometry& geometry, double tolerance) {
    return OGRGeometryUniquePtr(geometry.SimplifyPreserveTopology(tolerance));
}

Point2D centroid(const OGRGeometry& geometry) {
    OGRPoint point;
    if (geometry.Centroid(&point) != OGRERR_NONE || point.IsEmpty()) {
        BoundingBox box = envelope(geometry);
        return Point2D((box.min_x + box.max_x) / 2.0, (box.min_y + box.max_y) / 2.0);
    }
    return Point2D(point.getX(), point.getY());
}

namespace {

void collect_parts(const OGRGeometry& geometry, std::vector<OGRGeometryUniquePtr>& parts) {
    switch (wkbFlatten(geometry.getGeometryType())) {
        case wkbPolygon:
            if (!geometry.IsEmpty()) {
                parts.push_back(clone(geometry));
            }
            break;
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            const auto* collection = geometry.toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                collect_parts(*collection->getGeometryRef(i), parts);
            }
            break;
        }
        default:
            break;
    }
}

void collect_ring(const OGRSimpleCurve& curve, std::vector<Point2D>& points) {
    for (int i = 0; i < curve.getNumPoints(); ++i) {
        points.emplace_back(curve.getX(i), curve.getY(i));
    }
}

void collect_vertices(const OGRGeometry& geometry, std::vector<Point2D>& points) {
    switch (wkbFlatten(geometry.getGeometryType())) {
        case wkbPoint: {
            const auto* point = geometry.toPoint();
            if (!point->IsEmpty()) {
                points.emplace_back(point->getX(), point->getY());
            }
            break;
        }
        case wkbLineString:
            collect_ring(*geometry.toLineString(), points);
            break;
        case wkbPolygon: {
            const auto* polygon = geometry.toPolygon();
            if (polygon->getExteriorRing() != nullptr) {
                collect_ring(*polygon->getExteriorRing(), points);
            }
            for (int i = 0; i < polygon->getNumInteriorRings(); ++i) {
                collect_ring(*polygon->getInteriorRing(i), points);
            }
            break;
        }
        case wkbMultiPoint:
        case wkbMultiLineString:
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            const auto* collection = geometry.toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                collect_vertices(*collection->getGeometryRef(i), points);
            }
            break;
        }
        default:
            break;
    }
}

} // anonymous namespace

std::vector<OGRGeometryUniquePtr> polygon_parts(const OGRGeometry& geometry) {
    std::vector<OGRGeometryUniquePtr> parts;
    collect_parts(geometry, parts);
    return parts;
}

std::vector<Point2D> vertices(const OGRGeometry& geometry) {
    std::vector<Point2D> points;
    collect_vertices(geometry, points);
    return points;
}

std::vector<Point2D> unique_vertices(const OGRGeometry& geometry) {
    std::vector<Point2D> unique;
    std::set<std::pair<double, double>> seen;
    for (const auto& point : vertices(geometry)) {
        if (seen.insert({point.x(), point.y()}).second) {
            unique.push_back(point);
        }
    }
    return unique;
}

bool contains(const OGRGeometry& geometry, const Point2D& point) {
    OGRPoint ogr_point(point.x(), point.y());
    return geometry.Contains(&ogr_point);
}

bool intersects(const OGRGeometry& geometry, const Point2D& point) {
    OGRPoint ogr_point(point.x(), point.y());
    return geometry.Intersects(&ogr_point);
}

int contact_dimension(const OGRGeometry& a, const OGRGeometry& b) {
    if (!a.Intersects(&b)) {
        return -1;
    }
    auto shared = intersection(a, b);
    if (is_empty(shared.get())) {
        return -1;
    }
    return shared->getDimension();
}

} // namespace geometry
} // namespace tess
