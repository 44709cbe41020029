/**
 * @file PointSampler.cpp
 * @brief Direct, raster-weighted and random seed point sampling
 */

#include "PointSampler.hpp"
#include "GeometryUtils.hpp"
#include "RasterSource.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <random>
#include <set>

namespace tess {

PointSampler::PointSampler(const SamplingOptions& options)
    : options_(options), logger_("PointSampler") {
}

std::vector<Point2D> PointSampler::distance_filter(const std::vector<Point2D>& candidates,
                                                   double min_distance,
                                                   std::vector<bool> mask) {
    const Eigen::Index n = static_cast<Eigen::Index>(candidates.size());
    mask.resize(candidates.size(), true);

    Eigen::ArrayXd xs(n);
    Eigen::ArrayXd ys(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        xs(i) = candidates[i].x();
        ys(i) = candidates[i].y();
    }

    const double limit = min_distance * min_distance;
    std::vector<Point2D> kept;

    for (Eigen::Index i = 0; i < n; ++i) {
        if (!mask[i]) {
            continue;
        }
        kept.push_back(candidates[i]);

        Eigen::Index rest = n - i - 1;
        if (rest == 0) {
            break;
        }
        Eigen::ArrayXd dx = xs.tail(rest) - xs(i);
        Eigen::ArrayXd dy = ys.tail(rest) - ys(i);
        Eigen::ArrayXd squared = dx * dx + dy * dy;
        for (Eigen::Index j = 0; j < rest; ++j) {
            if (squared(j) < limit) {
                mask[i + 1 + j] = false;
            }
        }
    }

    return kept;
}

size_t PointSampler::random_point_count(const BoundingBox& box, double min_distance) {
    double count = (box.width() / min_distance + 1.0) * (box.height() / min_distance + 1.0) * 10.0;
    return static_cast<size_t>(std::ceil(count));
}

std::vector<Point2D> PointSampler::random_candidates(const BoundingBox& box) const {
    size_t count = random_point_count(box, options_.min_distance);

    std::mt19937_64 generator(options_.seed);
    std::uniform_real_distribution<double> x_dist(box.min_x, box.max_x);
    std::uniform_real_distribution<double> y_dist(box.min_y, box.max_y);

    std::vector<Point2D> points;
    points.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double x = x_dist(generator);
        double y = y_dist(generator);
        points.emplace_back(x, y);
    }
    return points;
}

std::vector<Point2D> PointSampler::raster_candidates(const OGRGeometry& region, const RasterSource& raster) const {
    BoundingBox bounds = geometry::envelope(region);
    PixelWindow window = raster.window_for(bounds.expanded(1.0));
    std::vector<double> values = raster.read(window);
    std::vector<Point2D> centres = raster.sample_points(window);

    std::vector<size_t> inside;
    for (size_t i = 0; i < centres.size(); ++i) {
        if (!raster.is_valid(values[i]) || !bounds.contains(centres[i])) {
            continue;
        }
        if (geometry::intersects(region, centres[i])) {
            inside.push_back(i);
        }
    }

    std::stable_sort(inside.begin(), inside.end(), [&values](size_t a, size_t b) {
        return values[a] > values[b];
    });

    std::vector<Point2D> candidates;
    candidates.reserve(inside.size());
    for (size_t index : inside) {
        candidates.push_back(centres[index]);
    }

    logger_.debug("Raster window " + std::to_string(window.width) + "x" + std::to_string(window.height) +
                  " yields " + std::to_string(candidates.size()) + " candidates");
    return candidates;
}

std::vector<Point2D> PointSampler::sample(const OGRGeometry& region, const RasterSource* raster) const {
    std::vector<Point2D> points;

    if (options_.method == PointMethod::DIRECT) {
        points = geometry::unique_vertices(region);
    } else {
        std::vector<Point2D> candidates;
        std::vector<bool> mask;

        if (options_.method == PointMethod::RASTER_WEIGHTED) {
            if (raster == nullptr) {
                throw ConfigurationError("raster_weighted sampling needs a point raster");
            }
            candidates = raster_candidates(region, *raster);
            mask.assign(candidates.size(), true);
        } else {
            candidates = random_candidates(geometry::envelope(region));
            mask.reserve(candidates.size());
            for (const auto& candidate : candidates) {
                mask.push_back(geometry::contains(region, candidate));
            }
        }

        if (options_.border == BorderInclusion::BEFORE_DISTANCE_FILTER) {
            for (const auto& vertex : geometry::vertices(region)) {
                candidates.push_back(vertex);
                mask.push_back(true);
            }
        }

        size_t eligible = static_cast<size_t>(std::count(mask.begin(), mask.end(), true));
        points = distance_filter(candidates, options_.min_distance, std::move(mask));
        logger_.debug("Distance filter kept " + std::to_string(points.size()) + " of " +
                      std::to_string(eligible) + " candidates");
    }

    if (points.empty()) {
        points.push_back(geometry::centroid(region));
        logger_.detailed("No sample points, using region centroid");
    }

    if (options_.border == BorderInclusion::AFTER_DISTANCE_FILTER) {
        std::set<std::pair<double, double>> seen;
        for (const auto& point : points) {
            seen.insert({point.x(), point.y()});
        }
        for (const auto& vertex : geometry::vertices(region)) {
            if (seen.insert({vertex.x(), vertex.y()}).second) {
                points.push_back(vertex);
            }
        }
    }

    return points;
}

} // namespace tess
