#pragma once

/**
 * @file PointSampler.hpp
 * @brief Seed point generation for the tessellation
 */

#include "tessellation.hpp"
#include "Logger.hpp"
#include <vector>

namespace tess {

class RasterSource;

/**
 * @brief Point sampling parameters
 */
struct SamplingOptions {
    PointMethod method = PointMethod::RASTER_WEIGHTED;
    double min_distance = 35.0;
    BorderInclusion border = BorderInclusion::NONE;
    std::uint64_t seed = 42;
};

/**
 * @brief Produces seed points inside a region
 *
 * Candidates are generated by the configured method, thinned greedily by
 * minimum distance in candidate order, and optionally extended with the
 * region's own vertices. An empty result falls back to the region centroid.
 */
class PointSampler {
public:
    explicit PointSampler(const SamplingOptions& options);

    /**
     * @brief Sample points for one region
     * @param region Polygon or multi-polygon being tessellated
     * @param raster Weight raster, required for RASTER_WEIGHTED
     * @throws ConfigurationError when RASTER_WEIGHTED has no raster
     */
    std::vector<Point2D> sample(const OGRGeometry& region, const RasterSource* raster = nullptr) const;

    /**
     * @brief Greedy minimum-distance thinning
     *
     * Walks candidates in order; every kept candidate rejects the later
     * candidates closer than min_distance. Candidates with a false mask entry
     * are never kept.
     */
    static std::vector<Point2D> distance_filter(const std::vector<Point2D>& candidates,
                                                double min_distance,
                                                std::vector<bool> mask);

    /// Seeded uniform points over a box, before any filtering
    std::vector<Point2D> random_candidates(const BoundingBox& box) const;

    static size_t random_point_count(const BoundingBox& box, double min_distance);

    /// Pixel centres inside the region with valid values, highest value first
    std::vector<Point2D> raster_candidates(const OGRGeometry& region, const RasterSource& raster) const;

    const SamplingOptions& options() const { return options_; }

private:
    SamplingOptions options_;
    Logger logger_;
};

} // namespace tess
