#pragma once

/**
 * @file ZonalStatistics.hpp
 * @brief Per-cell raster statistics
 */

#include "tessellation.hpp"
#include "Logger.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tess {

class RasterSource;

/**
 * @brief Raster layer with the name used as column prefix
 */
struct NamedRaster {
    std::string name;
    std::shared_ptr<RasterSource> source;
};

/**
 * @brief Outputs requested per raster layer
 */
struct ZonalStatsRequest {
    std::vector<Statistic> statistics;
    std::vector<double> percentiles;
    std::vector<CustomFormula> formulas;
    std::map<std::string, std::vector<double>> value_percentiles;  ///< Per layer name
};

/**
 * @brief Footprint of one cell on one pixel grid
 */
struct CellFootprint {
    PixelWindow window;
    std::vector<bool> mask;  ///< Pixel centres intersecting the cell, row-major
};

/**
 * @brief Footprints keyed by (cell index, geotransform), owned by one compute() call
 */
class FootprintCache {
public:
    const CellFootprint* find(size_t cell, const GeoTransform& transform) const;
    const CellFootprint& insert(size_t cell, const GeoTransform& transform, CellFootprint footprint);

    size_t size() const { return entries_.size(); }
    size_t hits() const { return hits_; }

private:
    std::map<std::pair<size_t, GeoTransform>, CellFootprint> entries_;
    mutable size_t hits_ = 0;
};

/**
 * @brief Computes statistics, percentiles, formulas and value occupancy per cell
 *
 * Column layout per layer: statistics, percentiles, formulas sorted by name,
 * value occupancies ascending. Cells with an empty geometry or without valid
 * pixels get NaN in every column of that layer.
 */
class ZonalStatsEngine {
public:
    explicit ZonalStatsEngine(const ZonalStatsRequest& request);

    /// Column names produced for one layer, in output order
    std::vector<std::string> column_names(const std::string& layer) const;

    /**
     * @brief Fill the columns of every layer into the table
     *
     * The table is resized to the cell count; columns are added before any
     * cell is processed.
     *
     * @return Number of footprints computed (cache misses)
     */
    size_t compute(const std::vector<const OGRGeometry*>& cells,
                   const std::vector<NamedRaster>& rasters,
                   AttributeTable& table) const;

    /**
     * @brief Values of one cell/layer pair in column order
     * @param values Pixel values of the footprint window
     * @param footprint Window and mask of the cell
     */
    std::vector<double> summarize(const std::string& layer,
                                  const std::vector<double>& values,
                                  const CellFootprint& footprint,
                                  const RasterSource& raster) const;

    /// Linear interpolation between closest ranks; values must be sorted
    static double percentile(const std::vector<double>& sorted, double rank);

    /// Pixel-centre footprint of a geometry on the raster's grid
    static CellFootprint footprint(const OGRGeometry& cell, const RasterSource& raster);

private:
    ZonalStatsRequest request_;
    std::vector<CustomFormula> sorted_formulas_;
    Logger logger_;

    std::vector<double> value_list(const std::string& layer) const;
};

} // namespace tess
