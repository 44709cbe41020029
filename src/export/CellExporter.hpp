/**
 * @file CellExporter.hpp
 * @brief OGR vector export of tessellation cells and sample points
 *
 * Writes one dataset with two layers: "<layer>_cells" carrying the polygon
 * geometry, split fields, every numeric attribute column and the chop
 * numbers, and "<layer>_points" carrying the sample points.
 */

#pragma once

#include "tessellation.hpp"
#include "../core/Logger.hpp"
#include <string>
#include <vector>

class GDALDataset;

namespace tess {

/**
 * @brief Exports cells and points through any OGR vector driver
 */
class CellExporter {
public:
    struct Options {
        std::string driver_name;                ///< OGR driver, e.g. "GPKG"
        std::string layer_name;                 ///< Prefix of both layer names
        int epsg;
        std::vector<std::string> split_fields;  ///< Names of Cell::attributes
        bool overwrite;                         ///< Delete an existing dataset first

        Options()
            : driver_name("GPKG"),
              layer_name("tessellation"),
              epsg(3059),
              overwrite(true) {}
    };

    CellExporter();
    explicit CellExporter(const Options& options);

    /**
     * @brief Write cells and points to a new dataset
     * @param filename Output dataset path
     * @return true if both layers were written
     */
    bool export_cells(const std::string& filename,
                      const std::vector<Cell>& cells,
                      const AttributeTable& table,
                      const ChopResult& chops,
                      const std::vector<Point2D>& points);

    const Options& get_options() const { return options_; }

private:
    Options options_;
    Logger logger_;

    bool write_cells_layer(GDALDataset* dataset,
                           const std::vector<Cell>& cells,
                           const AttributeTable& table,
                           const ChopResult& chops);

    bool write_points_layer(GDALDataset* dataset, const std::vector<Point2D>& points);
};

} // namespace tess
