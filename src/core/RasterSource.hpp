#pragma once

/**
 * @file RasterSource.hpp
 * @brief Pixel-read interface over single-band rasters
 */

#include "tessellation.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class GDALDataset;

namespace tess {

/**
 * @brief Pixel values of a window together with the metadata to interpret them
 */
struct RasterWindow {
    PixelWindow window;
    std::vector<double> values;        ///< Row-major, window.width * window.height
    std::optional<double> nodata;
    GeoTransform transform;            ///< Transform of the window's top-left pixel
};

/**
 * @brief Single-band raster read through boundless pixel windows
 *
 * Pixels outside the raster extent read as nodata (NaN when the band has
 * no nodata value).
 */
class RasterSource {
public:
    virtual ~RasterSource() = default;

    virtual const GeoTransform& geotransform() const = 0;
    virtual std::optional<double> nodata() const = 0;
    virtual long width() const = 0;
    virtual long height() const = 0;

    /// Name used in diagnostics (path for file rasters)
    virtual std::string identity() const = 0;

    /**
     * @brief Read pixel values of a window, row-major
     * @throws std::runtime_error when the underlying read fails
     */
    virtual std::vector<double> read(const PixelWindow& window) const = 0;

    /// Smallest pixel window covering a map-space bounding box
    PixelWindow window_for(const BoundingBox& bbox) const;

    /// Pixel-centre coordinates of a window, row-major
    std::vector<Point2D> sample_points(const PixelWindow& window) const;

    RasterWindow read_window(const BoundingBox& bbox) const;

    /// Value used for pixels outside the raster extent
    double fill_value() const;

    /// False for NaN and for the nodata value
    bool is_valid(double value) const;
};

/**
 * @brief In-memory raster grid
 */
class GridRasterSource : public RasterSource {
public:
    GridRasterSource(long width, long height, const GeoTransform& transform,
                     std::vector<double> values, std::optional<double> nodata = std::nullopt,
                     std::string name = "grid");

    const GeoTransform& geotransform() const override { return transform_; }
    std::optional<double> nodata() const override { return nodata_; }
    long width() const override { return width_; }
    long height() const override { return height_; }
    std::string identity() const override { return name_; }

    std::vector<double> read(const PixelWindow& window) const override;

    double at(long row, long col) const;

private:
    long width_;
    long height_;
    GeoTransform transform_;
    std::vector<double> values_;
    std::optional<double> nodata_;
    std::string name_;
};

/**
 * @brief Band 1 of a GDAL raster dataset, opened read-only
 */
class GdalRasterSource : public RasterSource {
public:
    ~GdalRasterSource() override;

    /**
     * @brief Open a raster file
     * @return nullptr (with an error logged) when the file cannot be opened
     */
    static std::shared_ptr<GdalRasterSource> open(const std::string& path);

    const GeoTransform& geotransform() const override { return transform_; }
    std::optional<double> nodata() const override { return nodata_; }
    long width() const override { return width_; }
    long height() const override { return height_; }
    std::string identity() const override { return path_; }

    std::vector<double> read(const PixelWindow& window) const override;

private:
    struct DatasetDeleter {
        void operator()(GDALDataset* dataset) const;
    };

    GdalRasterSource() = default;

    std::unique_ptr<GDALDataset, DatasetDeleter> dataset_;
    std::string path_;
    GeoTransform transform_;
    std::optional<double> nodata_;
    long width_ = 0;
    long height_ = 0;
};

} // namespace tess
