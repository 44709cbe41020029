/**
 * @file RasterSource.cpp
 * @brief Boundless pixel windows over in-memory grids and GDAL datasets
 */

#include "RasterSource.hpp"
#include "Logger.hpp"
#include <gdal_priv.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tess {

// ============================================================================
// RasterSource
// ============================================================================

PixelWindow RasterSource::window_for(const BoundingBox& bbox) const {
    double forward[6];
    double inverse[6];
    std::copy(geotransform().c.begin(), geotransform().c.end(), forward);
    if (!GDALInvGeoTransform(forward, inverse)) {
        throw std::runtime_error("Non-invertible geotransform for raster " + identity());
    }

    double min_col = std::numeric_limits<double>::max();
    double min_row = std::numeric_limits<double>::max();
    double max_col = std::numeric_limits<double>::lowest();
    double max_row = std::numeric_limits<double>::lowest();

    const double corners[4][2] = {
        {bbox.min_x, bbox.min_y}, {bbox.max_x, bbox.min_y},
        {bbox.max_x, bbox.max_y}, {bbox.min_x, bbox.max_y}
    };
    for (const auto& corner : corners) {
        double col = inverse[0] + corner[0] * inverse[1] + corner[1] * inverse[2];
        double row = inverse[3] + corner[0] * inverse[4] + corner[1] * inverse[5];
        min_col = std::min(min_col, col);
        max_col = std::max(max_col, col);
        min_row = std::min(min_row, row);
        max_row = std::max(max_row, row);
    }

    PixelWindow window;
    window.col_off = static_cast<long>(std::floor(min_col));
    window.row_off = static_cast<long>(std::floor(min_row));
    window.width = std::max(1L, static_cast<long>(std::ceil(max_col)) - window.col_off);
    window.height = std::max(1L, static_cast<long>(std::ceil(max_row)) - window.row_off);
    return window;
}

std::vector<Point2D> RasterSource::sample_points(const PixelWindow& window) const {
    std::vector<Point2D> points;
    points.reserve(window.pixel_count());
    const auto& transform = geotransform();
    for (long row = 0; row < window.height; ++row) {
        for (long col = 0; col < window.width; ++col) {
            points.push_back(transform.pixel_center(window.row_off + row, window.col_off + col));
        }
    }
    return points;
}

RasterWindow RasterSource::read_window(const BoundingBox& bbox) const {
    RasterWindow result;
    result.window = window_for(bbox);
    result.values = read(result.window);
    result.nodata = nodata();

    const auto& c = geotransform().c;
    result.transform = GeoTransform({
        c[0] + result.window.col_off * c[1] + result.window.row_off * c[2], c[1], c[2],
        c[3] + result.window.col_off * c[4] + result.window.row_off * c[5], c[4], c[5]
    });
    return result;
}

double RasterSource::fill_value() const {
    auto value = nodata();
    return value ? *value : std::numeric_limits<double>::quiet_NaN();
}

bool RasterSource::is_valid(double value) const {
    if (std::isnan(value)) {
        return false;
    }
    auto value_nodata = nodata();
    return !(value_nodata && value == *value_nodata);
}

// ============================================================================
// GridRasterSource
// ============================================================================

GridRasterSource::GridRasterSource(long width, long height, const GeoTransform& transform,
                                   std::vector<double> values, std::optional<double> nodata,
                                   std::string name)
    : width_(width), height_(height), transform_(transform),
      values_(std::move(values)), nodata_(nodata), name_(std::move(name)) {
    if (width_ < 0 || height_ < 0 ||
        values_.size() != static_cast<size_t>(width_) * static_cast<size_t>(height_)) {
        throw std::invalid_argument("Grid raster '" + name_ + "' has " + std::to_string(values_.size()) +
                                    " values for " + std::to_string(width_) + "x" + std::to_string(height_) + " pixels");
    }
}

double GridRasterSource::at(long row, long col) const {
    if (row < 0 || col < 0 || row >= height_ || col >= width_) {
        return fill_value();
    }
    return values_[static_cast<size_t>(row) * static_cast<size_t>(width_) + static_cast<size_t>(col)];
}

std::vector<double> GridRasterSource::read(const PixelWindow& window) const {
    std::vector<double> out;
    out.reserve(window.pixel_count());
    for (long row = 0; row < window.height; ++row) {
        for (long col = 0; col < window.width; ++col) {
            out.push_back(at(window.row_off + row, window.col_off + col));
        }
    }
    return out;
}

// ============================================================================
// GdalRasterSource
// ============================================================================

void GdalRasterSource::DatasetDeleter::operator()(GDALDataset* dataset) const {
    if (dataset) {
        GDALClose(dataset);
    }
}

GdalRasterSource::~GdalRasterSource() = default;

std::shared_ptr<GdalRasterSource> GdalRasterSource::open(const std::string& path) {
    Logger logger("RasterSource");
    GDALAllRegister();

    std::shared_ptr<GdalRasterSource> source(new GdalRasterSource());
    source->dataset_.reset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!source->dataset_) {
        logger.error("Failed to open raster: " + path);
        return nullptr;
    }
    if (source->dataset_->GetRasterCount() < 1) {
        logger.error("Raster has no bands: " + path);
        return nullptr;
    }

    double transform[6];
    if (source->dataset_->GetGeoTransform(transform) != CE_None) {
        logger.warning("Raster has no geotransform, using pixel coordinates: " + path);
    } else {
        std::copy(transform, transform + 6, source->transform_.c.begin());
    }

    GDALRasterBand* band = source->dataset_->GetRasterBand(1);
    int has_nodata = 0;
    double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        source->nodata_ = nodata;
    }

    source->path_ = path;
    source->width_ = source->dataset_->GetRasterXSize();
    source->height_ = source->dataset_->GetRasterYSize();

    logger.debug("Opened raster " + path + " (" + std::to_string(source->width_) + "x" +
                 std::to_string(source->height_) + (has_nodata ? ", nodata " + std::to_string(nodata) : "") + ")");
    return source;
}

std::vector<double> GdalRasterSource::read(const PixelWindow& window) const {
    std::vector<double> out(window.pixel_count(), fill_value());

    long x0 = std::max(0L, window.col_off);
    long y0 = std::max(0L, window.row_off);
    long x1 = std::min(width_, window.col_off + window.width);
    long y1 = std::min(height_, window.row_off + window.height);
    if (x1 <= x0 || y1 <= y0) {
        return out;
    }

    long read_width = x1 - x0;
    long read_height = y1 - y0;
    std::vector<double> buffer(static_cast<size_t>(read_width) * static_cast<size_t>(read_height));

    GDALRasterBand* band = dataset_->GetRasterBand(1);
    CPLErr err = band->RasterIO(GF_Read, static_cast<int>(x0), static_cast<int>(y0),
                                static_cast<int>(read_width), static_cast<int>(read_height),
                                buffer.data(), static_cast<int>(read_width), static_cast<int>(read_height),
                                GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw std::runtime_error("RasterIO failed for " + path_ + ": " + CPLGetLastErrorMsg());
    }

    for (long row = 0; row < read_height; ++row) {
        long out_row = y0 - window.row_off + row;
        long out_col = x0 - window.col_off;
        std::copy(buffer.begin() + row * read_width,
                  buffer.begin() + (row + 1) * read_width,
                  out.begin() + out_row * window.width + out_col);
    }
    return out;
}

} // namespace tess
