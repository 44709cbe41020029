#pragma once

/**
 * @file tessellation.hpp
 * @brief Main header for the tessellation and priority-chop generator
 *
 * Partitions a region into small polygonal cells, attaches zonal raster
 * statistics to every cell and assigns cells to area-bounded, mutually
 * non-adjacent allocation tranches ("chops").
 */

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <ogr_geometry.h>

namespace tess {

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Thrown for unusable configuration (unknown method names etc.)
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * @brief Thrown when the geometry engine fails on an input
 */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& message)
        : std::runtime_error("Geometry error: " + message) {}
};

// ============================================================================
// Basic geometry types
// ============================================================================

/**
 * @brief 2D point with x, y coordinates
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }
};

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool contains(const Point2D& point) const {
        return point.x() >= min_x && point.x() <= max_x &&
               point.y() >= min_y && point.y() <= max_y;
    }

    BoundingBox expanded(double margin) const {
        return BoundingBox(min_x - margin, min_y - margin, max_x + margin, max_y + margin);
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

/**
 * @brief GDAL-style affine geotransform
 *
 * x = c[0] + col * c[1] + row * c[2]
 * y = c[3] + col * c[4] + row * c[5]
 */
struct GeoTransform {
    std::array<double, 6> c{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};

    GeoTransform() = default;
    explicit GeoTransform(const std::array<double, 6>& coefficients) : c(coefficients) {}

    /// Map coordinates of the centre of pixel (row, col)
    Point2D pixel_center(long row, long col) const {
        double px = col + 0.5;
        double py = row + 0.5;
        return Point2D(c[0] + px * c[1] + py * c[2], c[3] + px * c[4] + py * c[5]);
    }

    /// Area covered by a single pixel
    double pixel_area() const {
        return std::abs(c[1] * c[5] - c[2] * c[4]);
    }

    bool operator==(const GeoTransform& other) const { return c == other.c; }
    bool operator<(const GeoTransform& other) const { return c < other.c; }
};

/**
 * @brief Rectangular pixel window (may extend past the raster extent)
 */
struct PixelWindow {
    long col_off = 0;
    long row_off = 0;
    long width = 0;
    long height = 0;

    size_t pixel_count() const {
        return (width > 0 && height > 0) ? static_cast<size_t>(width) * static_cast<size_t>(height) : 0;
    }
};

/// Attribute tuple grouping cells that are chopped independently
using SplitKey = std::vector<std::string>;

// ============================================================================
// Method enumerations
// ============================================================================

/**
 * @brief Strategy used to generate tessellation seed points
 */
enum class PointMethod {
    DIRECT,          ///< Region vertices are the points
    RASTER_WEIGHTED, ///< Raster pixel centres, highest value first
    RANDOM_UNIFORM   ///< Seeded uniform points over the region bbox
};

/**
 * @brief When region border vertices join the sample points
 */
enum class BorderInclusion {
    NONE,
    BEFORE_DISTANCE_FILTER, ///< Ordinary (lowest priority) candidates
    AFTER_DISTANCE_FILTER   ///< Added verbatim, never thinned
};

/**
 * @brief Tessellation producing the raw cell faces
 */
enum class PolygonMethod {
    VORONOI,
    DELAUNAY
};

/**
 * @brief Named aggregate statistic over the valid pixels of a cell
 */
enum class Statistic {
    MIN, MAX, MEAN, STD, VAR, SUM, MEDIAN, COUNT, PTP
};

/**
 * @brief Closed set of derived scalar formulas
 */
enum class Reducer {
    MEAN_DIV_STD,
    STD_DIV_MEAN,
    RANGE,
    VALID_COUNT,
    FOOTPRINT_COUNT,
    VALID_FRACTION,
    VALID_AREA
};

PointMethod parse_point_method(const std::string& name);
BorderInclusion parse_border_inclusion(const std::string& name);
PolygonMethod parse_polygon_method(const std::string& name);
Statistic parse_statistic(const std::string& name);
Reducer parse_reducer(const std::string& name);

std::string to_string(PointMethod method);
std::string to_string(BorderInclusion inclusion);
std::string to_string(PolygonMethod method);
std::string to_string(Statistic statistic);
std::string to_string(Reducer reducer);

/// Format a number the way column names use it ("25", "0.5")
std::string format_number(double value);

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Reference to a layer inside a vector dataset
 */
struct VectorLayerRef {
    std::string path;
    std::string layer;  ///< Empty selects the first layer
};

/**
 * @brief Named raster layer used for zonal statistics
 */
struct RasterLayerRef {
    std::string name;
    std::string path;
};

/**
 * @brief Output column computed by a reducer
 */
struct CustomFormula {
    std::string name;
    Reducer reducer = Reducer::MEAN_DIV_STD;
};

/**
 * @brief Configuration for a tessellation run
 */
struct TessellationConfig {
    std::string name = "tessellation";

    // Region
    std::optional<std::string> region_wkt;
    std::optional<BoundingBox> bbox;
    std::vector<VectorLayerRef> remove_before;
    std::vector<VectorLayerRef> remove_after;

    // Split source
    std::optional<VectorLayerRef> split_source;
    std::string split_filter;                  ///< OGR attribute filter
    std::vector<std::string> split_fields;     ///< Copied onto every cell

    // Point sampling
    PointMethod point_method = PointMethod::RASTER_WEIGHTED;
    std::string point_raster_path;
    double min_distance = 35.0;
    BorderInclusion border_inclusion = BorderInclusion::NONE;
    std::uint64_t seed = 42;

    // Cell generation
    PolygonMethod polygon_method = PolygonMethod::VORONOI;
    double min_area = 1.0;
    double simplify_tolerance = 1.0;

    // Zonal statistics
    std::vector<RasterLayerRef> rasters;
    std::vector<Statistic> statistics{Statistic::MIN, Statistic::MAX, Statistic::MEAN,
                                      Statistic::STD, Statistic::VAR};
    std::vector<double> percentiles{1, 25, 50, 75, 99};
    std::vector<CustomFormula> formulas;
    std::map<std::string, std::vector<double>> value_percentiles;

    // Chop partitioning
    std::vector<std::string> priority_split_key;
    std::vector<double> area_divisions{20, 20, 20};
    std::string priority_optimize_field = "split_area_percentile";
    bool neighbor_corners = true;
    size_t max_cluster_size = 12;
    size_t max_candidates = 100000;

    // Output
    std::string output_path = "output/tessellation.gpkg";
    std::string output_layer = "tessellation";
    std::string output_driver = "GPKG";
    int epsg = 3059;
    bool force = false;

    // Processing options
    bool parallel_processing = true;

    // Logging options
    int log_level = 3;
    std::string log_config;  ///< Facility levels, e.g. "3,ChopPartitioner=6"
    std::optional<std::string> log_file;

    // Config file support
    std::optional<std::string> config_file;
};

// ============================================================================
// Cells and attribute table
// ============================================================================

/**
 * @brief One polygon of the tessellation
 */
struct Cell {
    OGRGeometryUniquePtr geometry;
    BoundingBox bounds;
    std::optional<size_t> split_index;      ///< Parent split feature
    std::vector<std::string> attributes;    ///< Values of split_fields
    SplitKey split_key;
    double area_fraction = std::nan("");    ///< Area / 1% of parent area
};

/**
 * @brief Fixed-schema numeric attribute table (column-major)
 *
 * Columns are declared before rows are filled; every column holds one value
 * per cell.
 */
class AttributeTable {
public:
    AttributeTable() = default;
    explicit AttributeTable(size_t row_count) : row_count_(row_count) {}

    /// Append a column of NaN values; returns its index
    size_t add_column(const std::string& name);

    std::optional<size_t> column_index(const std::string& name) const;

    void set(size_t column, size_t row, double value) { values_.at(column).at(row) = value; }
    double get(size_t column, size_t row) const { return values_.at(column).at(row); }

    const std::vector<double>& column(size_t index) const { return values_.at(index); }
    const std::vector<std::string>& column_names() const { return names_; }

    size_t column_count() const { return names_.size(); }
    size_t row_count() const { return row_count_; }

    void resize_rows(size_t row_count);

private:
    size_t row_count_ = 0;
    std::vector<std::string> names_;
    std::vector<std::vector<double>> values_;
};

/**
 * @brief Tranche numbers per cell, 1-based with 0 meaning overflow
 */
struct ChopResult {
    std::vector<int> initial_chop;
    std::vector<int> final_chop;
};

/**
 * @brief Timing and size metrics of a run
 */
struct TessellationMetrics {
    std::chrono::milliseconds loading_time{0};
    std::chrono::milliseconds tessellation_time{0};
    std::chrono::milliseconds statistics_time{0};
    std::chrono::milliseconds chop_time{0};
    std::chrono::milliseconds export_time{0};
    std::chrono::milliseconds total_time{0};

    size_t regions_processed = 0;
    size_t regions_skipped = 0;
    size_t points_generated = 0;
    size_t cells_generated = 0;
    size_t split_groups = 0;
};

class RasterSource;

/**
 * @brief Main interface for the tessellation pipeline
 *
 * Runs load_inputs, tessellate, compute_statistics, compute_chops and
 * export_results in order. Inputs can also be injected in memory, in which
 * case load_inputs only reads what was not provided.
 */
class TessellationGenerator {
public:
    explicit TessellationGenerator(const TessellationConfig& config);
    ~TessellationGenerator();

    // Main pipeline
    bool generate();

    // Individual pipeline stages
    bool load_inputs();
    bool tessellate();
    bool compute_statistics();
    bool compute_chops();
    bool export_results();

    // In-memory inputs
    void set_region(OGRGeometryUniquePtr region);
    void add_split_region(OGRGeometryUniquePtr geometry, const std::vector<std::string>& attributes);
    void add_raster(const std::string& name, std::shared_ptr<RasterSource> source);
    void set_point_raster(std::shared_ptr<RasterSource> source);

    // Accessors
    const std::vector<Cell>& get_cells() const;
    const std::vector<Point2D>& get_points() const;
    const AttributeTable& get_attributes() const;
    const ChopResult& get_chops() const;
    const TessellationMetrics& get_metrics() const;
    const TessellationConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tess
