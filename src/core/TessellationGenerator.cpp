/**
 * @file TessellationGenerator.cpp
 * @brief Pipeline orchestration: load, tessellate, statistics, chops, export
 */

#include "tessellation.hpp"
#include "AdjacencyGraph.hpp"
#include "CellBuilder.hpp"
#include "ChopPartitioner.hpp"
#include "GeometryUtils.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "PointSampler.hpp"
#include "RasterSource.hpp"
#include "VectorSource.hpp"
#include "ZonalStatistics.hpp"
#include "../export/CellExporter.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>

namespace tess {

namespace {

using Clock = std::chrono::high_resolution_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

/**
 * One polygon part to tessellate, with the split feature it came from
 */
struct Region {
    OGRGeometryUniquePtr geometry;
    std::optional<size_t> split_index;
    std::vector<std::string> attributes;
    double parent_area = 0.0;
};

} // anonymous namespace

// ============================================================================
// TessellationGenerator::Impl - Private implementation
// ============================================================================

class TessellationGenerator::Impl {
public:
    explicit Impl(const TessellationConfig& config)
        : config_(config),
          logger_("TessellationGenerator") {
    }

    bool generate() {
        auto start_time = Clock::now();
        metrics_ = {};

        InputValidator validator;
        ValidationResult validation = validator.validate(config_, validation_context());
        if (validation.has_errors()) {
            logger_.error(validation.format_error_message());
            return false;
        }

        if (!config_.force && std::filesystem::exists(config_.output_path)) {
            logger_.info("Output " + config_.output_path + " exists, skipping (use --force to regenerate)");
            return true;
        }

        logger_.info("Tessellating '" + config_.name + "' to " + config_.output_path);

        if (!load_inputs() || !tessellate() || !compute_statistics() || !compute_chops() || !export_results()) {
            return false;
        }

        metrics_.total_time = elapsed_since(start_time);
        logger_.info("Completed in " + std::to_string(metrics_.total_time.count()) + "ms: " +
                     std::to_string(metrics_.cells_generated) + " cells, " +
                     std::to_string(metrics_.points_generated) + " points, " +
                     std::to_string(metrics_.regions_processed) + " regions (" +
                     std::to_string(metrics_.regions_skipped) + " skipped), " +
                     std::to_string(metrics_.split_groups) + " split groups");
        logger_.detailed("Stage times: load " + std::to_string(metrics_.loading_time.count()) +
                         "ms, tessellate " + std::to_string(metrics_.tessellation_time.count()) +
                         "ms, statistics " + std::to_string(metrics_.statistics_time.count()) +
                         "ms, chops " + std::to_string(metrics_.chop_time.count()) +
                         "ms, export " + std::to_string(metrics_.export_time.count()) + "ms");
        return true;
    }

    bool load_inputs() {
        auto start_time = Clock::now();

        try {
            if (!region_) {
                if (config_.region_wkt) {
                    region_ = geometry::from_wkt(*config_.region_wkt);
                } else {
                    region_ = geometry::make_box(config_.bbox.value_or(BoundingBox(0.0, 0.0, 1.0, 1.0)));
                }
            }

            if (!config_.remove_before.empty()) {
                OGRGeometryUniquePtr removal;
                if (!vector_source_.read_union(config_.remove_before, config_.bbox, removal)) {
                    return false;
                }
                if (removal) {
                    auto repaired = geometry::repair(*region_);
                    if (!repaired) {
                        throw GeometryError("cannot repair region");
                    }
                    region_ = geometry::difference(*repaired, *removal);
                    if (!region_) {
                        throw GeometryError("cannot subtract exclusion layers from region");
                    }
                    logger_.detailed("Region area after exclusions: " + format_number(geometry::area(*region_)));
                }
            }

            if (!config_.remove_after.empty() && !remove_after_ &&
                !vector_source_.read_union(config_.remove_after, config_.bbox, remove_after_)) {
                return false;
            }
        } catch (const GeometryError& e) {
            logger_.error(e.what());
            return false;
        }

        if (config_.split_source && split_features_.empty()) {
            if (!vector_source_.read(*config_.split_source, config_.bbox, config_.split_filter,
                                     config_.split_fields, split_features_)) {
                return false;
            }
            has_split_source_ = true;
            logger_.info("Loaded " + std::to_string(split_features_.size()) + " split polygons");
        }

        for (const auto& layer : config_.rasters) {
            if (find_raster(layer.name) != nullptr) {
                continue;
            }
            auto source = GdalRasterSource::open(layer.path);
            if (!source) {
                return false;
            }
            rasters_.push_back({layer.name, source});
        }

        if (config_.point_method == PointMethod::RASTER_WEIGHTED && !point_raster_) {
            point_raster_ = GdalRasterSource::open(config_.point_raster_path);
            if (!point_raster_) {
                return false;
            }
        }

        metrics_.loading_time = elapsed_since(start_time);
        logger_.detailed("Inputs loaded in " + std::to_string(metrics_.loading_time.count()) + "ms (" +
                         std::to_string(rasters_.size()) + " rasters)");
        return true;
    }

    bool tessellate() {
        auto start_time = Clock::now();
        if (!region_) {
            logger_.error("No region loaded");
            return false;
        }

        cells_.clear();
        points_.clear();

        std::vector<Region> regions;
        try {
            regions = split_regions();
        } catch (const GeometryError& e) {
            logger_.error(e.what());
            return false;
        }

        PointSampler sampler(SamplingOptions{config_.point_method, config_.min_distance,
                                             config_.border_inclusion, config_.seed});
        CellBuilder builder(CellOptions{config_.polygon_method, config_.min_area});

        std::vector<size_t> key_positions;
        for (const auto& field : config_.priority_split_key) {
            auto it = std::find(config_.split_fields.begin(), config_.split_fields.end(), field);
            key_positions.push_back(static_cast<size_t>(it - config_.split_fields.begin()));
        }

        logger_.info("Tessellating " + std::to_string(regions.size()) + " regions (" +
                     to_string(config_.point_method) + " points, " + to_string(config_.polygon_method) + " cells)");

        for (size_t r = 0; r < regions.size(); ++r) {
            Region& region = regions[r];

            if (config_.simplify_tolerance > 0.0) {
                auto simplified = geometry::simplify(*region.geometry, config_.simplify_tolerance);
                if (simplified && !simplified->IsEmpty()) {
                    region.geometry = std::move(simplified);
                }
            }

            double region_area = geometry::area(*region.geometry);
            if (region_area < config_.min_area) {
                logger_.debug("Region " + std::to_string(r) + " below minimum area (" + format_number(region_area) + ")");
                ++metrics_.regions_skipped;
                continue;
            }

            std::vector<Point2D> points;
            try {
                points = sampler.sample(*region.geometry, point_raster_.get());
            } catch (const std::runtime_error& e) {
                logger_.error("Point sampling failed for region " + std::to_string(r) + ": " + e.what());
                return false;
            }

            std::vector<OGRGeometryUniquePtr> parts;
            try {
                parts = builder.build(points, *region.geometry, remove_after_.get());
            } catch (const GeometryError& e) {
                logger_.warning(std::string(e.what()) + " during " + to_string(config_.polygon_method) +
                                " tessellation of " + std::to_string(points.size()) + " points, skipping region " +
                                std::to_string(r));
                ++metrics_.regions_skipped;
                continue;
            }

            SplitKey key;
            for (size_t position : key_positions) {
                key.push_back(position < region.attributes.size() ? region.attributes[position] : "");
            }

            const double percent_area = 0.01 * region.parent_area;
            for (auto& part : parts) {
                Cell cell;
                cell.bounds = geometry::envelope(*part);
                cell.area_fraction = percent_area > 0.0 ? geometry::area(*part) / percent_area : std::nan("");
                cell.geometry = std::move(part);
                cell.split_index = region.split_index;
                cell.attributes = region.attributes;
                cell.split_key = key;
                cells_.push_back(std::move(cell));
            }

            logger_.detailed("Region " + std::to_string(r + 1) + "/" + std::to_string(regions.size()) + ": " +
                             std::to_string(points.size()) + " points, " + std::to_string(parts.size()) + " cells");
            points_.insert(points_.end(), points.begin(), points.end());
            ++metrics_.regions_processed;
        }

        metrics_.points_generated = points_.size();
        metrics_.cells_generated = cells_.size();
        metrics_.tessellation_time = elapsed_since(start_time);
        logger_.info("Generated " + std::to_string(cells_.size()) + " cells from " +
                     std::to_string(points_.size()) + " points");
        return true;
    }

    bool compute_statistics() {
        auto start_time = Clock::now();

        table_ = AttributeTable(cells_.size());
        size_t area_column = table_.add_column("split_area_percentile");
        std::vector<const OGRGeometry*> geometries;
        for (size_t i = 0; i < cells_.size(); ++i) {
            table_.set(area_column, i, cells_[i].area_fraction);
            geometries.push_back(cells_[i].geometry.get());
        }

        ZonalStatsRequest request;
        request.statistics = config_.statistics;
        request.percentiles = config_.percentiles;
        request.formulas = config_.formulas;
        request.value_percentiles = config_.value_percentiles;

        try {
            ZonalStatsEngine engine(request);
            engine.compute(geometries, rasters_, table_);
        } catch (const std::runtime_error& e) {
            logger_.error(std::string("Statistics failed: ") + e.what());
            return false;
        }

        metrics_.statistics_time = elapsed_since(start_time);
        logger_.info("Computed " + std::to_string(table_.column_count()) + " attribute columns for " +
                     std::to_string(rasters_.size()) + " rasters");
        return true;
    }

    bool compute_chops() {
        auto start_time = Clock::now();

        auto column = table_.column_index(config_.priority_optimize_field);
        if (!column) {
            logger_.error("Priority optimize field '" + config_.priority_optimize_field + "' is not a column");
            return false;
        }

        std::vector<ChopCell> chop_cells;
        chop_cells.reserve(cells_.size());
        std::set<SplitKey> keys;
        for (size_t i = 0; i < cells_.size(); ++i) {
            ChopCell cell;
            cell.value = table_.get(*column, i);
            cell.area = cells_[i].area_fraction;
            cell.geometry = cells_[i].geometry.get();
            cell.split_key = cells_[i].split_key;
            keys.insert(cell.split_key);
            chop_cells.push_back(std::move(cell));
        }
        metrics_.split_groups = keys.size();

        ChopOptions options;
        options.divisions = config_.area_divisions;
        options.neighbor_corners = config_.neighbor_corners;
        options.max_cluster_size = config_.max_cluster_size;
        options.max_candidates = config_.max_candidates;
        options.parallel = config_.parallel_processing;

        ChopPartitioner partitioner(options);
        chops_ = partitioner.partition(chop_cells);

        if (logger_.shouldOutput(LogLevel::DETAILED)) {
            auto conflicts = partitioner.verify_assignment(chop_cells, chops_);
            logger_.detailed("Adjacency check: " + std::to_string(conflicts.size()) + " same-tranche neighbours");
        }

        metrics_.chop_time = elapsed_since(start_time);
        return true;
    }

    bool export_results() {
        auto start_time = Clock::now();

        CellExporter::Options options;
        options.driver_name = config_.output_driver;
        options.layer_name = config_.output_layer;
        options.epsg = config_.epsg;
        options.split_fields = config_.split_fields;

        CellExporter exporter(options);
        bool success = exporter.export_cells(config_.output_path, cells_, table_, chops_, points_);

        metrics_.export_time = elapsed_since(start_time);
        return success;
    }

    void set_region(OGRGeometryUniquePtr region) {
        region_ = std::move(region);
    }

    void add_split_region(OGRGeometryUniquePtr geometry, const std::vector<std::string>& attributes) {
        split_features_.push_back({std::move(geometry), attributes});
        has_split_source_ = true;
    }

    void add_raster(const std::string& name, std::shared_ptr<RasterSource> source) {
        for (auto& raster : rasters_) {
            if (raster.name == name) {
                raster.source = std::move(source);
                return;
            }
        }
        rasters_.push_back({name, std::move(source)});
    }

    void set_point_raster(std::shared_ptr<RasterSource> source) {
        point_raster_ = std::move(source);
    }

    const std::vector<Cell>& get_cells() const { return cells_; }
    const std::vector<Point2D>& get_points() const { return points_; }
    const AttributeTable& get_attributes() const { return table_; }
    const ChopResult& get_chops() const { return chops_; }
    const TessellationMetrics& get_metrics() const { return metrics_; }
    const TessellationConfig& get_config() const { return config_; }

private:
    TessellationConfig config_;
    Logger logger_;
    TessellationMetrics metrics_;
    VectorSource vector_source_;

    OGRGeometryUniquePtr region_;
    OGRGeometryUniquePtr remove_after_;
    std::vector<VectorFeature> split_features_;
    bool has_split_source_ = false;
    std::vector<NamedRaster> rasters_;
    std::shared_ptr<RasterSource> point_raster_;

    std::vector<Cell> cells_;
    std::vector<Point2D> points_;
    AttributeTable table_;
    ChopResult chops_;

    ValidationContext validation_context() const {
        ValidationContext context;
        for (const auto& raster : rasters_) {
            context.memory_rasters.push_back(raster.name);
        }
        context.has_point_raster = point_raster_ != nullptr;
        context.has_split_regions = !split_features_.empty();
        return context;
    }

    const RasterSource* find_raster(const std::string& name) const {
        for (const auto& raster : rasters_) {
            if (raster.name == name) {
                return raster.source.get();
            }
        }
        return nullptr;
    }

    /**
     * Single polygons of the region, or of its intersection with every split
     * polygon. Area fractions are measured against the whole split polygon.
     */
    std::vector<Region> split_regions() const {
        std::vector<Region> regions;

        if (!has_split_source_) {
            auto repaired = geometry::repair(*region_);
            if (!repaired) {
                throw GeometryError("cannot repair region");
            }
            double parent_area = geometry::area(*region_);
            for (auto& part : geometry::polygon_parts(*repaired)) {
                Region region;
                region.geometry = std::move(part);
                region.parent_area = parent_area;
                regions.push_back(std::move(region));
            }
            return regions;
        }

        for (size_t index = 0; index < split_features_.size(); ++index) {
            const auto& feature = split_features_[index];
            auto clipped = geometry::intersection(*region_, *feature.geometry);
            if (!clipped) {
                logger_.warning("Cannot intersect split polygon " + std::to_string(index) + " with the region, skipping");
                continue;
            }
            auto repaired = geometry::repair(*clipped);
            if (!repaired) {
                logger_.warning("Cannot repair split polygon " + std::to_string(index) + ", skipping");
                continue;
            }

            double parent_area = geometry::area(*feature.geometry);
            for (auto& part : geometry::polygon_parts(*repaired)) {
                Region region;
                region.geometry = std::move(part);
                region.split_index = index;
                region.attributes = feature.fields;
                region.parent_area = parent_area;
                regions.push_back(std::move(region));
            }
        }
        return regions;
    }
};

// ============================================================================
// TessellationGenerator - Public interface
// ============================================================================

TessellationGenerator::TessellationGenerator(const TessellationConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

TessellationGenerator::~TessellationGenerator() = default;

bool TessellationGenerator::generate() { return impl_->generate(); }
bool TessellationGenerator::load_inputs() { return impl_->load_inputs(); }
bool TessellationGenerator::tessellate() { return impl_->tessellate(); }
bool TessellationGenerator::compute_statistics() { return impl_->compute_statistics(); }
bool TessellationGenerator::compute_chops() { return impl_->compute_chops(); }
bool TessellationGenerator::export_results() { return impl_->export_results(); }

void TessellationGenerator::set_region(OGRGeometryUniquePtr region) { impl_->set_region(std::move(region)); }

void TessellationGenerator::add_split_region(OGRGeometryUniquePtr geometry, const std::vector<std::string>& attributes) {
    impl_->add_split_region(std::move(geometry), attributes);
}

void TessellationGenerator::add_raster(const std::string& name, std::shared_ptr<RasterSource> source) {
    impl_->add_raster(name, std::move(source));
}

void TessellationGenerator::set_point_raster(std::shared_ptr<RasterSource> source) {
    impl_->set_point_raster(std::move(source));
}

const std::vector<Cell>& TessellationGenerator::get_cells() const { return impl_->get_cells(); }
const std::vector<Point2D>& TessellationGenerator::get_points() const { return impl_->get_points(); }
const AttributeTable& TessellationGenerator::get_attributes() const { return impl_->get_attributes(); }
const ChopResult& TessellationGenerator::get_chops() const { return impl_->get_chops(); }
const TessellationMetrics& TessellationGenerator::get_metrics() const { return impl_->get_metrics(); }
const TessellationConfig& TessellationGenerator::get_config() const { return impl_->get_config(); }

} // namespace tess
