/**
 * @file ZonalStatistics.cpp
 * @brief Zonal statistics over pixel-centre cell footprints
 */

#include "ZonalStatistics.hpp"
#include "GeometryUtils.hpp"
#include "RasterSource.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>

namespace tess {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

} // anonymous namespace

// ============================================================================
// FootprintCache
// ============================================================================

const CellFootprint* FootprintCache::find(size_t cell, const GeoTransform& transform) const {
    auto it = entries_.find(std::make_pair(cell, transform));
    if (it == entries_.end()) {
        return nullptr;
    }
    ++hits_;
    return &it->second;
}

const CellFootprint& FootprintCache::insert(size_t cell, const GeoTransform& transform, CellFootprint footprint) {
    auto result = entries_.insert_or_assign(std::make_pair(cell, transform), std::move(footprint));
    return result.first->second;
}

// ============================================================================
// ZonalStatsEngine
// ============================================================================

ZonalStatsEngine::ZonalStatsEngine(const ZonalStatsRequest& request)
    : request_(request), sorted_formulas_(request.formulas), logger_("ZonalStatsEngine") {
    std::stable_sort(sorted_formulas_.begin(), sorted_formulas_.end(),
                     [](const CustomFormula& a, const CustomFormula& b) { return a.name < b.name; });
}

std::vector<double> ZonalStatsEngine::value_list(const std::string& layer) const {
    auto it = request_.value_percentiles.find(layer);
    if (it == request_.value_percentiles.end()) {
        return {};
    }
    std::vector<double> values = it->second;
    std::sort(values.begin(), values.end());
    return values;
}

std::vector<std::string> ZonalStatsEngine::column_names(const std::string& layer) const {
    std::vector<std::string> names;
    for (Statistic statistic : request_.statistics) {
        names.push_back(layer + "_" + to_string(statistic));
    }
    for (double rank : request_.percentiles) {
        names.push_back(layer + "_" + format_number(rank) + "_percentile");
    }
    for (const auto& formula : sorted_formulas_) {
        names.push_back(layer + "_" + formula.name);
    }
    for (double value : value_list(layer)) {
        names.push_back(layer + "_value_" + format_number(value) + "_percentile");
    }
    return names;
}

double ZonalStatsEngine::percentile(const std::vector<double>& sorted, double rank) {
    if (sorted.empty()) {
        return NaN;
    }
    double position = std::clamp(rank, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(position));
    size_t upper = static_cast<size_t>(std::ceil(position));
    double fraction = position - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

CellFootprint ZonalStatsEngine::footprint(const OGRGeometry& cell, const RasterSource& raster) {
    BoundingBox bounds = geometry::envelope(cell);

    CellFootprint result;
    result.window = raster.window_for(bounds.expanded(1.0));

    std::vector<Point2D> centres = raster.sample_points(result.window);
    result.mask.reserve(centres.size());
    for (const auto& centre : centres) {
        result.mask.push_back(bounds.contains(centre) && geometry::intersects(cell, centre));
    }
    return result;
}

std::vector<double> ZonalStatsEngine::summarize(const std::string& layer,
                                                const std::vector<double>& values,
                                                const CellFootprint& footprint,
                                                const RasterSource& raster) const {
    std::vector<double> valid;
    size_t footprint_count = 0;
    for (size_t i = 0; i < values.size() && i < footprint.mask.size(); ++i) {
        if (!footprint.mask[i]) {
            continue;
        }
        ++footprint_count;
        if (raster.is_valid(values[i])) {
            valid.push_back(values[i]);
        }
    }

    std::vector<double> occupancy_values = value_list(layer);
    const size_t column_count = request_.statistics.size() + request_.percentiles.size() +
                                sorted_formulas_.size() + occupancy_values.size();
    if (valid.empty()) {
        return std::vector<double>(column_count, NaN);
    }

    Eigen::Map<const Eigen::ArrayXd> data(valid.data(), static_cast<Eigen::Index>(valid.size()));
    const double count = static_cast<double>(valid.size());
    const double minimum = data.minCoeff();
    const double maximum = data.maxCoeff();
    const double mean = data.mean();
    const double variance = (data - mean).square().mean();
    const double deviation = std::sqrt(variance);

    std::vector<double> sorted = valid;
    std::sort(sorted.begin(), sorted.end());

    std::vector<double> out;
    out.reserve(column_count);

    for (Statistic statistic : request_.statistics) {
        switch (statistic) {
            case Statistic::MIN: out.push_back(minimum); break;
            case Statistic::MAX: out.push_back(maximum); break;
            case Statistic::MEAN: out.push_back(mean); break;
            case Statistic::STD: out.push_back(deviation); break;
            case Statistic::VAR: out.push_back(variance); break;
            case Statistic::SUM: out.push_back(data.sum()); break;
            case Statistic::MEDIAN: out.push_back(percentile(sorted, 50.0)); break;
            case Statistic::COUNT: out.push_back(count); break;
            case Statistic::PTP: out.push_back(maximum - minimum); break;
        }
    }

    for (double rank : request_.percentiles) {
        out.push_back(percentile(sorted, rank));
    }

    for (const auto& formula : sorted_formulas_) {
        switch (formula.reducer) {
            case Reducer::MEAN_DIV_STD: out.push_back(mean / deviation); break;
            case Reducer::STD_DIV_MEAN: out.push_back(deviation / mean); break;
            case Reducer::RANGE: out.push_back(maximum - minimum); break;
            case Reducer::VALID_COUNT: out.push_back(count); break;
            case Reducer::FOOTPRINT_COUNT: out.push_back(static_cast<double>(footprint_count)); break;
            case Reducer::VALID_FRACTION:
                out.push_back(100.0 * count / static_cast<double>(footprint_count));
                break;
            case Reducer::VALID_AREA:
                out.push_back(count * raster.geotransform().pixel_area());
                break;
        }
    }

    for (double value : occupancy_values) {
        double matches = static_cast<double>((data == value).count());
        out.push_back(100.0 * matches / count);
    }

    return out;
}

size_t ZonalStatsEngine::compute(const std::vector<const OGRGeometry*>& cells,
                                 const std::vector<NamedRaster>& rasters,
                                 AttributeTable& table) const {
    table.resize_rows(cells.size());

    std::vector<std::vector<size_t>> columns;
    for (const auto& raster : rasters) {
        std::vector<size_t> indices;
        for (const auto& name : column_names(raster.name)) {
            indices.push_back(table.add_column(name));
        }
        columns.push_back(std::move(indices));
    }

    FootprintCache cache;
    size_t computed = 0;

    for (size_t layer = 0; layer < rasters.size(); ++layer) {
        const auto& raster = rasters[layer];
        const auto& indices = columns[layer];
        const GeoTransform& transform = raster.source->geotransform();

        logger_.detailed("Computing statistics for '" + raster.name + "' over " +
                         std::to_string(cells.size()) + " cells");

        for (size_t cell = 0; cell < cells.size(); ++cell) {
            std::vector<double> row;

            if (geometry::is_empty(cells[cell])) {
                row.assign(indices.size(), NaN);
            } else {
                const CellFootprint* cached = cache.find(cell, transform);
                if (cached == nullptr) {
                    cached = &cache.insert(cell, transform, footprint(*cells[cell], *raster.source));
                    ++computed;
                }
                std::vector<double> values = raster.source->read(cached->window);
                row = summarize(raster.name, values, *cached, *raster.source);
            }

            for (size_t i = 0; i < indices.size(); ++i) {
                table.set(indices[i], cell, row[i]);
            }
        }
    }

    logger_.debug("Footprints computed: " + std::to_string(computed) + ", reused: " + std::to_string(cache.hits()));
    return computed;
}

} // namespace tess
