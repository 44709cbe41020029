/**
 * @file TessellationTypes.cpp
 * @brief Method name parsing and the attribute table
 */

#include "tessellation.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace tess {

namespace {

std::string normalize_name(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += (c == '-') ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

template<typename Enum, size_t N>
Enum lookup(const std::string& name, const std::pair<const char*, Enum> (&table)[N], const char* kind) {
    std::string key = normalize_name(name);
    for (const auto& entry : table) {
        if (key == entry.first) {
            return entry.second;
        }
    }
    throw ConfigurationError("unknown " + std::string(kind) + " '" + name + "'");
}

template<typename Enum, size_t N>
std::string reverse_lookup(Enum value, const std::pair<const char*, Enum> (&table)[N]) {
    for (const auto& entry : table) {
        if (entry.second == value) {
            return entry.first;
        }
    }
    return "unknown";
}

const std::pair<const char*, PointMethod> POINT_METHODS[] = {
    {"direct", PointMethod::DIRECT},
    {"raster_weighted", PointMethod::RASTER_WEIGHTED},
    {"random_uniform", PointMethod::RANDOM_UNIFORM},
};

const std::pair<const char*, BorderInclusion> BORDER_MODES[] = {
    {"none", BorderInclusion::NONE},
    {"before", BorderInclusion::BEFORE_DISTANCE_FILTER},
    {"after", BorderInclusion::AFTER_DISTANCE_FILTER},
};

const std::pair<const char*, PolygonMethod> POLYGON_METHODS[] = {
    {"voronoi", PolygonMethod::VORONOI},
    {"delaunay", PolygonMethod::DELAUNAY},
};

const std::pair<const char*, Statistic> STATISTICS[] = {
    {"min", Statistic::MIN},
    {"max", Statistic::MAX},
    {"mean", Statistic::MEAN},
    {"std", Statistic::STD},
    {"var", Statistic::VAR},
    {"sum", Statistic::SUM},
    {"median", Statistic::MEDIAN},
    {"count", Statistic::COUNT},
    {"ptp", Statistic::PTP},
};

const std::pair<const char*, Reducer> REDUCERS[] = {
    {"mean_div_std", Reducer::MEAN_DIV_STD},
    {"std_div_mean", Reducer::STD_DIV_MEAN},
    {"range", Reducer::RANGE},
    {"valid_count", Reducer::VALID_COUNT},
    {"footprint_count", Reducer::FOOTPRINT_COUNT},
    {"valid_fraction", Reducer::VALID_FRACTION},
    {"valid_area", Reducer::VALID_AREA},
};

} // anonymous namespace

PointMethod parse_point_method(const std::string& name) {
    return lookup(name, POINT_METHODS, "point sampling method");
}

BorderInclusion parse_border_inclusion(const std::string& name) {
    return lookup(name, BORDER_MODES, "border inclusion mode");
}

PolygonMethod parse_polygon_method(const std::string& name) {
    return lookup(name, POLYGON_METHODS, "polygon method");
}

Statistic parse_statistic(const std::string& name) {
    return lookup(name, STATISTICS, "statistic");
}

Reducer parse_reducer(const std::string& name) {
    return lookup(name, REDUCERS, "formula reducer");
}

std::string to_string(PointMethod method) { return reverse_lookup(method, POINT_METHODS); }
std::string to_string(BorderInclusion inclusion) { return reverse_lookup(inclusion, BORDER_MODES); }
std::string to_string(PolygonMethod method) { return reverse_lookup(method, POLYGON_METHODS); }
std::string to_string(Statistic statistic) { return reverse_lookup(statistic, STATISTICS); }
std::string to_string(Reducer reducer) { return reverse_lookup(reducer, REDUCERS); }

std::string format_number(double value) {
    if (std::isfinite(value) && value == std::floor(value) && std::abs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

// ============================================================================
// AttributeTable
// ============================================================================

size_t AttributeTable::add_column(const std::string& name) {
    auto existing = column_index(name);
    if (existing) {
        return *existing;
    }
    names_.push_back(name);
    values_.emplace_back(row_count_, std::nan(""));
    return names_.size() - 1;
}

std::optional<size_t> AttributeTable::column_index(const std::string& name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - names_.begin());
}

void AttributeTable::resize_rows(size_t row_count) {
    row_count_ = row_count;
    for (auto& column : values_) {
        column.resize(row_count, std::nan(""));
    }
}

} // namespace tess
